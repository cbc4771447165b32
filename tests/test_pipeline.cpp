#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "data/json_table_store.hpp"
#include "pipeline/pipeline.hpp"
#include "test_data.hpp"

#include <filesystem>
#include <memory>
#include <set>

using pipeline::Pipeline;
using feat::FeatureContract;

namespace {
const Date kStart = make_date(2023, 1, 1);
constexpr std::size_t kDays = 200;

void seed(data::TableStore& s, std::size_t days = kDays) {
    for (const auto& o : testdata::market(kStart, days)) s.upsert_market(o);
    for (const auto& [d, v] : testdata::articles(kStart, days)) s.upsert_article_scores(d, v);
}

// Megadott napokra mindig, vagy az első kísérletre hibázó tároló
class FlakyStore : public data::MemoryTableStore {
public:
    std::set<Date> always_fail;
    std::set<Date> fail_once;
    int attempts{0};

    void upsert_feature(const feat::FeatureRow& r) override {
        ++attempts;
        if (always_fail.count(r.date)) throw UpstreamWriteFailure("disk full");
        if (fail_once.erase(r.date)) throw UpstreamWriteFailure("transient");
        MemoryTableStore::upsert_feature(r);
    }
};

std::shared_ptr<strategy::EnsembleEngine> engine(double p_single, double p_window) {
    auto eng = std::make_shared<strategy::EnsembleEngine>(EnsembleConfig{0.5, 5}, FeatureContract::v13());
    strategy::ComponentSlot lr;
    lr.id = "lr";
    lr.weight = 1.0;
    lr.model = std::make_shared<strategy::CallbackModel>(
        "lr", InputShape::single_row(), std::vector<std::string>{"roc_1d"},
        [p_single](const FeatureMatrix&) { return p_single; });
    strategy::ComponentSlot gru;
    gru.id = "gru";
    gru.weight = 1.0;
    gru.model = std::make_shared<strategy::CallbackModel>(
        "gru", InputShape::window(5), std::vector<std::string>{"sent_5d", "bb_width"},
        [p_window](const FeatureMatrix&) { return p_window; });
    eng->add_component(lr);
    eng->add_component(gru);
    return eng;
}
}

TEST(Pipeline, FullAssemblyPersistsOnlyCompleteRows) {
    data::MemoryTableStore store;
    seed(store);
    Pipeline p(PipelineConfig{}, store);
    const auto rep = p.assemble_features(false);

    EXPECT_FALSE(rep.watermark);
    EXPECT_EQ(rep.rows.size(), kDays - 19);
    EXPECT_EQ(rep.written, rep.rows.size());
    EXPECT_EQ(rep.failed, 0u);
    ASSERT_EQ(store.features().size(), rep.rows.size());
    for (const auto& [d, r] : store.features()) EXPECT_EQ(r.values.size(), 13u) << to_string_date(d);

    EXPECT_FALSE(store.features().rbegin()->second.target);
    EXPECT_TRUE(store.features().begin()->second.target);
    EXPECT_EQ(store.indicators().size(), kDays - 19);
    EXPECT_EQ(store.sentiment().size(), kDays);
}

TEST(Pipeline, TargetComparesNextCalendarDayClose) {
    data::MemoryTableStore store;
    seed(store);
    Pipeline p(PipelineConfig{}, store);
    p.assemble_features(false);
    const auto obs = testdata::market(kStart, kDays);
    for (const auto& [d, r] : store.features()) {
        if (!r.target) continue;
        const std::size_t i = static_cast<std::size_t>(d - kStart);
        EXPECT_EQ(*r.target, obs[i + 1].close > obs[i].close ? 1 : 0) << to_string_date(d);
    }
}

TEST(Pipeline, MissingUpstreamIsReported) {
    data::MemoryTableStore empty;
    Pipeline p(PipelineConfig{}, empty);
    EXPECT_THROW(p.assemble_features(false), MissingUpstreamData);

    data::MemoryTableStore no_articles;
    for (const auto& o : testdata::market(kStart, 40)) no_articles.upsert_market(o);
    Pipeline q(PipelineConfig{}, no_articles);
    EXPECT_THROW(q.assemble_features(true), MissingUpstreamData);
}

TEST(Pipeline, AbsentReferenceDropsEveryRow) {
    data::MemoryTableStore store;
    for (const auto& o : testdata::market(kStart, 40, false)) store.upsert_market(o);
    for (const auto& [d, v] : testdata::articles(kStart, 40)) store.upsert_article_scores(d, v);
    Pipeline p(PipelineConfig{}, store);
    const auto rep = p.assemble_features(false);
    EXPECT_TRUE(rep.rows.empty());
    EXPECT_EQ(rep.dropped, rep.joined);
    EXPECT_TRUE(store.features().empty());
}

TEST(Pipeline, IncrementalRerunHasNoDrift) {
    data::MemoryTableStore store;
    seed(store);
    Pipeline p(PipelineConfig{}, store);
    p.assemble_features(false);
    const auto full = store.features();

    const auto first = p.assemble_features(true);
    const auto second = p.assemble_features(true);
    ASSERT_TRUE(first.watermark);
    EXPECT_EQ(*first.watermark, kStart + static_cast<Date>(kDays - 1));
    EXPECT_EQ(first.rederive_from, *first.watermark - 10);
    EXPECT_EQ(first.rows.size(), 11u);
    ASSERT_EQ(first.rows.size(), second.rows.size());
    for (std::size_t i = 0; i < first.rows.size(); ++i) {
        EXPECT_TRUE(first.rows[i] == second.rows[i]) << to_string_date(first.rows[i].date);
        EXPECT_TRUE(first.rows[i] == full.at(first.rows[i].date)) << to_string_date(first.rows[i].date);
    }
    EXPECT_TRUE(store.features() == full);
}

TEST(Pipeline, IncrementalPicksUpNewDayAndRefreshesTarget) {
    data::MemoryTableStore store;
    seed(store, kDays);
    Pipeline p(PipelineConfig{}, store);
    p.assemble_features(false);
    const Date last = kStart + static_cast<Date>(kDays - 1);
    EXPECT_FALSE(store.features().at(last).target);
    const auto before = store.features().at(last - 30);

    // késve érkező új nap
    store.upsert_market(testdata::market_day(last + 1, kDays));
    store.upsert_article_scores(last + 1, {0.4});
    const auto rep = p.assemble_features(true);
    EXPECT_EQ(rep.rederive_from, last - 10);
    EXPECT_EQ(rep.rows.back().date, last + 1);
    EXPECT_TRUE(store.features().at(last).target);
    EXPECT_FALSE(store.features().at(last + 1).target);
    EXPECT_TRUE(store.features().at(last - 30) == before);   // az ablak előtti sor érintetlen
}

TEST(Pipeline, IncrementalAfterBackfillMatchesFullRebuild) {
    data::MemoryTableStore store;
    seed(store);
    Pipeline p(PipelineConfig{}, store);
    p.assemble_features(false);
    const Date last = kStart + static_cast<Date>(kDays - 1);
    ASSERT_TRUE(store.features().count(last - 2));

    // utólagos javítás: a nasdaq záró az utolsó 10 napon konstans,
    // így az 5 napos korreláció a végén null lesz
    auto corrected = testdata::market(kStart, kDays);
    for (std::size_t i = kDays - 10; i < kDays; ++i) corrected[i].reference_close["nasdaq"] = 1000.0;
    for (std::size_t i = kDays - 10; i < kDays; ++i) store.upsert_market(corrected[i]);

    const auto rep = p.assemble_features(true);
    EXPECT_EQ(rep.rederive_from, last - 10);
    EXPECT_EQ(rep.dropped, 5u);
    EXPECT_EQ(rep.dropped_dates, (std::vector<Date>{last - 4, last - 3, last - 2, last - 1, last}));
    EXPECT_EQ(rep.erased, 5u);
    EXPECT_FALSE(store.features().count(last - 3));
    EXPECT_EQ(*store.latest_feature_date(), last - 5);

    // ugyanazokból a javított adatokból friss tárolón teljes futás
    data::MemoryTableStore fresh;
    for (const auto& o : corrected) fresh.upsert_market(o);
    for (const auto& [d, v] : testdata::articles(kStart, kDays)) fresh.upsert_article_scores(d, v);
    Pipeline(PipelineConfig{}, fresh).assemble_features(false);
    ASSERT_EQ(store.features().size(), fresh.features().size());
    EXPECT_TRUE(store.features() == fresh.features());
}

TEST(Pipeline, FullRebuildRemovesRowsNoLongerComplete) {
    data::MemoryTableStore store;
    seed(store, 40);
    Pipeline p(PipelineConfig{}, store);
    EXPECT_EQ(p.assemble_features(false).rows.size(), 21u);

    for (std::size_t i = 20; i < 40; ++i) {
        auto o = testdata::market_day(kStart + static_cast<Date>(i), i);
        o.reference_close["nasdaq"] = 1000.0;
        store.upsert_market(o);
    }
    const auto rep = p.assemble_features(false);
    EXPECT_EQ(rep.rows.size(), 6u);
    EXPECT_EQ(rep.dropped, 15u);
    EXPECT_EQ(rep.erased, 15u);
    for (const auto d : rep.dropped_dates) EXPECT_FALSE(store.features().count(d)) << to_string_date(d);
    EXPECT_EQ(store.features().size(), 6u);
    EXPECT_EQ(*store.latest_feature_date(), kStart + 24);
}

TEST(Pipeline, FileStoreHoldsBatchedRunAfterReload) {
    const auto dir = std::filesystem::temp_directory_path() / "nextday_pipeline_batch";
    std::filesystem::remove_all(dir);
    const auto& c = FeatureContract::v13();
    std::size_t written = 0;
    {
        data::JsonTableStore store(dir.string(), c);
        store.begin_batch();
        seed(store, 60);
        store.flush();
        written = Pipeline(PipelineConfig{}, store, c).assemble_features(false).written;
        EXPECT_FALSE(store.batching());
        EXPECT_EQ(store.pending_tables(), 0u);
    }
    data::JsonTableStore back(dir.string(), c);
    EXPECT_EQ(written, 41u);
    EXPECT_EQ(back.features().size(), written);
    EXPECT_EQ(back.indicators().size(), written);
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(Pipeline, WriteFailuresAreIsolatedAndRetried) {
    FlakyStore store;
    seed(store, 40);
    const Date bad = kStart + 25;
    const Date flaky = kStart + 30;
    store.always_fail.insert(bad);
    store.fail_once.insert(flaky);

    Pipeline p(PipelineConfig{}, store);
    const auto rep = p.assemble_features(false);
    EXPECT_EQ(rep.rows.size(), 21u);
    EXPECT_EQ(rep.failed, 1u);
    EXPECT_EQ(rep.written, 20u);
    EXPECT_FALSE(store.features().count(bad));
    EXPECT_TRUE(store.features().count(flaky));
    // 21 sor + 1 ismétlés a flaky napon + 2 ismétlés a hibás napon
    EXPECT_EQ(store.attempts, 24);
}

TEST(Pipeline, PredictUsesLatestRowsAndPersistsDecision) {
    data::MemoryTableStore store;
    seed(store, 60);
    Pipeline p(PipelineConfig{}, store);
    p.assemble_features(false);
    const Date last = kStart + 59;

    const auto eng = engine(0.8, 0.6);
    const auto d = p.predict_next_day(last + 1, *eng);
    EXPECT_EQ(d.feature_date, last);
    EXPECT_EQ(d.target_date, last + 1);
    EXPECT_NEAR(d.probability_up, 0.7, 1e-12);
    EXPECT_EQ(d.direction, Direction::Up);
    ASSERT_TRUE(store.load_decision(last + 1));

    // ugyanarra az állapotra ugyanaz a döntés, egyetlen rekord
    const auto again = p.predict_next_day(last + 1, *eng);
    EXPECT_DOUBLE_EQ(again.probability_up, d.probability_up);
    EXPECT_EQ(store.decisions().size(), 1u);
}

TEST(Pipeline, PredictAsOfPastDateIgnoresLaterRows) {
    data::MemoryTableStore store;
    seed(store, 60);
    Pipeline p(PipelineConfig{}, store);
    p.assemble_features(false);
    const Date as_of = kStart + 40;
    const auto d = p.predict_next_day(as_of, *engine(0.2, 0.2));
    EXPECT_EQ(d.feature_date, as_of);
    EXPECT_EQ(d.direction, Direction::Down);
    EXPECT_NEAR(d.confidence, 0.8, 1e-12);
}

TEST(Pipeline, PredictWithoutFeaturesOrModelsFails) {
    data::MemoryTableStore store;
    Pipeline p(PipelineConfig{}, store);
    EXPECT_THROW(p.predict_next_day(kStart, *engine(0.5, 0.5)), MissingUpstreamData);

    seed(store, 40);
    p.assemble_features(false);
    strategy::EnsembleEngine none(EnsembleConfig{}, FeatureContract::v13());
    strategy::ComponentSlot gone;
    gone.id = "xgb";
    gone.weight = 1.0;
    gone.unavailable_reason = "artifact missing";
    none.add_component(gone);
    EXPECT_THROW(p.predict_next_day(kStart + 39, none), NoViableModelComponents);
    EXPECT_TRUE(store.decisions().empty());
}
