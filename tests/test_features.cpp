#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "features/feature_assembler.hpp"
#include "features/feature_contract.hpp"

#include <stdexcept>

using feat::FeatureAssembler;
using feat::FeatureContract;

namespace {
const Date kDay = make_date(2024, 5, 10);

ind::DailyIndicatorRow indicator_row(Date d, double close) {
    ind::DailyIndicatorRow r;
    r.date = d;
    r.close = close;
    r.values = {
        {"close_to_sma10_ratio", 1.05},
        {"high_low_range", 0.03},
        {"roc_1d", 1.2},
        {"roc_3d", -0.7},
        {"bb_width", 0.11},
        {"volume_change_1d", 0.02},
        {"btc_nasdaq_corr_5d", 0.4},
        {"btc_nasdaq_beta_10d", 1.3},
    };
    return r;
}

sent::DailySentimentRow sentiment_row(Date d) {
    sent::DailySentimentRow s;
    s.date = d;
    s.mean_sentiment = -0.3;
    s.sent_3d = -0.1;
    s.sent_5d = 0.05;
    s.sent_vol = 0.2;
    s.sent_delta = -0.2;
    s.sent_accel = -0.1;
    s.quantile_bucket = 2;
    s.q2_flag = true;
    s.negative = true;
    return s;
}

double value(const FeatureContract& c, const feat::FeatureRow& r, const std::string& name) {
    return r.values.at(*c.index_of(name));
}
}

TEST(FeatureContract, CanonicalOrder) {
    const auto& c = FeatureContract::v13();
    EXPECT_EQ(c.version(), "v13");
    ASSERT_EQ(c.size(), 13u);
    EXPECT_EQ(c.names().front(), "btc_nasdaq_beta_10d");
    EXPECT_EQ(c.names().back(), "sent_q2_flag_x_close_to_sma10");
    EXPECT_EQ(*c.index_of("roc_1d"), 2u);
    EXPECT_FALSE(c.index_of("ROC_1d"));
}

TEST(FeatureContract, DuplicateNamesRejected) {
    EXPECT_THROW(FeatureContract("x", {"a", "b", "a"}), std::invalid_argument);
}

TEST(FeatureContract, ExtractListsEveryMissingName) {
    const FeatureContract c{"t", {"a", "b", "c"}};
    const std::map<std::string, OptDouble> named{{"a", 1.0}, {"b", std::nullopt}};
    try {
        c.extract(named, kDay);
        FAIL() << "expected IncompleteFeatureRow";
    } catch (const IncompleteFeatureRow& e) {
        EXPECT_EQ(e.missing(), (std::vector<std::string>{"b", "c"}));
    }
    const auto v = c.extract({{"c", 3.0}, {"a", 1.0}, {"b", 2.0}}, kDay);
    EXPECT_EQ(v, (std::vector<double>{1.0, 2.0, 3.0}));
}

TEST(FeatureAssembler, InteractionFeaturesAreExactProducts) {
    const auto& c = FeatureContract::v13();
    FeatureAssembler asmb(c);
    auto s = sentiment_row(kDay);
    const auto named = asmb.named_values(indicator_row(kDay, 100.0), s);
    EXPECT_DOUBLE_EQ(*named.at("sent_q2_flag_x_close_to_sma10"), 1.05);
    EXPECT_DOUBLE_EQ(*named.at("sent_neg_x_high_low_range"), 0.03);
    EXPECT_DOUBLE_EQ(*named.at("sent_cross_up_x_high_low_range"), 0.0);
    EXPECT_DOUBLE_EQ(*named.at("sent_q5_flag"), 0.0);

    s.q2_flag = false;
    s.cross_up = true;
    const auto named2 = asmb.named_values(indicator_row(kDay, 100.0), s);
    EXPECT_DOUBLE_EQ(*named2.at("sent_q2_flag_x_close_to_sma10"), 0.0);
    EXPECT_DOUBLE_EQ(*named2.at("sent_cross_up_x_high_low_range"), 0.03);
}

TEST(FeatureAssembler, InnerJoinAndTarget) {
    const auto& c = FeatureContract::v13();
    FeatureAssembler asmb(c);
    const std::vector<ind::DailyIndicatorRow> ind{
        indicator_row(kDay, 100.0), indicator_row(kDay + 1, 101.0),
        indicator_row(kDay + 2, 101.0), indicator_row(kDay + 3, 99.0)};
    // kDay+1-nek nincs szentiment sora
    const std::vector<sent::DailySentimentRow> sen{
        sentiment_row(kDay), sentiment_row(kDay + 2), sentiment_row(kDay + 3), sentiment_row(kDay + 4)};

    const auto res = asmb.assemble(ind, sen);
    EXPECT_EQ(res.joined, 3u);
    EXPECT_EQ(res.dropped, 0u);
    ASSERT_EQ(res.rows.size(), 3u);
    EXPECT_EQ(res.rows[0].date, kDay);
    EXPECT_EQ(res.rows[1].date, kDay + 2);
    EXPECT_EQ(res.rows[2].date, kDay + 3);

    EXPECT_EQ(res.rows[0].target.value_or(-1), 1);          // 101 > 100
    EXPECT_EQ(res.rows[1].target.value_or(-1), 0);          // 99 < 101
    EXPECT_FALSE(res.rows[2].target);          // holnapi záró ismeretlen

    EXPECT_DOUBLE_EQ(value(c, res.rows[0], "btc_nasdaq_beta_10d"), 1.3);
    EXPECT_DOUBLE_EQ(value(c, res.rows[0], "sent_5d"), 0.05);
    EXPECT_DOUBLE_EQ(value(c, res.rows[0], "sent_accel"), -0.1);
}

TEST(FeatureAssembler, EqualNextCloseIsNotUp) {
    FeatureAssembler asmb(FeatureContract::v13());
    const auto res = asmb.assemble({indicator_row(kDay, 100.0), indicator_row(kDay + 1, 100.0)},
                                   {sentiment_row(kDay), sentiment_row(kDay + 1)});
    ASSERT_EQ(res.rows.size(), 2u);
    EXPECT_EQ(res.rows[0].target.value_or(-1), 0);
}

TEST(FeatureAssembler, RowWithNullContractFeatureIsDropped) {
    FeatureAssembler asmb(FeatureContract::v13());
    auto bad = indicator_row(kDay + 1, 100.0);
    bad.values["btc_nasdaq_beta_10d"] = std::nullopt;
    auto no_range = indicator_row(kDay + 2, 100.0);
    no_range.values["high_low_range"] = std::nullopt;

    const auto res = asmb.assemble({indicator_row(kDay, 100.0), bad, no_range},
                                   {sentiment_row(kDay), sentiment_row(kDay + 1), sentiment_row(kDay + 2)});
    EXPECT_EQ(res.joined, 3u);
    EXPECT_EQ(res.dropped, 2u);
    EXPECT_EQ(res.dropped_dates, (std::vector<Date>{kDay + 1, kDay + 2}));
    ASSERT_EQ(res.rows.size(), 1u);
    EXPECT_EQ(res.rows[0].date, kDay);
    for (const auto& r : res.rows) EXPECT_EQ(r.values.size(), 13u);
}

TEST(FeatureAssembler, MissingReferenceColumnDropsEveryRow) {
    FeatureAssembler asmb(FeatureContract::v13());
    auto r = indicator_row(kDay, 100.0);
    r.values.erase("btc_nasdaq_corr_5d");
    const auto res = asmb.assemble({r}, {sentiment_row(kDay)});
    EXPECT_TRUE(res.rows.empty());
    EXPECT_EQ(res.dropped, 1u);
}
