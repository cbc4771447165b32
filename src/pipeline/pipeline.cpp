#include "pipeline/pipeline.hpp"
#include "core/errors.hpp"
#include "indicators/indicator_engine.hpp"
#include "sentiment/sentiment_aggregator.hpp"
#include <algorithm>
#include <cstddef>
#include <set>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace pipeline {

Pipeline::Pipeline(PipelineConfig cfg, data::TableStore& store, const feat::FeatureContract& contract)
    : cfg_(std::move(cfg)), store_(store), contract_(contract) {}

template <class F>
bool Pipeline::upsert_with_retry(const char* table, Date date, F&& write) const {
    for (int attempt = 0;; ++attempt){
        try {
            write();
            return true;
        } catch (const UpstreamWriteFailure& e) {
            if (attempt >= cfg_.assembly.write_retries){
                spdlog::error("{} {}: write failed after {} attempts: {}",
                              table, to_string_date(date), attempt+1, e.what());
                return false;
            }
            spdlog::warn("{} {}: write failed, retrying: {}", table, to_string_date(date), e.what());
        }
    }
}

AssemblyReport Pipeline::assemble_features(bool update_only){
    AssemblyReport rep;
    Date fetch_from = data::kMinDate;
    rep.rederive_from = data::kMinDate;

    if (update_only){
        rep.watermark = store_.latest_feature_date();
        if (rep.watermark){
            // a buffer ablakot mindig felülírjuk, a gördülő ablakokhoz extra előzmény kell
            rep.rederive_from = *rep.watermark - cfg_.assembly.buffer_days;
            fetch_from = rep.rederive_from - cfg_.assembly.history_days;
            spdlog::info("assemble: watermark {}, re-deriving from {}, reading inputs from {}",
                         to_string_date(*rep.watermark), to_string_date(rep.rederive_from),
                         to_string_date(fetch_from));
        } else {
            spdlog::info("assemble: no persisted features yet, running full");
        }
    }

    const auto market = store_.load_market(fetch_from, data::kMaxDate);
    if (market.empty())
        throw MissingUpstreamData(fmt::format("no market observations since {}",
                                              fetch_from==data::kMinDate ? std::string("start")
                                                                         : to_string_date(fetch_from)));
    const Date from = market.front().date;
    const Date to   = market.back().date;

    const auto articles = store_.load_article_scores(from, to);
    if (articles.empty())
        throw MissingUpstreamData(fmt::format("no article sentiment between {} and {}",
                                              to_string_date(from), to_string_date(to)));

    // a két ág független egymástól
    const ind::IndicatorEngine indicators(cfg_.indicators);
    const ind::IndicatorTable itable = indicators.compute(market);
    if (!itable.missing_references.empty())
        spdlog::warn("assemble: {} reference series missing in this range", itable.missing_references.size());

    const sent::SentimentAggregator aggregator(cfg_.sentiment);
    const auto srows = aggregator.build(articles, from, to);

    std::vector<ind::DailyIndicatorRow> irows;
    for (const auto& r : itable.rows)
        if (r.date >= rep.rederive_from) irows.push_back(r);

    const feat::FeatureAssembler assembler(contract_, cfg_.indicators.sma_window);
    auto result = assembler.assemble(irows, srows);
    rep.joined  = result.joined;
    rep.dropped = result.dropped;
    rep.dropped_dates = std::move(result.dropped_dates);

    // innentől az írások kötegben, a tartós írás a flush()-ban
    store_.begin_batch();

    if (cfg_.assembly.persist_intermediate){
        std::size_t failed = 0;
        for (const auto& r : irows)
            if (!upsert_with_retry("market_indicators", r.date, [&]{ store_.upsert_indicator(r); })) ++failed;
        for (const auto& s : srows){
            if (s.date < rep.rederive_from) continue;
            if (!upsert_with_retry("news_sentiment", s.date, [&]{ store_.upsert_sentiment(s); })) ++failed;
        }
        if (failed) spdlog::warn("assemble: {} intermediate rows not persisted", failed);
    }

    for (const auto& row : result.rows){
        if (upsert_with_retry("model_features", row.date, [&]{ store_.upsert_feature(row); })) ++rep.written;
        else ++rep.failed;
    }

    // az ablakban korábban kiírt, de most már nem előálló napok
    std::set<Date> fresh;
    for (const auto& row : result.rows) fresh.insert(row.date);
    for (const auto& old : store_.load_features(rep.rederive_from, to)){
        if (fresh.count(old.date)) continue;
        if (upsert_with_retry("model_features", old.date, [&]{ store_.erase_feature(old.date); })){
            spdlog::info("assemble: {} no longer complete, persisted row removed", to_string_date(old.date));
            ++rep.erased;
        }
    }

    if (!upsert_with_retry("flush", to, [&]{ store_.flush(); })){
        spdlog::error("assemble: batch not persisted, {} feature rows lost", rep.written);
        rep.failed += rep.written;
        rep.written = 0;
    }
    rep.rows = std::move(result.rows);

    spdlog::info("assemble ({}): {} joined, {} written, {} dropped, {} erased, {} failed",
                 update_only ? "incremental" : "full", rep.joined, rep.written, rep.dropped, rep.erased, rep.failed);
    return rep;
}

strategy::EnsembleDecision Pipeline::predict_next_day(Date as_of, const strategy::EnsembleEngine& engine){
    auto rows = store_.load_features(data::kMinDate, as_of);
    if (rows.empty())
        throw MissingUpstreamData(fmt::format("no feature rows on or before {}", to_string_date(as_of)));

    const std::size_t need = engine.rows_needed();
    if (rows.size() > need) rows.erase(rows.begin(), rows.end() - static_cast<std::ptrdiff_t>(need));

    const Date latest = rows.back().date;
    if (latest < as_of - 1)
        spdlog::warn("predict: latest feature row {} is stale for {}", to_string_date(latest), to_string_date(as_of));

    auto decision = engine.predict(rows);

    if (!upsert_with_retry("price_predictions", decision.target_date, [&]{ store_.upsert_decision(decision); }))
        spdlog::error("predict {}: decision not persisted", to_string_date(decision.target_date));
    return decision;
}

} // namespace pipeline
