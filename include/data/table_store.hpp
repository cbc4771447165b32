#pragma once
#include <limits>
#include <map>
#include <optional>
#include <vector>
#include "core/types.hpp"
#include "features/feature_contract.hpp"
#include "indicators/indicator_engine.hpp"
#include "sentiment/sentiment_aggregator.hpp"
#include "strategy/decision.hpp"

namespace data {

constexpr Date kMinDate = std::numeric_limits<Date>::min();
constexpr Date kMaxDate = std::numeric_limits<Date>::max();

// Dátum szerint kulcsolt táblák. Olvasás tartományra (zárt [from, to]),
// írás upsert-by-date. Írási hibánál UpstreamWriteFailure.
class TableStore {
public:
    virtual ~TableStore() = default;

    // upstream (gyűjtő oldali) táblák
    virtual std::vector<DailyMarketObservation> load_market(Date from, Date to) const = 0;
    virtual std::map<Date, std::vector<double>> load_article_scores(Date from, Date to) const = 0;
    virtual void upsert_market(const DailyMarketObservation& o) = 0;
    virtual void upsert_article_scores(Date date, const std::vector<double>& scores) = 0;

    // származtatott táblák
    virtual void upsert_indicator(const ind::DailyIndicatorRow& r) = 0;
    virtual void upsert_sentiment(const sent::DailySentimentRow& r) = 0;

    virtual std::optional<Date> latest_feature_date() const = 0;
    virtual std::vector<feat::FeatureRow> load_features(Date from, Date to) const = 0;
    virtual void upsert_feature(const feat::FeatureRow& r) = 0;
    // újraszámolás után érvénytelenné vált nap törlése; nem létező napra no-op
    virtual void erase_feature(Date date) = 0;

    // kimenet: a célnap szerint kulcsolva
    virtual std::optional<strategy::EnsembleDecision> load_decision(Date target_date) const = 0;
    virtual void upsert_decision(const strategy::EnsembleDecision& d) = 0;

    // Kötegelt írás: begin_batch() után az upsert-ek csak a memóriát
    // módosítják, a tartós írás a flush()-ban történik. Memóriás tárolónál no-op.
    virtual void begin_batch() {}
    virtual void flush() {}
};

// Memóriában tartott táblák (tesztek, beágyazás)
class MemoryTableStore : public TableStore {
public:
    std::vector<DailyMarketObservation> load_market(Date from, Date to) const override;
    std::map<Date, std::vector<double>> load_article_scores(Date from, Date to) const override;
    void upsert_market(const DailyMarketObservation& o) override;
    void upsert_article_scores(Date date, const std::vector<double>& scores) override;

    void upsert_indicator(const ind::DailyIndicatorRow& r) override;
    void upsert_sentiment(const sent::DailySentimentRow& r) override;

    std::optional<Date> latest_feature_date() const override;
    std::vector<feat::FeatureRow> load_features(Date from, Date to) const override;
    void upsert_feature(const feat::FeatureRow& r) override;
    void erase_feature(Date date) override;

    std::optional<strategy::EnsembleDecision> load_decision(Date target_date) const override;
    void upsert_decision(const strategy::EnsembleDecision& d) override;

    const std::map<Date, ind::DailyIndicatorRow>& indicators() const { return indicators_; }
    const std::map<Date, sent::DailySentimentRow>& sentiment() const { return sentiment_; }
    const std::map<Date, feat::FeatureRow>& features() const { return features_; }
    const std::map<Date, strategy::EnsembleDecision>& decisions() const { return decisions_; }

protected:
    std::map<Date, DailyMarketObservation> market_;
    std::map<Date, std::vector<double>> articles_;
    std::map<Date, ind::DailyIndicatorRow> indicators_;
    std::map<Date, sent::DailySentimentRow> sentiment_;
    std::map<Date, feat::FeatureRow> features_;
    std::map<Date, strategy::EnsembleDecision> decisions_;
};

} // namespace data
