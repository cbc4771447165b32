#include "data/table_store.hpp"

namespace data {

template <class V>
static std::vector<V> range_values(const std::map<Date, V>& m, Date from, Date to){
    std::vector<V> out;
    if (to < from) return out;
    for (auto it = m.lower_bound(from); it != m.end() && it->first <= to; ++it) out.push_back(it->second);
    return out;
}

std::vector<DailyMarketObservation> MemoryTableStore::load_market(Date from, Date to) const {
    return range_values(market_, from, to);
}

std::map<Date, std::vector<double>> MemoryTableStore::load_article_scores(Date from, Date to) const {
    std::map<Date, std::vector<double>> out;
    if (to < from) return out;
    for (auto it = articles_.lower_bound(from); it != articles_.end() && it->first <= to; ++it)
        out.emplace(it->first, it->second);
    return out;
}

void MemoryTableStore::upsert_market(const DailyMarketObservation& o){ market_[o.date] = o; }

void MemoryTableStore::upsert_article_scores(Date date, const std::vector<double>& scores){
    articles_[date] = scores;
}

void MemoryTableStore::upsert_indicator(const ind::DailyIndicatorRow& r){ indicators_[r.date] = r; }

void MemoryTableStore::upsert_sentiment(const sent::DailySentimentRow& r){ sentiment_[r.date] = r; }

std::optional<Date> MemoryTableStore::latest_feature_date() const {
    if (features_.empty()) return std::nullopt;
    return features_.rbegin()->first;
}

std::vector<feat::FeatureRow> MemoryTableStore::load_features(Date from, Date to) const {
    return range_values(features_, from, to);
}

void MemoryTableStore::upsert_feature(const feat::FeatureRow& r){ features_[r.date] = r; }

void MemoryTableStore::erase_feature(Date date){ features_.erase(date); }

std::optional<strategy::EnsembleDecision> MemoryTableStore::load_decision(Date target_date) const {
    auto it = decisions_.find(target_date);
    if (it==decisions_.end()) return std::nullopt;
    return it->second;
}

void MemoryTableStore::upsert_decision(const strategy::EnsembleDecision& d){ decisions_[d.target_date] = d; }

} // namespace data
