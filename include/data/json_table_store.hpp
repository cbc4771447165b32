#pragma once
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "data/table_store.hpp"

namespace data {

// JSON kódolás a táblák soraihoz
nlohmann::json encode(const DailyMarketObservation& o);
nlohmann::json encode(const ind::DailyIndicatorRow& r);
nlohmann::json encode(const sent::DailySentimentRow& r);
nlohmann::json encode(const feat::FeatureRow& r, const feat::FeatureContract& contract);
nlohmann::json encode(const strategy::EnsembleDecision& d);

DailyMarketObservation decode_market(const nlohmann::json& j);
ind::DailyIndicatorRow decode_indicator(const nlohmann::json& j);
sent::DailySentimentRow decode_sentiment(const nlohmann::json& j);
feat::FeatureRow decode_feature(const nlohmann::json& j, const feat::FeatureContract& contract);
strategy::EnsembleDecision decode_decision(const nlohmann::json& j);

// Fájl alapú tároló: táblánként egy <dir>/<tábla>.json, kulcs az ISO dátum.
// Kötegen kívül minden upsert azonnal, atomikusan újraírja a táblát (tmp + rename),
// hibánál a memória változatlan marad. Kötegben a módosított táblák a flush()-ban íródnak.
class JsonTableStore : public MemoryTableStore {
public:
    JsonTableStore(std::string dir, const feat::FeatureContract& contract);

    void upsert_market(const DailyMarketObservation& o) override;
    void upsert_article_scores(Date date, const std::vector<double>& scores) override;
    void upsert_indicator(const ind::DailyIndicatorRow& r) override;
    void upsert_sentiment(const sent::DailySentimentRow& r) override;
    void upsert_feature(const feat::FeatureRow& r) override;
    void erase_feature(Date date) override;
    void upsert_decision(const strategy::EnsembleDecision& d) override;

    void begin_batch() override;
    // Hiba esetén a még ki nem írt táblák piszkosak maradnak, újabb flush() pótolja
    void flush() override;

    bool batching() const { return batching_; }
    std::size_t pending_tables() const { return dirty_.size(); }

private:
    std::string path(const std::string& table) const;
    nlohmann::json read_table(const std::string& table) const;
    void write_table(const std::string& table, const nlohmann::json& j) const;

    // row == nullptr -> törlés
    void stage(const std::string& table, Date date, nlohmann::json row);

    std::string dir_;
    const feat::FeatureContract& contract_;
    std::map<std::string, nlohmann::json> docs_;   // tábla -> kódolt sorok
    std::set<std::string> dirty_;
    bool batching_{false};
};

} // namespace data
