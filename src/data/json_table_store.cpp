#include "data/json_table_store.hpp"
#include "core/errors.hpp"
#include <filesystem>
#include <fstream>
#include <optional>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace data {

static json opt(const OptDouble& v){
    return v ? json(*v) : json(nullptr);
}

json encode(const DailyMarketObservation& o){
    json j;
    j["date"] = to_string_date(o.date);
    j["open"] = o.open; j["high"] = o.high; j["low"] = o.low;
    j["close"] = o.close; j["volume"] = o.volume;
    j["reference_close"] = o.reference_close;
    return j;
}

json encode(const ind::DailyIndicatorRow& r){
    json j;
    j["date"] = to_string_date(r.date);
    j["close"] = r.close;
    json v = json::object();
    for (const auto& [k, x] : r.values) v[k] = opt(x);
    j["values"] = v;
    return j;
}

json encode(const sent::DailySentimentRow& r){
    json j;
    j["date"] = to_string_date(r.date);
    j["mean_sentiment"] = opt(r.mean_sentiment);
    j["provenance"] = sent::to_string(r.provenance);
    j["article_count"] = r.article_count;
    j["sent_3d"] = r.sent_3d;
    j["sent_5d"] = r.sent_5d;
    j["sent_vol"] = r.sent_vol;
    j["sent_delta"] = r.sent_delta;
    j["sent_accel"] = r.sent_accel;
    j["sent_q"] = r.quantile_bucket;
    j["sent_q2_flag"] = r.q2_flag ? 1 : 0;
    j["sent_q5_flag"] = r.q5_flag ? 1 : 0;
    j["sent_cross_up"] = r.cross_up ? 1 : 0;
    j["sent_neg"] = r.negative ? 1 : 0;
    return j;
}

json encode(const feat::FeatureRow& r, const feat::FeatureContract& contract){
    if (r.values.size()!=contract.size())
        throw UpstreamWriteFailure(fmt::format("feature row {} has {} values, contract has {}",
                                               to_string_date(r.date), r.values.size(), contract.size()));
    json j;
    j["date"] = to_string_date(r.date);
    j["contract"] = contract.version();
    json f = json::object();
    for (std::size_t i=0;i<contract.size();++i) f[contract.names()[i]] = r.values[i];
    j["features"] = f;
    j["target_nextday"] = r.target ? json(*r.target) : json(nullptr);
    return j;
}

json encode(const strategy::EnsembleDecision& d){
    json j;
    j["prediction_date"]  = to_string_date(d.target_date);
    j["feature_date"]     = to_string_date(d.feature_date);
    j["price_direction"]  = static_cast<int>(d.direction);
    j["probability_up"]   = d.probability_up;
    j["confidence_score"] = d.confidence;
    j["threshold"]        = d.threshold;
    json comps = json::array();
    for (const auto& c : d.components){
        comps.push_back({{"id", c.id}, {"weight", c.weight},
                         {"probability_up", opt(c.probability_up)},
                         {"status", strategy::to_string(c.status)}, {"error", c.error}});
    }
    j["components"] = comps;
    return j;
}

DailyMarketObservation decode_market(const json& j){
    DailyMarketObservation o;
    o.date   = parse_date(j.at("date").get<std::string>());
    o.open   = j.at("open").get<double>();
    o.high   = j.at("high").get<double>();
    o.low    = j.at("low").get<double>();
    o.close  = j.at("close").get<double>();
    o.volume = j.value("volume", 0.0);
    if (j.contains("reference_close"))
        o.reference_close = j["reference_close"].get<std::map<std::string, double>>();
    return o;
}

static OptDouble opt_at(const json& j, const char* k){
    if (!j.contains(k) || j[k].is_null()) return std::nullopt;
    return j[k].get<double>();
}

ind::DailyIndicatorRow decode_indicator(const json& j){
    ind::DailyIndicatorRow r;
    r.date  = parse_date(j.at("date").get<std::string>());
    r.close = j.at("close").get<double>();
    const auto& v = j.at("values");
    for (auto it = v.begin(); it != v.end(); ++it)
        r.values.emplace(it.key(), it.value().is_null() ? OptDouble{} : OptDouble{it.value().get<double>()});
    return r;
}

sent::DailySentimentRow decode_sentiment(const json& j){
    sent::DailySentimentRow r;
    r.date = parse_date(j.at("date").get<std::string>());
    r.mean_sentiment = opt_at(j, "mean_sentiment");
    r.provenance = j.value("provenance", std::string{})=="interpolated" ? sent::Provenance::Interpolated
                                                                         : sent::Provenance::Observed;
    r.article_count = j.value("article_count", std::size_t{0});
    r.sent_3d    = j.value("sent_3d", 0.0);
    r.sent_5d    = j.value("sent_5d", 0.0);
    r.sent_vol   = j.value("sent_vol", 0.0);
    r.sent_delta = j.value("sent_delta", 0.0);
    r.sent_accel = j.value("sent_accel", 0.0);
    r.quantile_bucket = j.value("sent_q", 0);
    r.q2_flag  = j.value("sent_q2_flag", 0)==1;
    r.q5_flag  = j.value("sent_q5_flag", 0)==1;
    r.cross_up = j.value("sent_cross_up", 0)==1;
    r.negative = j.value("sent_neg", 0)==1;
    return r;
}

feat::FeatureRow decode_feature(const json& j, const feat::FeatureContract& contract){
    feat::FeatureRow r;
    r.date = parse_date(j.at("date").get<std::string>());
    const std::string version = j.value("contract", contract.version());
    if (version!=contract.version())
        throw PipelineError(fmt::format("feature row {} uses contract {}, expected {}",
                                        to_string_date(r.date), version, contract.version()));
    const auto& f = j.at("features");
    for (const auto& n : contract.names()){
        if (!f.contains(n) || f[n].is_null())
            throw PipelineError(fmt::format("feature row {} lacks '{}'", to_string_date(r.date), n));
        r.values.push_back(f[n].get<double>());
    }
    if (j.contains("target_nextday") && !j["target_nextday"].is_null())
        r.target = j["target_nextday"].get<int>();
    return r;
}

strategy::EnsembleDecision decode_decision(const json& j){
    strategy::EnsembleDecision d;
    d.target_date    = parse_date(j.at("prediction_date").get<std::string>());
    d.feature_date   = parse_date(j.at("feature_date").get<std::string>());
    d.direction      = j.at("price_direction").get<int>()==1 ? Direction::Up : Direction::Down;
    d.probability_up = j.at("probability_up").get<double>();
    d.confidence     = j.at("confidence_score").get<double>();
    d.threshold      = j.value("threshold", 0.5);
    for (const auto& c : j.value("components", json::array())){
        strategy::ComponentOutput o;
        o.id = c.value("id", std::string{});
        o.weight = c.value("weight", 0.0);
        if (c.contains("probability_up") && !c["probability_up"].is_null())
            o.probability_up = c["probability_up"].get<double>();
        const auto st = c.value("status", std::string{});
        o.status = st=="ok" ? strategy::ComponentStatus::Ok
                 : st=="failed" ? strategy::ComponentStatus::Failed
                 : st=="unavailable" ? strategy::ComponentStatus::Unavailable
                 : strategy::ComponentStatus::Skipped;
        o.error = c.value("error", std::string{});
        d.components.push_back(std::move(o));
    }
    return d;
}

JsonTableStore::JsonTableStore(std::string dir, const feat::FeatureContract& contract)
    : dir_(std::move(dir)), contract_(contract) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw PipelineError(fmt::format("cannot create store dir '{}': {}", dir_, ec.message()));

    for (const char* t : {"market_data", "article_scores", "market_indicators", "news_sentiment",
                          "model_features", "price_predictions"})
        docs_[t] = read_table(t);

    for (const auto& row : docs_["market_data"]) {
        auto o = decode_market(row);
        market_[o.date] = o;
    }
    const auto& articles = docs_["article_scores"];
    for (auto it = articles.begin(); it != articles.end(); ++it)
        articles_[parse_date(it.key())] = it.value().get<std::vector<double>>();
    for (const auto& row : docs_["market_indicators"]) {
        auto r = decode_indicator(row);
        indicators_[r.date] = r;
    }
    for (const auto& row : docs_["news_sentiment"]) {
        auto r = decode_sentiment(row);
        sentiment_[r.date] = r;
    }
    for (const auto& row : docs_["model_features"]) {
        auto r = decode_feature(row, contract_);
        features_[r.date] = r;
    }
    for (const auto& row : docs_["price_predictions"]) {
        auto d = decode_decision(row);
        decisions_[d.target_date] = d;
    }
    spdlog::info("store '{}': {} market rows, {} article days, {} feature rows, {} predictions",
                 dir_, market_.size(), articles_.size(), features_.size(), decisions_.size());
}

std::string JsonTableStore::path(const std::string& table) const {
    return (fs::path(dir_) / (table + ".json")).string();
}

json JsonTableStore::read_table(const std::string& table) const {
    std::ifstream f(path(table));
    if (!f.good()) return json::object();
    try {
        return json::parse(f);
    } catch (const json::parse_error& e) {
        throw PipelineError(fmt::format("table '{}' is corrupt: {}", path(table), e.what()));
    }
}

void JsonTableStore::write_table(const std::string& table, const json& j) const {
    const std::string p = path(table);
    const std::string tmp = p + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.good()) throw UpstreamWriteFailure(fmt::format("cannot open '{}' for writing", tmp));
        f << j.dump(1);
        if (!f.good()) throw UpstreamWriteFailure(fmt::format("write to '{}' failed", tmp));
    }
    std::error_code ec;
    fs::rename(tmp, p, ec);
    if (ec) throw UpstreamWriteFailure(fmt::format("rename '{}' failed: {}", p, ec.message()));
}

void JsonTableStore::stage(const std::string& table, Date date, json row){
    auto& doc = docs_[table];
    const std::string key = to_string_date(date);
    std::optional<json> old;
    if (auto it = doc.find(key); it != doc.end()) old = *it;

    if (row.is_null()) doc.erase(key);
    else doc[key] = std::move(row);

    if (batching_){
        dirty_.insert(table);
        return;
    }
    try {
        write_table(table, doc);
    } catch (const UpstreamWriteFailure&) {
        // visszaállítás, hogy a memória és a fájl ne térjen el
        if (old) doc[key] = std::move(*old);
        else doc.erase(key);
        throw;
    }
}

void JsonTableStore::begin_batch(){ batching_ = true; }

void JsonTableStore::flush(){
    batching_ = false;
    for (auto it = dirty_.begin(); it != dirty_.end(); ){
        write_table(*it, docs_.at(*it));
        it = dirty_.erase(it);
    }
}

// A memória csak sikeres staging után frissül
void JsonTableStore::upsert_market(const DailyMarketObservation& o){
    stage("market_data", o.date, encode(o));
    MemoryTableStore::upsert_market(o);
}

void JsonTableStore::upsert_article_scores(Date date, const std::vector<double>& scores){
    stage("article_scores", date, json(scores));
    MemoryTableStore::upsert_article_scores(date, scores);
}

void JsonTableStore::upsert_indicator(const ind::DailyIndicatorRow& r){
    stage("market_indicators", r.date, encode(r));
    MemoryTableStore::upsert_indicator(r);
}

void JsonTableStore::upsert_sentiment(const sent::DailySentimentRow& r){
    stage("news_sentiment", r.date, encode(r));
    MemoryTableStore::upsert_sentiment(r);
}

void JsonTableStore::upsert_feature(const feat::FeatureRow& r){
    stage("model_features", r.date, encode(r, contract_));
    MemoryTableStore::upsert_feature(r);
}

void JsonTableStore::erase_feature(Date date){
    if (!features_.count(date)) return;
    stage("model_features", date, json(nullptr));
    MemoryTableStore::erase_feature(date);
}

void JsonTableStore::upsert_decision(const strategy::EnsembleDecision& d){
    stage("price_predictions", d.target_date, encode(d));
    MemoryTableStore::upsert_decision(d);
}

} // namespace data
