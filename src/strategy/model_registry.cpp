#include "strategy/model_registry.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace strategy {

static std::string join_path(const std::string& dir, const std::string& file){
    if (dir.empty() || dir.back()=='/') return dir + file;
    return dir + "/" + file;
}

std::shared_ptr<const EnsembleEngine> load_ensemble(const std::string& model_dir,
                                                    const EnsembleConfig& defaults,
                                                    const feat::FeatureContract& contract){
    const std::string cfg_path = join_path(model_dir, "ensemble_config.json");
    std::ifstream f(cfg_path);
    if (!f.good()) throw PipelineError(fmt::format("ensemble config '{}' not found", cfg_path));

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw PipelineError(fmt::format("ensemble config '{}': {}", cfg_path, e.what()));
    }

    const std::string contract_version = j.value("feature_contract", contract.version());
    if (contract_version != contract.version())
        throw PipelineError(fmt::format("ensemble trained on feature contract {}, pipeline uses {}",
                                        contract_version, contract.version()));

    EnsembleConfig cfg = defaults;
    cfg.threshold   = j.value("threshold", cfg.threshold);
    if (j.contains("window_size")){
        const auto& w = j["window_size"];
        if (!w.is_number_integer() || w.get<long long>() < 1)
            throw PipelineError(fmt::format("ensemble config '{}': window_size must be a positive integer", cfg_path));
        cfg.window_size = w.get<std::size_t>();
    }

    std::optional<StandardScaler> scaler;
    if (j.contains("scaler") && j["scaler"].is_string()){
        const std::string path = join_path(model_dir, j["scaler"].get<std::string>());
        try {
            scaler = StandardScaler::load(path);
            spdlog::info("ensemble: loaded scaler {} ({} features)", path, scaler->size());
        } catch (const std::exception& e) {
            // skálázót igénylő komponensek ekkor egyenként hibáznak
            spdlog::warn("ensemble: scaler not loaded: {}", e.what());
        }
    }

    auto engine = std::make_shared<EnsembleEngine>(cfg, contract, std::move(scaler));

    for (const auto& c : j.at("components")){
        ComponentSlot slot;
        slot.id     = c.at("id").get<std::string>();
        slot.weight = c.value("weight", 0.0);
        slot.scaled = c.value("scaled", false);
        slot.aliases = AliasTable::from_json(c.value("aliases", json::object()));
        const InputShape shape = InputShape::parse(c.value("shape", std::string("single_row")));

        const std::string artifact = join_path(model_dir, c.at("artifact").get<std::string>());
        try {
            slot.model = load_model_artifact(artifact, slot.id, shape);
            spdlog::info("ensemble: loaded {} ({}, weight {}) from {}", slot.id, shape.str(), slot.weight, artifact);
        } catch (const std::exception& e) {
            slot.unavailable_reason = e.what();
            spdlog::warn("ensemble: component {} unavailable: {}", slot.id, e.what());
        }
        engine->add_component(std::move(slot));
    }

    if (engine->components().empty())
        throw PipelineError(fmt::format("ensemble config '{}' lists no components", cfg_path));
    spdlog::info("ensemble: {} components, threshold {}, window {}",
                 engine->components().size(), cfg.threshold, cfg.window_size);
    return engine;
}

ModelRegistry& ModelRegistry::instance(){
    static ModelRegistry r;
    return r;
}

std::shared_ptr<const EnsembleEngine> ModelRegistry::get(const std::string& model_dir,
                                                         const EnsembleConfig& defaults,
                                                         const feat::FeatureContract& contract){
    // ugyanaz a könyvtár más alapértékkel vagy kontrakttal külön példány
    const std::string key = fmt::format("{}|{}|{}|{}", model_dir, contract.version(),
                                        defaults.threshold, defaults.window_size);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = loaded_.find(key);
    if (it!=loaded_.end()) return it->second;
    auto e = load_ensemble(model_dir, defaults, contract);
    loaded_.emplace(key, e);
    return e;
}

} // namespace strategy
