#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "core/config.hpp"
#include "features/feature_contract.hpp"
#include "strategy/ensemble.hpp"

namespace strategy {

// Az artefakt könyvtár ensemble_config.json-jából felépíti a motort.
// Hiányzó / hibás modell artefakt -> a komponens "unavailable" marad,
// a config hibája (vagy eltérő kontrakt) kivételt dob.
std::shared_ptr<const EnsembleEngine> load_ensemble(const std::string& model_dir,
                                                    const EnsembleConfig& defaults,
                                                    const feat::FeatureContract& contract);

// Folyamatonként egyszeri, idempotens betöltés (könyvtár, kontrakt, alapértékek) szerint
class ModelRegistry {
public:
    static ModelRegistry& instance();

    std::shared_ptr<const EnsembleEngine> get(const std::string& model_dir,
                                              const EnsembleConfig& defaults,
                                              const feat::FeatureContract& contract);

private:
    ModelRegistry() = default;
    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    std::mutex mtx_;
    std::map<std::string, std::shared_ptr<const EnsembleEngine>> loaded_;
};

} // namespace strategy
