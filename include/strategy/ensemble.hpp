#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/module.hpp"
#include "features/feature_contract.hpp"
#include "strategy/alias_table.hpp"
#include "strategy/decision.hpp"
#include "strategy/models.hpp"

namespace strategy {

// Egy konfigurált komponens. model==nullptr -> nem elérhető (pl. hiányzó artefakt).
struct ComponentSlot {
    std::string id;
    double weight{0.0};
    AliasTable aliases;
    bool scaled{false};
    std::shared_ptr<const IModelComponent> model;
    std::string unavailable_reason;
};

// Az utolsó n sor időrendben; ha kevesebb van, a legkorábbit ismétli elöl.
// Üres bemenetre std::invalid_argument.
FeatureMatrix build_window(const FeatureMatrix& rows, std::size_t n);

class EnsembleEngine {
public:
    EnsembleEngine(EnsembleConfig cfg, const feat::FeatureContract& contract,
                   std::optional<StandardScaler> scaler = std::nullopt);

    void add_component(ComponentSlot slot);
    const std::vector<ComponentSlot>& components() const { return slots_; }
    const EnsembleConfig& config() const { return cfg_; }

    // Hány feature sort kér a hívótól (legnagyobb ablak vagy window_size)
    std::size_t rows_needed() const;

    // rows: időrendben, az utolsó a legfrissebb. A hibázó / nem elérhető
    // komponens kimarad; ha egy sem marad, NoViableModelComponents.
    EnsembleDecision predict(const std::vector<feat::FeatureRow>& rows) const;

private:
    ComponentOutput invoke(const ComponentSlot& slot, const std::vector<feat::FeatureRow>& rows) const;

    EnsembleConfig cfg_;
    feat::FeatureContract contract_;
    std::optional<StandardScaler> scaler_;
    std::vector<ComponentSlot> slots_;
};

} // namespace strategy
