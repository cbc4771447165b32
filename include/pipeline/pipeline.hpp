#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include "core/config.hpp"
#include "data/table_store.hpp"
#include "features/feature_assembler.hpp"
#include "strategy/ensemble.hpp"

namespace pipeline {

// Egy assemble futás összesítője
struct AssemblyReport {
    std::vector<feat::FeatureRow> rows;     // az újraszámolt ablak sorai
    std::optional<Date> watermark;          // futás előtti legutolsó perzisztált nap
    Date rederive_from{};
    std::size_t joined{0};
    std::size_t dropped{0};
    std::vector<Date> dropped_dates;        // az ablakban hiányos, ezért nem (újra)írt napok
    std::size_t erased{0};                  // korábban perzisztált, most érvénytelen sorok
    std::size_t written{0};
    std::size_t failed{0};                  // írás ismétlés után is sikertelen
};

// A tárolóra épülő napi ciklus: feature tábla frissítése és a másnapi döntés.
// Egyszerre legfeljebb egy futás lehet aktív ugyanazon a tárolón.
class Pipeline {
public:
    Pipeline(PipelineConfig cfg, data::TableStore& store,
             const feat::FeatureContract& contract = feat::FeatureContract::v13());

    // update_only=false -> teljes újraszámolás.
    // update_only=true  -> a watermark előtti buffer naptól írunk felül.
    // Az újraszámolt ablakban a már nem teljes napok korábbi sorai törlődnek.
    // Üres piaci / cikk bemenetre MissingUpstreamData.
    AssemblyReport assemble_features(bool update_only);

    // A legutolsó as_of-ig (bezárólag) létező feature sor(ok)ból.
    // Nincs sor -> MissingUpstreamData; minden komponens hibázik -> NoViableModelComponents.
    strategy::EnsembleDecision predict_next_day(Date as_of, const strategy::EnsembleEngine& engine);

    const PipelineConfig& config() const { return cfg_; }

private:
    template <class F>
    bool upsert_with_retry(const char* table, Date date, F&& write) const;

    PipelineConfig cfg_;
    data::TableStore& store_;
    const feat::FeatureContract& contract_;
};

} // namespace pipeline
