#pragma once
#include <optional>
#include <string>
#include <vector>
#include <fmt/format.h>
#include "core/errors.hpp"
#include "core/types.hpp"

namespace strategy {

enum class ComponentStatus { Ok, Failed, Unavailable, Skipped };

inline const char* to_string(ComponentStatus s) {
    switch (s) {
        case ComponentStatus::Ok:          return "ok";
        case ComponentStatus::Failed:      return "failed";
        case ComponentStatus::Unavailable: return "unavailable";
        default:                           return "skipped";
    }
}

// Egy komponens nyers kimenete (audit)
struct ComponentOutput {
    std::string id;
    double weight{0.0};
    std::optional<double> probability_up;
    ComponentStatus status{ComponentStatus::Skipped};
    std::string error;
};

struct EnsembleDecision {
    Date feature_date{};             // a bemeneti feature sor napja
    Date target_date{};              // a jósolt nap (feature_date + 1)
    Direction direction{Direction::Down};
    double probability_up{0.0};
    double confidence{0.0};          // a nyertes osztály valószínűsége
    double threshold{0.5};
    std::vector<ComponentOutput> components;
};

// Súlyozott átlag a sikeres komponenseken, a ténylegesen kimenetet adó
// komponensek súlyösszegével normálva. Nincs ilyen -> NoViableModelComponents,
// alapértelmezett irány nincs.
inline EnsembleDecision decide(Date feature_date, std::vector<ComponentOutput> outputs,
                               double threshold){
    double sumw=0.0, acc=0.0;
    for (const auto& o : outputs){
        if (o.status!=ComponentStatus::Ok || !o.probability_up || o.weight<=0.0) continue;
        acc  += o.weight * *o.probability_up;
        sumw += o.weight;
    }
    if (sumw<=0.0){
        std::string why;
        for (const auto& o : outputs)
            why += fmt::format("{}{}={}{}", why.empty()? "" : ", ", o.id, to_string(o.status),
                               o.error.empty()? "" : " (" + o.error + ")");
        throw NoViableModelComponents(fmt::format("no model component produced a prediction for {}: [{}]",
                                                  to_string_date(feature_date), why));
    }

    EnsembleDecision d;
    d.feature_date   = feature_date;
    d.target_date    = feature_date + 1;
    d.probability_up = acc/sumw;
    d.threshold      = threshold;
    d.direction      = d.probability_up >= threshold ? Direction::Up : Direction::Down;
    d.confidence     = d.direction==Direction::Up ? d.probability_up : 1.0 - d.probability_up;
    d.components     = std::move(outputs);
    return d;
}

} // namespace strategy
