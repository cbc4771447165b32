#include "strategy/ensemble.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace strategy {

FeatureMatrix build_window(const FeatureMatrix& rows, std::size_t n){
    if (rows.empty()) throw std::invalid_argument("build_window: no rows");
    const std::size_t take = std::min(n, rows.size());
    FeatureMatrix out;
    out.reserve(n);
    const auto first = rows.end() - static_cast<std::ptrdiff_t>(take);
    // bal oldali kitöltés a legkorábbi elérhető sorral, soha nem jövőbeli sorral
    for (std::size_t k=take; k<n; ++k) out.push_back(*first);
    out.insert(out.end(), first, rows.end());
    return out;
}

EnsembleEngine::EnsembleEngine(EnsembleConfig cfg, const feat::FeatureContract& contract,
                               std::optional<StandardScaler> scaler)
    : cfg_(cfg), contract_(contract), scaler_(std::move(scaler)) {}

void EnsembleEngine::add_component(ComponentSlot slot){
    if (slot.weight < 0.0 || !std::isfinite(slot.weight))
        throw PipelineError(fmt::format("component {}: weight must be non-negative", slot.id));
    slots_.push_back(std::move(slot));
}

std::size_t EnsembleEngine::rows_needed() const {
    std::size_t n = cfg_.window_size;
    for (const auto& s : slots_)
        if (s.model && s.model->shape().kind==InputKind::Window) n = std::max(n, s.model->shape().rows);
    return n;
}

ComponentOutput EnsembleEngine::invoke(const ComponentSlot& slot,
                                       const std::vector<feat::FeatureRow>& rows) const {
    ComponentOutput out;
    out.id = slot.id;
    out.weight = slot.weight;
    if (slot.weight<=0.0){
        out.status = ComponentStatus::Skipped;
        return out;
    }
    if (!slot.model){
        out.status = ComponentStatus::Unavailable;
        out.error = slot.unavailable_reason;
        spdlog::warn("ensemble: component {} unavailable: {}", slot.id, slot.unavailable_reason);
        return out;
    }

    try {
        const auto idx = slot.aliases.resolve(slot.model->input_names(), contract_);
        const InputShape shape = slot.model->shape();
        const std::size_t n = shape.kind==InputKind::SingleRow ? 1 : shape.rows;
        const std::size_t take = std::min(n, rows.size());

        FeatureMatrix projected;
        for (auto it = rows.end() - static_cast<std::ptrdiff_t>(take); it != rows.end(); ++it){
            std::vector<double> v;
            v.reserve(idx.size());
            for (std::size_t i : idx) v.push_back(it->values.at(i));
            if (slot.scaled){
                if (!scaler_) throw PipelineError("component requires scaling but no scaler is loaded");
                v = scaler_->transform(v);
            }
            projected.push_back(std::move(v));
        }
        if (take < n)
            spdlog::warn("ensemble: {} needs {} rows, only {} available; left-padding with the earliest row",
                         slot.id, n, take);

        const FeatureMatrix x = shape.kind==InputKind::SingleRow ? projected : build_window(projected, n);
        const double p = slot.model->predict(x);
        if (!std::isfinite(p) || p<0.0 || p>1.0)
            throw PipelineError(fmt::format("probability out of range: {}", p));

        out.probability_up = p;
        out.status = ComponentStatus::Ok;
        spdlog::info("ensemble: {} ({}) p_up={:.4f} weight={}", slot.id, shape.str(), p, slot.weight);
    } catch (const UnresolvedFeatureAlias& e) {
        out.status = ComponentStatus::Failed;
        out.error = e.what();
        spdlog::error("ensemble: component {} excluded: {}", slot.id, e.what());
    } catch (const std::exception& e) {
        out.status = ComponentStatus::Failed;
        out.error = e.what();
        spdlog::error("ensemble: component {} failed: {}", slot.id, e.what());
    }
    return out;
}

EnsembleDecision EnsembleEngine::predict(const std::vector<feat::FeatureRow>& rows) const {
    if (rows.empty()) throw MissingUpstreamData("ensemble: no feature rows to predict from");
    for (std::size_t i=0;i<rows.size();++i){
        if (rows[i].values.size()!=contract_.size())
            throw PipelineError(fmt::format("feature row {} has {} values, contract {} has {}",
                                            to_string_date(rows[i].date), rows[i].values.size(),
                                            contract_.version(), contract_.size()));
        if (i>0 && rows[i].date<=rows[i-1].date)
            throw std::invalid_argument("ensemble: feature rows must be in ascending date order");
    }

    std::vector<ComponentOutput> outputs;
    outputs.reserve(slots_.size());
    for (const auto& s : slots_) outputs.push_back(invoke(s, rows));

    auto d = decide(rows.back().date, std::move(outputs), cfg_.threshold);
    spdlog::info("ensemble: prediction for {}: {} p_up={:.4f} confidence={:.4f}",
                 to_string_date(d.target_date), to_string(d.direction), d.probability_up, d.confidence);
    return d;
}

} // namespace strategy
