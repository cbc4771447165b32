#include "indicators/bollinger.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

std::optional<BB> compute_bb(const Series& v, std::size_t i, std::size_t p, double k){
    const auto mid = window_mean(v, i, p);
    const auto var = window_var(v, i, p);
    if (!mid || !var) return std::nullopt;
    const double sd = std::sqrt(std::max(0.0, *var));
    return BB{*mid, *mid + k*sd, *mid - k*sd};
}

Series bb_width(const Series& closes, std::size_t p, double k){
    Series out(closes.size());
    for (std::size_t i=0;i<closes.size();++i){
        const auto bb = compute_bb(closes, i, p, k);
        if (!bb || bb->mid==0.0) continue;
        out[i] = (bb->upper - bb->lower) / bb->mid;
    }
    return out;
}

} // namespace ind
