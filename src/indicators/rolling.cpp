#include "indicators/rolling.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

Series to_series(const std::vector<double>& v){
    Series s; s.reserve(v.size());
    for (double x : v) s.emplace_back(std::isfinite(x) ? OptDouble{x} : std::nullopt);
    return s;
}

OptDouble window_mean(const Series& v, std::size_t i, std::size_t p){
    if (p==0 || i>=v.size() || i+1<p) return std::nullopt;
    double s=0.0;
    for (std::size_t k=i+1-p; k<=i; ++k){
        if (!v[k]) return std::nullopt;
        s += *v[k];
    }
    return s/static_cast<double>(p);
}

OptDouble window_var(const Series& v, std::size_t i, std::size_t p){
    if (p<2) return std::nullopt;
    const auto m = window_mean(v, i, p);
    if (!m) return std::nullopt;
    double ss=0.0;
    for (std::size_t k=i+1-p; k<=i; ++k){ const double d=*v[k]-*m; ss+=d*d; }
    return ss/static_cast<double>(p-1);
}

OptDouble window_cov(const Series& x, const Series& y, std::size_t i, std::size_t p){
    if (p<2 || x.size()!=y.size()) return std::nullopt;
    const auto mx = window_mean(x, i, p);
    const auto my = window_mean(y, i, p);
    if (!mx || !my) return std::nullopt;
    double s=0.0;
    for (std::size_t k=i+1-p; k<=i; ++k) s += (*x[k]-*mx)*(*y[k]-*my);
    return s/static_cast<double>(p-1);
}

Series rolling_mean(const Series& v, std::size_t p){
    Series out(v.size());
    for (std::size_t i=0;i<v.size();++i) out[i] = window_mean(v, i, p);
    return out;
}

Series rolling_var(const Series& v, std::size_t p){
    Series out(v.size());
    for (std::size_t i=0;i<v.size();++i) out[i] = window_var(v, i, p);
    return out;
}

Series rolling_std(const Series& v, std::size_t p){
    Series out(v.size());
    for (std::size_t i=0;i<v.size();++i){
        const auto var = window_var(v, i, p);
        if (var) out[i] = std::sqrt(std::max(0.0, *var));
    }
    return out;
}

Series rolling_cov(const Series& x, const Series& y, std::size_t p){
    Series out(x.size());
    for (std::size_t i=0;i<x.size();++i) out[i] = window_cov(x, y, i, p);
    return out;
}

Series rolling_corr(const Series& x, const Series& y, std::size_t p){
    Series out(x.size());
    for (std::size_t i=0;i<x.size();++i){
        const auto c  = window_cov(x, y, i, p);
        const auto vx = window_var(x, i, p);
        const auto vy = window_var(y, i, p);
        if (!c || !vx || !vy) continue;
        const double den = std::sqrt(*vx) * std::sqrt(*vy);
        // nulla szórás -> definiálatlan
        if (den <= 0.0) continue;
        out[i] = *c/den;
    }
    return out;
}

Series pct_change(const Series& v, std::size_t k){
    Series out(v.size());
    for (std::size_t i=k;i<v.size();++i){
        if (!v[i] || !v[i-k] || *v[i-k]==0.0) continue;
        out[i] = *v[i] / *v[i-k] - 1.0;
    }
    return out;
}

Series divide(const Series& a, const Series& b){
    Series out(a.size());
    for (std::size_t i=0;i<a.size() && i<b.size();++i){
        if (!a[i] || !b[i] || *b[i]==0.0) continue;
        out[i] = *a[i] / *b[i];
    }
    return out;
}

Series scale(const Series& v, double k){
    Series out(v.size());
    for (std::size_t i=0;i<v.size();++i) if (v[i]) out[i] = *v[i]*k;
    return out;
}

} // namespace ind
