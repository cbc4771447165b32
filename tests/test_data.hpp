#pragma once
#include <cmath>
#include <map>
#include <vector>
#include "core/types.hpp"

// Szintetikus, determinisztikus bemenetek a tesztekhez
namespace testdata {

inline DailyMarketObservation market_day(Date d, std::size_t i, bool refs = true) {
    const double x = static_cast<double>(i);
    DailyMarketObservation o;
    o.date   = d;
    o.close  = 100.0 + 10.0 * std::sin(x * 0.3) + 0.5 * x;
    o.open   = o.close - 0.5 * std::cos(x * 0.5);
    o.high   = o.close * (1.01 + 0.005 * std::sin(x));
    o.low    = o.close * (0.99 - 0.004 * std::cos(x));
    o.volume = 1000.0 + 100.0 * std::sin(x * 0.11);
    if (refs) {
        o.reference_close["nasdaq"] = 1000.0 + 30.0 * std::sin(x * 0.7 + 1.0) + x;
        o.reference_close["gld"]    = 50.0 + std::cos(x * 0.2);
    }
    return o;
}

inline std::vector<DailyMarketObservation> market(Date start, std::size_t n, bool refs = true) {
    std::vector<DailyMarketObservation> out;
    for (std::size_t i = 0; i < n; ++i) out.push_back(market_day(start + static_cast<Date>(i), i, refs));
    return out;
}

// Cikk pontszámok; minden 7. napon (i%7==3) nincs cikk
inline std::map<Date, std::vector<double>> articles(Date start, std::size_t n) {
    std::map<Date, std::vector<double>> out;
    for (std::size_t i = 0; i < n; ++i) {
        if (i % 7 == 3) continue;
        const double x = static_cast<double>(i);
        out[start + static_cast<Date>(i)] = {0.6 * std::sin(x * 0.9), 0.3 * std::cos(x * 0.4)};
    }
    return out;
}

} // namespace testdata
