#pragma once
#include <cstddef>
#include <vector>
#include "core/types.hpp"

namespace ind {

// Idősor, ahol a hiányzó érték nullopt
using Series = std::vector<OptDouble>;

Series to_series(const std::vector<double>& v);

// Gördülő statisztikák a [i+1-p, i] ablakon. Ha az ablak nem teljes vagy
// null-t tartalmaz, az eredmény null. Minden ablakot önállóan számolunk
// (nincs futó összeg), így az érték nem függ a batch kezdetétől.
OptDouble window_mean(const Series& v, std::size_t i, std::size_t p);
OptDouble window_var(const Series& v, std::size_t i, std::size_t p);   // minta variancia (n-1)
OptDouble window_cov(const Series& x, const Series& y, std::size_t i, std::size_t p);

Series rolling_mean(const Series& v, std::size_t p);
Series rolling_std(const Series& v, std::size_t p);
Series rolling_var(const Series& v, std::size_t p);
Series rolling_cov(const Series& x, const Series& y, std::size_t p);
Series rolling_corr(const Series& x, const Series& y, std::size_t p);

// (v[i]/v[i-k] - 1); v[i-k]==0 -> null
Series pct_change(const Series& v, std::size_t k);

// a/b elemenként; b==0 -> null
Series divide(const Series& a, const Series& b);
Series scale(const Series& v, double k);

} // namespace ind
