#pragma once
#include <cstddef>
#include <optional>
#include "indicators/rolling.hpp"

namespace ind {

struct BB { double mid, upper, lower; };

// Sáv az i. elemre végződő p hosszú ablakon (minta szórás); nem teljes ablak -> nullopt
std::optional<BB> compute_bb(const Series& v, std::size_t i, std::size_t p=20, double k=2.0);

// (upper - lower) / mid, azaz 2k*sd/mid; mid==0 -> null
Series bb_width(const Series& closes, std::size_t p=20, double k=2.0);

} // namespace ind
