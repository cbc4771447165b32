#pragma once
#include <map>
#include <vector>
#include "indicators/rolling.hpp"

namespace ind {

// Hiányok pótlása (helyben). A visszatérési érték: hány elemet töltött ki.
std::size_t fill_forward(Series& v);
std::size_t fill_backward(Series& v);
// Csak belső hiányok: két ismert pont között lineárisan, pozíció szerint
std::size_t interpolate_linear(Series& v);

bool all_null(const Series& v);

// Referencia zárók átvitele az elsődleges naptárra:
// reindex -> ffill -> lineáris interpoláció -> bfill (vezető hiány).
// Ha a referenciának nincs egyetlen értéke sem, csupa null sort ad.
Series align_to_calendar(const std::vector<Date>& calendar,
                         const std::map<Date, double>& values);

} // namespace ind
