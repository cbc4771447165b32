#pragma once
#include <map>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace data {

// date,open,high,low,close,volume[,<ref>...]
// A fejléc kötelező; a további oszlopok neve a referencia kulcs (pl. nasdaq),
// üres cella -> aznap nincs referencia záró. A dátumból az első 10 karakter számít.
std::vector<DailyMarketObservation> load_market_csv(const std::string& path);

// date,score - cikkenként egy sor, a score [-1,1]-re vágva
std::map<Date, std::vector<double>> load_article_scores_csv(const std::string& path);

} // namespace data
