#pragma once
#include <map>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"

namespace ind {

// Egy nap származtatott indikátorai. A values kulcsai pontosan a
// táblázat columns listája; a definiálatlan érték nullopt.
struct DailyIndicatorRow {
    Date date{};
    double close{};
    std::map<std::string, OptDouble> values;

    OptDouble get(const std::string& col) const {
        auto it = values.find(col);
        return it==values.end() ? std::nullopt : it->second;
    }
};

struct IndicatorTable {
    std::vector<std::string> columns;
    std::vector<DailyIndicatorRow> rows;
    // referenciák, amelyeknek egyáltalán nem volt adata -> oszlopaik kimaradnak
    std::vector<std::string> missing_references;
};

class IndicatorEngine {
public:
    explicit IndicatorEngine(IndicatorConfig cfg = {});

    // Dátum szerint rendez, duplikált napból az utolsót tartja.
    // Csak azok a napok kerülnek ki, ahol minden gördülő ablak megtelt.
    IndicatorTable compute(std::vector<DailyMarketObservation> obs) const;

    // Hány sor előzmény kell az első kiadott sor előtt
    std::size_t warmup_rows() const;

    std::string sma_ratio_column() const;
    std::string corr_column(const std::string& ref) const;
    std::string beta_column(const std::string& ref) const;

    const IndicatorConfig& config() const { return cfg_; }

private:
    IndicatorConfig cfg_;
};

} // namespace ind
