#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "features/feature_contract.hpp"
#include "indicators/indicator_engine.hpp"
#include "sentiment/sentiment_aggregator.hpp"

namespace feat {

struct AssemblyResult {
    std::vector<FeatureRow> rows;   // csak teljes (kontrakt szerint nem-null) sorok
    std::size_t joined{0};          // indikátor + szentiment mindkettő megvolt
    std::size_t dropped{0};         // join után hiányos -> kimaradt
    std::vector<Date> dropped_dates;
};

// Indikátor és szentiment sorok belső join-ja dátumra, interakciós
// feature-ök, célváltozó, kontrakt szerinti kivonat.
class FeatureAssembler {
public:
    explicit FeatureAssembler(const FeatureContract& contract, std::size_t sma_window = 10);

    // Egy nap összes elnevezett értéke (indikátor + szentiment + interakciók)
    std::map<std::string, OptDouble> named_values(const ind::DailyIndicatorRow& i,
                                                  const sent::DailySentimentRow& s) const;

    AssemblyResult assemble(const std::vector<ind::DailyIndicatorRow>& indicators,
                            const std::vector<sent::DailySentimentRow>& sentiment) const;

    const FeatureContract& contract() const { return contract_; }

private:
    const FeatureContract& contract_;
    std::string sma_ratio_col_;
    std::string q2_x_sma_col_;
};

} // namespace feat
