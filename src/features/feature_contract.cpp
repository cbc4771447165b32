#include "features/feature_contract.hpp"
#include "core/errors.hpp"
#include <stdexcept>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace feat {

FeatureContract::FeatureContract(std::string version, std::vector<std::string> names)
    : version_(std::move(version)), names_(std::move(names)) {
    for (std::size_t i=0;i<names_.size();++i){
        if (!index_.emplace(names_[i], i).second)
            throw std::invalid_argument(fmt::format("feature contract {}: duplicate name '{}'",
                                                    version_, names_[i]));
    }
}

const FeatureContract& FeatureContract::v13() {
    static const FeatureContract c{"v13", {
        "btc_nasdaq_beta_10d",
        "sent_q5_flag",
        "roc_1d",
        "high_low_range",
        "roc_3d",
        "sent_5d",
        "sent_cross_up_x_high_low_range",
        "btc_nasdaq_corr_5d",
        "bb_width",
        "sent_accel",
        "sent_vol",
        "sent_neg_x_high_low_range",
        "sent_q2_flag_x_close_to_sma10",
    }};
    return c;
}

std::optional<std::size_t> FeatureContract::index_of(const std::string& name) const {
    auto it = index_.find(name);
    if (it==index_.end()) return std::nullopt;
    return it->second;
}

std::vector<double> FeatureContract::extract(const std::map<std::string, OptDouble>& named,
                                             Date date) const {
    std::vector<double> out;
    out.reserve(names_.size());
    std::vector<std::string> missing;
    for (const auto& n : names_){
        auto it = named.find(n);
        if (it==named.end() || !it->second) { missing.push_back(n); continue; }
        out.push_back(*it->second);
    }
    if (!missing.empty()){
        const auto msg = fmt::format("{}: null contract features [{}]",
                                     to_string_date(date), fmt::join(missing, ", "));
        throw IncompleteFeatureRow(msg, std::move(missing));
    }
    return out;
}

} // namespace feat
