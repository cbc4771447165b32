#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace feat {

// Rögzített, verziózott, rendezett feature lista
class FeatureContract {
public:
    FeatureContract(std::string version, std::vector<std::string> names);

    // A kanonikus 13 mezős kontrakt
    static const FeatureContract& v13();

    const std::string& version() const { return version_; }
    const std::vector<std::string>& names() const { return names_; }
    std::size_t size() const { return names_.size(); }
    std::optional<std::size_t> index_of(const std::string& name) const;

    // Névvel adott értékekből a kontrakt sorrendjében; ha bármelyik hiányzik
    // vagy null, IncompleteFeatureRow-t dob a hiányzó nevek listájával.
    std::vector<double> extract(const std::map<std::string, OptDouble>& named, Date date) const;

private:
    std::string version_;
    std::vector<std::string> names_;
    std::map<std::string, std::size_t> index_;
};

// A perzisztencia és az ensemble egysége
struct FeatureRow {
    Date date{};
    std::vector<double> values;     // kontrakt sorrend
    std::optional<int> target;      // csak history sorokon: close[t+1] > close[t]

    bool operator==(const FeatureRow& o) const {
        return date==o.date && values==o.values && target==o.target;
    }
};

} // namespace feat
