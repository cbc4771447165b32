#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "features/feature_contract.hpp"

namespace strategy {

// Tanításkori oszlopnév -> kontrakt mezőnév. Explicit tábla, nincs
// kisbetűsítés vagy egyéb "okos" egyeztetés futásidőben.
class AliasTable {
public:
    AliasTable() = default;
    explicit AliasTable(std::map<std::string, std::string> aliases, std::string version = {});

    void add(const std::string& model_name, const std::string& contract_name);

    // Minden kért névhez a kontrakt indexe. Feloldási sorrend: alias
    // bejegyzés, majd pontos egyezés a kontraktban. Bármely hiány esetén
    // UnresolvedFeatureAlias az összes hiányzó névvel.
    std::vector<std::size_t> resolve(const std::vector<std::string>& required,
                                     const feat::FeatureContract& contract) const;

    const std::string& version() const { return version_; }
    std::size_t size() const { return aliases_.size(); }

    // {"version": "...", "aliases": {"ROC_1d": "roc_1d", ...}} vagy sima objektum
    static AliasTable from_json(const nlohmann::json& j);

private:
    std::map<std::string, std::string> aliases_;
    std::string version_;
};

} // namespace strategy
