#include "strategy/alias_table.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace strategy {

AliasTable::AliasTable(std::map<std::string, std::string> aliases, std::string version)
    : aliases_(std::move(aliases)), version_(std::move(version)) {}

void AliasTable::add(const std::string& model_name, const std::string& contract_name){
    aliases_[model_name] = contract_name;
}

std::vector<std::size_t> AliasTable::resolve(const std::vector<std::string>& required,
                                             const feat::FeatureContract& contract) const {
    std::vector<std::size_t> idx;
    idx.reserve(required.size());
    std::vector<std::string> missing;
    for (const auto& name : required){
        auto a = aliases_.find(name);
        const std::string& target = a!=aliases_.end() ? a->second : name;
        if (auto i = contract.index_of(target)) idx.push_back(*i);
        else missing.push_back(a!=aliases_.end() ? fmt::format("{} -> {}", name, target) : name);
    }
    if (!missing.empty()){
        const auto msg = fmt::format("unresolved model inputs for contract {}: [{}]",
                                     contract.version(), fmt::join(missing, ", "));
        throw UnresolvedFeatureAlias(msg, std::move(missing));
    }
    return idx;
}

AliasTable AliasTable::from_json(const nlohmann::json& j){
    AliasTable t;
    if (j.is_null()) return t;
    const auto& m = j.contains("aliases") ? j.at("aliases") : j;
    if (!m.is_object())
        throw PipelineError("alias table must be a JSON object");
    t.version_ = j.value("version", std::string{});
    for (auto it = m.begin(); it != m.end(); ++it){
        if (it.key()=="version") continue;
        t.aliases_[it.key()] = it.value().get<std::string>();
    }
    return t;
}

} // namespace strategy
