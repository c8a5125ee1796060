#include "tools/capability_registry.hpp"

#include <algorithm>

#include "utils/logging.hpp"

namespace codebox::tools {

using codebox::utils::Log;
using codebox::utils::LogLevel;

void CapabilityRegistry::Register(std::unique_ptr<Capability> capability) {
    auto name = capability->Name();
    capabilities_.insert_or_assign(std::move(name), std::move(capability));
}

Capability* CapabilityRegistry::Get(const std::string& name) {
    auto it = capabilities_.find(name);
    if (it == capabilities_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool CapabilityRegistry::Has(const std::string& name) const {
    return capabilities_.find(name) != capabilities_.end();
}

std::vector<CapabilityDefinition> CapabilityRegistry::GetDefinitions() const {
    std::vector<CapabilityDefinition> defs;
    for (const auto& [name, capability] : capabilities_) {
        CapabilityDefinition def{};
        def.name = name;
        def.description = capability->Description();
        def.parameters_json = capability->ParametersJson();
        defs.push_back(def);
    }
    std::sort(defs.begin(), defs.end(), [](const CapabilityDefinition& a, const CapabilityDefinition& b) {
        return a.name < b.name;
    });
    return defs;
}

std::string CapabilityRegistry::Invoke(
    const std::string& name,
    const std::unordered_map<std::string, std::string>& params) {
    auto capability = Get(name);
    if (!capability) {
        return "Error: capability '" + name + "' not found";
    }
    {
        Log log(LogLevel::kInfo, "tool");
        log << "start name=" << name;
        for (const auto& [key, value] : params) {
            log.Field(key, value.size() > 80 ? value.substr(0, 80) + "..." : value);
        }
    }
    const auto result = capability->Invoke(params);
    Log(LogLevel::kInfo, "tool") << "end name=" << name << " size=" << result.size();
    return result;
}

std::vector<std::string> CapabilityRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : capabilities_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json DefinitionsToJson(const std::vector<CapabilityDefinition>& definitions) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& def : definitions) {
        auto parameters = nlohmann::json::parse(def.parameters_json, nullptr, false);
        if (parameters.is_discarded()) {
            parameters = nlohmann::json::object();
        }
        json.push_back({
            {"name", def.name},
            {"description", def.description},
            {"parameters", std::move(parameters)}
        });
    }
    return json;
}

}  // namespace codebox::tools
