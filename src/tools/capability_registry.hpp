#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"
#include "tools/capability.hpp"

namespace codebox::tools {

class CapabilityRegistry {
public:
    void Register(std::unique_ptr<Capability> capability);
    Capability* Get(const std::string& name);
    bool Has(const std::string& name) const;
    std::vector<CapabilityDefinition> GetDefinitions() const;
    std::string Invoke(const std::string& name,
                       const std::unordered_map<std::string, std::string>& params);

    std::vector<std::string> List() const;

private:
    std::unordered_map<std::string, std::unique_ptr<Capability>> capabilities_;
};

// Function-calling style description: [{"name", "description", "parameters"}].
nlohmann::json DefinitionsToJson(const std::vector<CapabilityDefinition>& definitions);

}  // namespace codebox::tools
