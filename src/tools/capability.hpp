#pragma once

#include <string>
#include <unordered_map>

namespace codebox::tools {

// Something an LLM caller can invoke by name: a description, a JSON schema
// for its parameters and a handler.
class Capability {
public:
    virtual ~Capability() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    virtual std::string Invoke(const std::unordered_map<std::string, std::string>& params) = 0;
};

struct CapabilityDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

}  // namespace codebox::tools
