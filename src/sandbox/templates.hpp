#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"

namespace codebox::sandbox {

// Named kernel launch recipes. Starts with the built-in templates; entries
// from configuration are layered on top and may replace them.
class TemplateCatalog {
public:
    TemplateCatalog();
    explicit TemplateCatalog(const std::unordered_map<std::string, codebox::config::TemplateConfig>& overrides);

    void Register(const std::string& name, codebox::config::TemplateConfig config);
    std::optional<codebox::config::TemplateConfig> Find(const std::string& name) const;
    std::vector<std::string> Names() const;

private:
    std::unordered_map<std::string, codebox::config::TemplateConfig> templates_;
};

// Source of the Python driver behind the built-in "python" template.
const std::string& PythonKernelDriver();

}  // namespace codebox::sandbox
