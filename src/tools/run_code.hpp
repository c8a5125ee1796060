#pragma once

#include <string>

#include "session/session.hpp"
#include "tools/capability.hpp"

namespace codebox::tools {

// Runs the "code" parameter in a bound session and answers with the
// Execution as JSON.
class RunCodeCapability : public Capability {
public:
    explicit RunCodeCapability(codebox::session::Session& session);

    std::string Name() const override { return "run_code"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    std::string Invoke(const std::unordered_map<std::string, std::string>& params) override;

private:
    codebox::session::Session& session_;
};

}  // namespace codebox::tools
