#include "tools/run_code.hpp"

#include "utils/logging.hpp"

namespace codebox::tools {

RunCodeCapability::RunCodeCapability(codebox::session::Session& session)
    : session_(session) {}

std::string RunCodeCapability::Description() const {
    return "Run code in a persistent sandboxed interpreter (template '" +
           session_.Config().template_name +
           "'). Variables and imports are kept between calls. Returns stdout, stderr, "
           "rich results and any error as JSON.";
}

std::string RunCodeCapability::ParametersJson() const {
    return R"({"type":"object","properties":{"code":{"type":"string","description":"Source code to run"}},"required":["code"]})";
}

std::string RunCodeCapability::Invoke(const std::unordered_map<std::string, std::string>& params) {
    auto it = params.find("code");
    if (it == params.end() || it->second.empty()) {
        return "Error: missing code";
    }
    try {
        const auto execution = session_.Run(it->second);
        if (execution.error) {
            codebox::utils::Log(codebox::utils::LogLevel::kInfo, "run_code")
                << "code raised " << execution.error->name;
        }
        return codebox::execution::ToJson(execution).dump();
    } catch (const codebox::session::SessionLost& ex) {
        auto json = codebox::execution::ToJson(ex.Partial());
        json["session_error"] = ex.what();
        return json.dump();
    } catch (const codebox::session::SessionError& ex) {
        return std::string("Error: ") + ex.what();
    }
}

}  // namespace codebox::tools
