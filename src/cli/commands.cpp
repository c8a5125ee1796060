#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "execution/execution_types.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/process_backend.hpp"
#include "session/session.hpp"
#include "tools/capability_registry.hpp"
#include "tools/run_code.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

struct CliOptions {
    std::string command;
    std::string input = "-";
    std::optional<std::string> template_name;
    std::optional<long long> timeout_ms;
};

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void PrintUsage() {
    std::cout << "Usage: codebox run [file|-] [--template NAME] [--timeout-ms N]\n"
              << "       codebox repl [--template NAME] [--timeout-ms N]\n"
              << "       codebox tools [--template NAME]" << std::endl;
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    if (argc < 2) {
        return std::nullopt;
    }
    CliOptions options{};
    options.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--template" && i + 1 < argc) {
            options.template_name = argv[++i];
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            try {
                options.timeout_ms = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cout << "Invalid --timeout-ms value." << std::endl;
                return std::nullopt;
            }
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cout << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            options.input = arg;
        }
    }
    return options;
}

std::optional<std::string> ReadInput(const std::string& input) {
    if (input == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(input);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

// Cancels the running cell when SIGINT/SIGTERM arrives.
class CancelWatcher {
public:
    explicit CancelWatcher(codebox::session::Session& session)
        : session_(session)
        , worker_([this]() { Loop(); }) {}

    ~CancelWatcher() {
        running_ = false;
        if (worker_.joinable()) {
            worker_.join();
        }
    }

private:
    void Loop() {
        while (running_) {
            if (g_signal != 0) {
                g_signal = 0;
                std::cerr << "[cli] cancelling " << session_.Id() << std::endl;
                session_.Cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    codebox::session::Session& session_;
    std::atomic<bool> running_{true};
    std::thread worker_;
};

std::shared_ptr<codebox::sandbox::ProcessBackend> MakeBackend(const codebox::config::Config& config) {
    codebox::sandbox::ProcessBackendOptions options{};
    options.scratch_root = config.sandbox.scratch_root;
    options.stop_grace = std::chrono::milliseconds(config.sandbox.stop_grace_ms);
    return std::make_shared<codebox::sandbox::ProcessBackend>(
        codebox::sandbox::TemplateCatalog(config.templates),
        options);
}

codebox::config::SessionConfig MakeSessionConfig(const codebox::config::Config& config, const CliOptions& options) {
    auto session_config = config.defaults;
    if (options.template_name) {
        session_config.template_name = *options.template_name;
    }
    if (options.timeout_ms) {
        session_config.timeout_ms = *options.timeout_ms;
    }
    return session_config;
}

codebox::session::SessionOptions MakeSessionOptions(const codebox::config::Config& config) {
    codebox::session::SessionOptions options{};
    options.interrupt_grace = std::chrono::milliseconds(config.sandbox.interrupt_grace_ms);
    return options;
}

// Prints the execution and returns the exit status it maps to.
int Report(const codebox::execution::Execution& execution) {
    std::cout << codebox::execution::ToJson(execution).dump(2) << std::endl;
    return execution.error ? 1 : 0;
}

int RunOnce(const codebox::config::Config& config, const CliOptions& options) {
    const auto code = ReadInput(options.input);
    if (!code) {
        std::cout << "Failed to read " << options.input << std::endl;
        return 1;
    }
    try {
        auto session = codebox::session::Session::Create(
            MakeBackend(config), MakeSessionConfig(config, options), MakeSessionOptions(config));
        CancelWatcher watcher(*session);
        return Report(session->Run(*code));
    } catch (const codebox::session::SessionLost& ex) {
        Report(ex.Partial());
        std::cerr << "[cli] " << ex.what() << std::endl;
        return 2;
    } catch (const codebox::sandbox::SandboxError& ex) {
        std::cerr << "[cli] " << ex.what() << std::endl;
        return 2;
    }
}

int RunRepl(const codebox::config::Config& config, const CliOptions& options) {
    std::unique_ptr<codebox::session::Session> session;
    try {
        session = codebox::session::Session::Create(
            MakeBackend(config), MakeSessionConfig(config, options), MakeSessionOptions(config));
    } catch (const codebox::sandbox::SandboxError& ex) {
        std::cerr << "[cli] " << ex.what() << std::endl;
        return 2;
    }
    CancelWatcher watcher(*session);
    std::cerr << "[cli] session " << session->Id() << " ready; end a cell with a line containing %%" << std::endl;

    std::string cell;
    std::string line;
    auto flush_cell = [&]() -> bool {
        if (cell.empty()) {
            return true;
        }
        try {
            Report(session->Run(cell));
        } catch (const codebox::session::SessionLost& ex) {
            Report(ex.Partial());
            std::cerr << "[cli] " << ex.what() << std::endl;
            return false;
        } catch (const codebox::session::SessionError& ex) {
            std::cerr << "[cli] " << ex.what() << std::endl;
            return false;
        }
        cell.clear();
        return true;
    };
    while (std::getline(std::cin, line)) {
        if (line == "%%") {
            if (!flush_cell()) {
                return 2;
            }
            continue;
        }
        cell += line;
        cell += "\n";
    }
    return flush_cell() ? 0 : 2;
}

int ListTools(const codebox::config::Config& config, const CliOptions& options) {
    try {
        auto session = codebox::session::Session::Create(
            MakeBackend(config), MakeSessionConfig(config, options), MakeSessionOptions(config));
        codebox::tools::CapabilityRegistry registry;
        registry.Register(std::make_unique<codebox::tools::RunCodeCapability>(*session));
        std::cout << codebox::tools::DefinitionsToJson(registry.GetDefinitions()).dump(2) << std::endl;
        return 0;
    } catch (const codebox::sandbox::SandboxError& ex) {
        std::cerr << "[cli] " << ex.what() << std::endl;
        return 2;
    }
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return 1;
    }

    const auto config = codebox::config::LoadConfig();
    codebox::utils::ConfigureLogging(codebox::config::ToLogConfig(config));
    InstallSignalHandlers();

    if (options->command == "run") {
        return RunOnce(config, *options);
    }
    if (options->command == "repl") {
        return RunRepl(config, *options);
    }
    if (options->command == "tools") {
        return ListTools(config, *options);
    }
    PrintUsage();
    return 1;
}
