#include "sandbox/process_backend.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <vector>
#include <signal.h>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

#include "channel/pipe_channel.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace bp = boost::process;

namespace {

using codebox::utils::Log;
using codebox::utils::LogLevel;

const char* kPassthroughVars[] = {
    "PATH",
    "LANG",
    "LC_ALL",
    "TZ",
    "HTTP_PROXY",
    "HTTPS_PROXY",
    "ALL_PROXY",
    "http_proxy",
    "https_proxy",
    "all_proxy",
    "NO_PROXY",
    "no_proxy"
};

struct KernelPipes {
    bp::pipe to_kernel;
    bp::pipe from_kernel;
    bp::pipe kernel_stderr;
};

void IgnoreSigpipe() {
    // A kernel that dies mid-write must surface as EPIPE, not kill the host.
    static const bool installed = [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGPIPE, &action, nullptr);
        return true;
    }();
    (void)installed;
}

bool IsExecutable(const std::string& path) {
    return ::access(path.c_str(), X_OK) == 0;
}

std::string ResolveExecutable(const std::string& command) {
    if (command.find('/') != std::string::npos) {
        return IsExecutable(command) ? command : std::string();
    }
    const auto resolved = bp::search_path(command);
    return resolved.empty() ? std::string() : resolved.string();
}

bp::environment BuildEnvironment(const codebox::config::TemplateConfig& tmpl,
                                 const codebox::config::SessionConfig& config,
                                 const std::filesystem::path& scratch_dir) {
    bp::environment env;
    for (const auto* key : kPassthroughVars) {
        if (const char* value = std::getenv(key)) {
            env[key] = value;
        }
    }
    env["HOME"] = scratch_dir.string();
    env["TMPDIR"] = scratch_dir.string();
    for (const auto& [key, value] : tmpl.env) {
        env[key] = value;
    }
    for (const auto& [key, value] : config.env) {
        env[key] = value;
    }
    return env;
}

void SetLimit(int resource, long long value) {
    if (value <= 0) {
        return;
    }
    struct rlimit limit {};
    limit.rlim_cur = static_cast<rlim_t>(value);
    limit.rlim_max = static_cast<rlim_t>(value);
    ::setrlimit(resource, &limit);
}

// Marks every inherited descriptor above stderr close-on-exec, so a kernel
// only sees its own stdio pipes and never the host's (or a sibling kernel's)
// descriptors. Runs in the forked child; async-signal-safe calls only.
void CloseInheritedDescriptors() {
#ifdef SYS_close_range
    constexpr unsigned int kCloseRangeCloexec = 1U << 2;
    if (::syscall(SYS_close_range, 3U, ~0U, kCloseRangeCloexec) == 0) {
        return;
    }
#endif
    struct rlimit limit {};
    long max_fd = 1024;
    if (::getrlimit(RLIMIT_NOFILE, &limit) == 0 && limit.rlim_cur != RLIM_INFINITY) {
        max_fd = static_cast<long>(std::min<rlim_t>(limit.rlim_cur, 65536));
    }
    for (long fd = 3; fd < max_fd; ++fd) {
        const int flags = ::fcntl(static_cast<int>(fd), F_GETFD);
        if (flags >= 0) {
            ::fcntl(static_cast<int>(fd), F_SETFD, flags | FD_CLOEXEC);
        }
    }
}

ProvisionFailure ClassifySpawnError(int code) {
    switch (code) {
        case ENOENT:
        case EACCES:
        case ENOEXEC:
        case ENOTDIR:
            return ProvisionFailure::kImageNotFound;
        case EAGAIN:
        case ENOMEM:
        case EMFILE:
        case ENFILE:
            return ProvisionFailure::kResourceExhausted;
        default:
            return ProvisionFailure::kStartupFailed;
    }
}

}  // namespace

struct ProcessBackend::Instance {
    std::string id;
    std::shared_ptr<KernelPipes> pipes;
    bp::group group;
    bp::child child;
    std::filesystem::path scratch_dir;
    bool channel_opened = false;
    std::mutex mutex;
};

ProcessBackend::ProcessBackend(TemplateCatalog catalog, ProcessBackendOptions options)
    : catalog_(std::move(catalog))
    , options_(std::move(options)) {
    IgnoreSigpipe();
}

ProcessBackend::~ProcessBackend() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, _] : instances_) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        Stop(BackendHandle{id});
    }
}

BackendHandle ProcessBackend::Start(const codebox::config::SessionConfig& config) {
    const auto tmpl = catalog_.Find(config.template_name);
    if (!tmpl || tmpl->command.empty()) {
        throw ProvisionError(ProvisionFailure::kImageNotFound,
                             "unknown template '" + config.template_name + "' (known: " +
                             codebox::utils::Join(catalog_.Names(), ", ") + ")");
    }
    const auto executable = ResolveExecutable(tmpl->command.front());
    if (executable.empty()) {
        throw ProvisionError(ProvisionFailure::kImageNotFound,
                             "template '" + config.template_name + "' needs '" +
                             tmpl->command.front() + "' which was not found");
    }

    auto instance = std::make_shared<Instance>();
    instance->id = "krn-" + codebox::utils::RandomHex(12);
    instance->scratch_dir = ScratchRoot() / instance->id;
    std::error_code ec;
    std::filesystem::create_directories(instance->scratch_dir, ec);
    if (ec) {
        throw ProvisionError(ProvisionFailure::kResourceExhausted,
                             "cannot create scratch dir " + instance->scratch_dir.string() + ": " + ec.message());
    }

    const std::vector<std::string> args(tmpl->command.begin() + 1, tmpl->command.end());
    const auto limits = tmpl->limits;
    try {
        instance->pipes = std::make_shared<KernelPipes>();
        auto env = BuildEnvironment(*tmpl, config, instance->scratch_dir);
        instance->child = bp::child(
            bp::exe = executable,
            bp::args = args,
            env,
            bp::start_dir = instance->scratch_dir.string(),
            bp::std_in < instance->pipes->to_kernel,
            bp::std_out > instance->pipes->from_kernel,
            bp::std_err > instance->pipes->kernel_stderr,
            instance->group,
            bp::extend::on_exec_setup([limits](auto&) {
                CloseInheritedDescriptors();
                SetLimit(RLIMIT_AS, limits.memory_mb * 1024 * 1024);
                SetLimit(RLIMIT_CPU, limits.cpu_seconds);
                SetLimit(RLIMIT_NOFILE, limits.open_files);
                SetLimit(RLIMIT_CORE, 0);
            }));
    } catch (const bp::process_error& ex) {
        std::filesystem::remove_all(instance->scratch_dir, ec);
        throw ProvisionError(ClassifySpawnError(ex.code().value()),
                             std::string("spawn failed: ") + ex.what());
    } catch (const std::system_error& ex) {
        std::filesystem::remove_all(instance->scratch_dir, ec);
        throw ProvisionError(ClassifySpawnError(ex.code().value()),
                             std::string("pipe setup failed: ") + ex.what());
    }

    BackendHandle handle{instance->id, static_cast<long long>(instance->child.id())};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_.emplace(instance->id, instance);
    }
    Log(LogLevel::kInfo, "backend") << "started " << handle.id
        << " template=" << config.template_name << " pid=" << handle.pid;
    return handle;
}

std::unique_ptr<codebox::channel::ExecutionChannel> ProcessBackend::OpenChannel(const BackendHandle& handle) {
    auto instance = Find(handle);
    if (!instance) {
        throw SandboxError("no running kernel for handle '" + handle.id + "'");
    }
    std::lock_guard<std::mutex> lock(instance->mutex);
    if (instance->channel_opened) {
        throw SandboxError("channel already open for '" + handle.id + "'");
    }
    instance->channel_opened = true;
    auto& pipes = *instance->pipes;
    return std::make_unique<codebox::channel::PipeChannel>(
        handle.id,
        pipes.to_kernel.native_sink(),
        pipes.from_kernel.native_source(),
        pipes.kernel_stderr.native_source(),
        instance->pipes);
}

bool ProcessBackend::Healthcheck(const BackendHandle& handle) {
    auto instance = Find(handle);
    if (!instance) {
        return false;
    }
    // Teardown holds the lock while it waits out the stop grace period.
    std::unique_lock<std::mutex> lock(instance->mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        return false;
    }
    std::error_code ec;
    const bool running = instance->child.running(ec);
    return running && !ec;
}

void ProcessBackend::Interrupt(const BackendHandle& handle) {
    auto instance = Find(handle);
    if (!instance) {
        return;
    }
    std::lock_guard<std::mutex> lock(instance->mutex);
    const auto pgid = instance->group.native_handle();
    if (pgid > 0) {
        ::killpg(pgid, SIGINT);
    }
    Log(LogLevel::kInfo, "backend") << "interrupted " << handle.id;
}

void ProcessBackend::Stop(const BackendHandle& handle) noexcept {
    std::shared_ptr<Instance> instance;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(handle.id);
        if (it == instances_.end()) {
            return;
        }
        instance = it->second;
        instances_.erase(it);
    }
    Teardown(*instance);
}

void ProcessBackend::Teardown(Instance& instance) noexcept {
    std::lock_guard<std::mutex> lock(instance.mutex);
    const auto started = std::chrono::steady_clock::now();
    const auto pgid = instance.group.native_handle();
    std::error_code ec;
    bool finished = !instance.child.running(ec);
    if (!finished && pgid > 0) {
        ::killpg(pgid, SIGTERM);
        const auto grace_deadline = std::chrono::steady_clock::now() + options_.stop_grace;
        while (std::chrono::steady_clock::now() < grace_deadline) {
            if (!instance.child.running(ec) || ec) {
                finished = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    // Anything left in the group, the kernel included, gets SIGKILL.
    if (instance.group.valid()) {
        instance.group.terminate(ec);
    }
    if (!finished) {
        instance.child.wait(ec);
    }
    std::filesystem::remove_all(instance.scratch_dir, ec);
    Log(LogLevel::kInfo, "backend") << "stopped " << instance.id
        << (finished ? " gracefully" : " forcibly")
        << " after " << codebox::utils::ElapsedMs(started) << "ms";
}

std::size_t ProcessBackend::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

std::shared_ptr<ProcessBackend::Instance> ProcessBackend::Find(const BackendHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(handle.id);
    if (it == instances_.end()) {
        return nullptr;
    }
    return it->second;
}

std::filesystem::path ProcessBackend::ScratchRoot() const {
    if (!options_.scratch_root.empty()) {
        return options_.scratch_root;
    }
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        temp = "/tmp";
    }
    return temp / "codebox";
}

}  // namespace codebox::sandbox
