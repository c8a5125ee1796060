#include <gtest/gtest.h>

#include <boost/process/search_path.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <thread>

#include "sandbox/process_backend.hpp"
#include "session/session.hpp"
#include "utils/common.hpp"

#ifndef CODEBOX_FAKE_KERNEL
#error "CODEBOX_FAKE_KERNEL must name the fake kernel binary"
#endif

namespace codebox::session {
namespace {

namespace fs = std::filesystem;
using codebox::sandbox::ProcessBackend;
using codebox::sandbox::ProcessBackendOptions;
using codebox::sandbox::ProvisionError;
using codebox::sandbox::ProvisionFailure;
using codebox::sandbox::TemplateCatalog;

codebox::config::TemplateConfig FakeTemplate(std::vector<std::string> extra_args = {}) {
    codebox::config::TemplateConfig tmpl{};
    tmpl.command = {CODEBOX_FAKE_KERNEL};
    tmpl.command.insert(tmpl.command.end(), extra_args.begin(), extra_args.end());
    tmpl.env["FAKE_KERNEL_FLAVOR"] = "plain";
    return tmpl;
}

std::string StripNewline(std::string text) {
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

class ProcessSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch_root_ = fs::temp_directory_path() / ("codebox-test-" + codebox::utils::RandomHex(8));
        TemplateCatalog catalog;
        catalog.Register("fake", FakeTemplate());
        catalog.Register("fake-failing", FakeTemplate({"--fail-start"}));
        catalog.Register("fake-silent", FakeTemplate({"--no-ready"}));
        catalog.Register("missing", codebox::config::TemplateConfig{{"/nonexistent/codebox-kernel"}, {}, {}});
        ProcessBackendOptions options{};
        options.scratch_root = scratch_root_;
        options.stop_grace = std::chrono::milliseconds(300);
        backend_ = std::make_shared<ProcessBackend>(std::move(catalog), options);
    }

    void TearDown() override {
        backend_.reset();
        std::error_code ec;
        fs::remove_all(scratch_root_, ec);
    }

    std::unique_ptr<Session> Open(const std::string& template_name = "fake", long long timeout_ms = 10000) {
        codebox::config::SessionConfig config{};
        config.template_name = template_name;
        config.timeout_ms = timeout_ms;
        config.env = env_;
        SessionOptions options{};
        options.interrupt_grace = std::chrono::milliseconds(500);
        return Session::Create(backend_, config, options);
    }

    fs::path scratch_root_;
    std::unordered_map<std::string, std::string> env_;
    std::shared_ptr<ProcessBackend> backend_;
};

TEST_F(ProcessSessionTest, VariablesSurviveAcrossRuns) {
    auto session = Open();
    const auto first = session->Run("x = 1");
    EXPECT_TRUE(first.logs.stdout_lines.empty());
    EXPECT_FALSE(first.HasError());

    const auto second = session->Run("print(x + 1)");
    EXPECT_EQ(second.logs.stdout_lines, (std::vector<std::string>{"2\n"}));
    EXPECT_FALSE(second.HasError());
    EXPECT_EQ(session->State(), SessionState::kIdle);
}

TEST_F(ProcessSessionTest, TrailingExpressionBecomesText) {
    auto session = Open();
    session->Run("y = 20");
    const auto execution = session->Run("print(1)\ny * 2 + 2");
    EXPECT_EQ(execution.text, "42");
    ASSERT_EQ(execution.results.size(), 1u);
    EXPECT_TRUE(execution.results[0].is_main_result);
}

TEST_F(ProcessSessionTest, StreamsAndRichResultsKeepTheirOrder) {
    auto session = Open();
    const auto execution = session->Run("print(1)\neprint(2)\ndisplay(text/html, <b>hi</b>)\nprint(3)");
    EXPECT_EQ(execution.logs.stdout_lines, (std::vector<std::string>{"1\n", "3\n"}));
    EXPECT_EQ(execution.logs.stderr_lines, (std::vector<std::string>{"2\n"}));
    ASSERT_EQ(execution.results.size(), 1u);
    EXPECT_EQ(execution.results[0].Get("text/html").value_or(""), "<b>hi</b>");
    EXPECT_FALSE(execution.results[0].is_main_result);
    EXPECT_EQ(execution.events.size(), 4u);
}

TEST_F(ProcessSessionTest, CodeErrorLeavesSessionUsable) {
    auto session = Open();
    session->Run("x = 5");
    const auto failed = session->Run("print(x)\n1/0\nprint(99)");
    ASSERT_TRUE(failed.HasError());
    EXPECT_EQ(failed.error->name, "ZeroDivisionError");
    EXPECT_EQ(failed.error->value, "division by zero");
    EXPECT_FALSE(failed.error->traceback.empty());
    EXPECT_EQ(failed.logs.stdout_lines, (std::vector<std::string>{"5\n"}));

    const auto next = session->Run("print(x)");
    EXPECT_FALSE(next.HasError());
    EXPECT_EQ(next.logs.stdout_lines, (std::vector<std::string>{"5\n"}));
}

TEST_F(ProcessSessionTest, UnknownTemplateIsImageNotFound) {
    try {
        Open("does-not-exist");
        FAIL() << "expected ProvisionError";
    } catch (const ProvisionError& ex) {
        EXPECT_EQ(ex.Reason(), ProvisionFailure::kImageNotFound);
        EXPECT_NE(std::string(ex.what()).find("known: fake, fake-failing"), std::string::npos);
    }
    EXPECT_EQ(backend_->ActiveCount(), 0u);
}

TEST_F(ProcessSessionTest, MissingInterpreterIsImageNotFound) {
    try {
        Open("missing");
        FAIL() << "expected ProvisionError";
    } catch (const ProvisionError& ex) {
        EXPECT_EQ(ex.Reason(), ProvisionFailure::kImageNotFound);
    }
    EXPECT_EQ(backend_->ActiveCount(), 0u);
}

TEST_F(ProcessSessionTest, KernelCrashingAtStartupIsReported) {
    try {
        Open("fake-failing");
        FAIL() << "expected ProvisionError";
    } catch (const ProvisionError& ex) {
        EXPECT_EQ(ex.Reason(), ProvisionFailure::kStartupFailed);
        EXPECT_NE(std::string(ex.what()).find("refusing to start"), std::string::npos);
    }
    EXPECT_EQ(backend_->ActiveCount(), 0u);
}

TEST_F(ProcessSessionTest, KernelNeverReadyTimesOut) {
    try {
        Open("fake-silent", 300);
        FAIL() << "expected ProvisionError";
    } catch (const ProvisionError& ex) {
        EXPECT_EQ(ex.Reason(), ProvisionFailure::kTimeout);
    }
    EXPECT_EQ(backend_->ActiveCount(), 0u);
}

TEST_F(ProcessSessionTest, LongRunIsInterruptedAndSessionTerminated) {
    auto session = Open();
    const auto started = std::chrono::steady_clock::now();
    try {
        session->Run("print(7)\nsleep(30000)", std::chrono::milliseconds(300));
        FAIL() << "expected ExecutionTimeout";
    } catch (const ExecutionTimeout& ex) {
        EXPECT_EQ(ex.Partial().logs.stdout_lines, (std::vector<std::string>{"7\n"}));
        ASSERT_TRUE(ex.Partial().HasError());
        EXPECT_EQ(ex.Partial().error->name, "KeyboardInterrupt");
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(session->State(), SessionState::kTerminated);
    EXPECT_EQ(backend_->ActiveCount(), 0u);
    EXPECT_THROW(session->Run("print(1)"), SessionClosed);
}

TEST_F(ProcessSessionTest, KernelIgnoringInterruptIsStillStopped) {
    auto session = Open();
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(session->Run("ignore_interrupts()\nsleep(30000)", std::chrono::milliseconds(200)),
                 ExecutionTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(backend_->ActiveCount(), 0u);
}

TEST_F(ProcessSessionTest, KernelExitIsSessionLost) {
    auto session = Open();
    session->Run("x = 1");
    try {
        session->Run("print(x)\nexit(3)");
        FAIL() << "expected SessionLost";
    } catch (const ExecutionTimeout&) {
        FAIL() << "a crash is not a timeout";
    } catch (const SessionLost& ex) {
        EXPECT_EQ(ex.Partial().logs.stdout_lines, (std::vector<std::string>{"1\n"}));
    }
    EXPECT_EQ(session->State(), SessionState::kTerminated);
    EXPECT_EQ(backend_->ActiveCount(), 0u);
}

TEST_F(ProcessSessionTest, MalformedKernelOutputIsSessionLost) {
    auto session = Open();
    EXPECT_THROW(session->Run("garbage()"), SessionLost);
    EXPECT_EQ(session->State(), SessionState::kTerminated);
}

TEST_F(ProcessSessionTest, EnvironmentIsScrubbedAndExtended) {
    ::setenv("CODEBOX_TEST_HOST_SECRET", "leak", 1);
    env_["CODEBOX_GREETING"] = "hello";
    auto session = Open();
    const auto execution = session->Run("getenv(CODEBOX_GREETING)\ngetenv(CODEBOX_TEST_HOST_SECRET)\ngetenv(FAKE_KERNEL_FLAVOR)");
    EXPECT_EQ(execution.logs.stdout_lines, (std::vector<std::string>{"hello\n", "<unset>\n", "plain\n"}));
    ::unsetenv("CODEBOX_TEST_HOST_SECRET");
}

TEST_F(ProcessSessionTest, KernelSeesOnlyItsOwnStdio) {
    auto sibling = Open();
    auto session = Open();
    const auto execution = session->Run("open_fds()");
    EXPECT_EQ(execution.logs.stdout_lines, (std::vector<std::string>{"0\n"}));
    EXPECT_EQ(sibling->Run("open_fds()").logs.stdout_lines, (std::vector<std::string>{"0\n"}));
}

TEST_F(ProcessSessionTest, HealthcheckDoesNotWaitForTeardown) {
    using codebox::channel::ReceiveStatus;
    codebox::config::SessionConfig config{};
    config.template_name = "fake";
    const auto handle = backend_->Start(config);
    auto channel = backend_->OpenChannel(handle);
    ASSERT_EQ(channel->WaitReady(std::chrono::seconds(5)), ReceiveStatus::kEnd);
    channel->Send(1, "ignore_terminate()");
    codebox::execution::OutputEvent event;
    ASSERT_EQ(channel->Receive(event, std::chrono::seconds(5)), ReceiveStatus::kEnd);
    EXPECT_TRUE(backend_->Healthcheck(handle));

    std::thread stopper([&]() { backend_->Stop(handle); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(backend_->Healthcheck(handle));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(100));
    stopper.join();
    channel->Close();
    EXPECT_EQ(backend_->ActiveCount(), 0u);
}

TEST_F(ProcessSessionTest, ScratchDirectoryIsRemovedOnClose) {
    auto session = Open();
    const auto execution = session->Run("pwd()");
    ASSERT_EQ(execution.logs.stdout_lines.size(), 1u);
    const fs::path workdir = StripNewline(execution.logs.stdout_lines[0]);
    ASSERT_TRUE(fs::exists(workdir));
    EXPECT_TRUE(fs::equivalent(workdir.parent_path(), scratch_root_));

    session->Close();
    EXPECT_FALSE(fs::exists(workdir));
    EXPECT_EQ(backend_->ActiveCount(), 0u);
}

TEST_F(ProcessSessionTest, ParallelSessionsAreIndependent) {
    auto first = Open();
    auto second = Open();
    EXPECT_EQ(backend_->ActiveCount(), 2u);

    std::thread a([&first]() { first->Run("x = 1\nsleep(100)"); });
    std::thread b([&second]() { second->Run("x = 2\nsleep(100)"); });
    a.join();
    b.join();

    EXPECT_EQ(first->Run("x").text, "1");
    EXPECT_EQ(second->Run("x").text, "2");

    first->Close();
    EXPECT_EQ(backend_->ActiveCount(), 1u);
    EXPECT_EQ(second->Run("x + 1").text, "3");
}

TEST_F(ProcessSessionTest, DestroyingSessionReleasesKernel) {
    auto session = Open();
    const auto workdir = fs::path(StripNewline(session->Run("pwd()").logs.stdout_lines.at(0)));
    session.reset();
    EXPECT_FALSE(fs::exists(workdir));
}

class PythonTemplateTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (boost::process::search_path("python3").empty()) {
            GTEST_SKIP() << "python3 is not installed";
        }
        scratch_root_ = fs::temp_directory_path() / ("codebox-py-" + codebox::utils::RandomHex(8));
        ProcessBackendOptions options{};
        options.scratch_root = scratch_root_;
        options.stop_grace = std::chrono::milliseconds(500);
        backend_ = std::make_shared<ProcessBackend>(TemplateCatalog(), options);
        SessionOptions session_options{};
        session_options.interrupt_grace = std::chrono::milliseconds(1000);
        codebox::config::SessionConfig config{};
        config.timeout_ms = 30000;
        session_ = Session::Create(backend_, config, session_options);
    }

    void TearDown() override {
        session_.reset();
        backend_.reset();
        std::error_code ec;
        fs::remove_all(scratch_root_, ec);
    }

    fs::path scratch_root_;
    std::shared_ptr<ProcessBackend> backend_;
    std::unique_ptr<Session> session_;
};

TEST_F(PythonTemplateTest, PrintProducesOneLinePerCall) {
    const auto first = session_->Run("x = 1");
    EXPECT_TRUE(first.logs.stdout_lines.empty());
    EXPECT_TRUE(first.logs.stderr_lines.empty());
    EXPECT_FALSE(first.HasError());

    const auto second = session_->Run("print(x + 1)");
    EXPECT_EQ(second.logs.stdout_lines, (std::vector<std::string>{"2\n"}));
    EXPECT_FALSE(second.HasError());
}

TEST_F(PythonTemplateTest, PartialLinesAreFlushedAtEndOfRun) {
    const auto execution = session_->Run("import sys\nsys.stdout.write('a')\nsys.stdout.write('b\\nc')");
    EXPECT_EQ(execution.logs.stdout_lines, (std::vector<std::string>{"ab\n", "c"}));
}

TEST_F(PythonTemplateTest, DivisionByZeroIsReportedAndSessionStaysIdle) {
    const auto failed = session_->Run("print('before')\n1/0");
    ASSERT_TRUE(failed.HasError());
    EXPECT_EQ(failed.error->name, "ZeroDivisionError");
    EXPECT_FALSE(failed.error->value.empty());
    EXPECT_FALSE(failed.error->traceback.empty());
    EXPECT_EQ(failed.logs.stdout_lines, (std::vector<std::string>{"before\n"}));
    EXPECT_EQ(session_->State(), SessionState::kIdle);

    const auto next = session_->Run("print('after')");
    EXPECT_FALSE(next.HasError());
    EXPECT_EQ(next.logs.stdout_lines, (std::vector<std::string>{"after\n"}));
}

TEST_F(PythonTemplateTest, TrailingExpressionFillsText) {
    session_->Run("y = 40");
    const auto execution = session_->Run("y + 2");
    EXPECT_EQ(execution.text, "42");
    ASSERT_EQ(execution.results.size(), 1u);
    EXPECT_TRUE(execution.results[0].is_main_result);
}

TEST_F(PythonTemplateTest, UndecodableTextDoesNotBreakTheSession) {
    const auto execution = session_->Run("print('bad \\udcff name')");
    EXPECT_FALSE(execution.HasError());
    ASSERT_EQ(execution.logs.stdout_lines.size(), 1u);
    EXPECT_EQ(execution.logs.stdout_lines[0], "bad ? name\n");
    EXPECT_EQ(session_->State(), SessionState::kIdle);
    EXPECT_NO_THROW(session_->Run("print(1)"));
}

}  // namespace
}  // namespace codebox::session
