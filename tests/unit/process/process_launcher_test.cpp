#include <gtest/gtest.h>
#include <mcpbridge/process/process_launcher.h>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

using namespace mcpbridge;
using namespace mcpbridge::process;
using namespace std::chrono_literals;

namespace {

ServerDescriptor mockServer(std::vector<std::string> args = {}) {
    ServerDescriptor d;
    d.name = "mock";
    d.command = MCPBRIDGE_MOCK_SERVER;
    d.args = std::move(args);
    return d;
}

ServerDescriptor shell(const std::string& script) {
    ServerDescriptor d;
    d.name = "sh";
    d.command = "sh";
    d.args = {"-c", script};
    return d;
}

// Read stdout until a full line arrives or the deadline passes
std::string readLine(ProcessHandle& proc, std::chrono::milliseconds limit = 5s) {
    std::string acc;
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        auto nl = acc.find('\n');
        if (nl != std::string::npos) {
            return acc.substr(0, nl);
        }
        auto io = proc.readStdout(50ms);
        if (io.status == IoStatus::Data) {
            acc += io.bytes;
        } else if (io.status == IoStatus::Eof || io.status == IoStatus::Error) {
            break;
        }
    }
    auto nl = acc.find('\n');
    return nl == std::string::npos ? acc : acc.substr(0, nl);
}

std::filesystem::path scratchDir() {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("mcpbridge_launch_test_" + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace

TEST(ProcessLauncher, MissingExecutableIsLaunchFailed) {
    ServerDescriptor d;
    d.name = "ghost";
    d.command = "/nonexistent/bin/pdf_server";
    auto r = launch(d);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::LaunchFailed);
    EXPECT_NE(r.error().message.find("/nonexistent/bin/pdf_server"), std::string::npos);

    d.command = "definitely-not-a-command-on-path-4711";
    auto viaPath = launch(d);
    ASSERT_FALSE(viaPath);
    EXPECT_EQ(viaPath.error().code, ErrorCode::LaunchFailed);
}

TEST(ProcessLauncher, NonExecutableFileIsLaunchFailed) {
    auto dir = scratchDir();
    auto file = dir / "not_a_program.py";
    std::ofstream(file) << "print('hi')\n";
    std::filesystem::permissions(file, std::filesystem::perms::owner_read |
                                           std::filesystem::perms::owner_write);

    ServerDescriptor d;
    d.name = "noexec";
    d.command = file.string();
    auto r = launch(d);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::LaunchFailed);
    std::filesystem::remove_all(dir);
}

TEST(ProcessLauncher, MissingWorkingDirectoryIsLaunchFailed) {
    auto d = mockServer();
    d.in_directory("/nonexistent/workdir");
    auto r = launch(d);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::LaunchFailed);
    EXPECT_NE(r.error().message.find("/nonexistent/workdir"), std::string::npos);
}

TEST(ProcessLauncher, ExchangesLinesWithHelper) {
    auto r = launch(mockServer());
    ASSERT_TRUE(r) << r.error().message;
    auto& proc = *r.value();
    EXPECT_TRUE(proc.isAlive());
    EXPECT_GT(proc.pid(), 0);
    EXPECT_EQ(proc.name(), "mock");

    ASSERT_TRUE(proc.writeStdin(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})"
        "\n"));
    auto line = readLine(proc);
    auto reply = nlohmann::json::parse(line);
    EXPECT_EQ(reply["id"], 1);
    EXPECT_EQ(reply["result"]["serverInfo"]["name"], "mock-mcp");

    // EOF on stdin makes the helper exit cleanly
    proc.closeStdin();
    ASSERT_TRUE(proc.waitForExit(5s));
    EXPECT_FALSE(proc.isAlive());
    EXPECT_EQ(proc.exitCode().value_or(-1), 0);
}

TEST(ProcessLauncher, EnvironmentAndWorkingDirectoryApplied) {
    auto dir = scratchDir();
    auto d = shell("echo \"$PDF_MODE $PYTHONUNBUFFERED $(pwd -P)\"");
    d.with_env("PDF_MODE", "fast").in_directory(dir);

    auto r = launch(d);
    ASSERT_TRUE(r) << r.error().message;
    auto line = readLine(*r.value());
    auto expectedDir = std::filesystem::canonical(dir).string();
    EXPECT_EQ(line, "fast 1 " + expectedDir);
    std::filesystem::remove_all(dir);
}

TEST(ProcessLauncher, DescriptorMayOverrideUnbufferedFlag) {
    auto d = shell("echo \"$PYTHONUNBUFFERED\"");
    d.with_env("PYTHONUNBUFFERED", "0");
    auto r = launch(d);
    ASSERT_TRUE(r);
    EXPECT_EQ(readLine(*r.value()), "0");
}

TEST(ProcessLauncher, ReportsExitCode) {
    auto r = launch(shell("exit 7"));
    ASSERT_TRUE(r);
    ASSERT_TRUE(r.value()->waitForExit(5s));
    EXPECT_EQ(r.value()->exitCode().value_or(-1), 7);
}

TEST(ProcessLauncher, WriteAfterExitIsTransportClosed) {
    auto r = launch(shell("exit 0"));
    ASSERT_TRUE(r);
    auto& proc = *r.value();
    ASSERT_TRUE(proc.waitForExit(5s));

    auto w = proc.writeStdin("{\"jsonrpc\":\"2.0\"}\n");
    ASSERT_FALSE(w);
    EXPECT_EQ(w.error().code, ErrorCode::TransportClosed);
}

TEST(ProcessLauncher, TerminateEscalatesToKill) {
    auto r = launch(mockServer({"--ignore-sigterm"}));
    ASSERT_TRUE(r);
    auto& proc = *r.value();
    // Give the helper time to install its SIGTERM handler
    ASSERT_TRUE(proc.writeStdin(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"
                                "\n"));
    ASSERT_FALSE(readLine(proc).empty());

    auto started = std::chrono::steady_clock::now();
    proc.terminate(200ms);
    EXPECT_FALSE(proc.isAlive());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
    EXPECT_EQ(proc.exitCode().value_or(-1), 128 + 9);
}

TEST(ProcessLauncher, DestructorReapsRunningChild) {
    pid_t pid = 0;
    {
        auto r = launch(mockServer());
        ASSERT_TRUE(r);
        pid = static_cast<pid_t>(r.value()->pid());
        EXPECT_GT(pid, 0);
    }
    errno = 0;
    EXPECT_EQ(::kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST(ProcessLauncher, PipesAreNotInheritedBySiblingHelpers) {
    auto first = launch(shell("cat >/dev/null"));
    ASSERT_TRUE(first);
    // A leaked copy of the first stdin write end would keep its cat from seeing EOF
    auto second = launch(shell("cat >/dev/null"));
    ASSERT_TRUE(second);

    first.value()->closeStdin();
    EXPECT_TRUE(first.value()->waitForExit(5s));
    EXPECT_EQ(first.value()->exitCode().value_or(-1), 0);
    EXPECT_TRUE(second.value()->isAlive());

    second.value()->closeStdin();
    EXPECT_TRUE(second.value()->waitForExit(5s));
}
