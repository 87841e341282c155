#pragma once

#include <mcpbridge/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge::process {

/**
 * @brief Static description of one helper server.
 *
 * Built from configuration at startup and never mutated afterwards.
 *
 * Example:
 * @code
 * ServerDescriptor pdf{
 *     .name = "pdf",
 *     .command = "python3",
 *     .args = {"pdf_processor.py"}
 * };
 * pdf.with_env("LOG_LEVEL", "debug").in_directory("/opt/helpers/pdf");
 * @endcode
 */
struct ServerDescriptor {
    std::string name;                                ///< Identity within the fleet
    std::string command;                             ///< Executable, resolved through PATH
    std::vector<std::string> args;                   ///< Command-line arguments
    std::optional<std::filesystem::path> workingDir; ///< Working directory (optional)
    std::map<std::string, std::string> env;          ///< Extra environment variables
    std::string description;                         ///< Human readable label
    std::vector<std::string> capabilities;           ///< Declared capability names

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& in_directory(std::filesystem::path dir) {
        workingDir = std::move(dir);
        return *this;
    }
};

enum class IoStatus : uint8_t {
    Data,    ///< Bytes were read
    Timeout, ///< Nothing arrived within the wait budget
    Eof,     ///< The write end was closed (process exited)
    Error    ///< read(2) failed
};

struct IoResult {
    IoStatus status{IoStatus::Timeout};
    std::string bytes;
};

/**
 * @brief Owning handle to a running helper process.
 *
 * RAII: destroying a handle whose child is still alive terminates it. All
 * methods are safe to call from different threads, but each pipe must have a
 * single reader.
 */
class ProcessHandle {
public:
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    /**
     * @brief Write the whole buffer to the child's stdin.
     *
     * Loops over partial writes. Returns TransportClosed when the pipe is
     * broken or already closed.
     */
    Result<void> writeStdin(std::string_view data);

    /**
     * @brief Block until stdout has data, reaches EOF, or @p wait elapses.
     */
    IoResult readStdout(std::chrono::milliseconds wait);
    IoResult readStderr(std::chrono::milliseconds wait);

    void closeStdin();

    /**
     * @brief Close stdin, send SIGTERM, wait up to @p grace, then SIGKILL and reap.
     *
     * Never blocks longer than grace plus one second.
     */
    void terminate(std::chrono::milliseconds grace);

    [[nodiscard]] bool isAlive() const;
    [[nodiscard]] int64_t pid() const noexcept;
    [[nodiscard]] std::optional<int> exitCode() const;
    [[nodiscard]] bool waitForExit(std::chrono::milliseconds timeout);
    [[nodiscard]] std::chrono::milliseconds uptime() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept;

private:
    friend Result<std::unique_ptr<ProcessHandle>> launch(const ServerDescriptor&);

    class Impl;
    explicit ProcessHandle(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Spawn the helper described by @p descriptor with all three stdio pipes captured.
 *
 * Missing executables, permission problems, an unusable working directory or
 * an exec failure in the child are reported synchronously as LaunchFailed.
 * PYTHONUNBUFFERED=1 is set unless the descriptor provides its own value.
 */
Result<std::unique_ptr<ProcessHandle>> launch(const ServerDescriptor& descriptor);

} // namespace mcpbridge::process
