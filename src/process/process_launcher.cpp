#include <mcpbridge/process/process_launcher.h>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace mcpbridge::process {

namespace {

constexpr size_t kReadChunk = 64 * 1024;

std::string errnoText(int err) {
    return std::string(std::strerror(err));
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// pipe() plus FD_CLOEXEC on both ends; the child dup2()s what it needs before exec
bool makeCloexecPipe(std::array<int, 2>& fds) {
    if (::pipe(fds.data()) < 0) {
        return false;
    }
    for (int fd : fds) {
        if (::fcntl(fd, F_SETFD, FD_CLOEXEC) < 0) {
            int err = errno;
            closeFd(fds[0]);
            closeFd(fds[1]);
            errno = err;
            return false;
        }
    }
    return true;
}

// Resolve a bare command name through PATH the way execvp would
Result<std::string> resolveExecutable(const std::string& command) {
    if (command.empty()) {
        return Error{ErrorCode::LaunchFailed, "Empty command"};
    }
    if (command.find('/') != std::string::npos) {
        if (::access(command.c_str(), F_OK) != 0) {
            return Error{ErrorCode::LaunchFailed, "Executable not found: " + command};
        }
        if (::access(command.c_str(), X_OK) != 0) {
            return Error{ErrorCode::LaunchFailed, "Executable not permitted: " + command};
        }
        return command;
    }

    const char* pathEnv = std::getenv("PATH");
    std::string paths = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= paths.size()) {
        auto end = paths.find(':', start);
        if (end == std::string::npos)
            end = paths.size();
        std::string dir = paths.substr(start, end - start);
        if (dir.empty())
            dir = ".";
        std::string candidate = dir + "/" + command;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return Error{ErrorCode::LaunchFailed, "Executable not found in PATH: " + command};
}

std::vector<std::string> buildEnvironment(const ServerDescriptor& descriptor) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry{*e};
        auto eq = entry.find('=');
        if (eq == std::string_view::npos)
            continue;
        merged[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));
    }
    merged["PYTHONUNBUFFERED"] = "1";
    for (const auto& [key, value] : descriptor.env) {
        merged[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

} // namespace

/**
 * @brief POSIX process implementation (Pimpl)
 */
class ProcessHandle::Impl {
public:
    Impl(std::string name, pid_t pid, int stdinFd, int stdoutFd, int stderrFd)
        : name_(std::move(name)), pid_(pid), stdin_fd_(stdinFd), stdout_fd_(stdoutFd),
          stderr_fd_(stderrFd), start_time_(std::chrono::steady_clock::now()) {}

    ~Impl() {
        if (isAlive()) {
            spdlog::debug("ProcessHandle[{}]: still alive at destruction, terminating", name_);
            terminate(std::chrono::seconds{5});
        }
        {
            std::lock_guard lock{stdin_mutex_};
            closeFd(stdin_fd_);
        }
        closeFd(stdout_fd_);
        closeFd(stderr_fd_);
    }

    Result<void> writeStdin(std::string_view data) {
        std::lock_guard lock{stdin_mutex_};
        if (stdin_fd_ < 0) {
            return Error{ErrorCode::TransportClosed, "stdin already closed"};
        }

        size_t offset = 0;
        while (offset < data.size()) {
            ssize_t written = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
            if (written < 0) {
                if (errno == EINTR)
                    continue;
                if (errno == EPIPE) {
                    spdlog::warn("ProcessHandle[{}]: broken pipe writing stdin (pid={})", name_,
                                 pid_);
                    return Error{ErrorCode::TransportClosed, "Broken pipe"};
                }
                return Error{ErrorCode::IOError, "stdin write failed: " + errnoText(errno)};
            }
            offset += static_cast<size_t>(written);
        }
        return {};
    }

    IoResult readFd(int fd, std::chrono::milliseconds wait) {
        if (fd < 0) {
            return {IoStatus::Eof, {}};
        }

        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(wait.count()));
        if (rc == 0) {
            return {IoStatus::Timeout, {}};
        }
        if (rc < 0) {
            if (errno == EINTR)
                return {IoStatus::Timeout, {}};
            return {IoStatus::Error, errnoText(errno)};
        }

        std::string buffer(kReadChunk, '\0');
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            buffer.resize(static_cast<size_t>(n));
            return {IoStatus::Data, std::move(buffer)};
        }
        if (n == 0) {
            return {IoStatus::Eof, {}};
        }
        if (errno == EINTR || errno == EAGAIN)
            return {IoStatus::Timeout, {}};
        return {IoStatus::Error, errnoText(errno)};
    }

    void closeStdin() {
        std::lock_guard lock{stdin_mutex_};
        closeFd(stdin_fd_);
    }

    void terminate(std::chrono::milliseconds grace) {
        if (!isAlive()) {
            closeStdin();
            return;
        }

        spdlog::info("ProcessHandle[{}]: terminating pid={} (grace {}ms)", name_, pid_,
                     grace.count());

        // EOF on stdin first; well-behaved helpers exit on their own
        closeStdin();

        if (::kill(pid_, SIGTERM) == 0) {
            if (waitForExit(grace)) {
                return;
            }
        }

        spdlog::warn("ProcessHandle[{}]: forcefully killing pid={}", name_, pid_);
        ::kill(pid_, SIGKILL);
        if (!waitForExit(std::chrono::seconds{1})) {
            spdlog::error("ProcessHandle[{}]: pid={} did not exit after SIGKILL", name_, pid_);
        }
    }

    bool tryReap() const {
        std::lock_guard lock{wait_mutex_};
        if (reaped_) {
            return true;
        }
        int status = 0;
        pid_t result = ::waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            if (WIFEXITED(status)) {
                exit_code_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code_ = 128 + WTERMSIG(status);
            }
            reaped_ = true;
        } else if (result < 0 && errno == ECHILD) {
            reaped_ = true;
        }
        return reaped_;
    }

    bool isAlive() const { return !tryReap(); }

    bool waitForExit(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (tryReap()) {
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
    }

    std::optional<int> exitCode() const {
        (void)tryReap();
        std::lock_guard lock{wait_mutex_};
        return exit_code_;
    }

    std::string name_;
    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex stdin_mutex_;
    mutable std::mutex wait_mutex_;
    mutable bool reaped_{false};
    mutable std::optional<int> exit_code_;
};

ProcessHandle::ProcessHandle(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

ProcessHandle::~ProcessHandle() = default;

Result<void> ProcessHandle::writeStdin(std::string_view data) {
    return pImpl->writeStdin(data);
}

IoResult ProcessHandle::readStdout(std::chrono::milliseconds wait) {
    return pImpl->readFd(pImpl->stdout_fd_, wait);
}

IoResult ProcessHandle::readStderr(std::chrono::milliseconds wait) {
    return pImpl->readFd(pImpl->stderr_fd_, wait);
}

void ProcessHandle::closeStdin() {
    pImpl->closeStdin();
}

void ProcessHandle::terminate(std::chrono::milliseconds grace) {
    pImpl->terminate(grace);
}

bool ProcessHandle::isAlive() const {
    return pImpl->isAlive();
}

int64_t ProcessHandle::pid() const noexcept {
    return static_cast<int64_t>(pImpl->pid_);
}

std::optional<int> ProcessHandle::exitCode() const {
    return pImpl->exitCode();
}

bool ProcessHandle::waitForExit(std::chrono::milliseconds timeout) {
    return pImpl->waitForExit(timeout);
}

std::chrono::milliseconds ProcessHandle::uptime() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 pImpl->start_time_);
}

const std::string& ProcessHandle::name() const noexcept {
    return pImpl->name_;
}

Result<std::unique_ptr<ProcessHandle>> launch(const ServerDescriptor& descriptor) {
    // A helper that dies mid-write must not take the whole application down with SIGPIPE
    static std::once_flag sigpipeOnce;
    std::call_once(sigpipeOnce, [] { ::signal(SIGPIPE, SIG_IGN); });

    auto executable = resolveExecutable(descriptor.command);
    if (!executable) {
        spdlog::error("ProcessLauncher[{}]: {}", descriptor.name, executable.error().message);
        return executable.error();
    }

    if (descriptor.workingDir) {
        std::error_code ec;
        if (!std::filesystem::is_directory(*descriptor.workingDir, ec)) {
            return Error{ErrorCode::LaunchFailed,
                         "Working directory does not exist: " + descriptor.workingDir->string()};
        }
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> argStorage;
    argStorage.push_back(descriptor.command);
    argStorage.insert(argStorage.end(), descriptor.args.begin(), descriptor.args.end());
    std::vector<char*> argv;
    for (auto& a : argStorage)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    auto envStorage = buildEnvironment(descriptor);
    std::vector<char*> envp;
    for (auto& e : envStorage)
        envp.push_back(e.data());
    envp.push_back(nullptr);

    std::string workdir = descriptor.workingDir ? descriptor.workingDir->string() : std::string{};
    const std::string& exePath = executable.value();

    std::array<int, 2> inPipe{-1, -1}, outPipe{-1, -1}, errPipe{-1, -1}, statusPipe{-1, -1};
    auto closeAll = [&] {
        for (auto* p : {&inPipe, &outPipe, &errPipe, &statusPipe}) {
            closeFd((*p)[0]);
            closeFd((*p)[1]);
        }
    };

    if (!makeCloexecPipe(inPipe) || !makeCloexecPipe(outPipe) || !makeCloexecPipe(errPipe) ||
        !makeCloexecPipe(statusPipe)) {
        int err = errno;
        closeAll();
        return Error{ErrorCode::LaunchFailed, "Failed to create pipes: " + errnoText(err)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeAll();
        return Error{ErrorCode::LaunchFailed, "fork() failed: " + errnoText(err)};
    }

    if (pid == 0) {
        // Child: dup2 clears FD_CLOEXEC on the standard descriptors
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);

        int err = 0;
        if (!workdir.empty() && ::chdir(workdir.c_str()) < 0) {
            err = errno;
        } else {
            ::execve(exePath.c_str(), argv.data(), envp.data());
            err = errno;
        }
        ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    // The status pipe closes on a successful exec; an errno arrives otherwise
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        closeAll();
        spdlog::error("ProcessLauncher[{}]: exec of '{}' failed: {}", descriptor.name, exePath,
                      errnoText(childErr));
        return Error{ErrorCode::LaunchFailed,
                     "Failed to start '" + descriptor.command + "': " + errnoText(childErr)};
    }

    spdlog::info("ProcessLauncher[{}]: spawned {} (pid={})", descriptor.name, exePath, pid);

    auto impl = std::make_unique<ProcessHandle::Impl>(descriptor.name, pid, inPipe[1], outPipe[0],
                                                      errPipe[0]);
    return std::unique_ptr<ProcessHandle>(new ProcessHandle(std::move(impl)));
}

} // namespace mcpbridge::process
