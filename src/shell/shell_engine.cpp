/*
 * shell_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "shell_engine.hpp"

#include "command_classifier.hpp"
#include "environment.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace bottles::shell {

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

constexpr milliseconds POLL_SLICE{50};
constexpr milliseconds EXIT_GRACE{100};
constexpr milliseconds TERM_GRACE{500};
constexpr milliseconds INTERRUPT_GRACE{500};
constexpr std::string_view NOT_ALIVE_MESSAGE = "Shell process is not alive";

std::atomic<uint64_t> g_engineCounter{0};

void ignoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        struct sigaction current {};
        if (sigaction(SIGPIPE, nullptr, &current) == 0 &&
            current.sa_handler == SIG_DFL) {
            struct sigaction ignore {};
            ignore.sa_handler = SIG_IGN;
            sigemptyset(&ignore.sa_mask);
            sigaction(SIGPIPE, &ignore, nullptr);
        }
    });
}

std::string generateId() {
    auto now = std::chrono::duration_cast<milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    return "shell_" + std::to_string(now) + "_" +
           std::to_string(++g_engineCounter);
}

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void setCloseOnExec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) {
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(whitespace);
    return std::string(text.substr(first, last - first + 1));
}

bool isBlank(std::string_view text) {
    return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

// Single-quoted shell word; embedded quotes become '\''.
std::string singleQuote(std::string_view text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

/**
 * @brief Read everything currently available from a non-blocking fd
 */
size_t drainFd(int fd, std::string& buffer, bool& eof) {
    std::array<char, 4096> chunk{};
    size_t total = 0;
    while (true) {
        ssize_t n = ::read(fd, chunk.data(), chunk.size());
        if (n > 0) {
            buffer.append(chunk.data(), static_cast<size_t>(n));
            total += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            eof = true;
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        break;
    }
    return total;
}

struct BusyGuard {
    explicit BusyGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~BusyGuard() { flag_.store(false); }
    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

}  // namespace

class ShellEngine::Impl {
public:
    Impl(EngineOptions options, config::EnvironmentSnapshot environment)
        : options_(std::move(options)), environment_(std::move(environment)) {
        if (options_.id.empty()) {
            options_.id = generateId();
        }
        if (options_.shell.empty()) {
            options_.shell = defaultShell();
        }
        if (options_.initTimeout == EngineOptions{}.initTimeout &&
            environment_.isCI()) {
            options_.initTimeout = milliseconds(3000);
        }
    }

    ~Impl() { cleanup(); }

    ShellResult<void> initialize() {
        if (initialized_ && isAlive()) {
            return {};
        }
        if (pid_ > 0) {
            cleanup();
        }

        if (auto spawned = spawn(); !spawned) {
            return spawned;
        }

        stdoutBuffer_.clear();
        stderrBuffer_.clear();

        auto stamp = std::chrono::duration_cast<milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
        const std::string marker = "READY_" + std::to_string(stamp);

        // Ctrl-C must stop the foreground command, not the shell itself.
        const std::string bootstrap =
            "trap ':' INT\necho \"" + marker + "\"\n";

        if (!writeAll(bootstrap)) {
            if (waitForExit(EXIT_GRACE)) {
                spdlog::error("[{}] Shell exited during startup",
                              options_.id);
                releaseProcess();
                return std::unexpected(ShellError::InitDied);
            }
            spdlog::error("[{}] Failed to write startup marker", options_.id);
            killAndReap();
            return std::unexpected(ShellError::InitFailed);
        }

        const auto deadline = Clock::now() + options_.initTimeout;
        while (stdoutBuffer_.find(marker) == std::string::npos) {
            if (childExited()) {
                spdlog::error("[{}] Shell died before becoming ready: {}",
                              options_.id, trim(stderrBuffer_));
                releaseProcess();
                return std::unexpected(ShellError::InitDied);
            }
            auto now = Clock::now();
            if (now >= deadline) {
                spdlog::error("[{}] Shell not ready after {} ms", options_.id,
                              options_.initTimeout.count());
                killAndReap();
                return std::unexpected(ShellError::InitTimeout);
            }
            pollOnce(std::min(
                POLL_SLICE,
                std::chrono::duration_cast<milliseconds>(deadline - now)));
        }

        stdoutBuffer_.clear();
        stderrBuffer_.clear();
        initialized_ = true;
        spdlog::debug("[{}] Shell ready (pid {}, {})", options_.id, pid_,
                      options_.shell);
        return {};
    }

    ShellResult<CommandResult> run(const std::string& command,
                                   milliseconds idleTimeout,
                                   milliseconds hardLimit) {
        if (!initialized_) {
            return std::unexpected(ShellError::NotInitialized);
        }
        if (!isAlive()) {
            return std::unexpected(ShellError::ShellNotAlive);
        }
        if (busy_.exchange(true)) {
            spdlog::warn("[{}] Rejected command while another is running",
                         options_.id);
            return std::unexpected(ShellError::EngineBusy);
        }
        BusyGuard guard(busy_);

        if (idleTimeout <= milliseconds::zero()) {
            idleTimeout = options_.defaultTimeout;
        }
        if (hardLimit <= milliseconds::zero()) {
            hardLimit = options_.maxCommandDuration;
        }

        const uint64_t seq = ++sequence_;
        const std::string startLine =
            std::string(CMD_START_MARKER) + std::to_string(seq);
        const std::string endPrefix =
            std::string(CMD_END_MARKER) + std::to_string(seq) + ":";

        stdoutBuffer_.clear();
        stderrBuffer_.clear();

        // The body goes through eval so a syntax error stays inside it and
        // the end marker is always reached. stdin of the command is
        // /dev/null so it cannot consume the shell's own command stream.
        const std::string body = isBlank(command) ? ":" : command;
        const std::string wrapped = "echo \"" + startLine + "\"\neval " +
                                    singleQuote(body) +
                                    " </dev/null\necho \"" + endPrefix +
                                    "$?\"\n";

        spdlog::debug("[{}] Executing: {}", options_.id, command);

        const auto start = Clock::now();
        if (!writeAll(wrapped)) {
            alive_ = false;
            return std::unexpected(ShellError::WriteFailed);
        }

        CommandResult result;
        std::optional<int> exitCode;
        bool died = false;
        size_t scanFrom = 0;
        auto lastActivity = start;
        const auto hardDeadline = start + hardLimit;

        while (true) {
            if ((exitCode = findEndMarker(endPrefix, scanFrom))) {
                break;
            }
            if (childExited()) {
                bool eof = false;
                if (stdoutFd_ >= 0) {
                    drainFd(stdoutFd_, stdoutBuffer_, eof);
                }
                if (stderrFd_ >= 0) {
                    drainFd(stderrFd_, stderrBuffer_, eof);
                }
                exitCode = findEndMarker(endPrefix, scanFrom);
                died = !exitCode.has_value();
                break;
            }

            const auto now = Clock::now();
            const auto idleDeadline = lastActivity + idleTimeout;
            if (now >= idleDeadline || now >= hardDeadline) {
                result.timedOut = true;
                break;
            }

            auto wait = std::min(
                {POLL_SLICE,
                 std::chrono::duration_cast<milliseconds>(idleDeadline - now),
                 std::chrono::duration_cast<milliseconds>(hardDeadline - now)});
            if (wait < milliseconds(1)) {
                wait = milliseconds(1);
            }

            auto activity = pollOnce(wait);
            if (activity.stdoutBytes > 0) {
                lastActivity = Clock::now();
            }
        }

        result.duration =
            std::chrono::duration_cast<milliseconds>(Clock::now() - start);
        result.stdoutText = extractOutput(startLine, endPrefix);
        result.stderrText = trim(stderrBuffer_);

        if (exitCode) {
            result.exitCode = *exitCode;
        } else if (result.timedOut) {
            result.exitCode = -1;
            spdlog::warn("[{}] Command timed out after {} ms without output: {}",
                         options_.id, idleTimeout.count(), command);
            recoverAfterTimeout(endPrefix, scanFrom);
        } else if (died) {
            alive_ = false;
            result.exitCode = crashExitCode();
            spdlog::error("[{}] Shell exited while running: {}", options_.id,
                          command);
        }
        return result;
    }

    SignalResult interrupt() noexcept {
        SignalResult result;
        result.signal = "SIGINT";
        if (!isAlive()) {
            result.error = std::string(NOT_ALIVE_MESSAGE);
            return result;
        }
        if (!sendToGroup(SIGINT)) {
            result.error = std::string("Failed to send SIGINT: ") +
                           std::strerror(errno);
            return result;
        }
        result.success = true;
        return result;
    }

    SignalResult terminate() noexcept {
        SignalResult result;
        result.signal = "SIGTERM";
        if (!isAlive()) {
            result.error = std::string(NOT_ALIVE_MESSAGE);
            return result;
        }
        if (!sendToGroup(SIGTERM)) {
            result.error = std::string("Failed to send SIGTERM: ") +
                           std::strerror(errno);
            return result;
        }
        alive_ = false;
        waitForExit(TERM_GRACE);
        result.success = true;
        spdlog::debug("[{}] Shell terminated", options_.id);
        return result;
    }

    SignalResult forceKill() noexcept {
        SignalResult result;
        result.signal = "SIGKILL";
        if (!isAlive()) {
            result.error = std::string(NOT_ALIVE_MESSAGE);
            return result;
        }
        if (!sendToGroup(SIGKILL)) {
            result.error = std::string("Failed to send SIGKILL: ") +
                           std::strerror(errno);
            return result;
        }
        alive_ = false;
        reapBlocking();
        result.success = true;
        spdlog::debug("[{}] Shell killed", options_.id);
        return result;
    }

    void cleanup() noexcept {
        if (pid_ <= 0) {
            closeFds();
            return;
        }

        if (!childExited()) {
            if (writeAll("exit\n")) {
                waitForExit(EXIT_GRACE);
            }
        }
        if (!childExited()) {
            sendToGroup(SIGTERM);
            if (!waitForExit(TERM_GRACE)) {
                sendToGroup(SIGKILL);
                reapBlocking();
            }
        }

        releaseProcess();
        spdlog::debug("[{}] Shell cleaned up", options_.id);
    }

    bool isAlive() const noexcept {
        if (!alive_ || pid_ <= 0) {
            return false;
        }
        if (childExited()) {
            alive_ = false;
            return false;
        }
        return true;
    }

    bool isInitialized() const noexcept { return initialized_; }

    EngineStatus getStatus() const {
        return {options_.id, isAlive(), initialized_.load(), platformName(),
                options_.shell};
    }

    const EngineOptions& options() const noexcept { return options_; }

private:
    struct ReadActivity {
        size_t stdoutBytes{0};
        size_t stderrBytes{0};
    };

    ShellResult<void> spawn() {
        ignoreSigpipeOnce();

        std::string shellPath = options_.shell;
        if (shellPath.find('/') == std::string::npos) {
            if (auto resolved = environment_.findExecutable(shellPath)) {
                shellPath = resolved->string();
            }
        }

        std::array<int, 2> inPipe{-1, -1};
        std::array<int, 2> outPipe{-1, -1};
        std::array<int, 2> errPipe{-1, -1};
        auto closeAll = [&]() {
            for (auto* p : {&inPipe, &outPipe, &errPipe}) {
                closeFd((*p)[0]);
                closeFd((*p)[1]);
            }
        };

        if (::pipe(inPipe.data()) != 0 || ::pipe(outPipe.data()) != 0 ||
            ::pipe(errPipe.data()) != 0) {
            spdlog::error("[{}] Failed to create pipes: {}", options_.id,
                          std::strerror(errno));
            closeAll();
            return std::unexpected(ShellError::InitFailed);
        }

        setCloseOnExec(inPipe[1]);
        setCloseOnExec(outPipe[0]);
        setCloseOnExec(errPipe[0]);

        const auto env =
            options_.cleanEnv
                ? createCleanEnvironment(environment_, options_.env,
                                         options_.preservePaths)
                : createStandardEnvironment(environment_, options_.env);
        auto block = toEnvironmentBlock(env);
        std::vector<char*> envp;
        envp.reserve(block.size() + 1);
        for (auto& entry : block) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);

        std::vector<std::string> args{shellPath};
        if (shellPath.ends_with("bash")) {
            args.emplace_back("--noprofile");
            args.emplace_back("--norc");
        }
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid < 0) {
            spdlog::error("[{}] Fork failed: {}", options_.id,
                          std::strerror(errno));
            closeAll();
            return std::unexpected(ShellError::InitFailed);
        }

        if (pid == 0) {
            // Child process
            ::setpgid(0, 0);
            if (!options_.cwd.empty() && ::chdir(options_.cwd.c_str()) != 0) {
                _exit(126);
            }
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
            for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1],
                           errPipe[0], errPipe[1]}) {
                if (fd > STDERR_FILENO) {
                    ::close(fd);
                }
            }
            ::execve(argv[0], argv.data(), envp.data());
            _exit(127);
        }

        // Parent process
        ::setpgid(pid, pid);
        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);

        stdinFd_ = inPipe[1];
        stdoutFd_ = outPipe[0];
        stderrFd_ = errPipe[0];
        setNonBlocking(stdoutFd_);
        setNonBlocking(stderrFd_);

        {
            std::lock_guard lock(processMutex_);
            pid_ = pid;
            reaped_ = false;
            exitStatus_ = 0;
        }
        alive_ = true;
        spdlog::debug("[{}] Spawned {} with PID {}", options_.id, shellPath,
                      pid);
        return {};
    }

    ReadActivity pollOnce(milliseconds wait) {
        ReadActivity activity;
        std::array<pollfd, 2> fds{};
        fds[0].fd = stdoutFd_;
        fds[0].events = POLLIN;
        fds[1].fd = stderrFd_;
        fds[1].events = POLLIN;

        int rc = ::poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
        if (rc <= 0) {
            return activity;
        }

        if (fds[0].fd >= 0 && (fds[0].revents & (POLLIN | POLLHUP)) != 0) {
            bool eof = false;
            activity.stdoutBytes = drainFd(stdoutFd_, stdoutBuffer_, eof);
            if (eof) {
                closeFd(stdoutFd_);
            }
        }
        if (fds[1].fd >= 0 && (fds[1].revents & (POLLIN | POLLHUP)) != 0) {
            bool eof = false;
            activity.stderrBytes = drainFd(stderrFd_, stderrBuffer_, eof);
            if (eof) {
                closeFd(stderrFd_);
            }
        }
        return activity;
    }

    std::optional<int> findEndMarker(const std::string& endPrefix,
                                     size_t& scanFrom) const {
        auto pos = stdoutBuffer_.find(endPrefix, scanFrom);
        if (pos == std::string::npos) {
            const size_t keep = endPrefix.size() + 16;
            scanFrom = stdoutBuffer_.size() > keep
                           ? stdoutBuffer_.size() - keep
                           : 0;
            return std::nullopt;
        }
        scanFrom = pos;

        const size_t codeStart = pos + endPrefix.size();
        const auto lineEnd = stdoutBuffer_.find('\n', codeStart);
        if (lineEnd == std::string::npos) {
            return std::nullopt;
        }

        int code = -1;
        const char* first = stdoutBuffer_.data() + codeStart;
        const char* last = stdoutBuffer_.data() + lineEnd;
        if (std::from_chars(first, last, code).ec != std::errc{}) {
            code = -1;
        }
        return code;
    }

    std::string extractOutput(const std::string& startLine,
                              const std::string& endPrefix) const {
        std::string_view buffer(stdoutBuffer_);
        size_t begin = 0;
        if (auto pos = buffer.find(startLine); pos != std::string_view::npos) {
            auto newline = buffer.find('\n', pos);
            begin = newline == std::string_view::npos ? buffer.size()
                                                      : newline + 1;
        }
        size_t end = buffer.size();
        if (auto pos = buffer.find(endPrefix, begin);
            pos != std::string_view::npos) {
            end = pos;
        }
        return trim(buffer.substr(begin, end - begin));
    }

    bool writeAll(std::string_view data) noexcept {
        std::lock_guard lock(writeMutex_);
        if (stdinFd_ < 0) {
            return false;
        }
        while (!data.empty()) {
            ssize_t n = ::write(stdinFd_, data.data(), data.size());
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            data.remove_prefix(static_cast<size_t>(n));
        }
        return true;
    }

    /**
     * @brief Bring the shell back to an idle prompt after a timeout
     *
     * SIGINT stops a simple foreground command and its end marker then
     * arrives. A loop survives SIGINT because the shell traps it, so when
     * the marker does not show up the whole process group is killed and a
     * fresh shell is started. Shell state such as cwd and variables does
     * not survive the restart.
     */
    void recoverAfterTimeout(const std::string& endPrefix, size_t scanFrom) {
        sendToGroup(SIGINT);
        const auto deadline = Clock::now() + INTERRUPT_GRACE;
        while (!childExited()) {
            if (findEndMarker(endPrefix, scanFrom)) {
                spdlog::debug("[{}] Interrupted command finished",
                              options_.id);
                return;
            }
            const auto now = Clock::now();
            if (now >= deadline) {
                break;
            }
            pollOnce(std::min(
                POLL_SLICE,
                std::chrono::duration_cast<milliseconds>(deadline - now)));
        }

        spdlog::warn("[{}] Command ignored SIGINT, restarting shell",
                     options_.id);
        killAndReap();
        initialized_ = false;
        if (auto restarted = initialize(); !restarted) {
            spdlog::error("[{}] Shell restart failed: {}", options_.id,
                          shellErrorToString(restarted.error()));
        }
    }

    bool sendToGroup(int signal) noexcept {
        if (pid_ <= 0) {
            return false;
        }
        if (::kill(-pid_, signal) == 0) {
            return true;
        }
        return ::kill(pid_, signal) == 0;
    }

    bool childExited() const noexcept {
        std::lock_guard lock(processMutex_);
        if (pid_ <= 0 || reaped_) {
            return true;
        }
        int status = 0;
        pid_t rc = ::waitpid(pid_, &status, WNOHANG);
        if (rc == pid_) {
            reaped_ = true;
            exitStatus_ = status;
            return true;
        }
        if (rc < 0 && errno == ECHILD) {
            reaped_ = true;
            return true;
        }
        return false;
    }

    bool waitForExit(milliseconds limit) noexcept {
        const auto deadline = Clock::now() + limit;
        while (!childExited()) {
            if (Clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(milliseconds(10));
        }
        return true;
    }

    void reapBlocking() noexcept {
        std::lock_guard lock(processMutex_);
        if (pid_ <= 0 || reaped_) {
            return;
        }
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        reaped_ = true;
        exitStatus_ = status;
    }

    void killAndReap() noexcept {
        sendToGroup(SIGKILL);
        reapBlocking();
        releaseProcess();
    }

    int crashExitCode() const noexcept {
        std::lock_guard lock(processMutex_);
        if (reaped_ && WIFEXITED(exitStatus_) && WEXITSTATUS(exitStatus_) != 0) {
            return WEXITSTATUS(exitStatus_);
        }
        return -1;
    }

    void releaseProcess() noexcept {
        alive_ = false;
        closeFds();
        std::lock_guard lock(processMutex_);
        pid_ = -1;
    }

    void closeFds() noexcept {
        {
            std::lock_guard lock(writeMutex_);
            closeFd(stdinFd_);
        }
        closeFd(stdoutFd_);
        closeFd(stderrFd_);
    }

    EngineOptions options_;
    config::EnvironmentSnapshot environment_;

    pid_t pid_{-1};
    int stdinFd_{-1};
    int stdoutFd_{-1};
    int stderrFd_{-1};

    mutable std::atomic<bool> alive_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> busy_{false};
    uint64_t sequence_{0};

    std::string stdoutBuffer_;
    std::string stderrBuffer_;

    std::mutex writeMutex_;
    mutable std::mutex processMutex_;
    mutable bool reaped_{false};
    mutable int exitStatus_{0};
};

ShellEngine::ShellEngine(EngineOptions options,
                         config::EnvironmentSnapshot environment)
    : pImpl_(std::make_unique<Impl>(std::move(options),
                                    std::move(environment))) {}

ShellEngine::~ShellEngine() = default;

ShellEngine::ShellEngine(ShellEngine&&) noexcept = default;
ShellEngine& ShellEngine::operator=(ShellEngine&&) noexcept = default;

ShellResult<void> ShellEngine::initialize() { return pImpl_->initialize(); }

auto ShellEngine::execute(const std::string& command,
                          std::chrono::milliseconds timeout)
    -> ShellResult<CommandResult> {
    return pImpl_->run(command, timeout, pImpl_->options().maxCommandDuration);
}

auto ShellEngine::execute(const std::string& command)
    -> ShellResult<CommandResult> {
    const auto& opts = pImpl_->options();
    auto profile = recommendedTimeout(command).scaled(opts.timeoutMultiplier);
    return pImpl_->run(command, profile.idleTimeout,
                       std::min(profile.absoluteMaximum,
                                opts.maxCommandDuration));
}

SignalResult ShellEngine::interrupt() noexcept { return pImpl_->interrupt(); }

SignalResult ShellEngine::terminate() noexcept { return pImpl_->terminate(); }

SignalResult ShellEngine::forceKill() noexcept { return pImpl_->forceKill(); }

void ShellEngine::cleanup() noexcept { pImpl_->cleanup(); }

auto ShellEngine::isAlive() const noexcept -> bool {
    return pImpl_ && pImpl_->isAlive();
}

bool ShellEngine::isInitialized() const noexcept {
    return pImpl_ && pImpl_->isInitialized();
}

EngineStatus ShellEngine::getStatus() const { return pImpl_->getStatus(); }

const std::string& ShellEngine::id() const noexcept {
    return pImpl_->options().id;
}

const EngineOptions& ShellEngine::options() const noexcept {
    return pImpl_->options();
}

}  // namespace bottles::shell
