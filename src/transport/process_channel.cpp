#include "mcpmux/transport/process_channel.hpp"
#include "mcpmux/log/logger.hpp"
#include "mcpmux/log/redact.hpp"

#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <format>
#include <system_error>

namespace mcpmux {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kReapPollInterval{10};
constexpr std::chrono::hours kMaxWait{24};
constexpr std::size_t kReadChunkSize = 8192;
constexpr std::size_t kMaxStderrLine = 64 * 1024;

enum class WaitOutcome { Ready, Woken, TimedOut, Failed };

Error make_fault(const std::string& msg) {
    return Error::connection_fault(msg);
}

std::string errno_text(int err) {
    return std::strerror(err);
}

void close_fd(int& fd) noexcept {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

bool open_pipe(int fds[2]) noexcept {
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

bool set_nonblocking(int fd) noexcept {
    const int flags = ::fcntl(fd, F_GETFL);
    return flags != -1 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

// A write to a pipe whose reader exited must surface as EPIPE, not kill us
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

Clock::time_point deadline_after(std::chrono::milliseconds timeout) {
    const auto bounded = std::min<std::chrono::milliseconds>(
        std::max(timeout, std::chrono::milliseconds{0}), kMaxWait);
    return Clock::now() + bounded;
}

int remaining_ms(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (left.count() <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<std::int64_t>(left.count(), INT_MAX));
}

/// Wait for `events` on `fd` or for the wake pipe, whichever comes first
WaitOutcome wait_ready(int fd, short events, int wake_fd, Clock::time_point deadline) {
    while (true) {
        struct pollfd fds[2]{};
        fds[0].fd = fd;
        fds[0].events = events;
        fds[1].fd = wake_fd;
        fds[1].events = POLLIN;

        const int result = ::poll(fds, 2, remaining_ms(deadline));
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            return WaitOutcome::Failed;
        }
        if (result == 0) {
            return WaitOutcome::TimedOut;
        }
        if (fds[1].revents != 0) {
            return WaitOutcome::Woken;
        }
        // POLLHUP/POLLERR included: the following read or write reports it
        return WaitOutcome::Ready;
    }
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

ProcessChannel::ProcessChannel(ProcessLaunch launch)
    : launch_(std::move(launch))
{}

ProcessChannel::~ProcessChannel() {
    close();
}

Result<std::unique_ptr<ProcessChannel>> ProcessChannel::spawn(ProcessLaunch launch) {
    std::unique_ptr<ProcessChannel> channel(new ProcessChannel(std::move(launch)));
    auto started = channel->start();
    if (!started) {
        return tl::unexpected(std::move(started.error()));
    }
    return channel;
}

Result<void> ProcessChannel::start() {
    ignore_sigpipe_once();

    // CRITICAL: Build argv and envp BEFORE fork(). After fork() only the
    // calling thread exists in the child; if another thread held the malloc
    // mutex at that moment, any allocation in the child deadlocks forever.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(launch_.args.size() + 1);
    argv_storage.push_back(launch_.executable);
    argv_storage.insert(argv_storage.end(), launch_.args.begin(), launch_.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    env_storage.reserve(launch_.environment.size());
    for (const auto& [key, value] : launch_.environment) {
        env_storage.push_back(key + "=" + value);
    }

    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const bool capture_stderr = (launch_.stderr_handling == StderrHandling::Log);

    // All pipe ends are close-on-exec; dup2 clears the flag on the child's 0/1/2
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    int wake_pipe[2] = {-1, -1};

    auto close_all = [&] {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe, wake_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    if (!open_pipe(stdin_pipe) || !open_pipe(stdout_pipe) || !open_pipe(status_pipe) ||
        !open_pipe(wake_pipe) || (capture_stderr && !open_pipe(stderr_pipe))) {
        const int err = errno;
        close_all();
        return tl::unexpected(make_fault("Failed to create pipes: " + errno_text(err)));
    }

    const pid_t pid = ::fork();

    if (pid == -1) {
        const int err = errno;
        close_all();
        return tl::unexpected(make_fault("Failed to fork: " + errno_text(err)));
    }

    if (pid == 0) {
        // Child process - NO ALLOCATIONS ALLOWED (malloc deadlock risk)
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);

        switch (launch_.stderr_handling) {
            case StderrHandling::Discard: {
                const int devnull = ::open("/dev/null", O_WRONLY);
                if (devnull != -1) {
                    ::dup2(devnull, STDERR_FILENO);
                    ::close(devnull);
                }
                break;
            }
            case StderrHandling::Passthrough:
                break;
            case StderrHandling::Log:
                ::dup2(stderr_pipe[1], STDERR_FILENO);
                break;
        }

        // SIG_IGN survives exec; the provider expects the default
        ::signal(SIGPIPE, SIG_DFL);

        ::execve(argv[0], argv.data(), envp.data());

        // Only reached when execve failed: report errno through the status pipe
        const int err = errno;
        if (::write(status_pipe[1], &err, sizeof(err)) < 0) {
            // Nothing left to do; the parent sees EOF and a 127 exit code
        }
        ::_exit(127);
    }

    // Parent process - close the child's ends
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    child_pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    wake_read_fd_ = wake_pipe[0];
    wake_write_fd_ = wake_pipe[1];

    auto exec_result = wait_for_exec(status_pipe[0]);
    close_fd(status_pipe[0]);
    if (!exec_result) {
        close();
        return exec_result;
    }

    if (!set_nonblocking(stdin_fd_) || !set_nonblocking(wake_write_fd_)) {
        const int err = errno;
        close();
        return tl::unexpected(make_fault("Failed to configure pipes: " + errno_text(err)));
    }

    if (capture_stderr) {
        try {
            stderr_thread_ = std::thread(&ProcessChannel::stderr_reader_loop, this);
        } catch (const std::system_error& e) {
            close();
            return tl::unexpected(make_fault(std::string("Failed to start stderr reader: ") + e.what()));
        }
    }

    MCPMUX_LOG_INFO(std::format("[{}] Started process {} {} (pid {})",
                                launch_.label, launch_.executable,
                                format_args(launch_.args), child_pid_));
    return {};
}

Result<void> ProcessChannel::wait_for_exec(int status_fd) {
    const auto deadline = deadline_after(launch_.spawn_timeout);

    int child_errno = 0;
    std::size_t received = 0;
    while (received < sizeof(child_errno)) {
        struct pollfd pfd{};
        pfd.fd = status_fd;
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(make_fault("Failed waiting for exec: " + errno_text(errno)));
        }
        if (ready == 0) {
            return tl::unexpected(make_fault(std::format(
                "Process {} did not start within {} ms",
                launch_.executable, launch_.spawn_timeout.count())));
        }

        const ssize_t n = ::read(status_fd, reinterpret_cast<char*>(&child_errno) + received,
                                 sizeof(child_errno) - received);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(make_fault("Failed waiting for exec: " + errno_text(errno)));
        }
        if (n == 0) {
            if (received == 0) {
                return {};  // EOF without payload: exec closed the pipe
            }
            child_errno = EIO;
            break;
        }
        received += static_cast<std::size_t>(n);
    }

    reap(true);
    return tl::unexpected(make_fault(std::format(
        "Failed to execute {}: {}", launch_.executable, errno_text(child_errno))));
}

void ProcessChannel::cancel() noexcept {
    if (cancelled_.exchange(true)) {
        return;
    }
    // The wake pipe is never drained, so every later poll sees it readable
    if (wake_write_fd_ != -1) {
        const char byte = 1;
        ssize_t rc;
        do {
            rc = ::write(wake_write_fd_, &byte, 1);
        } while (rc == -1 && errno == EINTR);
    }
}

void ProcessChannel::close() {
    cancel();

    // Pending send/receive return promptly once cancelled
    std::lock_guard lock(io_mutex_);
    if (closed_.exchange(true)) {
        return;
    }

    close_fd(stdin_fd_);

    if (child_pid_ > 0 && !reaped()) {
        ::kill(child_pid_, SIGTERM);

        const auto deadline = Clock::now() + launch_.shutdown_grace;
        reap(false);
        while (!reaped() && Clock::now() < deadline) {
            std::this_thread::sleep_for(kReapPollInterval);
            reap(false);
        }

        if (!reaped()) {
            MCPMUX_LOG_DEBUG(std::format("[{}] Process {} ignored SIGTERM, killing",
                                         launch_.label, child_pid_));
            ::kill(child_pid_, SIGKILL);
            reap(true);
        }
    }

    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }

    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(wake_read_fd_);
    close_fd(wake_write_fd_);

    if (child_pid_ > 0) {
        MCPMUX_LOG_INFO(std::format("[{}] Stopped process {}{}",
                                    launch_.label, child_pid_, exit_description()));
    }
}

bool ProcessChannel::is_open() const {
    return !cancelled_.load() && !closed_.load() && !eof_.load();
}

std::string ProcessChannel::describe() const {
    return std::format("process {} (pid {})", launch_.executable, child_pid_);
}

std::optional<int> ProcessChannel::exit_code() const {
    std::lock_guard lock(state_mutex_);
    return exit_code_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Reaping
// ─────────────────────────────────────────────────────────────────────────────

bool ProcessChannel::reaped() const {
    std::lock_guard lock(state_mutex_);
    return reaped_;
}

void ProcessChannel::reap(bool block) {
    std::lock_guard lock(state_mutex_);
    if (child_pid_ <= 0 || reaped_) {
        return;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(child_pid_, &status, block ? 0 : WNOHANG);
    } while (result == -1 && errno == EINTR);

    if (result == child_pid_) {
        reaped_ = true;
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -WTERMSIG(status);  // Negative indicates signal
        }
    } else if (result == -1) {
        // ECHILD: someone else reaped it; never signal that pid again
        reaped_ = true;
    }
}

std::string ProcessChannel::exit_description() const {
    const auto code = exit_code();
    if (!code.has_value()) {
        return {};
    }
    if (*code < 0) {
        return std::format(" (killed by signal {})", -*code);
    }
    return std::format(" (exit code {})", *code);
}

// ─────────────────────────────────────────────────────────────────────────────
// I/O
// ─────────────────────────────────────────────────────────────────────────────

Result<void> ProcessChannel::send(const Json& message, std::chrono::milliseconds timeout) {
    std::lock_guard lock(io_mutex_);

    if (cancelled_.load()) {
        return tl::unexpected(Error::cancelled("Channel was cancelled"));
    }
    if (closed_.load() || stdin_fd_ == -1) {
        return tl::unexpected(make_fault("Channel is closed"));
    }

    std::string data = message.dump(-1, ' ', false, Json::error_handler_t::replace);
    data += '\n';

    const auto deadline = deadline_after(timeout);

    // Loop to handle partial writes; stdin is non-blocking so a stalled
    // reader cannot hold us past the deadline
    const char* ptr = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        const ssize_t written = ::write(stdin_fd_, ptr, remaining);
        if (written >= 0) {
            ptr += written;
            remaining -= static_cast<std::size_t>(written);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            switch (wait_ready(stdin_fd_, POLLOUT, wake_read_fd_, deadline)) {
                case WaitOutcome::Ready:
                    continue;
                case WaitOutcome::Woken:
                    return tl::unexpected(Error::cancelled("Channel was cancelled"));
                case WaitOutcome::TimedOut:
                    return tl::unexpected(Error::protocol_fault(std::format(
                        "Timed out after {} ms writing to process", timeout.count())));
                case WaitOutcome::Failed:
                    return tl::unexpected(make_fault("Failed to poll process stdin: " + errno_text(errno)));
            }
        }
        if (errno == EPIPE) {
            reap(false);
            return tl::unexpected(make_fault("Process closed its stdin" + exit_description()));
        }
        return tl::unexpected(make_fault("Failed to write to process: " + errno_text(errno)));
    }

    return {};
}

Result<std::optional<std::string>> ProcessChannel::receive_line(std::chrono::milliseconds timeout) {
    std::lock_guard lock(io_mutex_);

    if (cancelled_.load()) {
        return tl::unexpected(Error::cancelled("Channel was cancelled"));
    }
    if (closed_.load() || stdout_fd_ == -1) {
        return tl::unexpected(make_fault("Channel is closed"));
    }

    const auto deadline = deadline_after(timeout);

    while (true) {
        const auto newline = pending_.find('\n');
        if (newline != std::string::npos) {
            std::string line = pending_.substr(0, newline);
            pending_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return std::optional<std::string>(std::move(line));
        }

        if (pending_.size() > launch_.max_line_length) {
            pending_.clear();
            return tl::unexpected(Error::protocol_fault(std::format(
                "Line from process exceeds {} bytes", launch_.max_line_length)));
        }

        if (eof_.load()) {
            if (!pending_.empty()) {
                // Unterminated final line
                std::string line = std::move(pending_);
                pending_.clear();
                return std::optional<std::string>(std::move(line));
            }
            reap(false);
            return tl::unexpected(make_fault("Process closed its stdout" + exit_description()));
        }

        switch (wait_ready(stdout_fd_, POLLIN, wake_read_fd_, deadline)) {
            case WaitOutcome::Ready:
                break;
            case WaitOutcome::Woken:
                return tl::unexpected(Error::cancelled("Channel was cancelled"));
            case WaitOutcome::TimedOut:
                return std::optional<std::string>{};
            case WaitOutcome::Failed:
                return tl::unexpected(make_fault("Failed to poll process stdout: " + errno_text(errno)));
        }

        char chunk[kReadChunkSize];
        const ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return tl::unexpected(make_fault("Failed to read from process: " + errno_text(errno)));
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        pending_.append(chunk, static_cast<std::size_t>(n));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Stderr forwarding
// ─────────────────────────────────────────────────────────────────────────────

void ProcessChannel::stderr_reader_loop() {
    std::string buffer;
    char chunk[1024];

    auto emit = [this](std::string_view line) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        MCPMUX_LOG_DEBUG(std::format("[{} stderr] {}", launch_.label, line));
    };

    while (true) {
        struct pollfd fds[2]{};
        fds[0].fd = stderr_fd_;
        fds[0].events = POLLIN;
        fds[1].fd = wake_read_fd_;
        fds[1].events = POLLIN;

        const int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (fds[1].revents != 0) {
            break;
        }

        const ssize_t n = ::read(stderr_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }

        buffer.append(chunk, static_cast<std::size_t>(n));
        std::size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            emit(std::string_view(buffer).substr(0, newline));
            buffer.erase(0, newline + 1);
        }
        if (buffer.size() > kMaxStderrLine) {
            emit(buffer);
            buffer.clear();
        }
    }

    if (!buffer.empty()) {
        emit(buffer);
    }
}

}  // namespace mcpmux
