#pragma once

// Platform check - ProcessChannel requires POSIX APIs
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessChannel is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "mcpmux/transport/channel.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/types.h>  // For pid_t

namespace mcpmux {

// ═══════════════════════════════════════════════════════════════════════════
// Process Channel Configuration
// ═══════════════════════════════════════════════════════════════════════════

/// How to handle stderr from the subprocess
enum class StderrHandling {
    Discard,     // Redirect to /dev/null (default)
    Passthrough, // Let stderr go to parent's stderr
    Log          // Forward each line to the debug log
};

[[nodiscard]] constexpr std::string_view to_string(StderrHandling handling) noexcept {
    switch (handling) {
        case StderrHandling::Discard:     return "discard";
        case StderrHandling::Passthrough: return "passthrough";
        case StderrHandling::Log:         return "log";
    }
    return "unknown";
}

struct ProcessLaunch {
    std::string label;                          // Server id, used in log lines
    std::string executable;                     // Already resolved path, passed to execve as-is
    std::vector<std::string> args;              // Arguments after argv[0]
    std::map<std::string, std::string> environment;  // Complete child environment
    StderrHandling stderr_handling{StderrHandling::Discard};
    std::chrono::milliseconds spawn_timeout{5000};
    std::chrono::milliseconds shutdown_grace{100};
    std::size_t max_line_length{16u << 20};    // 16 MiB
};

// ═══════════════════════════════════════════════════════════════════════════
// Process Channel
// ═══════════════════════════════════════════════════════════════════════════
// Spawns a subprocess and exchanges newline-delimited JSON over its
// stdin/stdout. A self-pipe wakes blocked reads and writes on cancel().

class ProcessChannel final : public IChannel {
public:
    /// Fork and exec `launch.executable`. Exec failure is reported as ConnectionFault.
    [[nodiscard]] static Result<std::unique_ptr<ProcessChannel>> spawn(ProcessLaunch launch);

    ~ProcessChannel() override;

    // Non-copyable, non-movable
    ProcessChannel(const ProcessChannel&) = delete;
    ProcessChannel& operator=(const ProcessChannel&) = delete;
    ProcessChannel(ProcessChannel&&) = delete;
    ProcessChannel& operator=(ProcessChannel&&) = delete;

    [[nodiscard]] Result<void> send(const Json& message, std::chrono::milliseconds timeout) override;
    [[nodiscard]] Result<std::optional<std::string>> receive_line(std::chrono::milliseconds timeout) override;
    void cancel() noexcept override;
    void close() override;
    [[nodiscard]] bool is_open() const override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] pid_t pid() const noexcept { return child_pid_; }

    /// Child exit code once reaped; negative values are terminating signals
    [[nodiscard]] std::optional<int> exit_code() const;

private:
    explicit ProcessChannel(ProcessLaunch launch);

    [[nodiscard]] Result<void> start();
    [[nodiscard]] Result<void> wait_for_exec(int status_fd);
    void stderr_reader_loop();
    void reap(bool block);
    [[nodiscard]] bool reaped() const;
    [[nodiscard]] std::string exit_description() const;

    ProcessLaunch launch_;
    pid_t child_pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
    int wake_read_fd_{-1};
    int wake_write_fd_{-1};

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> eof_{false};

    // Held for the duration of send/receive; close() takes it after cancel()
    std::mutex io_mutex_;

    // Guards the reaping state, which exit_code() reads without io_mutex_
    mutable std::mutex state_mutex_;
    bool reaped_{false};
    std::optional<int> exit_code_;

    // Read buffer to avoid syscall-per-byte
    std::string pending_;

    std::thread stderr_thread_;
};

}  // namespace mcpmux
