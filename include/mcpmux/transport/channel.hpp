#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Channel
// ═══════════════════════════════════════════════════════════════════════════
// Line-oriented, bidirectional byte channel to one tool provider. One JSON
// document per line in each direction. Implementations must allow cancel()
// and close() from a thread other than the one blocked in send/receive.

#include "mcpmux/error.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace mcpmux {

class IChannel {
public:
    virtual ~IChannel() = default;

    /// Serialize `message` and write it followed by '\n'
    [[nodiscard]] virtual Result<void> send(const Json& message, std::chrono::milliseconds timeout) = 0;

    /// Next line from the peer without its terminator.
    /// nullopt when `timeout` elapses first; ConnectionFault on EOF; Cancelled after cancel().
    [[nodiscard]] virtual Result<std::optional<std::string>> receive_line(std::chrono::milliseconds timeout) = 0;

    /// Make every pending and future send/receive return Cancelled. Thread-safe, never blocks.
    virtual void cancel() noexcept = 0;

    /// Cancel and release the underlying resources. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    /// Short human-readable description for logs (already redacted)
    [[nodiscard]] virtual std::string describe() const = 0;
};

}  // namespace mcpmux
