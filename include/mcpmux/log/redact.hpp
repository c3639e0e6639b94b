#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Redaction helpers for log output
// ─────────────────────────────────────────────────────────────────────────────
// Environment override values and auth tokens never reach the log. Command
// arguments are printed, except values attached to secret-looking flags
// (`--api-key=...`, `--token xyz`).

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

inline constexpr std::string_view kRedacted{"<redacted>"};

/// True for names such as API_KEY, --auth-token, client_secret, PASSWORD
[[nodiscard]] bool looks_secret(std::string_view name);

/// "KEY1=<redacted>, KEY2=<redacted>"
[[nodiscard]] std::string redact_env(const std::map<std::string, std::string>& env);

/// Copy of args with secret flag values replaced by <redacted>
[[nodiscard]] std::vector<std::string> redact_args(const std::vector<std::string>& args);

/// Space-joined, already-redacted argument list for log lines
[[nodiscard]] std::string format_args(const std::vector<std::string>& args);

}  // namespace mcpmux
