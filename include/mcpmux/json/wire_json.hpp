#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Wire JSON decoding
// ─────────────────────────────────────────────────────────────────────────────
// Incoming channel lines are parsed with simdjson and converted to
// nlohmann::json, which the rest of the library uses as its JSON model.
// Outgoing messages are serialized with nlohmann directly.

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcpmux {

struct WireDecodeError {
    std::string message;
};

using WireDecodeResult = tl::expected<nlohmann::json, WireDecodeError>;

class WireDecoder {
public:
    /// Nesting deeper than this is rejected instead of recursing further
    static constexpr std::size_t kMaxDepth = 64;

    WireDecoder() = default;

    WireDecoder(const WireDecoder&) = delete;
    WireDecoder& operator=(const WireDecoder&) = delete;

    /// Parse one complete JSON document
    [[nodiscard]] WireDecodeResult decode(std::string_view text);

private:
    [[nodiscard]] WireDecodeResult convert(simdjson::dom::element element, std::size_t depth);

    simdjson::dom::parser parser_;
};

/// Cheap pre-check: does the line look like it could hold a JSON object?
[[nodiscard]] bool looks_like_json_object(std::string_view line) noexcept;

}  // namespace mcpmux
