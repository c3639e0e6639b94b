#include "mcpmux/log/redact.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace mcpmux {

namespace {

constexpr std::array<std::string_view, 7> kSecretMarkers = {
    "key", "token", "secret", "password", "passwd", "auth", "credential"
};

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_flag(std::string_view arg) noexcept {
    return arg.size() > 1 && arg.front() == '-';
}

}  // namespace

bool looks_secret(std::string_view name) {
    const std::string lower = lowercase(name);
    return std::any_of(kSecretMarkers.begin(), kSecretMarkers.end(),
                       [&lower](std::string_view marker) {
                           return lower.find(marker) != std::string::npos;
                       });
}

std::string redact_env(const std::map<std::string, std::string>& env) {
    std::string out;
    for (const auto& [key, value] : env) {
        if (!out.empty()) {
            out += ", ";
        }
        out += key;
        out += '=';
        out += value.empty() ? std::string_view{"<empty>"} : kRedacted;
    }
    return out;
}

std::vector<std::string> redact_args(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    out.reserve(args.size());

    bool redact_next = false;
    for (const auto& arg : args) {
        if (redact_next && !is_flag(arg)) {
            out.emplace_back(kRedacted);
            redact_next = false;
            continue;
        }
        redact_next = false;

        if (is_flag(arg)) {
            const auto eq = arg.find('=');
            if (eq != std::string::npos) {
                const std::string_view flag(arg.data(), eq);
                if (looks_secret(flag)) {
                    out.push_back(std::string(flag) + "=" + std::string(kRedacted));
                    continue;
                }
            } else if (looks_secret(arg)) {
                redact_next = true;
            }
        }
        out.push_back(arg);
    }
    return out;
}

std::string format_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : redact_args(args)) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

}  // namespace mcpmux
