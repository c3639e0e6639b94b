// ─────────────────────────────────────────────────────────────────────────────
// Redaction Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpmux/log/redact.hpp"

using namespace mcpmux;

TEST_CASE("secret-looking names are detected case-insensitively", "[redact]") {
    REQUIRE(looks_secret("API_KEY"));
    REQUIRE(looks_secret("--auth-token"));
    REQUIRE(looks_secret("client_secret"));
    REQUIRE(looks_secret("PASSWORD"));
    REQUIRE(looks_secret("GITHUB_PERSONAL_ACCESS_TOKEN"));
    REQUIRE(looks_secret("--Credentials"));

    REQUIRE_FALSE(looks_secret("PATH"));
    REQUIRE_FALSE(looks_secret("--port"));
    REQUIRE_FALSE(looks_secret("-y"));
}

TEST_CASE("env values never appear in redacted output", "[redact][env]") {
    const std::map<std::string, std::string> env = {
        {"API_KEY", "sk-live-123"},
        {"REGION", "eu-west-1"},
        {"EMPTY", ""}
    };

    const auto text = redact_env(env);
    REQUIRE(text == "API_KEY=<redacted>, EMPTY=<empty>, REGION=<redacted>");
    REQUIRE(text.find("sk-live-123") == std::string::npos);
    REQUIRE(text.find("eu-west-1") == std::string::npos);
    REQUIRE(redact_env({}).empty());
}

TEST_CASE("inline secret flag values are redacted", "[redact][args]") {
    const auto args = redact_args({"-y", "@acme/server", "--api-key=sk-123", "--port=8080"});

    REQUIRE(args.size() == 4);
    REQUIRE(args[0] == "-y");
    REQUIRE(args[1] == "@acme/server");
    REQUIRE(args[2] == "--api-key=<redacted>");
    REQUIRE(args[3] == "--port=8080");
}

TEST_CASE("separate secret flag values are redacted", "[redact][args]") {
    const auto args = redact_args({"--token", "abc", "--verbose", "--password", "--next"});

    REQUIRE(args == std::vector<std::string>{"--token", "<redacted>", "--verbose", "--password", "--next"});
}

TEST_CASE("format_args joins the redacted list", "[redact][args]") {
    REQUIRE(format_args({"mcp-server-git", "--repository", "/srv/repo"}) ==
            "mcp-server-git --repository /srv/repo");
    REQUIRE(format_args({"--auth", "hunter2"}) == "--auth <redacted>");
    REQUIRE(format_args({}).empty());
}
