// ─────────────────────────────────────────────────────────────────────────────
// Transport Adapter Tests
// ─────────────────────────────────────────────────────────────────────────────
// Launch preparation is pure and tested directly; open() is tested against
// real subprocesses.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpmux/client/protocol_client.hpp"
#include "mcpmux/transport/transport_adapter.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace mcpmux;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
namespace fs = std::filesystem;

namespace {

ServerConfig local_server(std::string command, std::vector<std::string> args = {}) {
    ServerConfig config;
    config.id = "test";
    config.command = std::move(command);
    config.args = std::move(args);
    return config;
}

HostProfile restricted_host(const fs::path& scratch) {
    HostProfile host;
    host.is_restricted_host = true;
    host.platform = HostPlatform::Vercel;
    host.scratch_dir = scratch;
    return host;
}

bool contains_arg(const std::vector<std::string>& args, const std::string& arg) {
    return std::find(args.begin(), args.end(), arg) != args.end();
}

Environment env_of(Environment::VariableMap vars, std::filesystem::path cwd = "/home/dev") {
    return Environment(std::move(vars), std::move(cwd));
}

Environment process_env() {
    return env_of({{"PATH", "/usr/bin:/bin"}, {"HOME", "/home/dev"}, {"SHARED", "from-process"}});
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("empty env override is a ConfigurationError naming the key", "[adapter][validate]") {
    auto config = local_server("npx", {"-y", "some-server"});
    config.env = {{"API_KEY", ""}, {"OTHER", "ok"}};

    auto plan = prepare_launch(config, HostProfile{}, process_env());
    REQUIRE_FALSE(plan.has_value());
    REQUIRE(plan.error().code == ErrorCode::ConfigurationError);
    REQUIRE_THAT(plan.error().message, ContainsSubstring("API_KEY"));
}

TEST_CASE("whitespace-only env override is rejected", "[adapter][validate]") {
    REQUIRE_FALSE(validate_env_overrides({{"TOKEN", "  \t"}}).has_value());
    REQUIRE_FALSE(validate_env_overrides({{"", "value"}}).has_value());
    REQUIRE(validate_env_overrides({{"TOKEN", " x "}}).has_value());
    REQUIRE(validate_env_overrides({}).has_value());
}

TEST_CASE("required variables come from overrides or the host environment", "[adapter][validate]") {
    const auto host_env = env_of({{"PATH", "/usr/bin"}, {"TAVILY_API_KEY", "tvly-1"}, {"BLANK", "   "}});

    REQUIRE(check_required_env({"TAVILY_API_KEY"}, {}, host_env).has_value());
    REQUIRE(check_required_env({"BRAVE_API_KEY"}, {{"BRAVE_API_KEY", "k"}}, host_env).has_value());
    REQUIRE(check_required_env({}, {}, host_env).has_value());

    auto missing = check_required_env({"TAVILY_API_KEY", "BRAVE_API_KEY"}, {}, host_env);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::ConfigurationError);
    REQUIRE_THAT(missing.error().message, ContainsSubstring("BRAVE_API_KEY"));

    // A blank inherited value counts as missing
    REQUIRE_FALSE(check_required_env({"BLANK"}, {}, host_env).has_value());
}

TEST_CASE("missing required variable fails launch preparation", "[adapter][validate]") {
    auto config = local_server("npx", {"-y", "tavily-mcp"});
    config.required_env = {"TAVILY_API_KEY"};

    auto plan = prepare_launch(config, HostProfile{}, process_env());
    REQUIRE_FALSE(plan.has_value());
    REQUIRE(plan.error().code == ErrorCode::ConfigurationError);
    REQUIRE_THAT(plan.error().message, ContainsSubstring("TAVILY_API_KEY"));

    config.env = {{"TAVILY_API_KEY", "tvly-2"}};
    REQUIRE(prepare_launch(config, HostProfile{}, process_env()).has_value());
}

TEST_CASE("empty command is a ConfigurationError", "[adapter][validate]") {
    auto plan = prepare_launch(local_server(""), HostProfile{}, process_env());
    REQUIRE_FALSE(plan.has_value());
    REQUIRE(plan.error().code == ErrorCode::ConfigurationError);
}

// ═══════════════════════════════════════════════════════════════════════════
// Environment merge
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("standard host passes the process environment plus overrides", "[adapter][env]") {
    auto config = local_server("uvx", {"mcp-server-git"});
    config.env = {{"SHARED", "from-override"}, {"API_KEY", "secret"}};

    auto plan = prepare_launch(config, HostProfile{}, process_env());
    REQUIRE(plan.has_value());
    REQUIRE(plan->environment["PATH"] == "/usr/bin:/bin");
    REQUIRE(plan->environment["SHARED"] == "from-override");
    REQUIRE(plan->environment["API_KEY"] == "secret");
    REQUIRE(plan->environment.count("NPM_CONFIG_CACHE") == 0);
    REQUIRE(plan->args == std::vector<std::string>{"mcp-server-git"});
    REQUIRE(plan->scratch_dirs.empty());
}

TEST_CASE("restricted host injects npm defaults and scratch dirs", "[adapter][env][restricted]") {
    auto plan = prepare_launch(local_server("npx", {"-y", "pkg"}), restricted_host("/scratch"),
                               env_of({{"PATH", "/usr/bin"}}, "/var/task"));
    REQUIRE(plan.has_value());

    auto& env = plan->environment;
    REQUIRE(env["NPM_CONFIG_CACHE"] == "/scratch/.npm-cache");
    REQUIRE(env["NPM_CONFIG_PREFIX"] == "/scratch/.npm-global");
    REQUIRE(env["NPM_CONFIG_UPDATE_NOTIFIER"] == "false");
    REQUIRE(env["NPM_CONFIG_AUDIT"] == "false");
    REQUIRE(env["NPM_CONFIG_FUND"] == "false");
    REQUIRE(env["NPM_CONFIG_LOGLEVEL"] == "error");
    REQUIRE(env["HOME"] == "/scratch");
    REQUIRE(env["NODE_PATH"] == "/scratch/node_modules:/scratch/.npm-global/lib/node_modules");

    REQUIRE(plan->scratch_dirs.size() == 3);
    REQUIRE(contains_arg(plan->args, "--no-audit"));
    REQUIRE(contains_arg(plan->args, "--no-fund"));
    REQUIRE(contains_arg(plan->args, "--prefer-offline"));
    REQUIRE(plan->args[0] == "-y");
    REQUIRE(plan->args[1] == "pkg");
}

TEST_CASE("restricted host keeps an absolute HOME and extends NODE_PATH", "[adapter][env][restricted]") {
    auto plan = prepare_launch(local_server("node", {"server.js"}), restricted_host("/scratch"),
                               env_of({{"HOME", "/home/app"}, {"NODE_PATH", "/opt/lib"}}));
    REQUIRE(plan.has_value());
    REQUIRE(plan->environment["HOME"] == "/home/app");
    REQUIRE(plan->environment["NODE_PATH"] ==
            "/opt/lib:/scratch/node_modules:/scratch/.npm-global/lib/node_modules");
    REQUIRE(plan->args == std::vector<std::string>{"server.js"});  // not an npm launcher
}

TEST_CASE("restricted host does not duplicate npm flags", "[adapter][env][restricted]") {
    auto plan = prepare_launch(local_server("/usr/bin/npm", {"exec", "--no-fund", "pkg"}),
                               restricted_host("/scratch"), Environment{});
    REQUIRE(plan.has_value());
    REQUIRE(std::count(plan->args.begin(), plan->args.end(), "--no-fund") == 1);
    REQUIRE(contains_arg(plan->args, "--no-audit"));
}

TEST_CASE("caller overrides beat restricted-host defaults", "[adapter][env][restricted]") {
    auto config = local_server("npx");
    config.env = {{"NPM_CONFIG_LOGLEVEL", "verbose"}, {"HOME", "/custom"}};

    auto plan = prepare_launch(config, restricted_host("/scratch"), Environment{});
    REQUIRE(plan.has_value());
    REQUIRE(plan->environment["NPM_CONFIG_LOGLEVEL"] == "verbose");
    REQUIRE(plan->environment["HOME"] == "/custom");
}

// ═══════════════════════════════════════════════════════════════════════════
// open()
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("open never spawns when an env override is empty", "[adapter][open]") {
    const auto marker = fs::temp_directory_path() / ("mcpmux-no-spawn-" + std::to_string(::getpid()));
    fs::remove(marker);

    auto config = local_server("/bin/sh", {"-c", "touch " + marker.string()});
    config.env = {{"API_KEY", ""}};

    TransportAdapter adapter(process_env(), ProcessOptions{});
    auto opened = adapter.open(config, HostProfile{});

    REQUIRE_FALSE(opened.has_value());
    REQUIRE(opened.error().code == ErrorCode::ConfigurationError);
    std::this_thread::sleep_for(100ms);
    REQUIRE_FALSE(fs::exists(marker));
}

TEST_CASE("open never spawns when a required variable is missing", "[adapter][open]") {
    const auto marker = fs::temp_directory_path() / ("mcpmux-no-spawn-required-" + std::to_string(::getpid()));
    fs::remove(marker);

    auto config = local_server("/bin/sh", {"-c", "touch " + marker.string()});
    config.required_env = {"MCPMUX_TEST_UNSET_KEY"};

    TransportAdapter adapter(process_env(), ProcessOptions{});
    auto opened = adapter.open(config, HostProfile{});

    REQUIRE_FALSE(opened.has_value());
    REQUIRE(opened.error().code == ErrorCode::ConfigurationError);
    REQUIRE_THAT(opened.error().message, ContainsSubstring("MCPMUX_TEST_UNSET_KEY"));
    std::this_thread::sleep_for(100ms);
    REQUIRE_FALSE(fs::exists(marker));
}

TEST_CASE("open rejects remote-http as TransportUnavailable", "[adapter][open]") {
    ServerConfig config;
    config.id = "remote";
    config.transport = TransportKind::RemoteHttp;
    config.url = "https://example.com/mcp";

    TransportAdapter adapter(process_env(), ProcessOptions{});
    auto opened = adapter.open(config, HostProfile{});

    REQUIRE_FALSE(opened.has_value());
    REQUIRE(opened.error().code == ErrorCode::TransportUnavailable);
}

TEST_CASE("open reports an unresolvable command as TransportUnavailable", "[adapter][open]") {
    TransportAdapter adapter(process_env(), ProcessOptions{});
    auto opened = adapter.open(local_server("definitely_not_a_command_xyz"), HostProfile{});

    REQUIRE_FALSE(opened.has_value());
    REQUIRE(opened.error().code == ErrorCode::TransportUnavailable);
    REQUIRE(opened.error().details.has_value());
}

TEST_CASE("open resolves through the merged PATH and spawns", "[adapter][open]") {
    auto config = local_server("sh", {"-c", "echo \"$GREETING\""});
    config.env = {{"GREETING", "hello from override"}};

    TransportAdapter adapter(process_env(), ProcessOptions{});
    auto opened = adapter.open(config, HostProfile{});

    REQUIRE(opened.has_value());
    REQUIRE_THAT(opened->resolved_command, ContainsSubstring("/sh"));

    auto line = opened->channel->receive_line(5s);
    REQUIRE(line.has_value());
    REQUIRE(line->has_value());
    REQUIRE(**line == "hello from override");
    opened->channel->close();
}

TEST_CASE("open against the fake tool server completes a handshake", "[adapter][open][integration]") {
    auto config = local_server(MCPMUX_FAKE_SERVER_PATH, {"--no-prompts"});

    TransportAdapter adapter(process_env(), ProcessOptions{});
    auto opened = adapter.open(config, HostProfile{});
    REQUIRE(opened.has_value());
    REQUIRE(opened->resolved_command == MCPMUX_FAKE_SERVER_PATH);

    ProtocolClient client(opened->channel, "fake", Implementation{"tests", "1.0"});
    auto caps = client.handshake(5s);
    REQUIRE(caps.has_value());
    REQUIRE(caps->tools.size() == 5);
    REQUIRE(caps->resources.size() == 1);
    REQUIRE(caps->prompts.empty());
    REQUIRE(caps->server_info->name == "fake-tool-server");

    opened->channel->close();
}
