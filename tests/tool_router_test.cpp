// ─────────────────────────────────────────────────────────────────────────────
// Tool Router Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpmux/router/tool_router.hpp"
#include "mocks/scripted_channel.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

using namespace mcpmux;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using mcpmux::testing::McpScript;
using mcpmux::testing::ScriptedAdapter;
using mcpmux::testing::tool_json;

namespace {

HubConfig test_config() {
    HubConfig config;
    config.with_handshake_timeout(3s).with_call_timeout(3s).with_shutdown_grace(50ms);
    return config;
}

ServerConfig server(const std::string& id, const std::string& name = {}) {
    ServerConfig config;
    config.id = id;
    config.name = name;
    config.command = "scripted";
    return config;
}

Json text_result(const std::string& text) {
    return {{"content", Json::array({{{"type", "text"}, {"text", text}}})}};
}

McpScript script_with(Json tools) {
    McpScript script;
    script.tools = std::move(tools);
    script.on_tool_call = [](const Json& params) -> Json {
        const auto name = params.value("name", std::string{});
        if (name == "fail") {
            Json failed = text_result("boom");
            failed["isError"] = true;
            return failed;
        }
        return text_result(name + " " + params.value("arguments", Json::object()).dump());
    };
    return script;
}

std::vector<std::string> tool_names(const std::vector<AnnotatedTool>& tools) {
    std::vector<std::string> names;
    for (const auto& entry : tools) {
        names.push_back(entry.tool.name);
    }
    return names;
}

/// Router with git, github and fs active and a stopped git mirror
struct Fleet {
    std::shared_ptr<ScriptedAdapter> adapter = std::make_shared<ScriptedAdapter>();
    ToolRouter router{test_config(), HostProfile{}, adapter};

    Fleet() {
        adapter->script("git", script_with(Json::array({
            tool_json("git_status", "Show the working tree status"),
            tool_json("git_log", "Show commit logs"),
            tool_json("fail", "Always fails"),
        })));
        adapter->script("github", script_with(Json::array({
            tool_json("create_issue", "Create a GitHub issue"),
        })));
        adapter->script("fs", script_with(Json::array({
            tool_json("read_file", "Read a file from disk"),
        })));
        adapter->script("mirror", script_with(Json::array({
            tool_json("git_clone", "Clone a repository"),
        })));

        for (const auto& [id, name] : {std::pair{"git", "Git"}, std::pair{"github", "GitHub"},
                                       std::pair{"fs", "Filesystem"}, std::pair{"mirror", "Mirror"}}) {
            (void)router.add_server(server(id, name));
            REQUIRE(router.start_server(id).has_value());
        }
        REQUIRE(router.stop_server("mirror").has_value());
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Preconditions
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("execute_tool without an active connection is NotConnected", "[router][error]") {
    auto adapter = std::make_shared<ScriptedAdapter>();
    ToolRouter router(test_config(), HostProfile{}, adapter);
    (void)router.add_server(server("git"));

    auto inactive = router.execute_tool("git", "git_status", Json::object());
    REQUIRE_FALSE(inactive.has_value());
    REQUIRE(inactive.error().code == ErrorCode::NotConnected);

    REQUIRE(router.get_resource("git", "git://HEAD").error().code == ErrorCode::NotConnected);
    REQUIRE(router.get_prompt("git", "commit", Json::object()).error().code == ErrorCode::NotConnected);

    adapter->fail("broken", Error::connection_fault("died"));
    (void)router.add_server(server("broken"));
    REQUIRE_FALSE(router.start_server("broken").has_value());
    REQUIRE(router.execute_tool("broken", "x", Json::object()).error().code == ErrorCode::NotConnected);

    REQUIRE(router.execute_tool("unknown", "x", Json::object()).error().code == ErrorCode::NotFound);
}

TEST_CASE("execute_tool after stop is NotConnected", "[router][error]") {
    Fleet fleet;
    REQUIRE(fleet.router.execute_tool("git", "git_status", Json::object()).has_value());

    REQUIRE(fleet.router.stop_server("git").has_value());
    REQUIRE(fleet.router.execute_tool("git", "git_status", Json::object()).error().code ==
            ErrorCode::NotConnected);
    REQUIRE_FALSE(fleet.router.is_connected("git"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Invocation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("execute_tool routes to the named server", "[router][call]") {
    Fleet fleet;

    auto result = fleet.router.execute_tool("git", "git_status", {{"repo_path", "."}});
    REQUIRE(result.has_value());
    REQUIRE((*result)["content"][0]["text"] == R"(git_status {"repo_path":"."})");

    auto channel = fleet.adapter->channel("git");
    REQUIRE(channel->count_sent("tools/call") == 1);
    REQUIRE(fleet.adapter->channel("fs")->count_sent("tools/call") == 0);
}

TEST_CASE("isError results become ToolExecutionError with details", "[router][call][error]") {
    Fleet fleet;

    auto result = fleet.router.execute_tool("git", "fail", Json::object());
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::ToolExecutionError);
    REQUIRE(result.error().message == "boom");
    REQUIRE(result.error().details.has_value());
    REQUIRE((*result.error().details)["isError"] == true);
}

TEST_CASE("RPC errors from the provider keep the original error", "[router][call][error]") {
    auto adapter = std::make_shared<ScriptedAdapter>();
    ToolRouter router(test_config(), HostProfile{}, adapter);
    (void)router.add_server(server("bare"));  // default script has no tools/call handler
    REQUIRE(router.start_server("bare").has_value());

    auto result = router.execute_tool("bare", "anything", Json::object());
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::ToolExecutionError);
    REQUIRE(result.error().rpc_error.has_value());
    REQUIRE(result.error().rpc_error->code == RpcErrorCode::MethodNotFound);
}

TEST_CASE("get_resource and get_prompt go to the live connection", "[router][call]") {
    Fleet fleet;

    auto resource = fleet.router.get_resource("fs", "file:///etc/hosts");
    REQUIRE(resource.has_value());
    REQUIRE((*resource)["contents"][0]["uri"] == "file:///etc/hosts");

    auto prompt = fleet.router.get_prompt("git", "commit_message", {{"style", "short"}});
    REQUIRE(prompt.has_value());
    REQUIRE((*prompt)["messages"].is_array());

    const auto sent = fleet.adapter->channel("git")->sent();
    const auto request = std::find_if(sent.begin(), sent.end(), [](const Json& m) {
        return m.value("method", std::string{}) == "prompts/get";
    });
    REQUIRE(request != sent.end());
    REQUIRE((*request)["params"]["name"] == "commit_message");
    REQUIRE((*request)["params"]["arguments"]["style"] == "short");
}

// ═══════════════════════════════════════════════════════════════════════════
// Batches
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("execute_tool_calls captures each failure per call", "[router][batch]") {
    Fleet fleet;

    const std::vector<ToolCall> calls = {
        {"git", "git_status", Json::object()},
        {"mirror", "git_clone", Json::object()},
        {"git", "fail", Json::object()},
        {"nowhere", "x", Json::object()},
        {"fs", "read_file", {{"path", "/tmp/a"}}},
    };

    const auto outcomes = fleet.router.execute_tool_calls(calls);
    REQUIRE(outcomes.size() == 5);

    REQUIRE(outcomes[0].result.has_value());
    REQUIRE(outcomes[0].server_name == "Git");
    REQUIRE(outcomes[0].call.tool_name == "git_status");

    REQUIRE(outcomes[1].result.error().code == ErrorCode::NotConnected);
    REQUIRE(outcomes[1].server_name == "Mirror");

    REQUIRE(outcomes[2].result.error().code == ErrorCode::ToolExecutionError);

    REQUIRE(outcomes[3].result.error().code == ErrorCode::NotFound);
    REQUIRE(outcomes[3].server_name == "nowhere");

    REQUIRE(outcomes[4].result.has_value());
    REQUIRE((*outcomes[4].result)["content"][0]["text"] == R"(read_file {"path":"/tmp/a"})");
}

TEST_CASE("execute_tool_calls with no calls returns nothing", "[router][batch]") {
    Fleet fleet;
    REQUIRE(fleet.router.execute_tool_calls({}).empty());
}

TEST_CASE("format_tool_results renders each outcome", "[router][batch][format]") {
    const std::vector<ToolCallOutcome> outcomes = {
        {ToolCall{"git", "git_status"}, "Git", Json("clean")},
        {ToolCall{"fs", "read_file"}, "Filesystem", tl::unexpected(Error::not_connected("fs"))},
        {ToolCall{"x", "noop"}, "x", Json(nullptr)},
        {ToolCall{"s", "stats"}, "Stats", Json{{"count", 1}}},
    };

    const auto text = ToolRouter::format_tool_results(outcomes);
    REQUIRE(text ==
            "[Git - git_status]\nclean\n\n"
            "[Filesystem - read_file] Error: Server 'fs' has no active connection\n\n"
            "[x - noop] No result\n\n"
            "[Stats - stats]\n{\n  \"count\": 1\n}");

    REQUIRE(ToolRouter::format_tool_results({}).empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Aggregation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("get_all_tools covers active servers only", "[router][tools]") {
    Fleet fleet;

    const auto tools = fleet.router.get_all_tools();
    REQUIRE(tool_names(tools) ==
            std::vector<std::string>{"git_status", "git_log", "fail", "create_issue", "read_file"});
    REQUIRE(tools[0].server_id == "git");
    REQUIRE(tools[0].server_name == "Git");
    REQUIRE(tools[3].server_name == "GitHub");
    REQUIRE(tools[0].to_json()["tool"]["inputSchema"]["type"] == "object");
}

TEST_CASE("search_tools matches name or description case-insensitively", "[router][search]") {
    Fleet fleet;

    const auto matches = fleet.router.search_tools("git");
    REQUIRE(tool_names(matches) == std::vector<std::string>{"git_status", "git_log", "create_issue"});

    // The stopped mirror's git_clone is excluded
    for (const auto& match : matches) {
        REQUIRE(match.server_id != "mirror");
    }

    REQUIRE(tool_names(fleet.router.search_tools("DISK")) == std::vector<std::string>{"read_file"});
    REQUIRE(fleet.router.search_tools("nonexistent").empty());
    REQUIRE(fleet.router.search_tools("").size() == 5);
}

TEST_CASE("recommend_tools scores words from the message", "[router][recommend]") {
    Fleet fleet;

    const auto recommended = fleet.router.recommend_tools("Can you check the git status of my repo?");
    REQUIRE(tool_names(recommended) == std::vector<std::string>{"git_status", "git_log"});

    REQUIRE(tool_names(fleet.router.recommend_tools("please read this file")) ==
            std::vector<std::string>{"read_file"});
    REQUIRE(tool_names(fleet.router.recommend_tools("git status", 1)) ==
            std::vector<std::string>{"git_status"});
    REQUIRE(fleet.router.recommend_tools("hello there").empty());
}

TEST_CASE("active_server_ids and is_connected follow lifecycle", "[router][query]") {
    Fleet fleet;

    REQUIRE(fleet.router.active_server_ids() == std::vector<std::string>{"git", "github", "fs"});
    REQUIRE(fleet.router.is_connected("fs"));
    REQUIRE_FALSE(fleet.router.is_connected("mirror"));
    REQUIRE_FALSE(fleet.router.is_connected("unknown"));
    REQUIRE(fleet.router.list_servers().size() == 4);
    REQUIRE(fleet.router.get_server("mirror")->status == ServerStatus::Inactive);
}

TEST_CASE("delete and update go through the router", "[router][lifecycle]") {
    Fleet fleet;

    REQUIRE(fleet.router.delete_server("git").error().code == ErrorCode::PreconditionFailed);
    REQUIRE(fleet.router.delete_server("mirror")->success);
    REQUIRE(fleet.router.get_server("mirror").error().code == ErrorCode::NotFound);

    ServerUpdate update;
    update.description = "Local repository tools";
    auto updated = fleet.router.update_server("git", update);
    REQUIRE(updated.has_value());
    REQUIRE(updated->description == "Local repository tools");
    REQUIRE_FALSE(updated->restart_required);
}

// ═══════════════════════════════════════════════════════════════════════════
// Real subprocesses
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("router drives the fake tool server end to end", "[router][process][integration]") {
    auto router = ToolRouter::create(test_config());

    ServerConfig config;
    config.id = "fake";
    config.name = "Fake";
    config.command = MCPMUX_FAKE_SERVER_PATH;
    config.env = {{"FAKE_GREETING", "hello"}};
    (void)router->add_server(config);

    auto started = router->start_server("fake");
    REQUIRE(started.has_value());
    REQUIRE(started->tools.size() == 5);
    REQUIRE(started->prompts.size() == 1);
    REQUIRE(started->prompts[0].arguments[0].name == "topic");

    auto status = router->execute_tool("fake", "git_status", Json::object());
    REQUIRE(status.has_value());
    REQUIRE((*status)["content"][0]["text"] == "nothing to commit, working tree clean");

    auto env = router->execute_tool("fake", "env", {{"name", "FAKE_GREETING"}});
    REQUIRE(env.has_value());
    REQUIRE((*env)["content"][0]["text"] == "hello");

    auto failed = router->execute_tool("fake", "fail", Json::object());
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code == ErrorCode::ToolExecutionError);
    REQUIRE(failed.error().message == "boom");

    auto unknown = router->execute_tool("fake", "nope", Json::object());
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().rpc_error->code == RpcErrorCode::InvalidParams);

    auto resource = router->get_resource("fake", "memo://readme");
    REQUIRE(resource.has_value());
    REQUIRE((*resource)["contents"][0]["text"] == "contents of memo://readme");

    auto prompt = router->get_prompt("fake", "summarize", {{"topic", "logs"}});
    REQUIRE(prompt.has_value());
    REQUIRE((*prompt)["messages"][0]["content"]["text"] == "Summarize logs");

    REQUIRE(tool_names(router->search_tools("GIT")) == std::vector<std::string>{"git_status"});

    REQUIRE(router->stop_server("fake").has_value());
    REQUIRE(router->delete_server("fake")->success);
}

TEST_CASE("a call that outlives call_timeout is a ProtocolFault", "[router][process][timeout]") {
    auto config = test_config();
    config.with_call_timeout(200ms);
    auto router = ToolRouter::create(config);

    ServerConfig server_config;
    server_config.id = "fake";
    server_config.command = MCPMUX_FAKE_SERVER_PATH;
    (void)router->add_server(server_config);
    REQUIRE(router->start_server("fake").has_value());

    auto slow = router->execute_tool("fake", "sleep", {{"ms", 2000}});
    REQUIRE_FALSE(slow.has_value());
    REQUIRE(slow.error().code == ErrorCode::ProtocolFault);

    REQUIRE(router->stop_server("fake").has_value());
}

TEST_CASE("stopping a server cancels its in-flight call", "[router][process][cancel]") {
    auto router = ToolRouter::create(test_config());

    ServerConfig config;
    config.id = "fake";
    config.command = MCPMUX_FAKE_SERVER_PATH;
    (void)router->add_server(config);
    REQUIRE(router->start_server("fake").has_value());

    auto call = std::async(std::launch::async, [&] {
        return router->execute_tool("fake", "sleep", {{"ms", 2500}});
    });
    std::this_thread::sleep_for(300ms);

    const auto begin = std::chrono::steady_clock::now();
    REQUIRE(router->stop_server("fake").has_value());

    auto outcome = call.get();
    REQUIRE(std::chrono::steady_clock::now() - begin < 1500ms);
    REQUIRE_FALSE(outcome.has_value());
    REQUIRE(outcome.error().code == ErrorCode::Cancelled);
    REQUIRE_FALSE(router->is_connected("fake"));
}

TEST_CASE("router rejects an empty env override without spawning", "[router][process][error]") {
    auto router = ToolRouter::create(test_config());

    ServerConfig config;
    config.id = "keyed";
    config.command = "npx";
    config.args = {"-y", "@example/server"};
    config.env = {{"API_KEY", ""}};
    (void)router->add_server(config);

    auto started = router->start_server("keyed");
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code == ErrorCode::ConfigurationError);
    REQUIRE_THAT(started.error().message, ContainsSubstring("API_KEY"));
    REQUIRE(router->get_server("keyed")->status == ServerStatus::Error);
    REQUIRE(router->get_server("keyed")->resolved_command.empty());
}
