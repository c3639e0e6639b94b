// ─────────────────────────────────────────────────────────────────────────────
// mcpmux-cli - Tool Server Hub
// ─────────────────────────────────────────────────────────────────────────────
// Starts every server from a definitions file (or one ad-hoc command) and
// routes calls to them through mcpmux::ToolRouter.
//
// Usage:
//   # Definitions file ({"mcpServers": {"<id>": {"command": ..., "args": [...], "env": {...}}}})
//   mcpmux-cli --config servers.json --list-tools
//   mcpmux-cli --config servers.json --search git
//   mcpmux-cli --config servers.json --call git/git_status --args '{"repo_path":"."}'
//   mcpmux-cli --config servers.json --read fs --uri file:///tmp/notes.txt
//
//   # Single server without a file
//   mcpmux-cli -c uvx -a mcp-server-git --list-tools
//
// Server failures never abort the run: a server that fails to start is
// reported and skipped, the rest stay usable.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcpmux/config/hub_config.hpp"
#include "mcpmux/log/logger.hpp"
#include "mcpmux/log/spdlog_logger.hpp"
#include "mcpmux/router/tool_router.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace mcpmux;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* blue    = "\033[34m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

void print_tools(const std::vector<AnnotatedTool>& tools, bool json_output) {
    if (json_output) {
        Json output = Json::array();
        for (const auto& entry : tools) {
            output.push_back(entry.to_json());
        }
        print_json(output);
        return;
    }

    if (tools.empty()) {
        std::cout << color::c(color::dim) << "(no tools)" << color::c(color::reset) << "\n";
        return;
    }
    for (const auto& entry : tools) {
        std::cout << color::c(color::bold) << color::c(color::yellow)
                  << "• " << entry.server_id << "/" << entry.tool.name << color::c(color::reset);
        if (!entry.tool.description.empty()) {
            std::cout << "\n  " << color::c(color::dim) << entry.tool.description << color::c(color::reset);
        }
        std::cout << "\n\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_list_servers(const ToolRouter& router, bool json_output) {
    const auto servers = router.list_servers();
    if (json_output) {
        Json output = Json::array();
        for (const auto& server : servers) {
            output.push_back(server.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Servers");
    for (const auto& server : servers) {
        const bool active = server.status == ServerStatus::Active;
        std::cout << color::c(color::bold) << color::c(active ? color::green : color::red)
                  << "• " << server.id << color::c(color::reset)
                  << " [" << to_string(server.status) << "]";
        if (!server.resolved_command.empty()) {
            std::cout << " " << color::c(color::dim) << server.resolved_command << color::c(color::reset);
        }
        if (server.last_error) {
            std::cout << "\n  " << color::c(color::red) << server.last_error->describe() << color::c(color::reset);
        }
        if (server.tools) {
            std::cout << "\n  " << server.tools->size() << " tools, "
                      << server.resources.value_or(std::vector<ResourceDescriptor>{}).size() << " resources, "
                      << server.prompts.value_or(std::vector<PromptDescriptor>{}).size() << " prompts";
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_list_tools(const ToolRouter& router, bool json_output) {
    if (!json_output) {
        print_header("Tools");
    }
    print_tools(router.get_all_tools(), json_output);
    return 0;
}

int cmd_search(const ToolRouter& router, const std::string& query, bool json_output) {
    if (!json_output) {
        print_header("Tools matching '" + query + "'");
    }
    print_tools(router.search_tools(query), json_output);
    return 0;
}

int cmd_recommend(const ToolRouter& router, const std::string& message, bool json_output) {
    if (!json_output) {
        print_header("Recommended tools");
    }
    print_tools(router.recommend_tools(message), json_output);
    return 0;
}

int cmd_call(ToolRouter& router, const std::string& target, const std::string& args_json, bool json_output) {
    const auto slash = target.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == target.size()) {
        print_error("--call expects <server>/<tool>, got '" + target + "'");
        return 1;
    }

    const Json arguments = Json::parse(args_json, nullptr, /*allow_exceptions=*/false);
    if (arguments.is_discarded() || !arguments.is_object()) {
        print_error("--args must be a JSON object");
        return 1;
    }

    ToolCall call{target.substr(0, slash), target.substr(slash + 1), arguments};
    auto outcomes = router.execute_tool_calls({call});
    const auto& outcome = outcomes.front();

    if (json_output) {
        print_json(outcome.result ? *outcome.result : outcome.result.error().to_json());
    } else {
        std::cout << ToolRouter::format_tool_results(outcomes) << "\n";
    }
    return outcome.result ? 0 : 1;
}

int cmd_read(ToolRouter& router, const std::string& server_id, const std::string& uri, bool json_output) {
    auto result = router.get_resource(server_id, uri);
    if (!result) {
        if (json_output) {
            print_json(result.error().to_json());
        } else {
            print_error(result.error().describe());
        }
        return 1;
    }

    if (json_output) {
        print_json(*result);
        return 0;
    }

    print_header("Resource: " + uri);
    if (result->contains("contents") && (*result)["contents"].is_array()) {
        for (const auto& content : (*result)["contents"]) {
            if (content.contains("text") && content["text"].is_string()) {
                std::cout << content["text"].get<std::string>() << "\n";
            } else if (content.contains("blob")) {
                std::cout << color::c(color::dim) << "[binary, "
                          << content.value("mimeType", "unknown type") << "]" << color::c(color::reset) << "\n";
            }
        }
    } else {
        print_json(*result);
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpmux-cli", "Tool Server Hub");

    options.add_options()
        // Server sources
        ("f,config", "Server definitions file (JSON)", cxxopts::value<std::string>())
        ("c,command", "Single server command (local process)", cxxopts::value<std::string>())
        ("a,arg", "Argument for --command (can be repeated)", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("s,server", "Only start these server ids (can be repeated)", cxxopts::value<std::vector<std::string>>()->default_value(""))

        // Commands
        ("list-servers", "Show every server and its status")
        ("list-tools", "List tools of all active servers")
        ("search", "Search tools by name or description", cxxopts::value<std::string>())
        ("recommend", "Recommend tools for a message", cxxopts::value<std::string>())
        ("call", "Call a tool, as <server>/<tool>", cxxopts::value<std::string>())
        ("args", "JSON arguments for --call", cxxopts::value<std::string>()->default_value("{}"))
        ("read", "Read a resource from this server", cxxopts::value<std::string>())
        ("uri", "Resource URI for --read", cxxopts::value<std::string>())

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error, fatal or off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>()->default_value(""))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    mcpmux-cli --config servers.json --list-servers\n";
            std::cout << "    mcpmux-cli --config servers.json --call git/git_status --args '{\"repo_path\":\".\"}'\n";
            std::cout << "    mcpmux-cli -c npx -a -y -a @modelcontextprotocol/server-filesystem -a /tmp --list-tools\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        // Configuration: environment first, flags on top
        auto config = hub_config_from_env(Environment::from_process());
        if (!config) {
            print_error(config.error().describe());
            return 1;
        }

        LogLevel log_level = config->log_level.value_or(LogLevel::Warn);
        if (result.count("log-level")) {
            const auto level_text = result["log-level"].as<std::string>();
            const auto parsed = log_level_from_string(level_text);
            if (!parsed) {
                print_error("Unknown log level '" + level_text + "'");
                return 1;
            }
            log_level = *parsed;
        }
        configure_logging(log_level, result["log-file"].as<std::string>());

        // Server definitions
        std::vector<ServerConfig> definitions;
        if (result.count("config")) {
            auto loaded = load_server_file(result["config"].as<std::string>());
            if (!loaded) {
                print_error(loaded.error().describe());
                return 1;
            }
            definitions = std::move(*loaded);
        }
        if (result.count("command")) {
            ServerConfig adhoc;
            adhoc.id = "cli";
            adhoc.name = "cli";
            adhoc.command = result["command"].as<std::string>();
            for (const auto& arg : result["arg"].as<std::vector<std::string>>()) {
                if (!arg.empty()) {
                    adhoc.args.push_back(arg);
                }
            }
            definitions.push_back(std::move(adhoc));
        }
        if (definitions.empty()) {
            print_error("Must specify --config or --command");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        std::vector<std::string> only;
        for (const auto& id : result["server"].as<std::vector<std::string>>()) {
            if (!id.empty()) {
                only.push_back(id);
            }
        }

        auto router = ToolRouter::create(std::move(*config));

        for (auto& definition : definitions) {
            const auto server = router->add_server(std::move(definition));
            if (!only.empty() && std::find(only.begin(), only.end(), server.id) == only.end()) {
                continue;
            }

            auto started = router->start_server(server.id);
            if (!started) {
                print_error("[" + server.id + "] " + started.error().describe());
            } else if (!json_output) {
                print_success("[" + server.id + "] " + std::to_string(started->tools.size()) + " tools");
            }
        }

        int exit_code = 0;
        if (result.count("list-tools")) {
            exit_code = cmd_list_tools(*router, json_output);
        } else if (result.count("search")) {
            exit_code = cmd_search(*router, result["search"].as<std::string>(), json_output);
        } else if (result.count("recommend")) {
            exit_code = cmd_recommend(*router, result["recommend"].as<std::string>(), json_output);
        } else if (result.count("call")) {
            exit_code = cmd_call(*router, result["call"].as<std::string>(),
                                 result["args"].as<std::string>(), json_output);
        } else if (result.count("read")) {
            if (!result.count("uri")) {
                print_error("--read needs --uri");
                return 1;
            }
            exit_code = cmd_read(*router, result["read"].as<std::string>(),
                                 result["uri"].as<std::string>(), json_output);
        } else {
            exit_code = cmd_list_servers(*router, json_output);
        }

        for (const auto& id : router->active_server_ids()) {
            if (auto stopped = router->stop_server(id); !stopped) {
                print_error("[" + id + "] " + stopped.error().describe());
            }
        }
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
