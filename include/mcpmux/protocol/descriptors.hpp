#ifndef MCPMUX_PROTOCOL_DESCRIPTORS_HPP
#define MCPMUX_PROTOCOL_DESCRIPTORS_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcpmux {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            j.value("name", ""),
            j.value("version", "")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════
// The input schema is opaque here: it is carried from the provider to the
// caller unexamined.

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::optional<Json> input_schema;

    static ToolDescriptor from_json(const Json& j) {
        ToolDescriptor tool;
        tool.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            tool.description = j["description"].get<std::string>();
        }
        if (j.contains("inputSchema")) {
            tool.input_schema = j["inputSchema"];
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}, {"description", description}};
        if (input_schema) {
            j["inputSchema"] = *input_schema;
        }
        return j;
    }

    friend bool operator==(const ToolDescriptor&, const ToolDescriptor&) = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    static ResourceDescriptor from_json(const Json& j) {
        ResourceDescriptor res;
        res.uri = j.value("uri", "");
        res.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            res.description = j["description"].get<std::string>();
        }
        if (j.contains("mimeType") && j["mimeType"].is_string()) {
            res.mime_type = j["mimeType"].get<std::string>();
        }
        return res;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}, {"name", name}};
        if (description) j["description"] = *description;
        if (mime_type) j["mimeType"] = *mime_type;
        return j;
    }

    friend bool operator==(const ResourceDescriptor&, const ResourceDescriptor&) = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Prompts
// ═══════════════════════════════════════════════════════════════════════════

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    static PromptArgument from_json(const Json& j) {
        PromptArgument arg;
        arg.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            arg.description = j["description"].get<std::string>();
        }
        arg.required = j.value("required", false);
        return arg;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        if (required) j["required"] = required;
        return j;
    }

    friend bool operator==(const PromptArgument&, const PromptArgument&) = default;
};

struct PromptDescriptor {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    static PromptDescriptor from_json(const Json& j) {
        PromptDescriptor prompt;
        prompt.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            prompt.description = j["description"].get<std::string>();
        }
        if (j.contains("arguments") && j["arguments"].is_array()) {
            for (const auto& a : j["arguments"]) {
                prompt.arguments.push_back(PromptArgument::from_json(a));
            }
        }
        return prompt;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        if (!arguments.empty()) {
            j["arguments"] = Json::array();
            for (const auto& arg : arguments) {
                j["arguments"].push_back(arg.to_json());
            }
        }
        return j;
    }

    friend bool operator==(const PromptDescriptor&, const PromptDescriptor&) = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Discovered Capabilities
// ═══════════════════════════════════════════════════════════════════════════

struct Capabilities {
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;
    std::vector<PromptDescriptor> prompts;
    std::optional<Implementation> server_info;
};

/// A tool tagged with the server that owns it, for cross-server listings
struct AnnotatedTool {
    std::string server_id;
    std::string server_name;
    ToolDescriptor tool;

    [[nodiscard]] Json to_json() const {
        return {{"serverId", server_id}, {"serverName", server_name}, {"tool", tool.to_json()}};
    }
};

}  // namespace mcpmux

#endif  // MCPMUX_PROTOCOL_DESCRIPTORS_HPP
