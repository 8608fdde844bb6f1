#include "server.hpp"
#include <array>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace browsetrail {

static constexpr std::array<const char*, 3> kSupportedProtocolVersions = {
    "2025-06-18", "2025-03-26", "2024-11-05"
};

McpServer::McpServer(std::vector<std::unique_ptr<Tool>> tools, ServerInfo info)
    : tools_(std::move(tools)), info_(std::move(info)) {}

json McpServer::make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

json McpServer::tool_result_json(const ToolResult& result) {
    json content = json::array();
    content.push_back(json{{"type", "text"}, {"text", result.output}});
    return {
        {"content", content},
        {"structuredContent", {{"result", result.output}}}
    };
}

// Tool output is not guaranteed to be UTF-8 (history titles come straight
// from SQLite); invalid sequences become U+FFFD instead of throwing.
static std::string serialize(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

Tool* McpServer::find_tool(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool->tool_name() == name) return tool.get();
    }
    return nullptr;
}

json McpServer::handle(const json& message) const {
    if (!message.is_array()) return handle_single(message);

    if (message.empty()) {
        return make_error(nullptr, rpc_error::INVALID_REQUEST, "Empty batch");
    }
    json responses = json::array();
    for (const auto& item : message) {
        json r = handle_single(item);
        if (!r.is_null()) responses.push_back(std::move(r));
    }
    if (responses.empty()) return nullptr;
    return responses;
}

std::string McpServer::handle_text(const std::string& body) const {
    json message;
    try {
        message = json::parse(body);
    } catch (const json::parse_error& e) {
        return serialize(make_error(nullptr, rpc_error::PARSE_ERROR,
                                    std::string("Parse error: ") + e.what()));
    }
    json response = handle(message);
    if (response.is_null()) return {};
    return serialize(response);
}

void McpServer::run_stdio(std::istream& in, std::ostream& out) const {
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;
        std::string response = handle_text(line);
        if (!response.empty()) {
            out << response << "\n";
            out.flush();
        }
    }
}

ToolResult McpServer::call_tool(const std::string& name, const std::string& args_json) const {
    Tool* tool = find_tool(name);
    if (!tool) return ToolResult{false, "Unknown tool: " + name};
    try {
        return tool->execute(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, "Tool " + name + " failed: " + e.what()};
    }
}

json McpServer::handle_single(const json& message) const {
    if (!message.is_object()) {
        return make_error(nullptr, rpc_error::INVALID_REQUEST, "Request must be an object");
    }

    const bool has_id = message.contains("id");
    json id = has_id ? message["id"] : json(nullptr);
    if (has_id && !(id.is_string() || id.is_number() || id.is_null())) {
        return make_error(nullptr, rpc_error::INVALID_REQUEST, "Invalid id");
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0" ||
        !message.contains("method") || !message["method"].is_string()) {
        // Responses from the client (result/error without method) need no reply
        if (!message.contains("method") &&
            (message.contains("result") || message.contains("error"))) {
            return nullptr;
        }
        return make_error(id, rpc_error::INVALID_REQUEST, "Invalid JSON-RPC request");
    }

    const std::string method = message["method"].get<std::string>();
    const json params = message.contains("params") ? message["params"] : json::object();

    // Notifications never get a response
    if (!has_id) {
        if (method == "notifications/initialized") {
            std::cerr << "[mcp] Client initialized\n";
        }
        return nullptr;
    }

    if (!params.is_object()) {
        return make_error(id, rpc_error::INVALID_PARAMS, "params must be an object");
    }

    json result;
    if (method == "initialize") {
        result = handle_initialize(params);
    } else if (method == "ping") {
        result = json::object();
    } else if (method == "tools/list") {
        result = handle_tools_list();
    } else if (method == "tools/call") {
        return handle_tools_call(id, params);
    } else {
        return make_error(id, rpc_error::METHOD_NOT_FOUND, "Method not found: " + method);
    }

    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json McpServer::handle_initialize(const json& params) const {
    std::string version = kLatestProtocolVersion;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        std::string requested = params["protocolVersion"].get<std::string>();
        for (const char* supported : kSupportedProtocolVersions) {
            if (requested == supported) {
                version = requested;
                break;
            }
        }
    }

    return {
        {"protocolVersion", version},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}}
    };
}

json McpServer::handle_tools_list() const {
    json list = json::array();
    for (const auto& tool : tools_) {
        ToolSpec spec = tool->spec();
        json input_schema;
        try {
            input_schema = json::parse(spec.parameters_json);
        } catch (const json::parse_error& e) {
            std::cerr << "[mcp] Bad schema for tool " << spec.name << ": " << e.what() << "\n";
            input_schema = {{"type", "object"}};
        }

        list.push_back(json{
            {"name", spec.name},
            {"title", spec.title},
            {"description", spec.description},
            {"inputSchema", input_schema},
            {"outputSchema", {
                {"type", "object"},
                {"properties", {{"result", {{"type", "string"}}}}},
                {"required", json::array({"result"})}
            }},
            {"annotations", {
                {"readOnlyHint", true},
                {"openWorldHint", spec.open_world}
            }}
        });
    }
    return {{"tools", list}};
}

json McpServer::handle_tools_call(const json& id, const json& params) const {
    if (!params.contains("name") || !params["name"].is_string()) {
        return make_error(id, rpc_error::INVALID_PARAMS, "Missing tool name");
    }
    std::string name = params["name"].get<std::string>();
    if (!find_tool(name)) {
        return make_error(id, rpc_error::INVALID_PARAMS, "Unknown tool: " + name);
    }

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return make_error(id, rpc_error::INVALID_PARAMS, "arguments must be an object");
        }
        arguments = params["arguments"];
    }

    ToolResult result = call_tool(name, arguments.dump());
    std::cerr << "[mcp] tools/call " << name << " -> " << (result.success ? "ok" : "error") << "\n";

    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", tool_result_json(result)}};
}

} // namespace browsetrail
