#pragma once
#include "../tool.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace browsetrail {

// JSON-RPC 2.0 error codes
namespace rpc_error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

constexpr const char* kLatestProtocolVersion = "2025-06-18";

struct ServerInfo {
    std::string name = "tech rss reader";
    std::string version = "0.0.1";
};

// Transport-independent MCP dispatcher. handle() may be called from several
// threads at once; the tool set is fixed at construction.
class McpServer {
public:
    explicit McpServer(std::vector<std::unique_ptr<Tool>> tools, ServerInfo info = {});

    // One message or a batch. Returns null when nothing should be sent back
    // (notifications only).
    nlohmann::json handle(const nlohmann::json& message) const;

    // Raw JSON text in, JSON text out ("" when there is no response)
    std::string handle_text(const std::string& body) const;

    // Newline-delimited JSON-RPC until EOF
    void run_stdio(std::istream& in, std::ostream& out) const;

    // Run one tool by name outside of JSON-RPC. Unknown names fail.
    ToolResult call_tool(const std::string& name, const std::string& args_json) const;

    const std::vector<std::unique_ptr<Tool>>& tools() const { return tools_; }

    // {content:[{type:"text",text}], structuredContent:{result}}
    static nlohmann::json tool_result_json(const ToolResult& result);

    static nlohmann::json make_error(const nlohmann::json& id, int code,
                                     const std::string& message);

private:
    nlohmann::json handle_single(const nlohmann::json& message) const;
    nlohmann::json handle_initialize(const nlohmann::json& params) const;
    nlohmann::json handle_tools_list() const;
    nlohmann::json handle_tools_call(const nlohmann::json& id,
                                     const nlohmann::json& params) const;
    Tool* find_tool(const std::string& name) const;

    std::vector<std::unique_ptr<Tool>> tools_;
    ServerInfo info_;
};

} // namespace browsetrail
