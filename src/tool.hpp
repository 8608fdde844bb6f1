#pragma once
#include <string>
#include <memory>
#include <vector>

namespace browsetrail {

struct ToolSpec {
    std::string name;
    std::string title;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
    bool open_world = false;
};

// success == false still carries a human-readable message in output;
// callers render both the same way.
struct ToolResult {
    bool success;
    std::string output;
};

class Tool {
public:
    virtual ~Tool() = default;
    // Must be safe to call from concurrent requests.
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string title() const { return tool_name(); }
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;
    // Talks to systems outside this machine
    virtual bool open_world() const { return false; }

    ToolSpec spec() const {
        return ToolSpec{tool_name(), title(), description(), parameters_json(), open_world()};
    }
};

} // namespace browsetrail
