#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

namespace browsetrail {

// Parse JSON tool arguments. Returns error ToolResult on failure.
// An empty string is treated as "{}".
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    if (args_json.empty()) {
        out = nlohmann::json::object();
        return std::nullopt;
    }
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (out.is_null()) out = nlohmann::json::object();
    if (!out.is_object()) {
        return ToolResult{false, "Failed to parse arguments: expected a JSON object"};
    }
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field};
    }
    return std::nullopt;
}

// String field if present and non-empty
inline std::optional<std::string> optional_string(const nlohmann::json& args, const char* field) {
    if (args.contains(field) && args[field].is_string()) {
        auto value = args[field].get<std::string>();
        if (!value.empty()) return value;
    }
    return std::nullopt;
}

// Positive integer field. Absent, zero, negative, fractional or non-numeric
// values yield nullopt; oversized values clamp to UINT32_MAX.
inline std::optional<uint32_t> optional_positive_int(const nlohmann::json& args, const char* field) {
    if (!args.contains(field)) return std::nullopt;
    const auto& v = args[field];
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        if (n == 0) return std::nullopt;
        if (n > std::numeric_limits<uint32_t>::max()) return std::numeric_limits<uint32_t>::max();
        return static_cast<uint32_t>(n);
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d) || d < 1.0 || std::floor(d) != d) return std::nullopt;
        if (d > static_cast<double>(std::numeric_limits<uint32_t>::max()))
            return std::numeric_limits<uint32_t>::max();
        return static_cast<uint32_t>(d);
    }
    return std::nullopt;
}

} // namespace browsetrail
