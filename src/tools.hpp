#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace sonarbridge {

enum class ToolKind { ask, reason, search };

struct ToolDescriptor {
    ToolKind kind;
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    // Shape served by tools/list
    nlohmann::json to_json() const {
        return {
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema}
        };
    }
};

const char* tool_name(ToolKind kind);
std::optional<ToolKind> parse_tool_kind(const std::string& name);

// The complete, fixed set of tools, in listing order.
const std::vector<ToolDescriptor>& tool_descriptors();

// Recency values accepted by `search`, mirrored into its schema.
const std::vector<std::string>& recency_values();

} // namespace sonarbridge
