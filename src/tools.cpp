#include "tools.hpp"

namespace sonarbridge {

const char* tool_name(ToolKind kind) {
    switch (kind) {
    case ToolKind::ask:    return "ask";
    case ToolKind::reason: return "reason";
    case ToolKind::search: return "search";
    }
    return "";
}

std::optional<ToolKind> parse_tool_kind(const std::string& name) {
    for (auto kind : {ToolKind::ask, ToolKind::reason, ToolKind::search}) {
        if (name == tool_name(kind)) return kind;
    }
    return std::nullopt;
}

const std::vector<std::string>& recency_values() {
    static const std::vector<std::string> values = {"day", "week", "month", "year"};
    return values;
}

static nlohmann::json messages_property() {
    return {
        {"type", "array"},
        {"items", {
            {"type", "object"},
            {"properties", {
                {"role", {
                    {"type", "string"},
                    {"enum", {"system", "user", "assistant"}},
                    {"description", "Role of the message (e.g., system, user, assistant)"}
                }},
                {"content", {
                    {"type", "string"},
                    {"description", "The content of the message"}
                }}
            }},
            {"required", {"role", "content"}}
        }},
        {"minItems", 1},
        {"description", "Array of conversation messages"}
    };
}

static std::vector<ToolDescriptor> build_descriptors() {
    std::vector<ToolDescriptor> tools;

    nlohmann::json ask_schema = {
        {"type", "object"},
        {"properties", {
            {"messages", messages_property()},
            {"model", {
                {"type", "string"},
                {"description", "Model to use instead of the server's default model"}
            }}
        }},
        {"required", nlohmann::json::array({"messages"})}
    };
    tools.push_back(ToolDescriptor{
        ToolKind::ask, tool_name(ToolKind::ask),
        "Engages in a conversation using the Sonar API. "
        "Accepts an array of messages (each with a role and content) "
        "and returns a chat completion response from the Perplexity model, "
        "with citations appended when the model provides them.",
        ask_schema});

    nlohmann::json reason_schema = {
        {"type", "object"},
        {"properties", {
            {"messages", messages_property()}
        }},
        {"required", nlohmann::json::array({"messages"})}
    };
    tools.push_back(ToolDescriptor{
        ToolKind::reason, tool_name(ToolKind::reason),
        "Performs reasoning tasks using the Perplexity API. "
        "Accepts an array of messages (each with a role and content) "
        "and returns a well-reasoned response from the configured reasoning model.",
        reason_schema});

    nlohmann::json search_schema = {
        {"type", "object"},
        {"properties", {
            {"query", {
                {"type", "string"},
                {"description", "The search query to find information about"}
            }},
            {"recency", {
                {"type", "string"},
                {"enum", recency_values()},
                {"default", "month"},
                {"description", "Filter results by how recent they are: 'day' (last 24h), "
                                "'week' (last 7 days), 'month' (last 30 days), 'year' (last 365 days)"}
            }}
        }},
        {"required", nlohmann::json::array({"query"})}
    };
    tools.push_back(ToolDescriptor{
        ToolKind::search, tool_name(ToolKind::search),
        "Search the web by asking Perplexity AI with recency filtering",
        search_schema});

    return tools;
}

const std::vector<ToolDescriptor>& tool_descriptors() {
    static const std::vector<ToolDescriptor> tools = build_descriptors();
    return tools;
}

} // namespace sonarbridge
