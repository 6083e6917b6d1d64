#include "prompts.hpp"

namespace sonarbridge {

nlohmann::json PromptDescriptor::to_json() const {
    nlohmann::json args = nlohmann::json::array();
    for (auto& a : arguments) {
        args.push_back({{"name", a.name}, {"description", a.description}, {"required", a.required}});
    }
    return {{"name", name}, {"description", description}, {"arguments", args}};
}

const std::vector<PromptDescriptor>& prompt_descriptors() {
    static const std::vector<PromptDescriptor> prompts = {
        {"search", "Search the web using Perplexity AI and filter results by recency", {
            {"query", "The search query to find information about", true},
            {"recency", "Filter results by how recent they are. Options: 'day' (last 24h), "
                        "'week' (last 7 days), 'month' (last 30 days), 'year' (last 365 days). "
                        "Defaults to 'month'.", false}
        }},
        {"reason", "Reason about a topic using Perplexity AI and filter context by recency", {
            {"query", "The topic or question to reason about", true},
            {"recency", "Filter context by how recent it is. Options: 'day' (last 24h), "
                        "'week' (last 7 days), 'month' (last 30 days), 'year' (last 365 days). "
                        "Defaults to 'month'.", false}
        }}
    };
    return prompts;
}

static nlohmann::json user_text(const std::string& text) {
    return {{"role", "user"}, {"content", {{"type", "text"}, {"text", text}}}};
}

// Prompt arguments arrive as strings; anything else is ignored
static std::string string_arg(const nlohmann::json& args, const char* key, const std::string& fallback) {
    if (args.is_object() && args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return fallback;
}

Result<nlohmann::json> render_prompt(const std::string& name, const nlohmann::json& arguments) {
    std::string query = string_arg(arguments, "query", "");
    std::string recency = string_arg(arguments, "recency", "month");

    if (name == "search") {
        return nlohmann::json{
            {"description", "Search the web for information about: " + query},
            {"messages", {
                user_text("Find recent information about: " + query),
                user_text("Only include results from the last " + recency)
            }}
        };
    }
    if (name == "reason") {
        return nlohmann::json{
            {"description", "Reason about the topic: " + query},
            {"messages", {
                user_text("Reason about the following topic: " + query),
                user_text("Use context primarily from the last " + recency)
            }}
        };
    }
    return validation_error("Unknown prompt: " + name);
}

} // namespace sonarbridge
