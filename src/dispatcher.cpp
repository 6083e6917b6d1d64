#include "dispatcher.hpp"
#include <algorithm>

namespace sonarbridge {

static const char* SEARCH_SYSTEM_PROMPT = "Be precise and concise.";

std::vector<Message> search_messages(const std::string& query) {
    return {
        Message{Role::system, SEARCH_SYSTEM_PROMPT},
        Message{Role::user, query}
    };
}

Dispatcher::Dispatcher(const Config& cfg, const CompletionClient& client, const AuditLog& log)
    : config_(cfg), client_(client), log_(log) {}

ToolResult Dispatcher::invoke(const std::string& name, const nlohmann::json& arguments) const {
    if (arguments.is_null() || (arguments.is_object() && arguments.empty())) {
        log_.error("No arguments provided for tool call");
        return ToolResult::text("Error: No arguments provided", true);
    }
    if (!arguments.is_object()) {
        log_.error("Tool arguments are not an object");
        return ToolResult::text("Error: Invalid arguments: expected an object", true);
    }

    auto kind = parse_tool_kind(name);
    if (!kind) {
        log_.error("Unknown tool requested: " + name);
        return ToolResult::text("Unknown tool: " + name, true);
    }

    Result<std::string> outcome = std::string();
    switch (*kind) {
    case ToolKind::ask:    outcome = run_ask(arguments); break;
    case ToolKind::reason: outcome = run_reason(arguments); break;
    case ToolKind::search: outcome = run_search(arguments); break;
    }

    if (is_error(outcome)) {
        const auto& err = get_error(outcome);
        log_.error("Error processing " + name + " tool call (" + error_kind_name(err.kind) +
                   "): " + err.message);
        return ToolResult::text("Error: " + err.message, true);
    }
    return ToolResult::text(get_value(outcome));
}

Result<std::string> Dispatcher::run_ask(const nlohmann::json& args) const {
    auto parsed = parse_messages(args, "ask");
    if (is_error(parsed)) return get_error(parsed);
    const auto& messages = get_value(parsed);

    std::string model = config_.default_model;
    if (args.contains("model") && !args["model"].is_null()) {
        if (!args["model"].is_string()) {
            return validation_error("Invalid arguments for ask: 'model' must be a string");
        }
        auto requested = args["model"].get<std::string>();
        if (!requested.empty()) model = requested;
    }

    log_.info("Processing ask tool call with " + std::to_string(messages.size()) + " messages");
    return client_.complete(messages, model);
}

Result<std::string> Dispatcher::run_reason(const nlohmann::json& args) const {
    auto parsed = parse_messages(args, "reason");
    if (is_error(parsed)) return get_error(parsed);
    const auto& messages = get_value(parsed);

    log_.info("Processing reason tool call with " + std::to_string(messages.size()) + " messages");
    CompletionOptions opts;
    opts.strip_reasoning = config_.strip_reasoning;
    return client_.complete(messages, config_.reasoning_model, nlohmann::json::object(), opts);
}

Result<std::string> Dispatcher::run_search(const nlohmann::json& args) const {
    if (!args.contains("query") || !args["query"].is_string() ||
        args["query"].get<std::string>().empty()) {
        return validation_error("Invalid arguments for search: 'query' must be a non-empty string");
    }
    std::string query = args["query"].get<std::string>();

    std::string recency = "month";
    if (args.contains("recency") && !args["recency"].is_null()) {
        const auto& allowed = recency_values();
        if (!args["recency"].is_string() ||
            std::find(allowed.begin(), allowed.end(), args["recency"].get<std::string>()) == allowed.end()) {
            return validation_error(
                "Invalid arguments for search: 'recency' must be one of day, week, month, year");
        }
        recency = args["recency"].get<std::string>();
    }

    const std::string& model = config_.default_model;
    nlohmann::json params = config_.search_params;
    if (!params.contains("max_tokens")) {
        // Reasoning models need room for their deliberation
        params["max_tokens"] = model.find("reasoning") != std::string::npos ? 4000 : 2000;
    }
    params["search_recency_filter"] = recency;

    log_.info("Processing search tool call (recency " + recency + ")");
    return client_.complete(search_messages(query), model, params);
}

} // namespace sonarbridge
