#pragma once
#include "config.hpp"
#include "tools.hpp"
#include "errors.hpp"
#include "audit_log.hpp"
#include "completion_client.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sonarbridge {

struct ContentBlock {
    std::string type = "text";
    std::string text;
};

struct ToolResult {
    std::vector<ContentBlock> content;
    bool is_error = false;

    static ToolResult text(const std::string& text, bool is_error = false) {
        ToolResult r;
        r.content.push_back(ContentBlock{"text", text});
        r.is_error = is_error;
        return r;
    }

    nlohmann::json to_json() const {
        nlohmann::json blocks = nlohmann::json::array();
        for (auto& b : content) {
            blocks.push_back({{"type", b.type}, {"text", b.text}});
        }
        return {{"content", blocks}, {"isError", is_error}};
    }
};

// Routes tools/call to the completion client. Every failure comes back as a
// ToolResult whose text starts with "Error: "; nothing escapes to the transport.
// Holds no per-call state.
class Dispatcher {
public:
    Dispatcher(const Config& cfg, const CompletionClient& client, const AuditLog& log);

    const std::vector<ToolDescriptor>& list_tools() const { return tool_descriptors(); }

    // `arguments` may be null when the caller sent none.
    ToolResult invoke(const std::string& name, const nlohmann::json& arguments) const;

private:
    const Config& config_;
    const CompletionClient& client_;
    const AuditLog& log_;

    Result<std::string> run_ask(const nlohmann::json& args) const;
    Result<std::string> run_reason(const nlohmann::json& args) const;
    Result<std::string> run_search(const nlohmann::json& args) const;
};

// The two-turn conversation `search` sends upstream.
std::vector<Message> search_messages(const std::string& query);

} // namespace sonarbridge
