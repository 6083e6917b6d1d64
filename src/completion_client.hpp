#pragma once
#include "config.hpp"
#include "message.hpp"
#include "errors.hpp"
#include "audit_log.hpp"
#include "https_client.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sonarbridge {

struct CompletionResponse {
    std::string content;
    std::vector<std::string> citations;   // order is significant, indices are rendered
};

struct CompletionOptions {
    bool strip_reasoning = false;
};

// One POST per call to <api_base>/chat/completions. Never retries.
class CompletionClient {
public:
    CompletionClient(const Config& cfg, const AuditLog& log, HttpPost post = https_post);

    // `params` is merged into the body after model and messages and cannot
    // replace either of them.
    Result<std::string> complete(const std::vector<Message>& messages,
                                 const std::string& model,
                                 const nlohmann::json& params = nlohmann::json::object(),
                                 const CompletionOptions& opts = {}) const;

    HttpsRequest build_request(const std::vector<Message>& messages,
                               const std::string& model,
                               const nlohmann::json& params) const;

private:
    const Config& config_;
    const AuditLog& log_;
    HttpPost post_;
    // Cached URL components (parsed once in constructor)
    std::string origin_;
    std::string path_prefix_;
};

// Requires choices[0].message.content to be a string.
Result<CompletionResponse> parse_completion(const std::string& body);

// "\n\nCitations:\n[1] a\n[2] b\n", or "" when there are none.
std::string format_citations(const std::vector<std::string>& citations);

// Removes every <think>...</think> span and trims the remainder.
std::string strip_think_tags(const std::string& text);

} // namespace sonarbridge
