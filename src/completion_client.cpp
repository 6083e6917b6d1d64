#include "completion_client.hpp"
#include "utils.hpp"

namespace sonarbridge {

// Invalid UTF-8 sequences become U+FFFD so the text can be serialised into a reply.
static std::string valid_utf8(const std::string& text) {
    auto dumped = nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(dumped).get<std::string>();
}

CompletionClient::CompletionClient(const Config& cfg, const AuditLog& log, HttpPost post)
    : config_(cfg), log_(log), post_(std::move(post)) {
    split_base_url(config_.api_base, origin_, path_prefix_);
}

HttpsRequest CompletionClient::build_request(const std::vector<Message>& messages,
                                             const std::string& model,
                                             const nlohmann::json& params) const {
    nlohmann::json body;
    body["model"] = model;
    auto& msgs = body["messages"];
    msgs = nlohmann::json::array();
    for (auto& m : messages) {
        msgs.push_back(m.to_json());
    }
    if (params.is_object()) {
        for (auto& [k, v] : params.items()) {
            if (k == "model" || k == "messages") continue;
            body[k] = v;
        }
    }

    HttpsRequest req;
    req.base_url = origin_;
    req.path = path_prefix_ + "/chat/completions";
    req.headers = {{"Authorization", "Bearer " + config_.api_key}};
    req.content_type = "application/json";
    req.body = body.dump();
    req.timeout_sec = config_.timeout_sec;
    return req;
}

Result<std::string> CompletionClient::complete(const std::vector<Message>& messages,
                                               const std::string& model,
                                               const nlohmann::json& params,
                                               const CompletionOptions& opts) const {
    auto req = build_request(messages, model, params);

    log_.info("Sending request to completion API with " + std::to_string(messages.size()) +
              " messages using model " + model);

    auto res = post_(req);
    if (res.transport_failed()) {
        std::string msg = "Network error while calling completion API: " + res.error;
        log_.error(msg);
        return ToolError{ErrorKind::network, msg};
    }

    if (res.status < 200 || res.status >= 300) {
        std::string body = res.body.empty() ? "Unable to parse error response" : valid_utf8(res.body);
        std::string msg = "Completion API error: " + std::to_string(res.status);
        if (!res.reason.empty()) msg += " " + res.reason;
        msg += "\n" + body;
        log_.error(msg);
        return ToolError{ErrorKind::upstream, msg, res.status, body};
    }

    auto parsed = parse_completion(res.body);
    if (is_error(parsed)) {
        log_.error(get_error(parsed).message);
        return get_error(parsed);
    }
    log_.info("Successfully received and parsed response from completion API");

    const auto& resp = get_value(parsed);
    std::string content = opts.strip_reasoning ? strip_think_tags(resp.content) : resp.content;
    if (!resp.citations.empty()) {
        log_.info("Adding " + std::to_string(resp.citations.size()) + " citations to response");
        content += format_citations(resp.citations);
    }
    return content;
}

Result<CompletionResponse> parse_completion(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return ToolError{ErrorKind::decode,
                         valid_utf8(std::string("Failed to parse JSON response from completion API: ") + e.what())};
    }

    const std::string shape_error =
        "Unexpected response from completion API: missing choices[0].message.content";
    if (!j.is_object() || !j.contains("choices") || !j["choices"].is_array() ||
        j["choices"].empty()) {
        return ToolError{ErrorKind::decode, shape_error};
    }
    auto& choice = j["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        return ToolError{ErrorKind::decode, shape_error};
    }
    auto& msg = choice["message"];
    if (!msg.contains("content") || !msg["content"].is_string()) {
        return ToolError{ErrorKind::decode, shape_error};
    }

    CompletionResponse resp;
    resp.content = msg["content"].get<std::string>();
    if (j.contains("citations") && j["citations"].is_array()) {
        for (auto& c : j["citations"]) {
            resp.citations.push_back(c.is_string() ? c.get<std::string>() : c.dump());
        }
    }
    return resp;
}

std::string format_citations(const std::vector<std::string>& citations) {
    if (citations.empty()) return "";
    std::string out = "\n\nCitations:\n";
    for (size_t i = 0; i < citations.size(); i++) {
        out += "[" + std::to_string(i + 1) + "] " + citations[i] + "\n";
    }
    return out;
}

std::string strip_think_tags(const std::string& text) {
    static const std::string open_tag = "<think>";
    static const std::string close_tag = "</think>";

    std::string result = text;
    size_t pos = 0;
    for (;;) {
        size_t s = result.find(open_tag, pos);
        if (s == std::string::npos) break;
        size_t e = result.find(close_tag, s + open_tag.size());
        if (e == std::string::npos) break;  // unterminated span stays
        result.erase(s, e + close_tag.size() - s);
        pos = s;
    }
    return trim(result);
}

} // namespace sonarbridge
