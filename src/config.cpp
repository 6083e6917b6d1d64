#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>

namespace sonarbridge {

nlohmann::json Config::default_search_params() {
    return {
        {"temperature", 0.3},
        {"top_p", 0.95},
        {"top_k", 0},
        {"presence_penalty", 0},
        {"frequency_penalty", 1},
        {"return_images", false},
        {"return_related_questions", false},
        {"return_citations", true},
        {"search_context_size", "low"},
        {"stream", false}
    };
}

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["api_base"] = api_base;
    j["default_model"] = default_model;
    j["reasoning_model"] = reasoning_model;
    j["timeout_sec"] = timeout_sec;
    if (!log_file.empty()) j["log_file"] = log_file;
    j["max_log_bytes"] = max_log_bytes;
    j["strip_reasoning"] = strip_reasoning;
    j["search_params"] = search_params;
    // api_key is never written back out
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    c.api_key = j.value("api_key", c.api_key);
    c.api_base = j.value("api_base", c.api_base);
    c.default_model = j.value("default_model", c.default_model);
    c.reasoning_model = j.value("reasoning_model", c.reasoning_model);
    c.timeout_sec = j.value("timeout_sec", c.timeout_sec);
    c.log_file = expand_path(j.value("log_file", c.log_file));
    c.max_log_bytes = j.value("max_log_bytes", c.max_log_bytes);
    c.strip_reasoning = j.value("strip_reasoning", c.strip_reasoning);

    // Partial overrides merge into the defaults; null removes a key
    if (j.contains("search_params") && j["search_params"].is_object()) {
        c.search_params.merge_patch(j["search_params"]);
    }
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::apply_env() {
    auto key = env_or_empty("PERPLEXITY_API_KEY");
    if (!key.empty()) api_key = key;

    auto base = env_or_empty("PERPLEXITY_API_BASE");
    if (!base.empty()) api_base = base;

    auto model = env_or_empty("PERPLEXITY_MODEL");
    if (!model.empty()) default_model = model;

    auto reasoning = env_or_empty("PERPLEXITY_REASONING_MODEL");
    if (!reasoning.empty()) reasoning_model = reasoning;

    auto timeout = env_or_empty("PERPLEXITY_TIMEOUT");
    if (!timeout.empty()) {
        size_t pos = 0;
        try {
            timeout_sec = std::stoi(timeout, &pos);
        } catch (const std::exception&) {
            pos = 0;
        }
        if (pos == 0 || pos != timeout.size()) {
            throw ConfigError("PERPLEXITY_TIMEOUT must be an integer number of seconds, got '" +
                              timeout + "'");
        }
    }

    auto log = env_or_empty("SONARBRIDGE_LOG_FILE");
    if (!log.empty()) log_file = expand_path(log);
}

void Config::validate() const {
    if (api_key.empty()) {
        throw ConfigError("PERPLEXITY_API_KEY environment variable is required");
    }
    if (timeout_sec <= 0) {
        throw ConfigError("timeout must be positive, got " + std::to_string(timeout_sec));
    }
    if (api_base.rfind("http://", 0) != 0 && api_base.rfind("https://", 0) != 0) {
        throw ConfigError("api_base must start with http:// or https://, got '" + api_base + "'");
    }
    if (!search_params.is_object()) {
        throw ConfigError("search_params must be a JSON object");
    }
}

Config Config::resolve(const std::string& config_path) {
    Config c = config_path.empty() ? make_default() : load(config_path);
    c.apply_env();
    c.validate();
    return c;
}

} // namespace sonarbridge
