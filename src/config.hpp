#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace sonarbridge {

struct Config {
    std::string api_key;                                  // required
    std::string api_base = "https://api.perplexity.ai";
    std::string default_model = "sonar-pro";
    std::string reasoning_model = "sonar-reasoning-pro";
    int timeout_sec = 30;

    std::string log_file;                                 // empty = <project root>/mcp-server.log
    uintmax_t max_log_bytes = 20ull * 1024 * 1024;

    bool strip_reasoning = true;                          // drop <think> spans from `reason`
    nlohmann::json search_params = default_search_params();

    static nlohmann::json default_search_params();

    static Config make_default();
    static Config load(const std::string& path);
    static Config from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // PERPLEXITY_* / SONARBRIDGE_* variables override whatever is already set.
    void apply_env();

    // Throws ConfigError when a required value is missing or out of range.
    void validate() const;

    // Defaults, then optional config file, then environment; validated.
    static Config resolve(const std::string& config_path);
};

} // namespace sonarbridge
