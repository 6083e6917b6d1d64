#include <iostream>
#include <string>
#include <vector>
#include <utility>
#include "config.hpp"
#include "errors.hpp"
#include "audit_log.hpp"
#include "completion_client.hpp"
#include "dispatcher.hpp"
#include "mcp_server.hpp"
#include "utils.hpp"

namespace sonarbridge {

static void print_usage(std::ostream& os) {
    os << "Usage: sonarbridge [--config PATH]\n\n"
       << "Serves the ask, reason and search tools over stdio (JSON-RPC 2.0).\n\n"
       << "Options:\n"
       << "  --config PATH   JSON config file (environment variables take precedence)\n"
       << "  --version       Print version and exit\n"
       << "  --help          Show this help\n\n"
       << "Environment:\n"
       << "  PERPLEXITY_API_KEY           API token (required)\n"
       << "  PERPLEXITY_API_BASE          Endpoint base (default https://api.perplexity.ai)\n"
       << "  PERPLEXITY_MODEL             Default model (default sonar-pro)\n"
       << "  PERPLEXITY_REASONING_MODEL   Reasoning model (default sonar-reasoning-pro)\n"
       << "  PERPLEXITY_TIMEOUT           Request timeout in seconds (default 30)\n"
       << "  SONARBRIDGE_LOG_FILE         Log file path (default <project root>/mcp-server.log)\n";
}

static fs::path executable_dir(const char* argv0) {
    std::error_code ec;
#ifndef _WIN32
    auto self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) return self.parent_path();
#endif
    fs::path p = fs::absolute(argv0 ? argv0 : ".", ec);
    if (ec) return fs::current_path(ec);
    return p.parent_path();
}

static void log_model_catalogue(const AuditLog& log, const Config& cfg) {
    static const std::vector<std::pair<std::string, std::string>> known_models = {
        {"sonar-reasoning-pro", "128k context - Advanced reasoning with professional focus"},
        {"sonar-reasoning", "128k context - Enhanced reasoning capabilities"},
        {"sonar-pro", "200k context - Professional grade model"},
        {"sonar", "128k context - General purpose model"},
    };

    log.info("Available models (S = default, R = reasoning; set with PERPLEXITY_MODEL "
             "or PERPLEXITY_REASONING_MODEL):");
    for (auto& [name, desc] : known_models) {
        std::string marker;
        if (name == cfg.default_model) marker += "S";
        if (name == cfg.reasoning_model) marker += "R";
        marker = marker.empty() ? "    " : marker + "-> ";
        log.info(" " + marker + name + ": " + desc);
    }
}

static int serve(const std::string& config_path, const char* argv0) {
    // The log path is needed before the config is known to be valid
    fs::path root = find_project_root(executable_dir(argv0));
    Config cfg;
    std::string log_path = (root / "mcp-server.log").string();
    std::string env_log = expand_path(env_or_empty("SONARBRIDGE_LOG_FILE"));
    if (!env_log.empty()) log_path = env_log;

    std::cerr << "Using repository root: " << root.string() << "\n";

    try {
        cfg = Config::resolve(config_path);
    } catch (const ConfigError& e) {
        AuditLog early(log_path);
        early.error(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!cfg.log_file.empty()) log_path = cfg.log_file;
    std::cerr << "Log file will be created at: " << log_path << "\n";

    AuditLog log(log_path, cfg.max_log_bytes);
    log.info(std::string("Starting ") + SERVER_NAME + " " + SERVER_VERSION);
    log.info("Using model: " + cfg.default_model);
    log.info("Using reasoning model: " + cfg.reasoning_model);
    log.info("Completion endpoint: " + cfg.api_base + "/chat/completions");
    log_model_catalogue(log, cfg);

    CompletionClient client(cfg, log);
    Dispatcher dispatcher(cfg, client, log);
    McpServer server(dispatcher, log);

    try {
        server.run(std::cin, std::cout);
    } catch (const std::exception& e) {
        log.error("Fatal error running server", e);
        return 1;
    }
    return 0;
}

} // namespace sonarbridge

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = sonarbridge::expand_path(args[++i]);
        } else if (args[i] == "--version") {
            std::cout << sonarbridge::SERVER_NAME << " " << sonarbridge::SERVER_VERSION << "\n";
            return 0;
        } else if (args[i] == "--help" || args[i] == "-h") {
            sonarbridge::print_usage(std::cout);
            return 0;
        } else {
            std::cerr << "Unknown option: " << args[i] << "\n";
            sonarbridge::print_usage(std::cerr);
            return 1;
        }
    }

    return sonarbridge::serve(config_path, argc > 0 ? argv[0] : nullptr);
}
