#include "mcp_server.hpp"
#include "prompts.hpp"
#include <atomic>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>
#include <vector>

namespace sonarbridge {

nlohmann::json rpc_result(const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json rpc_error(const nlohmann::json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

std::string serialize_reply(const nlohmann::json& reply) {
    return reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

McpServer::McpServer(const Dispatcher& dispatcher, const AuditLog& log)
    : dispatcher_(dispatcher), log_(log) {}

namespace {

struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

bool is_tool_call(const nlohmann::json& request) {
    return request.is_object() && request.contains("id") &&
           request.value("method", nlohmann::json()) == "tools/call";
}

} // namespace

void McpServer::run(std::istream& in, std::ostream& out) const {
    log_.info(std::string(SERVER_NAME) + " running on stdio");

    std::mutex out_mutex;
    auto write_reply = [&](const nlohmann::json& reply) {
        if (reply.is_null()) return;
        std::string wire = serialize_reply(reply);
        std::lock_guard<std::mutex> lock(out_mutex);
        out << wire << "\n";
        out.flush();
    };

    std::vector<Worker> workers;
    auto reap = [&workers]() {
        for (auto it = workers.begin(); it != workers.end();) {
            if (it->done->load()) {
                it->thread.join();
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    };

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        reap();

        nlohmann::json request, fault;
        if (!parse_request(line, request, fault)) {
            write_reply(fault);
            continue;
        }
        if (!is_tool_call(request)) {
            write_reply(handle_request(request));
            continue;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([this, request, done, &write_reply]() {
            nlohmann::json reply;
            try {
                reply = handle_request(request);
            } catch (const std::exception& e) {
                log_.error("Tool call failed unexpectedly", e);
                reply = rpc_error(request["id"], rpc_internal_error, e.what());
            }
            write_reply(reply);
            done->store(true);
        });
        workers.push_back(Worker{std::move(t), done});
    }

    for (auto& w : workers) w.thread.join();
    log_.info("stdin closed, shutting down");
}

bool McpServer::parse_request(const std::string& line, nlohmann::json& request,
                              nlohmann::json& fault) const {
    try {
        request = nlohmann::json::parse(line);
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        log_.error("Malformed JSON-RPC message", e);
        fault = rpc_error(nullptr, rpc_parse_error, std::string("Parse error: ") + e.what());
        return false;
    }
}

nlohmann::json McpServer::handle_line(const std::string& line) const {
    nlohmann::json request, fault;
    if (!parse_request(line, request, fault)) return fault;
    return handle_request(request);
}

nlohmann::json McpServer::handle_request(const nlohmann::json& request) const {
    if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
        nlohmann::json id = request.is_object() && request.contains("id") ? request["id"] : nlohmann::json();
        return rpc_error(id, rpc_invalid_request, "Invalid Request");
    }

    std::string method = request["method"].get<std::string>();
    nlohmann::json params = request.value("params", nlohmann::json::object());

    // Notifications (no id) never get a reply
    if (!request.contains("id")) {
        if (method == "notifications/initialized") {
            log_.info("Client initialized");
        } else if (method == "notifications/cancelled") {
            log_.warn("Client cancelled a request; in-flight calls run to completion");
        }
        return nullptr;
    }

    const auto& id = request["id"];

    if (method == "initialize") return rpc_result(id, handle_initialize(params));
    if (method == "ping") return rpc_result(id, nlohmann::json::object());
    if (method == "tools/list") return rpc_result(id, handle_tools_list());
    if (method == "tools/call") return handle_tools_call(id, params);
    if (method == "prompts/list") return rpc_result(id, handle_prompts_list());
    if (method == "prompts/get") return handle_prompts_get(id, params);

    log_.warn("Unsupported method: " + method);
    return rpc_error(id, rpc_method_not_found, "Method not found: " + method);
}

nlohmann::json McpServer::handle_initialize(const nlohmann::json& params) const {
    std::string version = DEFAULT_PROTOCOL_VERSION;
    if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        log_.info("Initialize from " + params["clientInfo"].value("name", std::string("unknown client")) +
                  " (protocol " + version + ")");
    }
    return {
        {"protocolVersion", version},
        {"capabilities", {
            {"tools", {{"listChanged", false}}},
            {"prompts", {{"listChanged", false}}}
        }},
        {"serverInfo", {{"name", SERVER_NAME}, {"version", SERVER_VERSION}}}
    };
}

nlohmann::json McpServer::handle_tools_list() const {
    nlohmann::json tools = nlohmann::json::array();
    for (auto& t : dispatcher_.list_tools()) {
        tools.push_back(t.to_json());
    }
    return {{"tools", tools}};
}

nlohmann::json McpServer::handle_tools_call(const nlohmann::json& id, const nlohmann::json& params) const {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        log_.error("tools/call without a tool name");
        return rpc_error(id, rpc_invalid_params, "tools/call requires a string 'name'");
    }
    std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.contains("arguments") ? params["arguments"] : nlohmann::json();

    auto result = dispatcher_.invoke(name, arguments);
    return rpc_result(id, result.to_json());
}

nlohmann::json McpServer::handle_prompts_list() const {
    nlohmann::json prompts = nlohmann::json::array();
    for (auto& p : prompt_descriptors()) {
        prompts.push_back(p.to_json());
    }
    return {{"prompts", prompts}};
}

nlohmann::json McpServer::handle_prompts_get(const nlohmann::json& id, const nlohmann::json& params) const {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return rpc_error(id, rpc_invalid_params, "prompts/get requires a string 'name'");
    }
    std::string name = params["name"].get<std::string>();
    auto rendered = render_prompt(name, params.value("arguments", nlohmann::json::object()));
    if (is_error(rendered)) {
        log_.error(get_error(rendered).message);
        return rpc_error(id, rpc_invalid_params, get_error(rendered).message);
    }
    return rpc_result(id, get_value(rendered));
}

} // namespace sonarbridge
