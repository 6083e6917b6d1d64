#pragma once
#include "dispatcher.hpp"
#include "audit_log.hpp"
#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>

namespace sonarbridge {

static constexpr const char* SERVER_NAME = "sonarbridge";
static constexpr const char* SERVER_VERSION = "0.2.0";
static constexpr const char* DEFAULT_PROTOCOL_VERSION = "2025-06-18";

// Newline-delimited JSON-RPC 2.0 over a pair of streams (stdin/stdout in
// production). tools/call runs on its own thread so a slow upstream never
// holds up other requests; everything else is answered inline.
class McpServer {
public:
    McpServer(const Dispatcher& dispatcher, const AuditLog& log);

    // Returns when `in` reaches EOF and every in-flight tool call has replied.
    void run(std::istream& in, std::ostream& out) const;

    // Handles one raw line. Returns the reply, or null for notifications.
    nlohmann::json handle_line(const std::string& line) const;

    nlohmann::json handle_request(const nlohmann::json& request) const;

private:
    const Dispatcher& dispatcher_;
    const AuditLog& log_;

    bool parse_request(const std::string& line, nlohmann::json& request, nlohmann::json& fault) const;

    nlohmann::json handle_initialize(const nlohmann::json& params) const;
    nlohmann::json handle_tools_list() const;
    nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params) const;
    nlohmann::json handle_prompts_list() const;
    nlohmann::json handle_prompts_get(const nlohmann::json& id, const nlohmann::json& params) const;
};

// JSON-RPC error codes
enum RpcError {
    rpc_parse_error = -32700,
    rpc_invalid_request = -32600,
    rpc_method_not_found = -32601,
    rpc_invalid_params = -32602,
    rpc_internal_error = -32603,
};

nlohmann::json rpc_result(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json rpc_error(const nlohmann::json& id, int code, const std::string& message);

// One wire line; invalid UTF-8 in strings is replaced, never thrown.
std::string serialize_reply(const nlohmann::json& reply);

} // namespace sonarbridge
