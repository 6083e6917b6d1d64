#pragma once
#include "errors.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace sonarbridge {

enum class Role { system, user, assistant };

inline const char* role_name(Role r) {
    switch (r) {
    case Role::system:    return "system";
    case Role::user:      return "user";
    case Role::assistant: return "assistant";
    }
    return "user";
}

inline std::optional<Role> parse_role(const std::string& s) {
    if (s == "system") return Role::system;
    if (s == "user") return Role::user;
    if (s == "assistant") return Role::assistant;
    return std::nullopt;
}

struct Message {
    Role role = Role::user;
    std::string content;

    nlohmann::json to_json() const {
        return {{"role", role_name(role)}, {"content", content}};
    }

    bool operator==(const Message& o) const {
        return role == o.role && content == o.content;
    }
};

// Parses a caller-supplied conversation. `tool` only flavours the error text.
inline Result<std::vector<Message>> parse_messages(const nlohmann::json& args,
                                                   const std::string& tool) {
    if (!args.contains("messages") || !args["messages"].is_array()) {
        return validation_error("Invalid arguments for " + tool +
                                ": 'messages' must be an array");
    }
    auto& arr = args["messages"];
    if (arr.empty()) {
        return validation_error("Invalid arguments for " + tool +
                                ": 'messages' must not be empty");
    }

    std::vector<Message> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); i++) {
        auto& m = arr[i];
        std::string where = "messages[" + std::to_string(i) + "]";
        if (!m.is_object()) {
            return validation_error("Invalid arguments for " + tool + ": " + where +
                                    " must be an object");
        }
        if (!m.contains("role") || !m["role"].is_string() ||
            !m.contains("content") || !m["content"].is_string()) {
            return validation_error("Invalid arguments for " + tool + ": " + where +
                                    " must have string 'role' and 'content'");
        }
        auto role = parse_role(m["role"].get<std::string>());
        if (!role) {
            return validation_error("Invalid arguments for " + tool + ": " + where +
                                    " has unsupported role '" + m["role"].get<std::string>() +
                                    "' (expected system, user or assistant)");
        }
        out.push_back(Message{*role, m["content"].get<std::string>()});
    }
    return out;
}

} // namespace sonarbridge
