#pragma once
#include <string>
#include <variant>
#include <stdexcept>

namespace sonarbridge {

enum class ErrorKind {
    validation,     // malformed or missing caller input
    network,        // could not reach the completion API
    upstream,       // completion API answered with a non-2xx status
    decode,         // completion API answered with an unusable body
    unknown_tool,
    configuration
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::validation:    return "validation";
    case ErrorKind::network:       return "network";
    case ErrorKind::upstream:      return "upstream";
    case ErrorKind::decode:        return "decode";
    case ErrorKind::unknown_tool:  return "unknown_tool";
    case ErrorKind::configuration: return "configuration";
    }
    return "unknown";
}

struct ToolError {
    ErrorKind kind;
    std::string message;
    int status = 0;          // upstream only
    std::string body;        // upstream only
};

template <typename T>
using Result = std::variant<T, ToolError>;

template <typename T>
bool is_error(const Result<T>& r) {
    return std::holds_alternative<ToolError>(r);
}

template <typename T>
const ToolError& get_error(const Result<T>& r) {
    return std::get<ToolError>(r);
}

template <typename T>
const T& get_value(const Result<T>& r) {
    return std::get<T>(r);
}

inline ToolError validation_error(const std::string& message) {
    return ToolError{ErrorKind::validation, message};
}

// Startup-only failure; terminates the process before any request is served.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace sonarbridge
