#include "audit_log.hpp"
#include "utils.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <stdexcept>
#include <utility>

namespace sonarbridge {

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

AuditLog::AuditLog(std::string path, uintmax_t max_bytes)
    : path_(std::move(path)), max_bytes_(max_bytes) {
    std::error_code ec;
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
}

// Split on '\n' keeping the trailing empty piece, so a file ending in a
// newline still ends in one after the halves are re-joined.
static std::vector<std::string> split_lines(const std::string& data) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (;;) {
        size_t nl = data.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(data.substr(start));
            break;
        }
        lines.push_back(data.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

bool AuditLog::compact_if_needed(const std::string& entry) const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) return true;
    uintmax_t size = fs::file_size(path_, ec);
    if (ec || size < max_bytes_) return true;

    try {
        std::ifstream in(path_, std::ios::binary);
        if (!in) throw std::runtime_error("cannot read " + path_);
        std::ostringstream ss;
        ss << in.rdbuf();
        in.close();

        auto lines = split_lines(ss.str());
        size_t half = lines.size() / 2;
        std::string kept;
        for (size_t i = half; i < lines.size(); i++) {
            if (i > half) kept += '\n';
            kept += lines[i];
        }

        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("cannot rewrite " + path_);
        out << kept;
        out.flush();
        if (!out) throw std::runtime_error("rewrite of " + path_ + " failed");
        return true;
    } catch (const std::exception&) {
        // Start over with just this entry
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("cannot overwrite " + path_);
        out << entry;
        out.flush();
        if (!out) throw std::runtime_error("overwrite of " + path_ + " failed");
        return false;
    }
}

void AuditLog::record(LogLevel level, const std::string& message) const {
    std::string line = std::string(log_level_name(level)) + ": " + message;
    std::string entry = "[" + iso_timestamp() + "] " + line + "\n";

    try {
        if (!compact_if_needed(entry)) return;

        std::ofstream f(path_, std::ios::binary | std::ios::app);
        if (!f) throw std::runtime_error("cannot open " + path_ + " for append");
        f << entry;
        f.flush();
        if (!f) throw std::runtime_error("append to " + path_ + " failed");
    } catch (const std::exception& e) {
        std::cerr << "Logging error: " << e.what() << "\n"
                  << line << std::endl;
    }
}

} // namespace sonarbridge
