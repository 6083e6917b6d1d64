#pragma once
#include <string>
#include <cstdint>
#include <exception>

namespace sonarbridge {

enum class LogLevel { info, warn, error };

const char* log_level_name(LogLevel level);

// Append-only diagnostic log. stdout belongs to the protocol channel, so this
// file is the only place runtime events go. Never throws: when the file cannot
// be written the entry lands on stderr instead.
//
// Once the file reaches max_bytes the next record() first rewrites it to keep
// the second half of its lines. The bound is approximate; uneven line lengths
// can leave the file above max_bytes after compaction.
class AuditLog {
public:
    static constexpr uintmax_t DEFAULT_MAX_BYTES = 20ull * 1024 * 1024;

    explicit AuditLog(std::string path, uintmax_t max_bytes = DEFAULT_MAX_BYTES);

    void record(LogLevel level, const std::string& message) const;

    void info(const std::string& message) const { record(LogLevel::info, message); }
    void warn(const std::string& message) const { record(LogLevel::warn, message); }
    void error(const std::string& message) const { record(LogLevel::error, message); }
    void error(const std::string& message, const std::exception& e) const {
        record(LogLevel::error, message + ": " + e.what());
    }

    const std::string& path() const { return path_; }
    uintmax_t max_bytes() const { return max_bytes_; }

private:
    std::string path_;
    uintmax_t max_bytes_;

    // Returns false when the rewrite failed and the entry was written in its place.
    bool compact_if_needed(const std::string& entry) const;
};

} // namespace sonarbridge
