#pragma once
#include <string>
#include <cstdlib>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdio>

namespace sonarbridge {

namespace fs = std::filesystem;

inline std::string home_dir() {
#ifdef _WIN32
    const char* h = std::getenv("USERPROFILE");
    if (!h) h = std::getenv("HOMEDRIVE");
#else
    const char* h = std::getenv("HOME");
#endif
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && (p[1] == '/' || p[1] == '\\')) {
        return home_dir() + p.substr(1);
    }
    return p;
}

// Empty string when unset or set to ""
inline std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : "";
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// UTC, millisecond precision: 2026-10-18T07:09:00.123Z
inline std::string iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

// Walk up from `start` to the first directory holding .git or CMakeLists.txt.
// Falls back to `start` itself.
inline fs::path find_project_root(const fs::path& start) {
    std::error_code ec;
    fs::path dir = fs::weakly_canonical(start, ec);
    if (ec) dir = start;
    fs::path cur = dir;
    while (!cur.empty()) {
        if (fs::exists(cur / ".git", ec) || fs::exists(cur / "CMakeLists.txt", ec)) {
            return cur;
        }
        if (cur == cur.root_path() || cur.parent_path() == cur) break;
        cur = cur.parent_path();
    }
    return dir;
}

} // namespace sonarbridge
