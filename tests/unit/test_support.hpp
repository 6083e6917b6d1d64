#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "https_client.hpp"

namespace sonarbridge::test {

class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::random_device rd;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = std::filesystem::temp_directory_path() /
                ("sonarbridge_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(root_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }
    std::string file(const std::string& name) const { return (root_ / name).string(); }

private:
    std::filesystem::path root_;
};

inline std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

inline std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Stands in for the network: records every request, answers with `next`.
struct FakeApi {
    std::vector<HttpsRequest> requests;
    HttpsResponse next;
    std::chrono::milliseconds delay{0};

    HttpPost poster() {
        return [this](const HttpsRequest& req) {
            if (delay.count() > 0) std::this_thread::sleep_for(delay);
            requests.push_back(req);
            return next;
        };
    }

    void respond(int status, const nlohmann::json& body, const std::string& reason = "OK") {
        next = HttpsResponse{};
        next.status = status;
        next.reason = reason;
        next.body = body.dump();
    }

    nlohmann::json last_body() const {
        return nlohmann::json::parse(requests.back().body);
    }
};

inline nlohmann::json completion_body(const std::string& content,
                                      const nlohmann::json& citations = nullptr) {
    nlohmann::json message = {{"role", "assistant"}, {"content", content}};
    nlohmann::json choice = {{"index", 0}, {"message", message}};
    nlohmann::json j = {{"id", "cmpl-1"}, {"choices", nlohmann::json::array({choice})}};
    if (!citations.is_null()) j["citations"] = citations;
    return j;
}

} // namespace sonarbridge::test
