#pragma once
#include <string>
#include <map>
#include <functional>

namespace sonarbridge {

struct HttpsRequest {
    std::string base_url;                        // scheme://host[:port]
    std::string path;                            // /chat/completions
    std::map<std::string, std::string> headers;
    std::string body;
    std::string content_type = "application/json";
    int timeout_sec = 30;
};

struct HttpsResponse {
    int status = 0;
    std::string reason;
    std::string body;
    std::string error;   // set when no HTTP response was received at all

    bool transport_failed() const { return !error.empty(); }
    bool ok() const { return !transport_failed() && status >= 200 && status < 300; }
};

// POST over httplib; https:// needs CPPHTTPLIB_OPENSSL_SUPPORT at build time.
HttpsResponse https_post(const HttpsRequest& req);

// Seam used by CompletionClient so tests can answer without a network.
using HttpPost = std::function<HttpsResponse(const HttpsRequest&)>;

// Splits "https://api.example.ai/v1/" into "https://api.example.ai:443" and "/v1".
void split_base_url(const std::string& url, std::string& origin, std::string& path_prefix);

} // namespace sonarbridge
