#include "https_client.hpp"
#include <chrono>
#include <httplib.h>

namespace sonarbridge {

void split_base_url(const std::string& url, std::string& origin, std::string& path_prefix) {
    std::string scheme = "http";
    std::string host = "127.0.0.1";
    int port = 80;
    path_prefix.clear();

    size_t pos = 0;
    if (url.rfind("https://", 0) == 0) {
        scheme = "https"; pos = 8; port = 443;
    } else if (url.rfind("http://", 0) == 0) {
        scheme = "http"; pos = 7; port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        path_prefix = url.substr(slash);
        while (!path_prefix.empty() && path_prefix.back() == '/') path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host = host_port.substr(0, colon);
        try {
            port = std::stoi(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            // keep the scheme default
        }
    } else if (!host_port.empty()) {
        host = host_port;
    }

    origin = scheme + "://" + host + ":" + std::to_string(port);
}

HttpsResponse https_post(const HttpsRequest& req) {
    HttpsResponse resp;

    httplib::Client cli(req.base_url);
    if (!cli.is_valid()) {
        resp.error = "unsupported endpoint " + req.base_url +
                     " (https requires a build with OpenSSL)";
        return resp;
    }
    cli.set_connection_timeout(req.timeout_sec);
    cli.set_read_timeout(req.timeout_sec);
    cli.set_write_timeout(req.timeout_sec);
    // Caps the whole exchange; the read timeout alone restarts on every recv
    cli.set_max_timeout(std::chrono::seconds(req.timeout_sec));

    httplib::Headers headers;
    for (auto& [k, v] : req.headers) {
        headers.emplace(k, v);
    }

    auto res = cli.Post(req.path, headers, req.body, req.content_type);
    if (!res) {
        resp.error = httplib::to_string(res.error());
        return resp;
    }
    resp.status = res->status;
    resp.reason = res->reason;
    resp.body = res->body;
    return resp;
}

} // namespace sonarbridge
