#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "completion_client.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using sonarbridge::AuditLog;
using sonarbridge::CompletionClient;
using sonarbridge::CompletionOptions;
using sonarbridge::Config;
using sonarbridge::ErrorKind;
using sonarbridge::Message;
using sonarbridge::Role;
using sonarbridge::get_error;
using sonarbridge::get_value;
using sonarbridge::is_error;
using sonarbridge::test::FakeApi;
using sonarbridge::test::TempDir;
using sonarbridge::test::completion_body;
using sonarbridge::test::slurp;

class CompletionClientTest : public ::testing::Test {
protected:
    CompletionClientTest() : dir_("completion"), log_(dir_.file("mcp-server.log")) {
        cfg_.api_key = "test-key";
    }

    CompletionClient make_client() { return CompletionClient(cfg_, log_, api_.poster()); }

    TempDir dir_;
    AuditLog log_;
    Config cfg_;
    FakeApi api_;
};

TEST_F(CompletionClientTest, BuildsPostWithBearerTokenAndJsonBody) {
    api_.respond(200, completion_body("ok"));
    auto client = make_client();

    auto result = client.complete({Message{Role::user, "Hello"}}, "sonar-pro");
    ASSERT_FALSE(is_error(result));

    ASSERT_EQ(api_.requests.size(), 1u);
    const auto& req = api_.requests[0];
    EXPECT_EQ(req.base_url, "https://api.perplexity.ai:443");
    EXPECT_EQ(req.path, "/chat/completions");
    EXPECT_EQ(req.headers.at("Authorization"), "Bearer test-key");
    EXPECT_EQ(req.content_type, "application/json");
    EXPECT_EQ(req.timeout_sec, 30);

    auto body = api_.last_body();
    EXPECT_EQ(body["model"], "sonar-pro");
    EXPECT_EQ(body["messages"], json::parse(R"([{"role":"user","content":"Hello"}])"));
}

TEST_F(CompletionClientTest, ForwardsMessagesInOrderUnmodified) {
    api_.respond(200, completion_body("ok"));
    auto client = make_client();
    std::vector<Message> messages = {
        {Role::system, "You are terse."},
        {Role::user, "first  question\nwith a newline"},
        {Role::assistant, "an answer"},
        {Role::user, "first  question\nwith a newline"},
        {Role::user, "caf\xc3\xa9 \"quoted\""},
    };

    ASSERT_FALSE(is_error(client.complete(messages, "sonar")));

    auto sent = api_.last_body()["messages"];
    ASSERT_EQ(sent.size(), messages.size());
    for (size_t i = 0; i < messages.size(); i++) {
        EXPECT_EQ(sent[i]["role"], sonarbridge::role_name(messages[i].role)) << i;
        EXPECT_EQ(sent[i]["content"], messages[i].content) << i;
    }
}

TEST_F(CompletionClientTest, ParamsMergeButCannotReplaceModelOrMessages) {
    api_.respond(200, completion_body("ok"));
    auto client = make_client();
    json params = {{"temperature", 0.3}, {"model", "hijack"}, {"messages", json::array()}};

    ASSERT_FALSE(is_error(client.complete({Message{Role::user, "q"}}, "sonar", params)));

    auto body = api_.last_body();
    EXPECT_EQ(body["model"], "sonar");
    EXPECT_EQ(body["messages"].size(), 1u);
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.3);
}

TEST_F(CompletionClientTest, ApiBaseWithPathPrefix) {
    cfg_.api_base = "http://localhost:8080/v1/";
    api_.respond(200, completion_body("ok"));
    auto client = make_client();

    ASSERT_FALSE(is_error(client.complete({Message{Role::user, "q"}}, "m")));
    EXPECT_EQ(api_.requests[0].base_url, "http://localhost:8080");
    EXPECT_EQ(api_.requests[0].path, "/v1/chat/completions");
}

TEST_F(CompletionClientTest, AppendsNumberedCitationsInOriginalOrder) {
    api_.respond(200, completion_body("Answer", {"https://b.example", "https://a.example", "https://c.example"}));
    auto client = make_client();

    auto result = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result),
              "Answer\n\nCitations:\n"
              "[1] https://b.example\n"
              "[2] https://a.example\n"
              "[3] https://c.example\n");
}

TEST_F(CompletionClientTest, NoCitationsBlockWhenEmptyOrAbsent) {
    auto client = make_client();

    api_.respond(200, completion_body("Plain"));
    auto absent = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_FALSE(is_error(absent));
    EXPECT_EQ(get_value(absent), "Plain");

    api_.respond(200, completion_body("Plain", json::array()));
    auto empty = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_FALSE(is_error(empty));
    EXPECT_EQ(get_value(empty), "Plain");
    EXPECT_EQ(get_value(empty).find("Citations:"), std::string::npos);
}

TEST_F(CompletionClientTest, TransportFailureIsNetworkError) {
    api_.next = sonarbridge::HttpsResponse{};
    api_.next.error = "Could not establish connection";
    auto client = make_client();

    auto result = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::network);
    EXPECT_NE(get_error(result).message.find("Could not establish connection"), std::string::npos);
    EXPECT_EQ(api_.requests.size(), 1u);   // no retry
    EXPECT_NE(slurp(log_.path()).find("ERROR: Network error"), std::string::npos);
}

TEST_F(CompletionClientTest, NonSuccessStatusIsUpstreamError) {
    api_.next = sonarbridge::HttpsResponse{};
    api_.next.status = 401;
    api_.next.reason = "Unauthorized";
    api_.next.body = R"({"error":"invalid api key"})";
    auto client = make_client();

    auto result = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_EQ(err.kind, ErrorKind::upstream);
    EXPECT_EQ(err.status, 401);
    EXPECT_EQ(err.body, R"({"error":"invalid api key"})");
    EXPECT_EQ(err.message, "Completion API error: 401 Unauthorized\n{\"error\":\"invalid api key\"}");
    EXPECT_NE(slurp(log_.path()).find("ERROR: Completion API error: 401"), std::string::npos);
}

TEST_F(CompletionClientTest, UpstreamErrorWithoutBodyUsesPlaceholder) {
    api_.next = sonarbridge::HttpsResponse{};
    api_.next.status = 502;
    api_.next.reason = "Bad Gateway";
    auto client = make_client();

    auto result = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message, "Completion API error: 502 Bad Gateway\nUnable to parse error response");
}

TEST_F(CompletionClientTest, UnparsableBodyIsDecodeError) {
    api_.next = sonarbridge::HttpsResponse{};
    api_.next.status = 200;
    api_.next.body = "<html>not json</html>";
    auto client = make_client();

    auto result = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::decode);
    EXPECT_NE(get_error(result).message.find("Failed to parse JSON response"), std::string::npos);
}

TEST_F(CompletionClientTest, InvalidUtf8FromUpstreamIsReplacedInErrors) {
    auto client = make_client();

    api_.next = sonarbridge::HttpsResponse{};
    api_.next.status = 502;
    api_.next.reason = "Bad Gateway";
    api_.next.body = "\xff\xfe gateway";
    auto upstream = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_TRUE(is_error(upstream));
    EXPECT_EQ(get_error(upstream).kind, ErrorKind::upstream);
    EXPECT_NE(get_error(upstream).message.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_NE(get_error(upstream).message.find(" gateway"), std::string::npos);
    EXPECT_NO_THROW(json(get_error(upstream).message).dump());

    api_.next.status = 200;
    api_.next.reason = "OK";
    api_.next.body = "\xff not json";
    auto decode = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_TRUE(is_error(decode));
    EXPECT_EQ(get_error(decode).kind, ErrorKind::decode);
    EXPECT_NO_THROW(json(get_error(decode).message).dump());
}

TEST_F(CompletionClientTest, MissingContentIsDecodeError) {
    auto client = make_client();
    for (auto body : {json::parse(R"({"choices":[]})"),
                      json::parse(R"({"choices":[{"message":{}}]})"),
                      json::parse(R"({"choices":[{"message":{"content":null}}]})"),
                      json::parse(R"({"result":"ok"})"),
                      json::parse(R"([1,2,3])")}) {
        api_.respond(200, body);
        auto result = client.complete({Message{Role::user, "q"}}, "sonar");
        ASSERT_TRUE(is_error(result)) << body.dump();
        EXPECT_EQ(get_error(result).kind, ErrorKind::decode) << body.dump();
    }
}

TEST_F(CompletionClientTest, StripsReasoningBeforeCitations) {
    api_.respond(200, completion_body("<think>\nstep one\nstep two\n</think>\n\n  The answer.  ", {"http://x"}));
    auto client = make_client();
    CompletionOptions opts;
    opts.strip_reasoning = true;

    auto result = client.complete({Message{Role::user, "q"}}, "sonar-reasoning-pro", json::object(), opts);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "The answer.\n\nCitations:\n[1] http://x\n");
}

TEST_F(CompletionClientTest, ReasoningKeptWithoutOption) {
    api_.respond(200, completion_body("<think>hmm</think>done"));
    auto client = make_client();

    auto result = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "<think>hmm</think>done");
}

TEST(StripThinkTagsTest, RemovesSpanAndTrims) {
    EXPECT_EQ(sonarbridge::strip_think_tags("<think>ignored</think>kept"), "kept");
    EXPECT_EQ(sonarbridge::strip_think_tags("  a <think>x\ny</think> b <think>z</think>c \n"), "a  b c");
    EXPECT_EQ(sonarbridge::strip_think_tags("no tags here"), "no tags here");
    EXPECT_EQ(sonarbridge::strip_think_tags("keep <think>unterminated"), "keep <think>unterminated");
}

TEST(FormatCitationsTest, OneIndexedLines) {
    EXPECT_EQ(sonarbridge::format_citations({}), "");
    EXPECT_EQ(sonarbridge::format_citations({"a"}), "\n\nCitations:\n[1] a\n");
}

TEST(ParseCompletionTest, NonStringCitationsRenderedAsJson) {
    auto parsed = sonarbridge::parse_completion(
        R"({"choices":[{"message":{"content":"c"}}],"citations":["u",{"url":"v"}]})");
    ASSERT_FALSE(is_error(parsed));
    const auto& resp = get_value(parsed);
    ASSERT_EQ(resp.citations.size(), 2u);
    EXPECT_EQ(resp.citations[0], "u");
    EXPECT_EQ(resp.citations[1], R"({"url":"v"})");
}

TEST_F(CompletionClientTest, ClosedPortIsNetworkError) {
    cfg_.api_base = "http://127.0.0.1:1";
    cfg_.timeout_sec = 2;
    CompletionClient client(cfg_, log_);

    auto result = client.complete({Message{Role::user, "q"}}, "sonar");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::network);
}

TEST_F(CompletionClientTest, LoopbackRoundTripThroughHttplib) {
    httplib::Server svr;
    std::string seen_auth;
    json seen_body;
    svr.Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
        seen_auth = req.get_header_value("Authorization");
        seen_body = json::parse(req.body);
        res.set_content(completion_body("Hi", {"http://x"}).dump(), "application/json");
    });
    int port = svr.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    std::thread t([&] { svr.listen_after_bind(); });
    svr.wait_until_ready();

    cfg_.api_base = "http://127.0.0.1:" + std::to_string(port) + "/v1";
    CompletionClient client(cfg_, log_);
    auto result = client.complete({Message{Role::user, "Hello"}}, "sonar-pro");

    svr.stop();
    t.join();

    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    EXPECT_EQ(get_value(result), "Hi\n\nCitations:\n[1] http://x\n");
    EXPECT_EQ(seen_auth, "Bearer test-key");
    EXPECT_EQ(seen_body["model"], "sonar-pro");
    EXPECT_EQ(seen_body["messages"][0]["content"], "Hello");
}

TEST_F(CompletionClientTest, TimeoutCoversTheWholeCall) {
    // Sends a byte every 600ms, so no single read waits out the 1s timeout
    httplib::Server svr;
    svr.Post("/chat/completions", [](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider("application/json",
            [](size_t offset, httplib::DataSink& sink) {
                if (offset >= 8) {
                    sink.done();
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(600));
                return sink.write(" ", 1);
            });
    });
    int port = svr.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    std::thread t([&] { svr.listen_after_bind(); });
    svr.wait_until_ready();

    cfg_.api_base = "http://127.0.0.1:" + std::to_string(port);
    cfg_.timeout_sec = 1;
    CompletionClient client(cfg_, log_);
    auto started = std::chrono::steady_clock::now();
    auto result = client.complete({Message{Role::user, "q"}}, "sonar");
    auto elapsed = std::chrono::steady_clock::now() - started;

    svr.stop();
    t.join();

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::network);
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

} // namespace
