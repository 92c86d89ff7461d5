#include <unistd.h>
#include <regex>
#include <thread>
#include "gtest/gtest.h"
#include "http/server.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codebox;
using namespace codebox::http;

TEST(RateLimiterTest, FixedWindowTest) {
    rate_limiter limiter(2, chrono::seconds(60));
    auto now = chrono::steady_clock::now();
    EXPECT_TRUE(limiter.allow("1.2.3.4", now));
    EXPECT_TRUE(limiter.allow("1.2.3.4", now + chrono::seconds(1)));
    EXPECT_FALSE(limiter.allow("1.2.3.4", now + chrono::seconds(2)));
    // 不同 IP 互不影响
    EXPECT_TRUE(limiter.allow("5.6.7.8", now + chrono::seconds(2)));
    // 新窗口重新计数
    EXPECT_TRUE(limiter.allow("1.2.3.4", now + chrono::seconds(61)));
}

TEST(RateLimiterTest, ExpiredKeysAreDroppedTest) {
    rate_limiter limiter(5, chrono::seconds(60));
    auto now = chrono::steady_clock::now();
    for (int i = 0; i < 100; ++i)
        EXPECT_TRUE(limiter.allow("10.0.0." + to_string(i), now));
    EXPECT_TRUE(limiter.allow("10.0.1.1", now + chrono::seconds(30)));
    EXPECT_EQ(limiter.size(), 101);

    // 一个窗口之后只剩下仍在窗口内的 key
    EXPECT_TRUE(limiter.allow("10.0.2.1", now + chrono::seconds(61)));
    EXPECT_EQ(limiter.size(), 2);

    EXPECT_TRUE(limiter.allow("10.0.2.2", now + chrono::seconds(200)));
    EXPECT_EQ(limiter.size(), 1);
}

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        problems.add("1001", {{"1 2", "3", false}});
        service.start(1);
        config.host = "127.0.0.1";
        config.port = 18000 + (int)(::getpid() % 1000);
        config.submit_limit = 3;
        server = make_unique<http_server>(service, config);
    }

    void TearDown() override {
        if (server_thread.joinable()) {
            server->stop();
            server_thread.join();
        }
        service.stop();
        events.stop();
    }

    void start_listening() {
        server_thread = thread([this] { server->listen(); });
        for (int i = 0; i < 200 && !server->running(); ++i)
            this_thread::sleep_for(chrono::milliseconds(10));
        ASSERT_TRUE(server->running());
    }

    static httplib::Request post(const string &path, const nlohmann::json &body) {
        httplib::Request req;
        req.method = "POST";
        req.path = path;
        req.body = body.dump();
        req.remote_addr = "127.0.0.1";
        return req;
    }

    language_registry languages = language_registry::builtin(server::language_config());
    test::scripted_executor exec{[](const execution_request &request) { return test::success_result(request.input); }};
    memory_session_store sessions;
    memory_submission_repository submissions;
    memory_problem_repository problems;
    event_publisher events{64};
    execution_service service{languages, exec, sessions, submissions, problems, events, nullptr, 16, 2};
    server::http_config config;
    unique_ptr<http_server> server;
    thread server_thread;
};

TEST_F(HttpServerTest, RunHandlerTest) {
    httplib::Response res;
    server->handle_run(post("/run", {{"language", "python"}, {"code", "print(1)"}, {"input", "x"}}), res);
    EXPECT_EQ(res.status, 202);
    auto body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["success"], true);
    string session_id = body["data"]["sessionId"];
    EXPECT_TRUE(sessions.get(session_id));
}

TEST_F(HttpServerTest, ResultHandlerTest) {
    httplib::Request req;
    req.method = "GET";
    req.path = "/result/unknown-session";
    regex_match(req.path, req.matches, regex(R"(/result/([\w\-]+))"));
    httplib::Response res;
    server->handle_result(req, res);
    EXPECT_EQ(res.status, 200);
    EXPECT_JSON_EQ(nlohmann::json::parse(res.body)["data"], (nlohmann::json{{"status", "not_found"}, {"error", "Session not found"}}));
}

TEST_F(HttpServerTest, LanguagesHandlerTest) {
    httplib::Response res;
    server->handle_languages(httplib::Request(), res);
    auto body = nlohmann::json::parse(res.body);
    ASSERT_EQ(body["data"].size(), 3);
    EXPECT_EQ(body["data"][0]["id"], "python");
    EXPECT_EQ(body["data"][1]["compiled"], true);
}

TEST_F(HttpServerTest, EndToEndTest) {
    start_listening();
    httplib::Client cli(config.host, config.port);

    auto health = cli.Get("/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
    EXPECT_EQ(health->body, "ok");

    auto run = cli.Post("/run", R"({"language":"py","code":"print(input())","input":"hi"})", "application/json");
    ASSERT_TRUE(run);
    ASSERT_EQ(run->status, 202);
    string session_id = nlohmann::json::parse(run->body)["data"]["sessionId"];

    nlohmann::json data;
    for (int i = 0; i < 200; ++i) {
        auto polled = cli.Get(("/result/" + session_id).c_str());
        ASSERT_TRUE(polled);
        data = nlohmann::json::parse(polled->body)["data"];
        if (data["status"] == "completed" || data["status"] == "error") break;
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    EXPECT_EQ(data["status"], "completed");
    EXPECT_EQ(data["output"], "hi");
}

TEST_F(HttpServerTest, ErrorMappingTest) {
    start_listening();
    httplib::Client cli(config.host, config.port);

    auto unsupported = cli.Post("/run", R"({"language":"ruby","code":"puts 1"})", "application/json");
    ASSERT_TRUE(unsupported);
    EXPECT_EQ(unsupported->status, 400);
    EXPECT_EQ(nlohmann::json::parse(unsupported->body)["message"], "Unsupported language: ruby");

    auto missing = cli.Post("/run", R"({"language":"python"})", "application/json");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 400);

    auto malformed = cli.Post("/run", "{not json", "application/json");
    ASSERT_TRUE(malformed);
    EXPECT_EQ(malformed->status, 400);

    httplib::Headers user = {{"X-User-Id", "u1"}};
    auto no_user = cli.Post("/submit", R"({"problemId":"1001","language":"cpp","code":"x"})", "application/json");
    ASSERT_TRUE(no_user);
    EXPECT_EQ(no_user->status, 400);

    auto unknown = cli.Post("/submit", user, R"({"problemId":"404","language":"cpp","code":"x"})", "application/json");
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown->status, 404);

    auto cancel = cli.Post("/cancel/no-such-session", "", "application/json");
    ASSERT_TRUE(cancel);
    EXPECT_EQ(cancel->status, 404);

    auto sync = cli.Post("/execute", R"({"language":"python","code":"print(1)"})", "application/json");
    ASSERT_TRUE(sync);
    EXPECT_EQ(sync->status, 503);
}

TEST_F(HttpServerTest, SubmitRateLimitTest) {
    start_listening();
    httplib::Client cli(config.host, config.port);
    httplib::Headers user = {{"X-User-Id", "u1"}};
    string body = R"({"problemId":"1001","language":"cpp","code":"x","input":"1 2"})";

    for (unsigned i = 0; i < config.submit_limit; ++i) {
        auto res = cli.Post("/submit", user, body, "application/json");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 202);
        auto data = nlohmann::json::parse(res->body)["data"];
        EXPECT_TRUE(data.count("submissionId"));
        EXPECT_TRUE(data.count("sessionId"));
    }
    auto limited = cli.Post("/submit", user, body, "application/json");
    ASSERT_TRUE(limited);
    EXPECT_EQ(limited->status, 429);
}
