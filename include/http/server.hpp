#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <httplib.h>
#include "server/config.hpp"
#include "service.hpp"

namespace codebox::http {

/**
 * @brief 固定窗口限流，每个 key（客户端 IP）在一个窗口内最多 limit 次请求
 */
struct rate_limiter {
    explicit rate_limiter(unsigned limit, std::chrono::seconds window = std::chrono::seconds(60));

    /**
     * @return 超过限额时返回 false，此时请求不计数
     */
    bool allow(const std::string &key, std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /**
     * @brief 当前记录的 key 数量，窗口过期的 key 会在之后的 allow 中被清除
     */
    std::size_t size();

private:
    struct bucket {
        std::chrono::steady_clock::time_point window_start;
        unsigned count = 0;
    };

    unsigned limit;
    std::chrono::seconds window;
    std::mutex mut;
    std::chrono::steady_clock::time_point last_sweep;
    std::map<std::string, bucket> buckets;
};

/**
 * @brief 执行服务的 HTTP 接口
 *
 * POST /run                     {language, code, input}
 * POST /submit                  {problemId, code, language, contestId?, input?}，需要 X-User-Id
 * POST /submit/batch            {problemId, code, language, contestId?, compareMode?}，需要 X-User-Id
 * GET  /result/<sessionId>
 * POST /cancel/<sessionId>
 * POST /execute                 同步执行，供其他节点作为远程后端调用
 * GET  /languages
 * GET  /health
 */
struct http_server {
    http_server(execution_service &service, const server::http_config &config);

    /**
     * @brief 阻塞监听直到 stop 被调用
     * @return 无法绑定端口时返回 false
     */
    bool listen();

    void stop();

    bool running() const;

    // 以下为各路由的处理函数，可以直接用构造的 Request 调用
    void handle_run(const httplib::Request &req, httplib::Response &res);
    void handle_submit(const httplib::Request &req, httplib::Response &res);
    void handle_submit_batch(const httplib::Request &req, httplib::Response &res);
    void handle_result(const httplib::Request &req, httplib::Response &res);
    void handle_cancel(const httplib::Request &req, httplib::Response &res);
    void handle_execute(const httplib::Request &req, httplib::Response &res);
    void handle_languages(const httplib::Request &req, httplib::Response &res);

private:
    using handler = void (http_server::*)(const httplib::Request &, httplib::Response &);

    /**
     * @brief 限流并把异常转换为错误响应
     */
    httplib::Server::Handler guarded(handler h, rate_limiter &limiter);

    execution_service &service;
    server::http_config config;
    rate_limiter run_limiter;
    rate_limiter result_limiter;
    rate_limiter submit_limiter;
    httplib::Server srv;
};

/**
 * @brief {success: false, message}
 */
void send_error(httplib::Response &res, int status, const std::string &message);

/**
 * @brief {success: true, data}
 */
void send_data(httplib::Response &res, int status, const nlohmann::json &data);

}  // namespace codebox::http
