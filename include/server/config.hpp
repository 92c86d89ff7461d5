#pragma once

#include <map>
#include <optional>
#include "common/json_utils.hpp"
#include "sandbox.hpp"

namespace codebox::server {

/**
 * @brief 描述一个 AMQP 消息队列的配置数据结构
 * 事件会被发送到 exchange，routing key 为事件名
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的主机地址
     */
    std::string hostname;

    /**
     * @brief AMQP 消息队列的主机端口
     */
    int port = 5672;

    /**
     * @brief 通过该结构体发送的消息的 Exchange 名
     */
    std::string exchange;

    /**
     * @brief Exchange 类型，可选 direct, topic, fanout
     */
    std::string exchange_type = "topic";
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * redis 的登录情况
 */
struct redis {
    /**
     * @brief redis 服务器地址
     */
    std::string host = "127.0.0.1";

    /**
     * @brief redis 服务器端口
     */
    int port = 6379;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval = 1000;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;

    /**
     * @brief 发布事件的通道名，为空时不通过 redis 发布事件
     */
    std::string channel;

    /**
     * @brief 会话的过期时间，单位秒
     */
    unsigned session_ttl = 24 * 60 * 60;
};

void from_json(const nlohmann::json &j, redis &redis_config);

/**
 * @brief 各语言的镜像和时限
 */
struct language_config {
    std::string python_image = "python:3.11-slim";
    std::string cpp_image = "gcc:12.2.0";
    std::string java_image = "eclipse-temurin:17-jdk-jammy";

    /**
     * @brief 编译时间限制，单位毫秒
     */
    unsigned compile_timeout_ms = 15000;

    /**
     * @brief 运行时间限制，单位毫秒
     */
    unsigned run_timeout_ms = 8000;

    /**
     * @brief Java 的运行时间限制，JVM 启动较慢，单位毫秒
     */
    unsigned java_run_timeout_ms = 15000;
};

void from_json(const nlohmann::json &j, language_config &config);

/**
 * @brief 沙箱类型和资源限制
 */
struct sandbox_config {
    /**
     * @brief docker 或者 direct
     * direct 表示不隔离，直接在工作目录中运行，只用于开发环境
     */
    std::string type = "docker";

    sandbox_limits limits;
};

void from_json(const nlohmann::json &j, sandbox_config &config);

/**
 * @brief 执行后端的配置，按 local、remote、piston 的顺序尝试
 */
struct backend_config {
    /**
     * @brief 是否启用本机沙箱
     */
    bool local = true;

    /**
     * @brief 另一个执行节点的地址，为空时不启用
     * 请求会发送到 <remote_url>/execute
     */
    std::string remote_url;

    /**
     * @brief Piston API 的地址，为空时不启用
     */
    std::string piston_url = "https://emkc.org/api/v2/piston";

    /**
     * @brief 语言对应的 Piston 版本号
     */
    std::map<std::string, std::string> piston_versions = {
        {"python", "3.11.0"}, {"cpp", "10.2.0"}, {"java", "15.0.2"}};

    /**
     * @brief 调用远程后端的超时，单位毫秒
     */
    unsigned http_timeout_ms = 30000;
};

void from_json(const nlohmann::json &j, backend_config &config);

/**
 * @brief 执行服务的配置
 */
struct service_config {
    /**
     * @brief worker 线程数
     */
    unsigned workers = 4;

    /**
     * @brief 等待队列的最大长度，超过时拒绝新任务
     */
    std::size_t queue_capacity = 64;

    /**
     * @brief 同时进行的同步执行 (POST /execute) 数量上限，超过时拒绝请求
     */
    std::size_t sync_capacity = 4;

    /**
     * @brief 事件队列的最大长度，超过时丢弃事件
     */
    std::size_t event_queue_capacity = 1024;

    /**
     * @brief 题目测试数据目录，每个题目为 <problem_dir>/<题号>.json
     */
    std::string problem_dir = "problems";

    /**
     * @brief 会话和提交记录的存储，memory 或者 redis
     */
    std::string store = "memory";
};

void from_json(const nlohmann::json &j, service_config &config);

/**
 * @brief HTTP 接口的配置
 */
struct http_config {
    std::string host = "0.0.0.0";
    int port = 5000;

    /**
     * @brief 每个 IP 每分钟的请求上限
     */
    unsigned run_limit = 60;
    unsigned result_limit = 120;
    unsigned submit_limit = 20;
};

void from_json(const nlohmann::json &j, http_config &config);

struct system_config {
    language_config languages;
    sandbox_config sandbox;
    backend_config backends;
    service_config service;
    http_config http;

    /**
     * @brief 未配置时不连接 redis
     */
    std::optional<redis> redis_server;

    /**
     * @brief 未配置时不向消息队列发送事件
     */
    std::optional<amqp> amqp_server;
};

void from_json(const nlohmann::json &j, system_config &config);

/**
 * @brief 用环境变量覆盖配置
 * PY_IMAGE、CPP_IMAGE、JAVA_IMAGE、COMPILE_TIMEOUT_MS、RUN_TIMEOUT_MS、JAVA_RUN_TIMEOUT_MS、
 * SANDBOX_CPUS、SANDBOX_MEMORY、SANDBOX_PIDS、PISTON_API_URL、REMOTE_EXECUTOR_URL
 */
void apply_environment(system_config &config);

}  // namespace codebox::server
