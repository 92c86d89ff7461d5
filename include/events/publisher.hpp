#pragma once

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "server/rabbitmq.hpp"
#include "server/redis.hpp"

namespace codebox {

/**
 * @brief 推送给前端的事件
 */
struct event {
    /**
     * @brief 事件名，比如 compiler:session:update
     */
    std::string name;

    /**
     * @brief 为空时广播，否则只推送给该房间，比如 user:<id>
     */
    std::optional<std::string> room;

    nlohmann::json payload;
};

/**
 * @brief {event, room, data}
 */
void to_json(nlohmann::json &j, const event &e);

/**
 * @brief compiler:session:update 事件，payload 为 {sessionId, status, language} 加上 extra 中的字段
 */
event session_event(const std::string &session_id, const std::string &status, const std::string &language,
                     const nlohmann::json &extra = nlohmann::json::object());

/**
 * @brief compiler:submission:update 事件，只推送给提交者
 */
event submission_event(const std::string &user_id, const std::string &submission_id, const std::string &status);

/**
 * @brief 事件的投递目标
 * publish 可以抛出异常，由 event_publisher 捕获并记录日志
 */
struct event_sink {
    virtual ~event_sink() = default;
    virtual std::string name() const = 0;
    virtual void publish(const event &e) = 0;
};

/**
 * @brief 只把事件写入日志
 */
struct log_event_sink : public event_sink {
    std::string name() const override;
    void publish(const event &e) override;
};

/**
 * @brief 通过 Redis PUBLISH 发送事件，由 WebSocket 网关订阅后转发
 */
struct redis_event_sink : public event_sink {
    redis_event_sink(server::redis_conn &conn, std::string channel);

    std::string name() const override;
    void publish(const event &e) override;

private:
    server::redis_conn &conn;
    std::string channel;
};

/**
 * @brief 发送到 AMQP exchange，routing key 为事件名
 */
struct amqp_event_sink : public event_sink {
    explicit amqp_event_sink(std::unique_ptr<server::rabbitmq> mq);

    std::string name() const override;
    void publish(const event &e) override;

private:
    std::unique_ptr<server::rabbitmq> mq;
};

/**
 * @brief 异步发送事件
 * publish 不会阻塞调用者：事件进入有界队列，队列已满时事件被丢弃并计数。
 * 一个发送线程从队列中取出事件，依次交给所有 sink。
 */
struct event_publisher {
    explicit event_publisher(std::size_t capacity);
    ~event_publisher();

    /**
     * @brief 必须在 start 之前调用
     */
    void add_sink(std::unique_ptr<event_sink> sink);

    void start();

    /**
     * @brief 发送完队列中剩余的事件后停止发送线程
     */
    void stop();

    /**
     * @return 事件被丢弃时返回 false
     */
    bool publish(event e);

    std::size_t dropped() const;

    std::size_t delivered() const;

private:
    void dispatch_loop();

    concurrent_queue<event> queue;
    std::vector<std::unique_ptr<event_sink>> sinks;
    std::thread dispatcher;
    std::atomic<std::size_t> dropped_count{0};
    std::atomic<std::size_t> delivered_count{0};
};

}  // namespace codebox
