#pragma once

#include <mutex>
#include "SimpleAmqpClient/SimpleAmqpClient.h"
#include "server/config.hpp"

namespace codebox::server {

/**
 * @brief 向 AMQP exchange 发送消息的类
 */
struct rabbitmq {
    explicit rabbitmq(const amqp &amqp);

    /**
     * @brief 发送消息，连接断开时重连后重试
     * @param routing_key 消息的 Routing Key
     * @param message 消息内容
     */
    void report(const std::string &routing_key, const std::string &message);

private:
    void connect();

    AmqpClient::Channel::ptr_t channel;
    codebox::server::amqp queue;
    std::mutex mut;
};

}  // namespace codebox::server
