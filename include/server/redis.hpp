#pragma once

#include <cpp_redis/cpp_redis>
#include <functional>
#include <mutex>
#include <vector>
#include "server/config.hpp"

namespace codebox::server {

/**
 * @brief 表示一个 Redis 连接，多个线程可以共享同一个连接
 */
struct redis_conn {
    /**
     * @brief 根据 Redis 配置初始化 Redis 服务器连接
     */
    void init(const redis &redis_config) noexcept;

    /**
     * @brief 在 callback 内发送 Redis 的操作，并等待所有操作完成
     * 该函数负责确保 Redis 连接会被建立。
     * 如果 Redis 服务器主动断开连接，那么这个函数将尝试重新创建连接，
     * 如果重试次数过多则抛出 store_error。
     * @param callback 你可以在 callback 内完成 Redis 的操作，并把 future 放进 replies 中
     * @return 按 replies 顺序排列的操作结果
     */
    std::vector<cpp_redis::reply> execute(std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> callback);

    /**
     * @brief 尝试重连
     * @param force 真时强制重连
     */
    void reconnect(bool force = false);

    const redis &config() const;

private:
    redis redis_config;
    cpp_redis::client redis_client;
    std::mutex mut;
};

}  // namespace codebox::server
