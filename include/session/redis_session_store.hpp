#pragma once

#include <chrono>
#include "server/redis.hpp"
#include "session/session_store.hpp"

namespace codebox {

/**
 * @brief 基于 Redis 的会话存储，每个会话为一个 hash
 * 写入通过 Lua 脚本原子完成，脚本负责终止状态和进度的检查，并刷新过期时间。
 *
 * session:<id>
 * ├── sessionId
 * ├── submissionId
 * ├── status // queued, running, completed, error
 * ├── language
 * ├── progressCurrent
 * ├── progressTotal
 * ├── result // JSON
 * ├── createdAt
 * └── updatedAt
 */
struct redis_session_store : public session_store {
    /**
     * @param conn 与其他组件共享的 Redis 连接
     * @param ttl 会话的过期时间
     */
    redis_session_store(server::redis_conn &conn, std::chrono::seconds ttl);

    void create(const session &s) override;
    void patch(const std::string &session_id, const session_patch &patch) override;
    std::optional<session> get(const std::string &session_id) override;

    /**
     * @brief 会话对应的 Redis 键
     */
    static std::string key(const std::string &session_id);

private:
    void write(const std::string &session_id, const session_patch &patch, bool replace);

    server::redis_conn &conn;
    std::chrono::seconds ttl;
};

}  // namespace codebox
