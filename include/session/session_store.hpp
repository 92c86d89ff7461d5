#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "session/session.hpp"

namespace codebox {

/**
 * @brief 会话存储
 * 实现必须保证：终止状态的会话不再被修改，进度不回退。被丢弃的写入只记录日志，不抛出异常。
 */
struct session_store {
    virtual ~session_store() = default;

    /**
     * @brief 写入完整的会话记录，会话已存在时覆盖
     * @throw store_error 存储不可用
     */
    virtual void create(const session &s) = 0;

    /**
     * @brief 合并部分字段，会话不存在时新建
     * @throw store_error 存储不可用
     */
    virtual void patch(const std::string &session_id, const session_patch &patch) = 0;

    /**
     * @return 会话不存在或已过期时为空
     * @throw store_error 存储不可用
     */
    virtual std::optional<session> get(const std::string &session_id) = 0;
};

/**
 * @brief 进程内的会话存储，进程退出后会话丢失
 */
struct memory_session_store : public session_store {
    void create(const session &s) override;
    void patch(const std::string &session_id, const session_patch &patch) override;
    std::optional<session> get(const std::string &session_id) override;

private:
    std::mutex mut;
    std::map<std::string, session> sessions;
};

}  // namespace codebox
