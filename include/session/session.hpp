#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace codebox {

/**
 * @brief 会话状态
 * queued -> running -> completed | error，completed 和 error 为终止状态
 */
enum class session_status {
    queued,
    running,
    completed,
    error
};

const char *get_display_message(session_status status);

/**
 * @throw std::out_of_range 未知的状态
 */
session_status parse_session_status(const std::string &text);

bool is_terminal(session_status status);

/**
 * @brief 批量测试的进度，current 为已完成的测试用例数
 */
struct session_progress {
    int current = 0;
    int total = 0;
};

/**
 * @brief 一次执行任务的可轮询状态
 */
struct session {
    std::string session_id;
    std::optional<std::string> submission_id;
    session_status status = session_status::queued;
    std::string language;
    std::optional<session_progress> progress;

    /**
     * @brief 终止状态时的结果
     */
    std::optional<nlohmann::json> result;

    /**
     * @brief 毫秒时间戳
     */
    long long created_at = 0;
    long long updated_at = 0;
};

/**
 * @brief 对会话的部分更新，为空的字段保持不变
 */
struct session_patch {
    std::optional<std::string> submission_id;
    std::optional<session_status> status;
    std::optional<std::string> language;
    std::optional<session_progress> progress;
    std::optional<nlohmann::json> result;

    /**
     * @brief 包含 s 的所有字段的更新
     */
    static session_patch from(const session &s);
};

/**
 * @brief 把 patch 合并进 current
 * 终止状态的会话不再接受任何写入；进度不会回退，并且不会超过总数
 * @return 写入被丢弃时返回 false
 */
bool merge_session(session &current, const session_patch &patch, long long now);

/**
 * @brief 轮询接口返回的内容
 * 会话不存在时为 {"status":"not_found","error":"Session not found"}，
 * 未结束时为 {status, progress}，结束后为 result（没有 result 时为 {status}）
 */
nlohmann::json project(const std::optional<session> &s);

void to_json(nlohmann::json &j, const session_progress &progress);
void from_json(const nlohmann::json &j, session_progress &progress);

void to_json(nlohmann::json &j, const session &s);

}  // namespace codebox
