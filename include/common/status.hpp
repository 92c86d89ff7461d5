#pragma once

#include <string>

namespace codebox {

/**
 * @brief 表示提交记录的评测状态
 * 单次运行的提交只会出现 QUEUED、RUNNING 以及 COMPLETED 到 SERVER_ERROR 之间的状态，
 * 批量测试的提交最终状态为 ACCEPTED、WRONG_ANSWER、RUNTIME_ERROR 或 SERVER_ERROR。
 */
enum class submission_status {
    /**
     * @brief 提交已创建，正在等待 worker
     */
    QUEUED = 0,

    /**
     * @brief 提交正在编译或者运行
     */
    RUNNING = 1,

    /**
     * @brief 单次运行成功结束
     */
    COMPLETED = 2,

    COMPILATION_ERROR = 3,

    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 用户程序返回值非零或者输出了标准错误流
     */
    RUNTIME_ERROR = 5,

    /**
     * @brief 所有测试用例都通过
     */
    ACCEPTED = 6,

    WRONG_ANSWER = 7,

    /**
     * @brief 执行引擎内部错误，比如所有执行后端都不可用
     */
    SERVER_ERROR = 8,

    /**
     * @brief 任务被用户取消
     */
    CANCELLED = 9
};

const char *get_display_message(submission_status);

}  // namespace codebox
