#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "judge/warm_pool.hpp"
#include "language.hpp"
#include "process.hpp"
#include "sandbox.hpp"

namespace codebox {

/**
 * @brief 一次执行请求
 */
struct execution_request {
    /**
     * @brief 用户代码，可能经过网页表单的 HTML 转义
     */
    std::string code;

    /**
     * @brief 语言名或者别名
     */
    std::string language;

    /**
     * @brief 标准输入
     */
    std::string input;

    /**
     * @brief 覆盖语言默认的运行时限
     */
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief 执行结果的分类
 */
enum class execution_outcome {
    success,
    compilation_error,
    time_limit_exceeded,

    /**
     * @brief 返回值非零，或者输出了标准错误流
     */
    runtime_error,

    /**
     * @brief 执行引擎或执行后端出错，与用户代码无关
     */
    server_error,

    cancelled
};

const char *get_display_message(execution_outcome outcome);

/**
 * @brief 一次执行的结果
 */
struct execution_result {
    std::string std_out;
    std::string std_err;
    int exit_code = 0;

    /**
     * @brief 有资源报告时为 CPU 时间，否则为时钟时间，单位毫秒
     */
    long long runtime_ms = 0;

    /**
     * @brief 峰值内存，没有资源报告时为空
     */
    std::optional<long long> peak_memory_kb;

    bool compile_failed = false;
    bool timed_out = false;
    bool cancelled = false;
    bool system_error = false;

    /**
     * @brief 产生该结果的执行后端
     */
    std::string backend;

    execution_outcome outcome() const;
};

/**
 * @brief 同步接口 POST /execute 的返回格式
 * {stdout, stderr, output, exitCode, runtimeMs, memoryKb, compileFailed, timedOut, status, backend}
 */
void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 单个任务的执行流水线
 * 创建工作目录，写入代码和标准输入，在沙箱中编译、运行，读取资源报告，最后删除工作目录。
 * 该类不持有可变状态，可以被多个 worker 同时调用。
 */
struct pipeline {
    pipeline(const language_registry &languages,
             const sandbox &box,
             process_runner &runner,
             sandbox_limits limits,
             std::filesystem::path run_dir,
             warm_pool *warmer = nullptr);

    /**
     * @brief 执行一个请求
     * 编译失败、超时、运行错误都通过返回值报告
     * @throw unsupported_language 语言不存在，此时不会产生任何文件
     * @throw internal_error 无法创建工作目录或者写入文件
     */
    execution_result execute(const execution_request &request, const cancel_token *cancel = nullptr) const;

private:
    process_result run_stage(const language_profile &profile,
                             const std::filesystem::path &workspace,
                             const std::vector<std::string> &args,
                             std::chrono::milliseconds timeout,
                             const std::string &name,
                             const cancel_token *cancel) const;

    const language_registry &languages;
    const sandbox &box;
    process_runner &runner;
    sandbox_limits limits;
    std::filesystem::path run_dir;
    warm_pool *warmer;
};

}  // namespace codebox
