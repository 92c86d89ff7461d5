#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "executor/executor.hpp"

namespace codebox {

/**
 * @brief 输出比较方式
 */
enum class compare_mode {
    /**
     * @brief 忽略大小写、行内连续空白、行首行尾空白以及空行
     */
    relaxed,

    /**
     * @brief 只统一换行符并去掉首尾空白
     */
    strict
};

/**
 * @brief 除 "strict"（忽略大小写）以外都视为 relaxed
 */
compare_mode parse_compare_mode(const std::string &text);

/**
 * @brief CRLF 转为 LF，每行的连续空白压缩为一个空格并去掉首尾空白，删除空行，转为小写
 */
std::string normalize_relaxed(const std::string &text);

/**
 * @brief CRLF 转为 LF，去掉首尾空白
 */
std::string normalize_strict(const std::string &text);

bool outputs_match(const std::string &actual, const std::string &expected, compare_mode mode);

/**
 * @brief 题目的一个测试用例
 */
struct test_case {
    std::string input;
    std::string expected_output;

    /**
     * @brief 隐藏的测试用例不会在结果中返回输入和期望输出
     */
    bool hidden = false;
};

void from_json(const nlohmann::json &j, test_case &tc);

/**
 * @brief 一个测试用例的评测结果
 */
struct case_result {
    test_case test;
    std::string actual_output;
    bool passed = false;

    /**
     * @brief 编译错误、超时、运行错误时的错误信息
     */
    std::optional<std::string> error;
    long long runtime_ms = 0;
    std::optional<long long> memory_kb;
};

void to_json(nlohmann::json &j, const case_result &result);

/**
 * @brief 批量测试的结果
 */
struct batch_result {
    /**
     * @brief ACCEPTED、WRONG_ANSWER、RUNTIME_ERROR 或 SERVER_ERROR
     * 执行后端全部失败的测试用例使结果为 SERVER_ERROR
     */
    submission_status status = submission_status::ACCEPTED;
    int tests_passed = 0;
    int total_tests = 0;

    /**
     * @brief 所有测试用例运行时间之和
     */
    long long runtime_ms = 0;
    std::vector<case_result> cases;

    /**
     * @brief 任务在全部测试用例完成之前被取消
     */
    bool cancelled = false;
};

/**
 * @brief 按顺序执行所有测试用例并比较输出
 */
struct batch_runner {
    /**
     * @brief 每完成一个测试用例调用一次，current 从 1 开始
     */
    using progress_callback = std::function<void(int current, int total)>;

    explicit batch_runner(executor &exec);

    /**
     * @brief 执行所有测试用例
     * 测试用例严格按顺序执行，取消后不再执行下一个测试用例
     */
    batch_result run(const std::string &code,
                     const std::string &language,
                     const std::vector<test_case> &cases,
                     compare_mode mode,
                     const progress_callback &on_progress = nullptr,
                     const cancel_token *cancel = nullptr);

private:
    executor &exec;
};

}  // namespace codebox
