#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/batch.hpp"
#include "server/redis.hpp"

namespace codebox {

/**
 * @brief 只读的题库，题库的维护不在执行引擎内
 */
struct problem_repository {
    virtual ~problem_repository() = default;

    /**
     * @return 题目不存在时为空，题目没有测试用例时为空列表
     * @throw store_error 题目数据无法读取
     */
    virtual std::optional<std::vector<test_case>> test_cases(const std::string &problem_id) = 0;
};

/**
 * @brief 从目录中读取题目，每个题目一个 JSON 文件
 *
 * problem_dir
 * ├── 1001.json // {"testCases":[{"input":"1 2","expectedOutput":"3","isHidden":false}]}
 * └── ...
 */
struct json_problem_repository : public problem_repository {
    explicit json_problem_repository(std::filesystem::path problem_dir);

    std::optional<std::vector<test_case>> test_cases(const std::string &problem_id) override;

private:
    std::filesystem::path problem_dir;
};

struct memory_problem_repository : public problem_repository {
    void add(const std::string &problem_id, std::vector<test_case> cases);

    std::optional<std::vector<test_case>> test_cases(const std::string &problem_id) override;

private:
    std::mutex mut;
    std::map<std::string, std::vector<test_case>> problems;
};

/**
 * @brief 创建提交记录所需的字段
 */
struct new_submission {
    std::string user_id;
    std::string problem_id;
    std::optional<std::string> contest_id;
    std::string code;
    std::string language;
    std::string input;
    std::optional<int> total_tests;
};

/**
 * @brief 评测结束后更新提交记录的字段，为空的字段保持不变
 */
struct submission_update {
    submission_status status = submission_status::RUNNING;
    std::optional<std::string> output;
    std::optional<std::string> error;
    std::optional<long long> runtime_ms;
    std::optional<long long> memory_kb;
    std::optional<int> tests_passed;
    std::optional<int> total_tests;
    std::optional<nlohmann::json> test_results;
};

/**
 * @brief 提交记录
 */
struct submission_record {
    std::string id;
    new_submission fields;
    submission_status status = submission_status::QUEUED;
    submission_update last_update;
    long long started_at = 0;
    long long completed_at = 0;
};

/**
 * @brief 提交记录的存储
 */
struct submission_repository {
    virtual ~submission_repository() = default;

    /**
     * @brief 创建状态为 Queued 的提交记录
     * @return 提交号
     */
    virtual std::string create(const new_submission &submission) = 0;

    virtual void update(const std::string &submission_id, const submission_update &update) = 0;

    /**
     * @return 提交者，提交不存在时为空
     */
    virtual std::optional<std::string> owner(const std::string &submission_id) = 0;
};

struct memory_submission_repository : public submission_repository {
    std::string create(const new_submission &submission) override;
    void update(const std::string &submission_id, const submission_update &update) override;
    std::optional<std::string> owner(const std::string &submission_id) override;

    std::optional<submission_record> get(const std::string &submission_id);

private:
    std::mutex mut;
    std::map<std::string, submission_record> submissions;
};

/**
 * @brief 提交记录保存在 Redis 的 hash submission:<id> 中
 */
struct redis_submission_repository : public submission_repository {
    explicit redis_submission_repository(server::redis_conn &conn);

    std::string create(const new_submission &submission) override;
    void update(const std::string &submission_id, const submission_update &update) override;
    std::optional<std::string> owner(const std::string &submission_id) override;

    static std::string key(const std::string &submission_id);

private:
    server::redis_conn &conn;
};

}  // namespace codebox
