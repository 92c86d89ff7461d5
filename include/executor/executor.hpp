#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "judge/pipeline.hpp"

namespace codebox {

/**
 * @brief 执行后端
 * 实现可以抛出异常，由 best_effort_executor 负责兜底
 */
struct executor {
    virtual ~executor() = default;

    virtual std::string name() const = 0;

    /**
     * @param request 语言名已经规范化的执行请求
     */
    virtual execution_result execute(const execution_request &request, const cancel_token *cancel) = 0;
};

/**
 * @brief 使用本机沙箱执行
 */
struct local_executor : public executor {
    explicit local_executor(const pipeline &runner);

    std::string name() const override;
    execution_result execute(const execution_request &request, const cancel_token *cancel) override;

private:
    const pipeline &runner;
};

/**
 * @brief 调用兼容 Piston 的执行服务 (POST <base>/execute)
 */
struct piston_executor : public executor {
    /**
     * @param base_url 比如 https://emkc.org/api/v2/piston
     * @param versions 语言对应的 Piston 运行时版本
     */
    piston_executor(std::string base_url, std::map<std::string, std::string> versions, std::chrono::milliseconds timeout);

    std::string name() const override;
    execution_result execute(const execution_request &request, const cancel_token *cancel) override;

    nlohmann::json build_request(const execution_request &request) const;

    /**
     * @brief 将 Piston 的响应转换为执行结果
     * @throw network_error 响应中没有 run 对象
     */
    static execution_result parse_response(const nlohmann::json &response);

private:
    std::string base_url;
    std::map<std::string, std::string> versions;
    std::chrono::milliseconds timeout;
};

/**
 * @brief 调用另一个执行节点的同步接口 (POST <base>/execute)
 */
struct remote_executor : public executor {
    remote_executor(std::string base_url, std::chrono::milliseconds timeout);

    std::string name() const override;
    execution_result execute(const execution_request &request, const cancel_token *cancel) override;

    /**
     * @brief 接受 {stdout, stderr, exitCode, runtimeMs, memoryKb} 或者 {output, error, runtime, memory}，
     * 以及外面包一层 {success, data} 的格式
     * @throw network_error 响应中既没有 stdout 也没有 output
     */
    static execution_result parse_response(const nlohmann::json &response);

private:
    std::string base_url;
    std::chrono::milliseconds timeout;
};

/**
 * @brief 按顺序尝试多个执行后端，返回第一个有效结果
 * 后端抛出异常或者返回 server_error 时尝试下一个后端，
 * 全部失败时返回 system_error 的结果，该类不会抛出异常。
 */
struct best_effort_executor : public executor {
    explicit best_effort_executor(std::vector<std::unique_ptr<executor>> backends);

    std::string name() const override;
    execution_result execute(const execution_request &request, const cancel_token *cancel) override;

    std::size_t size() const;

private:
    std::vector<std::unique_ptr<executor>> backends;
};

/**
 * @brief 解析各种格式的运行时间
 * 接受数字（毫秒）、"123"、"123ms"、"1.5s"、"2 sec"
 * @return 无法解析时为空
 */
std::optional<long long> parse_runtime_ms(const nlohmann::json &value);

/**
 * @brief 解析各种格式的内存用量
 * 接受数字（KB）、"12KB"、"1.5MB"、"1GB"、"2048b"
 * @return 无法解析时为空
 */
std::optional<long long> parse_memory_kb(const nlohmann::json &value);

}  // namespace codebox
