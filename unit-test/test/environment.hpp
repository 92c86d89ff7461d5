#pragma once

#include <gmock/gmock.h>
#include <functional>
#include <map>
#include <mutex>
#include <vector>
#include "executor/executor.hpp"
#include "language.hpp"
#include "server/config.hpp"

namespace codebox::test {

/**
 * @brief 初始化测试使用的运行目录
 */
void setup_test_environment();

/**
 * @brief 不依赖容器镜像的语言表，配合 direct_sandbox 使用
 * sh：直接运行 main.sh
 * shc：先用 sh -n 检查语法再复制为 prog.sh，成功时输出 __COMPILED__
 * Shell：从 "public class X" 推断入口名，源文件为 X.sh
 */
language_registry shell_languages();

/**
 * @brief 当前机器上能否运行 docker 容器
 */
bool docker_available();

/**
 * @brief 测试使用的 Redis 服务器，地址取自环境变量 REDIS_HOST 和 REDIS_PORT，默认为 127.0.0.1:6379
 */
server::redis test_redis_config();

/**
 * @brief 能否连接上 test_redis_config 指定的 Redis 服务器
 */
bool redis_available();

struct mock_executor : public executor {
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(execution_result, execute, (const execution_request &request, const cancel_token *cancel), (override));
};

/**
 * @brief 根据标准输入返回预设结果的执行后端，记录每次收到的请求
 */
struct scripted_executor : public executor {
    using script = std::function<execution_result(const execution_request &)>;

    explicit scripted_executor(script s);

    std::string name() const override;
    execution_result execute(const execution_request &request, const cancel_token *cancel) override;

    std::vector<execution_request> requests();

private:
    script s;
    std::mutex mut;
    std::vector<execution_request> received;
};

/**
 * @brief 标准输出为 out 的成功结果
 */
execution_result success_result(const std::string &out, long long runtime_ms = 10);

}  // namespace codebox::test
