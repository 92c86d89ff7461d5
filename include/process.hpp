#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace codebox {

/**
 * @brief 取消标记，由请求取消的线程设置，由执行进程的线程轮询
 */
struct cancel_token {
    void cancel() noexcept;
    bool cancelled() const noexcept;

private:
    std::atomic<bool> flag{false};
};

/**
 * @brief 一次子进程执行的结果
 */
struct process_result {
    std::string std_out;
    std::string std_err;

    /**
     * @brief 子进程的返回值
     * 超时为 124，取消为 130，找不到可执行文件为 127，因信号退出时为 128 + 信号值
     */
    int exit_code = 0;

    /**
     * @brief 从创建子进程到子进程结束（或被杀死）的时钟时间
     */
    long long runtime_ms = 0;

    bool timed_out = false;
    bool cancelled = false;

    /**
     * @brief 子进程未能启动
     */
    bool spawn_failed = false;
};

/**
 * @brief 执行外部命令
 * 实现不能因为子进程启动失败而抛出异常，而是返回 spawn_failed 的结果
 */
struct process_runner {
    virtual ~process_runner() = default;

    /**
     * @brief 执行外部命令并等待其结束
     * @param argv 外部命令的路径 (argv[0]) 和参数
     * @param input 写入子进程标准输入的内容，写完后关闭标准输入
     * @param timeout 超过该时间后杀死子进程所在的整个进程组
     * @param cancel 不为空时，标记被设置后杀死子进程所在的整个进程组
     */
    virtual process_result run(const std::vector<std::string> &argv,
                               const std::string &input,
                               std::chrono::milliseconds timeout,
                               const cancel_token *cancel = nullptr) = 0;
};

/**
 * @brief 基于 fork/exec 的实现
 * 子进程在新的进程组中运行，超时或取消时向整个进程组发送 SIGKILL
 */
struct posix_process_runner : public process_runner {
    posix_process_runner();

    process_result run(const std::vector<std::string> &argv,
                       const std::string &input,
                       std::chrono::milliseconds timeout,
                       const cancel_token *cancel = nullptr) override;
};

}  // namespace codebox
