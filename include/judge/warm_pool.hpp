#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include "language.hpp"
#include "process.hpp"
#include "sandbox.hpp"

namespace codebox {

/**
 * @brief 每个进程对每种语言至多执行一次预热命令
 * 预热失败只影响延迟，不影响执行结果，因此失败时只记录日志
 */
struct warm_pool {
    warm_pool(const sandbox &box, process_runner &runner, sandbox_limits limits, std::filesystem::path run_dir);

    /**
     * @brief 执行 profile 的预热命令，并发调用时只有一个线程真正执行，其他线程等待其完成
     */
    void warm(const language_profile &profile);

    bool warmed(const std::string &language) const;

private:
    void run_warmup(const language_profile &profile);

    const sandbox &box;
    process_runner &runner;
    sandbox_limits limits;
    std::filesystem::path run_dir;

    mutable std::mutex mut;
    std::map<std::string, std::unique_ptr<std::once_flag>> flags;
    std::map<std::string, bool> done;
};

}  // namespace codebox
