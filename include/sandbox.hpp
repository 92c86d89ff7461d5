#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "process.hpp"

namespace codebox {

/**
 * @brief 沙箱的资源限制，直接透传给容器引擎
 */
struct sandbox_limits {
    /**
     * @brief 可使用的 CPU 核数，比如 "1.0"
     */
    std::string cpus = "1.0";

    /**
     * @brief 内存上限，比如 "512m"
     */
    std::string memory = "512m";

    /**
     * @brief 进程数上限
     */
    unsigned pids_limit = 256;
};

/**
 * @brief 生成在隔离环境中执行命令的完整命令行
 * 命令的工作目录为挂载进来的工作目录，工作目录内的相对路径在沙箱内外一致
 */
struct sandbox {
    virtual ~sandbox() = default;

    /**
     * @brief 沙箱类型，比如 docker
     */
    virtual std::string type() const = 0;

    /**
     * @brief 生成完整命令行，该函数不会失败
     * @param image 容器镜像
     * @param workspace 宿主机上的工作目录
     * @param args 在沙箱内执行的命令
     * @param limits 资源限制
     * @param name 本次执行的唯一名字，用于超时后清理
     */
    virtual std::vector<std::string> build(const std::string &image,
                                           const std::filesystem::path &workspace,
                                           const std::vector<std::string> &args,
                                           const sandbox_limits &limits,
                                           const std::string &name) const = 0;

    /**
     * @brief 强制杀死执行命令的进程后，清理沙箱内可能残留的进程
     */
    virtual void reap(const std::string &name, process_runner &runner) const = 0;
};

/**
 * @brief 使用 docker run 隔离
 * 容器没有网络，工作目录挂载到 /code，容器退出后自动删除
 */
struct docker_sandbox : public sandbox {
    std::string type() const override;

    std::vector<std::string> build(const std::string &image,
                                   const std::filesystem::path &workspace,
                                   const std::vector<std::string> &args,
                                   const sandbox_limits &limits,
                                   const std::string &name) const override;

    void reap(const std::string &name, process_runner &runner) const override;
};

/**
 * @brief 不隔离，直接在工作目录中执行命令，忽略镜像和资源限制
 */
struct direct_sandbox : public sandbox {
    std::string type() const override;

    std::vector<std::string> build(const std::string &image,
                                   const std::filesystem::path &workspace,
                                   const std::vector<std::string> &args,
                                   const sandbox_limits &limits,
                                   const std::string &name) const override;

    void reap(const std::string &name, process_runner &runner) const override;
};

}  // namespace codebox
