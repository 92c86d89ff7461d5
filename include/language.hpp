#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "server/config.hpp"

namespace codebox {

/**
 * @brief 描述一种语言如何编译和运行
 * 命令中的 {entry} 会被替换为入口名（Java 为类名），{source} 会被替换为源文件名。
 * 语言表构造完成后不再修改，因此可以在多个 worker 之间共享。
 */
struct language_profile {
    /**
     * @brief 语言的规范名，比如 python、cpp、java
     */
    std::string id;

    /**
     * @brief 语言的别名，比如 py、python3、c++
     */
    std::vector<std::string> aliases;

    /**
     * @brief 编译和运行该语言使用的容器镜像
     */
    std::string image;

    /**
     * @brief 源文件名，比如 main.cpp、{entry}.java
     */
    std::string source_filename;

    /**
     * @brief 编译命令，交给 bash -c 执行，成功时必须输出 __COMPILED__
     * 解释型语言没有编译命令
     */
    std::optional<std::string> compile_command;

    /**
     * @brief 运行命令的参数列表
     */
    std::vector<std::string> run_command;

    std::chrono::milliseconds compile_timeout{15000};

    std::chrono::milliseconds run_timeout{8000};

    /**
     * @brief 预热命令，每个进程只执行一次，用于加载镜像和 JVM 的缓存
     */
    std::optional<std::string> warmup_command;

    /**
     * @brief 是否从代码中的 public class 声明推断入口名
     */
    bool entry_from_declared_class = false;

    /**
     * @brief 未能推断入口名时使用的默认值
     */
    std::string default_entry = "main";

    /**
     * @brief 根据用户代码确定入口名
     */
    std::string entry_point(const std::string &source) const;

    std::string source_file(const std::string &entry) const;

    /**
     * @brief 完整的编译命令，没有编译步骤时返回空列表
     */
    std::vector<std::string> compile_args(const std::string &entry) const;

    std::vector<std::string> run_args(const std::string &entry) const;

    std::vector<std::string> warmup_args() const;
};

/**
 * @brief 语言表，按规范名或者别名查找语言
 * 查找时忽略大小写以及首尾空白字符
 */
struct language_registry {
    explicit language_registry(std::vector<language_profile> profiles);

    /**
     * @brief 内置的 python、cpp、java 三种语言
     */
    static language_registry builtin(const server::language_config &config);

    /**
     * @return 语言不存在时返回 nullptr
     */
    const language_profile *find(const std::string &id) const;

    /**
     * @throw unsupported_language 语言不存在
     */
    const language_profile &at(const std::string &id) const;

    const std::vector<language_profile> &profiles() const;

private:
    std::vector<language_profile> list;
    std::map<std::string, std::size_t> index;
};

}  // namespace codebox
