#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace codebox {

/**
 * @brief 执行引擎所有异常的基类
 * 记录抛出异常时的调用栈，便于日志中定位问题
 */
struct codebox_exception : std::exception {
    explicit codebox_exception(const std::string &message);

    /**
     * @brief 输出异常信息和抛出时的调用栈
     */
    friend std::ostream &operator<<(std::ostream &os, const codebox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 请求的语言不在语言表中
 * 必须在分配任何资源（工作目录、会话、提交记录）之前抛出
 */
struct unsupported_language : public codebox_exception {
    explicit unsupported_language(const std::string &language);

    std::string language;
};

/**
 * @brief 调用方传入的参数不合法，比如缺少必填字段
 */
struct invalid_request : public codebox_exception {
    explicit invalid_request(const std::string &message);
};

/**
 * @brief 请求的外部资源（题目、提交）不存在
 */
struct not_found_error : public codebox_exception {
    explicit not_found_error(const std::string &message);
};

/**
 * @brief 表示执行引擎的内部错误
 * 比如无法创建工作目录、无法写入源代码
 */
struct internal_error : public codebox_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public codebox_exception {
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示会话存储或提交存储的读写错误
 */
struct store_error : public codebox_exception {
    explicit store_error(const std::string &message);
};

/**
 * @brief 等待队列已满，当前无法接受新的任务
 */
struct service_unavailable : public codebox_exception {
    explicit service_unavailable(const std::string &message);
};

}  // namespace codebox
