#pragma once

#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace codebox {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在或者为空，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 根据 key 来查找环境变量并转换为 T 类型
 * 无法转换时返回 def_value
 */
template <typename T>
T get_env_as(const std::string &key, const T &def_value) {
    std::string text = get_env(key, "");
    if (text.empty()) return def_value;
    try {
        return boost::lexical_cast<T>(text);
    } catch (boost::bad_lexical_cast &) {
        return def_value;
    }
}

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 还原网页表单转义过的代码
 * 处理 &lt; &gt; &quot; &#39; &amp;，其中 &amp; 最后处理，避免 "&amp;lt;" 被还原两次
 */
std::string unescape_html(const std::string &text);

/**
 * @brief 把参数包装成 POSIX shell 的单引号字符串
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief 把参数列表拼接成可以交给 bash -c 执行的命令
 */
std::string shell_join(const std::vector<std::string> &args);

/**
 * @brief 生成随机的 UUID 字符串，用作会话号和提交号
 */
std::string generate_uuid();

/**
 * @brief 当前时间的毫秒时间戳
 */
long long now_millis();

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace codebox
