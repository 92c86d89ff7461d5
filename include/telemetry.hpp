#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace codebox {

/**
 * @brief /usr/bin/time -v 报告的资源使用情况
 * 报告中缺失或无法解析的字段为空
 */
struct resource_usage {
    /**
     * @brief 峰值内存，单位 KB
     */
    std::optional<long long> peak_memory_kb;

    /**
     * @brief 用户态时间与内核态时间之和，单位毫秒
     */
    std::optional<long long> cpu_time_ms;

    /**
     * @brief 时钟时间，单位秒
     */
    std::optional<double> wall_time;

    /**
     * @brief 被测命令的返回值
     */
    std::optional<int> exit_status;
};

/**
 * @brief 读取形如 "key: value" 的报告，key 和 value 的首尾空白被去掉
 */
std::map<std::string, std::string> read_metadata(const std::string &content);

resource_usage parse_resource_usage(const std::string &report);

/**
 * @brief 读取工作目录中的 time.txt
 * 文件不存在时返回空结果
 */
resource_usage read_resource_usage(const std::filesystem::path &report_file);

}  // namespace codebox
