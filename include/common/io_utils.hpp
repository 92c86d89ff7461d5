#pragma once

#include <filesystem>
#include <string>

namespace codebox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 * 写入失败时抛出 internal_error
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 用户代码决定的文件名（比如 Java 的类名）会被拼接到工作目录下，
 * 如果文件名包含 "/" 或 ".."，那么可能会写到工作目录外面去。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 在 parent 下创建一个名字唯一、只有当前用户可访问的临时文件夹
 * @param prefix 文件夹名前缀
 * @return 新建文件夹的路径，创建失败时抛出 internal_error
 */
std::filesystem::path make_temp_directory(const std::filesystem::path &parent, const std::string &prefix);

}  // namespace codebox
