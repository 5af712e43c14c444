#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace scorer {

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
 * @brief 读取选手程序可以修改的目录中的文件
 * 不跟随符号链接，也不读取 FIFO、设备等非普通文件
 * @param path 文件路径
 * @return 文件的内容，文件不存在、不是普通文件或者无法读取时返回空
 */
std::optional<std::string> read_regular_file(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算运行目录内的文件名时不会出现目录遍历攻击
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace scorer
