#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace scorer {

/**
 * @brief GNU time -v 输出的资源统计信息
 * 统计文件的每一行形如 "\tMaximum resident set size (kbytes): 9396"，
 * 缺失或无法解析的字段为空
 */
struct time_statistics {
    /**
     * @brief 最大常驻内存，单位为 KB
     */
    std::optional<long> max_resident_kb;

    /**
     * @brief 用户态 CPU 时间，单位为秒
     */
    std::optional<double> user_time;

    /**
     * @brief 内核态 CPU 时间，单位为秒
     */
    std::optional<double> sys_time;

    /**
     * @brief 被统计的命令因信号终止时的信号编号
     * 对应 "Command terminated by signal 9" 一行
     */
    std::optional<int> terminating_signal;
};

time_statistics parse_time_statistics(const std::string &text);

/**
 * @brief 读取 time -v -o 写入的统计文件
 * 统计文件位于选手程序可写的目录中，符号链接等非普通文件视为不存在
 * @return 文件不存在或无法读取时返回空
 */
std::optional<time_statistics> read_time_statistics(const std::filesystem::path &stats_file);

}  // namespace scorer
