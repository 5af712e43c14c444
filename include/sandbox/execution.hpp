#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace scorer {

/**
 * @brief 一次沙箱运行的请求
 * 每个测试点构造一个，运行期间不会被修改
 */
struct execution_request {
    /**
     * @brief 选手代码
     */
    std::string source_code;

    /**
     * @brief 选手程序的标准输入
     */
    std::string input;

    /**
     * @brief 时钟时间限制
     */
    std::chrono::duration<double> time_limit;

    /**
     * @brief 内存限制
     * @note 单位为字节
     */
    std::size_t memory_limit;
};

namespace exit_status {

/**
 * @brief 选手程序正常退出（返回值可能不为 0）
 */
struct completed {
    int code;
};

/**
 * @brief 选手程序被信号终止
 */
struct signaled {
    int signal;

    /**
     * @brief 是否是因为超出内存限制被 OOM killer 终止
     */
    bool oom_killed;
};

/**
 * @brief 选手程序的运行时间超出限制，被强制终止
 */
struct timed_out {};

/**
 * @brief 容器运行时无法启动，选手程序根本没有运行
 */
struct launch_failed {
    std::string message;
};

}  // namespace exit_status

using exit_status_t = std::variant<exit_status::completed,
                                   exit_status::signaled,
                                   exit_status::timed_out,
                                   exit_status::launch_failed>;

/**
 * @brief 容器被 OOM killer 或 SIGKILL 终止时 docker run 的返回值（128 + SIGKILL）
 */
constexpr int OOM_EXIT_CODE = 137;

/**
 * @brief 一次沙箱运行的结果，每次运行只产生一次
 */
struct execution_result {
    exit_status_t status;

    /**
     * @brief 选手程序的标准输出
     */
    std::string output;

    /**
     * @brief 选手程序的标准错误输出
     */
    std::string error;

    /**
     * @brief 时钟时间
     */
    std::chrono::duration<double> wall_time;

    /**
     * @brief 最大常驻内存，time 没有给出统计信息时为空
     * @note 单位为字节
     */
    std::optional<std::size_t> peak_memory;

    /**
     * @brief 用户态 CPU 时间，单位为秒
     */
    std::optional<double> user_time;

    /**
     * @brief 内核态 CPU 时间，单位为秒
     */
    std::optional<double> sys_time;
};

}  // namespace scorer
