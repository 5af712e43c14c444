#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace scorer {

/**
 * @brief 评测系统自身出错时抛出的异常
 * 评测结果（AC、WA、TLE 等）永远不会以异常的形式抛出，
 * 只有评测机制本身无法工作时才会抛出这类异常。
 */
struct scorer_exception : std::exception {
    explicit scorer_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const scorer_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如无法创建或删除运行目录、无法创建子进程
 */
struct internal_error : public scorer_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示容器运行时无法启动
 * 比如 docker 命令不存在、docker daemon 无法连接、镜像不存在。
 * 这不是选手程序的运行时错误，调用方需要将其作为"评测不可用"处理。
 */
struct launch_error : public scorer_exception {
    explicit launch_error(const std::string &message);
};

}  // namespace scorer
