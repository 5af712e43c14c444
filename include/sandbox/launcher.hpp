#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "sandbox/execution.hpp"
#include "sandbox/language.hpp"
#include "sandbox/workspace.hpp"

namespace scorer {

/**
 * @brief 沙箱启动器
 * 在隔离的环境中运行运行目录中的选手代码，并收集运行结果。
 * 评测结果以 execution_result 的形式返回，只有评测系统自身出错时才抛出异常。
 */
struct launcher {
    virtual ~launcher();

    /**
     * @brief 运行选手代码
     * 本函数可以被多个线程并发调用，前提是每次调用的运行目录不同。
     * @param ws 选手代码所在的运行目录，选手程序的输出和统计信息也会写入此处
     * @param request 运行请求，包含标准输入和资源限制
     * @return 运行结果，容器运行时无法启动时返回 launch_failed
     * @throw internal_error 若无法创建子进程等
     */
    virtual execution_result run(const workspace &ws, const execution_request &request) const = 0;
};

/**
 * @brief 通过 docker run 在容器中运行选手代码
 * 容器没有网络，有硬性的内存上限和 CPU 份额，沙箱目录挂载到 MOUNT_POINT。
 * 容器内通过 GNU time -v 统计选手程序的资源使用情况。
 *
 * 时间限制由本进程通过时钟时间强制执行，与容器的 CPU 统计无关：
 * 超时后先终止 docker 客户端的进程组，再通过 docker kill 和 docker rm -f 终止并删除容器。
 *
 * 容器启动后会先向 docker 客户端的标准输出打印 STARTED_MARKER，然后才运行选手程序。
 * docker 客户端的输出保存在选手程序无法访问的 runtime.log 中，
 * 返回 125、126、127 且 runtime.log 中没有该标记时才认为容器运行时出错。
 */
struct docker_launcher : public launcher {
    static constexpr const char *STARTED_MARKER = "scorer: container started";

    explicit docker_launcher(const language &lang);

    execution_result run(const workspace &ws, const execution_request &request) const override;

    /**
     * @brief 构造 docker run 的命令行
     * @param docker 容器运行时的可执行文件路径
     * @param ws 运行目录
     * @param request 运行请求
     * @param container_name 容器名，用于超时时终止容器
     * @return 命令行参数列表，第一项为 docker
     */
    std::vector<std::string> build_command(const std::filesystem::path &docker, const workspace &ws, const execution_request &request, const std::string &container_name) const;

private:
    const language &lang;
};

}  // namespace scorer
