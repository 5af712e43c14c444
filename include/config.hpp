#pragma once

#include <filesystem>
#include <string>

namespace scorer {

enum error_codes {
    E_SUCCESS = 0,
    E_USAGE_ERROR = 1,
    E_INTERNAL_ERROR = 2
};

/**
 * @brief 容器运行时的可执行文件
 * 可以是 PATH 中的命令名，也可以是绝对路径
 * @defaultValue docker
 */
extern std::string DOCKER_BINARY;

/**
 * @brief 运行选手程序的容器镜像
 * 镜像内必须包含 bash、Python 解释器以及 GNU time（见 TIME_BINARY）
 * @defaultValue python-with-time
 */
extern std::string DOCKER_IMAGE;

/**
 * @brief 容器内 GNU time 的路径
 * 通过 time -v 统计选手程序的运行时间和最大常驻内存
 */
extern std::string TIME_BINARY;

/**
 * @brief 容器内的解释器命令
 */
extern std::string INTERPRETER;

/**
 * @brief 容器可以使用的 CPU 份额，传给 docker run --cpus
 * 0.5 表示半个核心
 */
extern std::string CPU_LIMIT;

/**
 * @brief 测试点未指定时间限制时使用的默认值
 * @note 单位为秒
 */
extern double DEFAULT_TIME_LIMIT;

/**
 * @brief 测试点未指定内存限制时使用的默认值
 * @note 单位为 MB
 */
extern int DEFAULT_MEMORY_LIMIT;

/**
 * @brief 存放所有运行目录的根目录
 * 每次运行都会在这里创建一个 run-<uuid> 文件夹，运行结束后删除
 *
 * RUN_DIR
 * ├── run-ABCDEFG // 随机生成的 uuid
 * │   ├── client_script.py // 选手代码
 * │   ├── stdout.txt // 选手程序的 stdout 输出
 * │   ├── stderr.txt // 选手程序的 stderr 输出
 * │   ├── time_stats.txt // time -v 的统计信息
 * │   └── runtime.log // docker 客户端自己的输出
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 运行目录在容器内的挂载点，也是容器内的工作路径
 */
extern std::string MOUNT_POINT;

/**
 * @brief 容器内运行选手程序的用户，格式为 uid:gid
 * 为空时使用评测进程自身的 uid 和 gid
 */
extern std::string RUN_USER;

/**
 * @brief 一次评测最多同时运行多少个测试点
 * 0 表示不限制，所有测试点同时运行
 */
extern std::size_t MAX_PARALLEL;

}  // namespace scorer
