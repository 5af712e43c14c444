#pragma once

#include <filesystem>
#include <string>
#include "sandbox/execution.hpp"
#include "sandbox/language.hpp"

namespace scorer {

/**
 * @brief 一次沙箱运行独占的运行目录
 * 通过 acquire 创建，析构时删除整个目录，因此无论运行正常结束、
 * 超时还是抛出异常，运行目录都不会泄漏。不同的运行之间不会共享运行目录。
 *
 * 运行目录只能移动不能复制，被移动后的对象不再持有目录。
 *
 * 运行目录的结构：
 * run-<uuid>/            只有评测机可以访问，保存 docker 客户端的输出 runtime.log
 * run-<uuid>/sandbox/    挂载到容器中作为选手程序的工作目录，保存选手代码和运行结果
 */
struct workspace {
    static constexpr const char *STDOUT_FILE = "stdout.txt";
    static constexpr const char *STDERR_FILE = "stderr.txt";
    static constexpr const char *STATS_FILE = "time_stats.txt";
    static constexpr const char *RUNTIME_LOG = "runtime.log";
    static constexpr const char *SANDBOX_DIR = "sandbox";

    /**
     * @brief 在 RUN_DIR 下创建一个空的运行目录，并写入选手代码
     * @param request 运行请求，选手代码保存为 lang.source_filename()
     * @param lang 选手代码的语言
     * @throw internal_error 若运行目录无法创建或选手代码无法写入
     */
    static workspace acquire(const execution_request &request, const language &lang);

    workspace(workspace &&other);
    workspace &operator=(workspace &&other);
    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    /**
     * @brief 删除运行目录，删除失败时只记录日志
     */
    ~workspace();

    /**
     * @brief 运行目录的绝对路径
     */
    const std::filesystem::path &path() const;

    /**
     * @brief 挂载到容器中的目录，选手程序可以任意修改其中的内容
     */
    std::filesystem::path sandbox() const;

    /**
     * @brief 沙箱目录中的文件
     * @param name 文件名，不允许包含路径分隔符
     */
    std::filesystem::path file(const std::string &name) const;

    /**
     * @brief 运行目录中选手程序无法访问的文件
     * @param name 文件名，不允许包含路径分隔符
     */
    std::filesystem::path host_file(const std::string &name) const;

    /**
     * @brief 恢复沙箱目录中所有目录的权限
     * 选手程序可能收回沙箱目录的读写权限，读取运行结果和删除运行目录前需要先恢复。
     * 不会跟随符号链接。
     */
    void restore_permissions() const;

    /**
     * @brief 选手代码的文件名
     */
    const std::string &source_filename() const;

    /**
     * @brief 是否还持有运行目录
     */
    bool valid() const;

    /**
     * @brief 删除运行目录及其所有内容
     * 重复调用没有作用
     * @throw internal_error 若运行目录无法删除
     */
    void release();

private:
    workspace(std::filesystem::path dir, std::string source_filename);

    std::filesystem::path dir;
    std::string source;
};

}  // namespace scorer
