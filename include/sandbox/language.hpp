#pragma once

#include <string>
#include <vector>

namespace scorer {

/**
 * @brief 评测语言
 * 描述选手代码如何保存到运行目录、如何在容器内启动，以及
 * 如何从 stderr 判断选手代码没有通过语法检查。
 * 目前只支持 Python，见 python_language
 */
struct language {
    virtual ~language();

    /**
     * @brief 语言名，用于日志
     */
    virtual std::string name() const = 0;

    /**
     * @brief 选手代码在运行目录中的文件名
     */
    virtual std::string source_filename() const = 0;

    /**
     * @brief 在容器内运行选手代码的命令
     * @param source 选手代码的文件名，相对于容器内的工作路径
     * @return 命令及其参数，将交给 shell 执行，每个参数都需要是 shell 安全的
     */
    virtual std::vector<std::string> run_command(const std::string &source) const = 0;

    /**
     * @brief 根据 stderr 判断选手代码是否无法通过解释器的语法检查
     * @param error 选手程序的 stderr
     */
    virtual bool is_compilation_error(const std::string &error) const = 0;
};

/**
 * @brief Python 语言
 * 解释器由 INTERPRETER 指定，Python 没有编译过程，
 * 语法错误会在程序开始运行前以 SyntaxError 等异常的形式输出到 stderr
 */
struct python_language : public language {
    std::string name() const override;
    std::string source_filename() const override;
    std::vector<std::string> run_command(const std::string &source) const override;
    bool is_compilation_error(const std::string &error) const override;
};

/**
 * @brief 默认的评测语言，即 Python
 */
const language &default_language();

}  // namespace scorer
