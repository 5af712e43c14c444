#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "sandbox/execution.hpp"
#include "sandbox/language.hpp"

namespace scorer {

/**
 * @brief 一个测试点的评测结果，创建后不会被修改
 */
struct verdict {
    outcome result;

    /**
     * @brief 选手程序的标准输出
     */
    std::string output;

    /**
     * @brief 选手程序的标准错误输出
     */
    std::string error;

    std::chrono::duration<double> elapsed;

    /**
     * @brief 最大常驻内存，单位为字节
     */
    std::optional<std::size_t> peak_memory;
};

/**
 * @brief 根据运行结果判断测试点的评测结果
 * 判断顺序：
 * 1. 超时 -> TIMEOUT
 * 2. 被 OOM killer 终止 -> MEMORY_LIMIT_EXCEEDED
 * 3. 返回值为 0，比较去除首尾空白字符后的输出 -> ACCEPTED 或 WRONG_ANSWER
 * 4. 返回值不为 0 或被其他信号终止，stderr 中包含语法错误信息 -> COMPILATION_ERROR，否则 RUNTIME_ERROR
 *
 * @param result 运行结果
 * @param expected 标准输出
 * @param lang 用于识别语法错误的语言
 * @return 评测结果，容器运行时无法启动 (launch_failed) 时返回空，这种情况不属于评测结果
 */
std::optional<outcome> classify(const execution_result &result, const std::string &expected, const language &lang);

std::optional<outcome> classify(const execution_result &result, const std::string &expected);

/**
 * @brief 根据运行结果构造测试点的评测结果
 * @throw launch_error 若运行结果为 launch_failed
 */
verdict make_verdict(const execution_result &result, const std::string &expected, const language &lang);

}  // namespace scorer
