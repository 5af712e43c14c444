#pragma once

#include <exception>
#include <optional>
#include <string>
#include <vector>
#include "judge/verdict.hpp"
#include "sandbox/execution.hpp"

namespace scorer {

/**
 * @brief 一个测试点
 */
struct test_case {
    /**
     * @brief 选手程序的标准输入
     */
    std::string input;

    /**
     * @brief 标准输出，比较时会去除首尾的空白字符
     */
    std::string expected_output;

    /**
     * @brief 时间限制，单位为秒
     * 小于等于 0 时使用 DEFAULT_TIME_LIMIT
     */
    double time_limit = -1;

    /**
     * @brief 内存限制，单位为 MB
     * 小于等于 0 时使用 DEFAULT_MEMORY_LIMIT
     */
    int memory_limit = -1;
};

/**
 * @brief 根据测试点构造运行请求，未指定的资源限制使用默认值
 */
execution_request make_request(const std::string &code, const test_case &tc);

/**
 * @brief 一次正在评测的提交
 * 每个测试点由一个 worker 评测，评测结果和评测过程中的异常
 * 分别写入 verdicts 和 faults 中对应测试点下标的位置，
 * 不同的 worker 不会写入同一个位置，因此不需要加锁。
 */
struct submission {
    /**
     * @brief 选手代码
     */
    std::string code;

    std::vector<test_case> test_cases;

    /**
     * @brief 每个测试点的评测结果，评测完成前为空
     */
    std::vector<std::optional<verdict>> verdicts;

    /**
     * @brief 每个测试点评测时评测系统自身发生的错误
     */
    std::vector<std::exception_ptr> faults;
};

}  // namespace scorer
