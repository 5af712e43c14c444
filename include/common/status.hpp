#pragma once

namespace scorer {

/**
 * @brief 表示一个测试点的评测结果
 * 评测结果都是正常返回的数据，不会以异常的形式抛出。
 * 容器运行时不可用等评测系统自身的问题不属于评测结果，见 common/exceptions.hpp
 */
enum class outcome {
    /**
     * @brief 选手程序正常退出，且去除首尾空白字符后的输出和标准输出一致
     */
    ACCEPTED = 0,

    /**
     * @brief 选手程序正常退出，但输出和标准输出不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 选手程序无法通过解释器的语法检查
     * Python 没有编译过程，这里通过检查 stderr 中是否包含 SyntaxError、
     * IndentationError 等信息来判断，见 sandbox/language.hpp
     */
    COMPILATION_ERROR = 2,

    /**
     * @brief 选手程序返回值不为 0，或者因为信号崩溃
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 选手程序运行的时钟时间超出限制，被强制终止
     */
    TIMEOUT = 4,

    /**
     * @brief 选手程序的内存使用超出容器的内存限制，被 OOM killer 终止
     */
    MEMORY_LIMIT_EXCEEDED = 5
};

const char *get_display_message(outcome);

}  // namespace scorer
