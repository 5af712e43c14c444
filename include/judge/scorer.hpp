#pragma once

#include <string>
#include <vector>
#include "common/messages.hpp"
#include "judge/submission.hpp"
#include "judge/verdict.hpp"
#include "sandbox/language.hpp"
#include "sandbox/launcher.hpp"

namespace scorer {

/**
 * @brief 一次批量评测的结果
 */
struct batch_result {
    /**
     * @brief 每个测试点的评测结果，顺序与输入的测试点顺序一致
     */
    std::vector<verdict> verdicts;

    /**
     * @brief 是否所有测试点都通过，没有测试点时为 true
     */
    bool all_accepted = true;
};

/**
 * @brief 批量评测
 * 每个测试点都在独立的运行目录中运行一次选手代码，所有测试点并发评测，
 * 全部评测完成后才返回结果。任何一个测试点的评测系统错误都会导致整次评测失败。
 */
struct batch_scorer {
    batch_scorer(const launcher &runner, const language &lang);

    /**
     * @brief 评测选手代码
     * @param code 选手代码
     * @param test_cases 测试点
     * @return 评测结果
     * @throw launch_error 若容器运行时无法启动
     * @throw internal_error 若运行目录无法创建等
     */
    batch_result score(const std::string &code, const std::vector<test_case> &test_cases) const;

    /**
     * @brief worker 调用此函数评测一个测试点
     * 评测结果和异常都写入 task.submit 中，本函数不会抛出 std::exception
     */
    void judge(const message::scoring_task &task) const;

    /**
     * @brief 评测一个测试点
     * 运行目录在返回前删除
     */
    verdict judge(const std::string &code, const test_case &tc) const;

private:
    const launcher &runner;
    const language &lang;
};

}  // namespace scorer
