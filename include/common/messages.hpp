#pragma once

#include <cstddef>
#include "judge/submission.hpp"

namespace scorer::message {

/**
 * @brief 批量评测时分发给 worker 的评测任务
 */
struct scoring_task {
    /**
     * @brief 当前 worker 所评测的提交
     */
    submission *submit;

    /**
     * @brief 本测试点的 id
     * 为当前测试点在 submit.test_cases 的下标，
     * 评测结果也写入 submit.verdicts 的相同下标
     */
    std::size_t id;
};

}  // namespace scorer::message
