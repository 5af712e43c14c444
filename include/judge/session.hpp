#pragma once

#include <optional>
#include <string>
#include "judge/scorer.hpp"

namespace scorer {

/**
 * @brief 一次评测所属的会话
 * 调用方在生成代码时创建会话并记录提示词，评测时将会话交给评测，
 * 评测消耗这个会话，会话不会在评测之间共享。
 */
struct scoring_session {
    std::string user_id;
    std::string challenge_id;

    /**
     * @brief 生成代码时使用的提示词，没有生成过代码时为空
     */
    std::optional<std::string> prompt;
};

/**
 * @brief 调用方需要保存的提交记录
 */
struct submission_record {
    std::string user_id;
    std::string challenge_id;

    /**
     * @brief 是否通过所有测试点
     */
    bool is_correct = false;

    /**
     * @brief 提交是否公开，只有通过所有测试点的提交才公开
     */
    bool is_public = false;

    /**
     * @brief 只有通过所有测试点时才附带会话中的提示词
     */
    std::optional<std::string> prompt;
};

/**
 * @brief 根据评测结果生成提交记录，并消耗会话
 * 会话中的提示词只在通过所有测试点时被取出，否则被丢弃
 */
submission_record make_submission_record(const batch_result &result, scoring_session &&session);

}  // namespace scorer
