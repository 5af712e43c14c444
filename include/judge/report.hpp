#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "judge/scorer.hpp"
#include "judge/session.hpp"
#include "judge/submission.hpp"
#include "judge/verdict.hpp"

namespace scorer {

/**
 * @brief 一次评测请求
 * JSON 格式：
 * {
 *   "code": "print(input())",
 *   "testcases": [
 *     {"input": "1", "expected_output": "1", "time_limit_seconds": 2.0, "memory_limit_mb": 128}
 *   ],
 *   "session": {"user_id": "1", "challenge_id": "2", "prompt": "..."}  // 可选
 * }
 */
struct scoring_request {
    std::string code;
    std::vector<test_case> test_cases;
    std::optional<scoring_session> session;
};

/**
 * @brief 解析评测请求
 * @throw std::invalid_argument 若请求格式不正确
 */
scoring_request parse_scoring_request(const nlohmann::json &j);

void from_json(const nlohmann::json &j, test_case &value);

void from_json(const nlohmann::json &j, scoring_session &value);

/**
 * @brief 单个测试点的评测结果
 * {"outcome", "stdout", "stderr", "elapsed_seconds", "peak_memory_kb"}，
 * 没有内存统计时 peak_memory_kb 为 null
 */
void to_json(nlohmann::json &j, const verdict &value);

void to_json(nlohmann::json &j, const batch_result &value);

void to_json(nlohmann::json &j, const submission_record &value);

/**
 * @brief 评测报告，submission 只在请求包含会话时存在
 */
nlohmann::json make_report(const batch_result &result, const std::optional<submission_record> &record);

/**
 * @brief 评测系统出错时输出的报告
 */
nlohmann::json make_error_report(const std::string &message);

}  // namespace scorer
