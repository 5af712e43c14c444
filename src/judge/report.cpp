#include "judge/report.hpp"
#include "common/json_utils.hpp"

namespace scorer {
using namespace std;
using namespace nlohmann;

template <typename T>
static json optional_to_json(const optional<T> &value) {
    if (value) return *value;
    return nullptr;
}

/**
 * @brief 用户 id 和题目 id 可能是数字也可能是字符串
 */
static string read_id(const json &j, const char *key) {
    const json &value = j.at(key);
    if (value.is_string()) return value.get<string>();
    if (value.is_number_integer()) return value.dump();
    throw build_invalid_argument(j, key);
}

void from_json(const json &j, test_case &value) {
    if (!j.is_object()) throw invalid_argument("Test case must be an object: " + j.dump());
    assign_optional(j, value.input, "input");
    assign_optional(j, value.expected_output, "expected_output");
    assign_optional(j, value.time_limit, "time_limit_seconds");
    assign_optional(j, value.memory_limit, "memory_limit_mb");
}

void from_json(const json &j, scoring_session &value) {
    value.user_id = read_id(j, "user_id");
    value.challenge_id = read_id(j, "challenge_id");
    if (exists(j, "prompt")) {
        string prompt;
        assign_optional(j, prompt, "prompt");
        value.prompt = move(prompt);
    }
}

scoring_request parse_scoring_request(const json &j) {
    if (!j.is_object()) throw invalid_argument("Scoring request must be an object");
    if (!exists(j, "code") || !j.at("code").is_string())
        throw build_invalid_argument(j, "code");
    if (!exists(j, "testcases") || !j.at("testcases").is_array())
        throw build_invalid_argument(j, "testcases");

    scoring_request request;
    try {
        j.at("code").get_to(request.code);
        for (auto &tc : j.at("testcases"))
            request.test_cases.push_back(tc.get<test_case>());
        if (exists(j, "session"))
            request.session = j.at("session").get<scoring_session>();
    } catch (json::exception &ex) {
        throw invalid_argument(string("Malformed scoring request: ") + ex.what());
    }
    return request;
}

void to_json(json &j, const verdict &value) {
    optional<size_t> peak_memory_kb;
    if (value.peak_memory) peak_memory_kb = *value.peak_memory / 1024;

    j = {{"outcome", get_display_message(value.result)},
         {"stdout", value.output},
         {"stderr", value.error},
         {"elapsed_seconds", value.elapsed.count()},
         {"peak_memory_kb", optional_to_json(peak_memory_kb)}};
}

void to_json(json &j, const batch_result &value) {
    j = {{"all_accepted", value.all_accepted},
         {"results", value.verdicts}};
}

void to_json(json &j, const submission_record &value) {
    j = {{"user_id", value.user_id},
         {"challenge_id", value.challenge_id},
         {"is_correct", value.is_correct},
         {"is_public", value.is_public},
         {"prompt", optional_to_json(value.prompt)}};
}

json make_report(const batch_result &result, const optional<submission_record> &record) {
    json report = result;
    if (record) report["submission"] = *record;
    return report;
}

json make_error_report(const string &message) {
    return {{"error", "scoring unavailable"},
            {"message", message}};
}

}  // namespace scorer
