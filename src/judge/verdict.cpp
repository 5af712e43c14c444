#include "judge/verdict.hpp"
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace scorer {
using namespace std;

// 空格、制表符、换行、回车、垂直制表符、换页
static bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

static string trim(const string &text) {
    return boost::algorithm::trim_copy_if(text, is_blank);
}

optional<outcome> classify(const execution_result &result, const string &expected, const language &lang) {
    auto nonzero = [&](const string &error) {
        return lang.is_compilation_error(error) ? outcome::COMPILATION_ERROR : outcome::RUNTIME_ERROR;
    };

    return visit(overloaded{
                     [](const exit_status::timed_out &) -> optional<outcome> {
                         return outcome::TIMEOUT;
                     },
                     [&](const exit_status::signaled &sig) -> optional<outcome> {
                         if (sig.oom_killed) return outcome::MEMORY_LIMIT_EXCEEDED;
                         return nonzero(result.error);
                     },
                     [&](const exit_status::completed &c) -> optional<outcome> {
                         if (c.code != 0) return nonzero(result.error);
                         if (trim(result.output) == trim(expected))
                             return outcome::ACCEPTED;
                         else
                             return outcome::WRONG_ANSWER;
                     },
                     [](const exit_status::launch_failed &) -> optional<outcome> {
                         return {};
                     }},
                 result.status);
}

optional<outcome> classify(const execution_result &result, const string &expected) {
    return classify(result, expected, default_language());
}

verdict make_verdict(const execution_result &result, const string &expected, const language &lang) {
    auto kind = classify(result, expected, lang);
    if (!kind)
        throw launch_error(get<exit_status::launch_failed>(result.status).message);

    verdict v;
    v.result = *kind;
    v.output = result.output;
    v.error = result.error;
    v.elapsed = result.wall_time;
    v.peak_memory = result.peak_memory;
    return v;
}

}  // namespace scorer
