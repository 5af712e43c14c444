#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace scorer {
using namespace std;

// clang-format off
static const unordered_map<outcome, const char *> outcome_string = boost::assign::map_list_of
    (outcome::ACCEPTED, "Accepted")
    (outcome::WRONG_ANSWER, "Wrong Answer")
    (outcome::COMPILATION_ERROR, "Compilation Error")
    (outcome::RUNTIME_ERROR, "Runtime Error")
    (outcome::TIMEOUT, "Timeout")
    (outcome::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded");
// clang-format on

const char *get_display_message(outcome result) {
    return outcome_string.at(result);
}

}  // namespace scorer
