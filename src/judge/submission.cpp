#include "judge/submission.hpp"
#include "config.hpp"

namespace scorer {
using namespace std;

execution_request make_request(const string &code, const test_case &tc) {
    execution_request request;
    request.source_code = code;
    request.input = tc.input;
    request.time_limit = chrono::duration<double>(tc.time_limit > 0 ? tc.time_limit : DEFAULT_TIME_LIMIT);
    size_t memory_mb = tc.memory_limit > 0 ? tc.memory_limit : DEFAULT_MEMORY_LIMIT;
    request.memory_limit = memory_mb * 1024 * 1024;
    return request;
}

}  // namespace scorer
