#pragma once

#include "gmock/gmock.h"
#include "sandbox/launcher.hpp"

namespace scorer::test {

/**
 * 测试用的沙箱启动器，不会真正运行选手代码
 * 用法：
 * 1. mock_launcher runner;
 * 2. EXPECT_CALL(runner, run(_, _)).WillRepeatedly(Invoke(...));
 * 3. batch_scorer(runner, default_language()).score(...)
 */
struct mock_launcher : public launcher {
    MOCK_METHOD(execution_result, run, (const workspace &ws, const execution_request &request), (const, override));
};

/**
 * @brief 构造一个正常退出的运行结果
 */
inline execution_result completed_result(const std::string &output, int code = 0, const std::string &error = "") {
    execution_result result;
    result.status = exit_status::completed{code};
    result.output = output;
    result.error = error;
    result.wall_time = std::chrono::duration<double>(0.05);
    result.peak_memory = 9396 * 1024;
    return result;
}

}  // namespace scorer::test
