#pragma once

#include <functional>

#define SCORER_DEFER_1(x, y) x##y
#define SCORER_DEFER_2(x, y) SCORER_DEFER_1(x, y)
#define SCORER_DEFER_0(x) SCORER_DEFER_2(x, __COUNTER__)

/**
 * @brief 在离开当前作用域时执行代码块，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     int fd = open(...);
 *     defer { close(fd); };
 * @endcode
 */
#define defer auto SCORER_DEFER_0(_deferred_option) = ::scorer::scoped_guard() + [&]

namespace scorer {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace scorer
