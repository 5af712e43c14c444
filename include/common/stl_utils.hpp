#pragma once

namespace scorer {

/**
 * @brief 用于 std::visit 的多个 lambda 组合
 * @code{.cpp}
 *     std::visit(overloaded{
 *         [](const exit_status::completed &c) { ... },
 *         [](const exit_status::timed_out &) { ... }}, status);
 * @endcode
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace scorer
