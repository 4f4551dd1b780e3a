#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * 在当前作用域退出时执行代码块，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     workspace ws = manager.create(tc, code);
 *     defer { manager.destroy(ws); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = codify::scoped_guard() + [&]

namespace codify {

struct scoped_guard {
    std::function<void()> f;

    scoped_guard();
    explicit scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace codify
