#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_deferred_action) = scoped_guard() + [&]

/**
 * @brief 离开作用域时执行清理动作
 * 清理动作抛出的异常会被吞掉并写入日志，因为析构函数不能抛出异常
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;

    /**
     * @brief 取消清理动作
     */
    void dismiss();

    scoped_guard operator+(std::function<void()> f) const;
};
