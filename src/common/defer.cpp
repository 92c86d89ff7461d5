#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(std::function<void()> f) : f(std::move(f)) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    try {
        f();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Deferred action failed: " << ex.what();
    }
}

void scoped_guard::dismiss() {
    f = nullptr;
}

scoped_guard scoped_guard::operator+(std::function<void()> f) const {
    return scoped_guard(std::move(f));
}
