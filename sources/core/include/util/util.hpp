#pragma once

#include <concepts>

namespace rvfs {
    template<std::integral T>
    constexpr T rounddown(T value, T multiple) {
        return value / multiple * multiple;
    }
}

#define RVFS_NOCOPY(it) \
    it(const it&) = delete; \
    it& operator=(const it&) = delete;

#define RVFS_NOMOVE(it) \
    it(it&&) = delete; \
    it& operator=(it&&) = delete;
