#pragma once

#include <source_location>
#include <string_view>

namespace rvfs {
    [[noreturn]]
    void BugCheck(std::string_view message, std::source_location where = std::source_location::current()) noexcept;
}

#define RVFS_CHECK(expr, msg) do { if (!(expr)) { rvfs::BugCheck(msg); } } while (0)
#define RVFS_ASSERT(expr) do { if (!(expr)) { rvfs::BugCheck(#expr); } } while (0)
