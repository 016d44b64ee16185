#include "panic.hpp"

#include "logger/categories.hpp"

#include <cstdlib>

void rvfs::BugCheck(std::string_view message, std::source_location where) noexcept {
    VfsLog.fatalf("Assertion failed '", message, "'");
    VfsLog.fatalf(where.function_name(), " (", where.file_name(), ":", where.line(), ")");
    std::abort();
}
