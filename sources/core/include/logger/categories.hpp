#pragma once

#include "logger/logger.hpp"

inline rvfs::Logger VfsLog { "VFS" };
inline rvfs::Logger StreamLog { "STREAM" };
inline rvfs::Logger TestLog { "TEST" };
