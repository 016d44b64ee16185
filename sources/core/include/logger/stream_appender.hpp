#pragma once

#include "logger/appender.hpp"

#include <rvfs/status.h>

#include <ostream>

namespace rvfs {
    /// @brief Writes each message to an output stream as a single line.
    class StreamAppender final : public ILogAppender {
        std::ostream *mStream = nullptr;

        void write(const LogMessageView& message) override;

    public:
        constexpr StreamAppender() noexcept = default;

        static RvfsStatus create(std::ostream *stream, StreamAppender *appender) noexcept;
    };
}
