#pragma once

#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>

namespace rvfs {
    class Logger;
    class LogQueue;
    class ILogAppender;

    enum class LogLevel : uint8_t {
        ePrint = 0,
        eDebug = 1,
        eInfo = 2,
        eWarning = 3,
        eError = 4,
        eFatal = 5,
    };

    namespace detail {
        struct LogMessage {
            LogLevel level;
            std::source_location location;
            const Logger *logger;
            std::string message;
        };
    }

    struct LogMessageView {
        std::source_location location;
        std::string_view message;
        const Logger *logger;
        LogLevel level;
    };

    class ILogAppender {
    public:
        virtual ~ILogAppender() = default;

        virtual void write(const LogMessageView& message) = 0;
    };
}
