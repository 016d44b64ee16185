#include "logger/stream_appender.hpp"

#include "logger/logger.hpp"

void rvfs::StreamAppender::write(const LogMessageView& message) {
    auto& [_, msg, logger, level] = message;

    if (level != LogLevel::ePrint) {
        *mStream << "[" << logger->getName() << "] ";
    }

    *mStream << msg;

    if (level != LogLevel::ePrint) {
        *mStream << '\n';
    }
}

RvfsStatus rvfs::StreamAppender::create(std::ostream *stream, StreamAppender *appender) noexcept {
    if (stream == nullptr) {
        return RvfsStatusInvalidInput;
    }

    appender->mStream = stream;
    return RvfsStatusSuccess;
}
