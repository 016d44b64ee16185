#include "logger/logger.hpp"

#include <algorithm>

void rvfs::LogQueue::write(const LogMessageView& message) {
    for (ILogAppender *appender : mAppenders) {
        appender->write(message);
    }
}

RvfsStatus rvfs::LogQueue::addAppender(ILogAppender *appender) {
    if (appender == nullptr) {
        return RvfsStatusInvalidInput;
    }

    std::lock_guard guard(mLock);

    if (std::find(mAppenders.begin(), mAppenders.end(), appender) != mAppenders.end()) {
        return RvfsStatusAlreadyExists;
    }

    mAppenders.push_back(appender);
    return RvfsStatusSuccess;
}

void rvfs::LogQueue::removeAppender(ILogAppender *appender) noexcept {
    std::lock_guard guard(mLock);
    std::erase(mAppenders, appender);
}

void rvfs::LogQueue::setLevel(LogLevel level) noexcept {
    std::lock_guard guard(mLock);
    mLevel = level;
}

rvfs::LogLevel rvfs::LogQueue::getLevel() noexcept {
    std::lock_guard guard(mLock);
    return mLevel;
}

RvfsStatus rvfs::LogQueue::submit(const detail::LogMessage& message) {
    std::lock_guard guard(mLock);

    // Print messages are never filtered.
    if (message.level != LogLevel::ePrint && message.level < mLevel) {
        mFilteredCount.fetch_add(1, std::memory_order_relaxed);
        return RvfsStatusSuccess;
    }

    write({ message.location, message.message, message.logger, message.level });
    mComittedCount.fetch_add(1, std::memory_order_relaxed);

    return RvfsStatusSuccess;
}

rvfs::LogQueue& rvfs::LogQueue::getGlobalQueue() noexcept {
    static LogQueue sLogQueue;
    return sLogQueue;
}

std::string_view rvfs::Logger::getName() const noexcept {
    return mName;
}

void rvfs::Logger::submit(LogLevel level, std::string_view message, std::source_location location) noexcept {
    detail::LogMessage logMessage {
        .level = level,
        .location = location,
        .logger = this,
        .message = std::string(message),
    };

    mQueue->submit(logMessage);
}

void rvfs::Logger::dbg(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eDebug, message, location);
}

void rvfs::Logger::info(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eInfo, message, location);
}

void rvfs::Logger::warn(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eWarning, message, location);
}

void rvfs::Logger::error(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eError, message, location);
}

void rvfs::Logger::fatal(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eFatal, message, location);
}
