#pragma once

#include "logger/appender.hpp"

#include <rvfs/status.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace rvfs {
    /// @brief Fans log messages out to a set of appenders.
    ///
    /// Messages are written synchronously under the queue lock, messages
    /// below the queue level are counted as filtered and discarded.
    class LogQueue {
        using AppenderList = std::vector<ILogAppender*>;

        std::mutex mLock;
        AppenderList mAppenders;
        LogLevel mLevel = LogLevel::eInfo;

        /// @brief Number of messages that were discarded for being below the queue level.
        std::atomic<uint32_t> mFilteredCount{0};

        /// @brief Number of messages that were written out to the appenders.
        std::atomic<uint32_t> mComittedCount{0};

        void write(const LogMessageView& message);

    public:
        RvfsStatus addAppender(ILogAppender *appender);
        void removeAppender(ILogAppender *appender) noexcept;

        void setLevel(LogLevel level) noexcept;
        LogLevel getLevel() noexcept;

        RvfsStatus submit(const detail::LogMessage& message);

        uint32_t getFilteredCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mFilteredCount.load(order);
        }

        uint32_t getCommittedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mComittedCount.load(order);
        }

        static LogQueue& getGlobalQueue() noexcept;

        static RvfsStatus addGlobalAppender(ILogAppender *appender) {
            return getGlobalQueue().addAppender(appender);
        }

        static void removeGlobalAppender(ILogAppender *appender) noexcept {
            getGlobalQueue().removeAppender(appender);
        }
    };
}
