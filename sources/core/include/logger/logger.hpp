#pragma once

#include "logger/queue.hpp"

#include "util/format.hpp"

namespace rvfs {
    class Logger {
        LogQueue *mQueue;
        std::string_view mName;

    public:
        Logger(std::string_view name, LogQueue *queue) noexcept
            : mQueue(queue)
            , mName(name)
        { }

        Logger(std::string_view name) noexcept
            : Logger(name, &LogQueue::getGlobalQueue())
        { }

        std::string_view getName() const noexcept;

        void submit(LogLevel level, std::string_view message, std::source_location location) noexcept;

        template<typename... Args>
        void print(Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            submit(LogLevel::ePrint, rvfs::concat(std::forward<Args>(args)...), std::source_location::current());
        }

        template<typename... Args>
        void println(Args&&... args) noexcept {
            print(std::forward<Args>(args)..., "\n");
        }

        void dbg(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void info(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void warn(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void error(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void fatal(std::string_view message, std::source_location location = std::source_location::current()) noexcept;

        template<typename... Args>
        void dbgfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            dbg(rvfs::concat(std::forward<Args>(args)...), location);
        }

        template<typename... Args>
        void infofImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            info(rvfs::concat(std::forward<Args>(args)...), location);
        }

        template<typename... Args>
        void warnfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            warn(rvfs::concat(std::forward<Args>(args)...), location);
        }

        template<typename... Args>
        void errorfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            error(rvfs::concat(std::forward<Args>(args)...), location);
        }

        template<typename... Args>
        void fatalfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            fatal(rvfs::concat(std::forward<Args>(args)...), location);
        }
    };
}

#define dbgf(...) dbgfImpl(std::source_location::current(), __VA_ARGS__)
#define infof(...) infofImpl(std::source_location::current(), __VA_ARGS__)
#define warnf(...) warnfImpl(std::source_location::current(), __VA_ARGS__)
#define errorf(...) errorfImpl(std::source_location::current(), __VA_ARGS__)
#define fatalf(...) fatalfImpl(std::source_location::current(), __VA_ARGS__)
