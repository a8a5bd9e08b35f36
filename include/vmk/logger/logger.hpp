#pragma once

#include "vmk/logger/queue.hpp"

namespace vmk {
    class Logger {
        LogQueue *mQueue;
        stdx::StringView mName;

    public:
        constexpr Logger(stdx::StringView name, LogQueue *queue) noexcept
            : mQueue(queue)
            , mName(name)
        { }

        Logger(stdx::StringView name) noexcept
            : Logger(name, &LogQueue::getGlobalQueue())
        { }

        stdx::StringView getName() const noexcept;

        void submit(LogLevel level, stdx::StringView message, std::source_location location) noexcept;

        void dbg(stdx::StringView message, std::source_location location = std::source_location::current()) noexcept;
        void info(stdx::StringView message, std::source_location location = std::source_location::current()) noexcept;
        void warn(stdx::StringView message, std::source_location location = std::source_location::current()) noexcept;
        void error(stdx::StringView message, std::source_location location = std::source_location::current()) noexcept;
        void fatal(stdx::StringView message, std::source_location location = std::source_location::current()) noexcept;

        template<typename... Args>
        void dbgfImpl(std::source_location location, Args&&... args) noexcept {
            submitf(LogLevel::eDebug, location, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void infofImpl(std::source_location location, Args&&... args) noexcept {
            submitf(LogLevel::eInfo, location, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void warnfImpl(std::source_location location, Args&&... args) noexcept {
            submitf(LogLevel::eWarning, location, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void errorfImpl(std::source_location location, Args&&... args) noexcept {
            submitf(LogLevel::eError, location, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void fatalfImpl(std::source_location location, Args&&... args) noexcept {
            submitf(LogLevel::eFatal, location, std::forward<Args>(args)...);
        }

    private:
        template<typename... Args>
        void submitf(LogLevel level, std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            stdx::StaticString message = vmk::concat<kLogMessageSize>(std::forward<Args>(args)...);
            submit(level, message, location);
        }
    };
}

#define dbgf(...) dbgfImpl(std::source_location::current(), __VA_ARGS__)
#define infof(...) infofImpl(std::source_location::current(), __VA_ARGS__)
#define warnf(...) warnfImpl(std::source_location::current(), __VA_ARGS__)
#define errorf(...) errorfImpl(std::source_location::current(), __VA_ARGS__)
#define fatalf(...) fatalfImpl(std::source_location::current(), __VA_ARGS__)
