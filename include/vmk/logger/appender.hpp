#pragma once

#include "vmk/std/static_string.hpp"

#include <source_location>

#include <stdint.h>

namespace vmk {
    class Logger;
    class LogQueue;
    class ILogAppender;

    static constexpr size_t kLogMessageSize = 256;

    enum class LogLevel : uint8_t {
        eDebug,
        eInfo,
        eWarning,
        eError,
        eFatal,
    };

    namespace detail {
        struct LogMessage {
            LogLevel level;
            std::source_location location;
            const Logger *logger;
            stdx::StaticString<kLogMessageSize> message;
        };
    }

    struct LogMessageView {
        std::source_location location;
        stdx::StringView message;
        const Logger *logger;
        LogLevel level;
    };

    class ILogAppender {
    public:
        virtual ~ILogAppender() = default;

        virtual void write(const LogMessageView& message) = 0;
    };
}
