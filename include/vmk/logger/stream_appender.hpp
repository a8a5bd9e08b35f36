#pragma once

#include "vmk/logger/appender.hpp"

#include <stdio.h>

namespace vmk {
    /// @brief Writes log lines to a stdio stream.
    class StreamAppender final : public ILogAppender {
        FILE *mStream;

    public:
        StreamAppender(FILE *stream [[gnu::nonnull]]) noexcept
            : mStream(stream)
        { }

        void write(const LogMessageView& message) override;
    };
}
