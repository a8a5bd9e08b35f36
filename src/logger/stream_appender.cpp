#include "vmk/logger/stream_appender.hpp"
#include "vmk/logger/logger.hpp"

using namespace stdx::literals;

static stdx::StringView GetLevelName(vmk::LogLevel level) {
    using enum vmk::LogLevel;
    switch (level) {
    case eDebug: return "DEBUG"_sv;
    case eInfo: return "INFO"_sv;
    case eWarning: return "WARN"_sv;
    case eError: return "ERROR"_sv;
    case eFatal: return "FATAL"_sv;
    }

    return "UNKNOWN"_sv;
}

void vmk::StreamAppender::write(const LogMessageView& message) {
    std::string_view text = message.message;
    std::string_view level = GetLevelName(message.level);
    std::string_view name = message.logger->getName();
    fprintf(mStream, "[%.*s] %.*s: %.*s\n",
        int(level.size()), level.data(),
        int(name.size()), name.data(),
        int(text.size()), text.data());
}
