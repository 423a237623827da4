#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <antiforgery/middleware.hpp>

namespace antiforgery::basics
{
    // Sink provided by the host through Services. When none is registered the
    // antiforgery layer stays silent.
    struct ILogger
    {
        virtual ~ILogger() = default;
        virtual void info(std::string_view msg) = 0;
        virtual void warn(std::string_view msg) = 0;
        virtual void error(std::string_view msg) = 0;
    };

    enum class LogLevel
    {
        Info,
        Warn,
        Error
    };

    inline void log(const Context &ctx, LogLevel level, std::string_view msg)
    {
        auto sink = ctx.services().get<ILogger>();
        if (!sink)
            return;

        std::string line;
        line.reserve(msg.size() + 16);
        line += "[antiforgery] ";
        line += msg;

        switch (level)
        {
        case LogLevel::Info:
            sink->info(line);
            break;
        case LogLevel::Warn:
            sink->warn(line);
            break;
        case LogLevel::Error:
            sink->error(line);
            break;
        }
    }

} // namespace antiforgery::basics
