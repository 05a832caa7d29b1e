#pragma once

#include <log/level.hpp>
#include <log/logger.hpp>

#include <fmt/format.h>

#include <utility>

namespace Log
{
    namespace Detail
    {
        extern Logger logger;
    }

    template <typename... Args>
    void log(Level level, fmt::format_string<Args...> format, Args&&... args)
    {
        Detail::logger.log(level, format, std::forward<Args>(args)...);
    }

    /**
     * @brief Attaches a sink that receives every log message, for instance the notification area of the UI.
     * Messages logged before are flushed into it. An empty sink detaches, messages are stashed again.
     */
    void setupForwarding(ForwardingSink sink);

    /// Only filters the spdlog output, the forwarding sink receives every message.
    inline void setLevel(Level level)
    {
        Detail::logger.setLevel(level);
    }

    inline Level level()
    {
        return Detail::logger.level();
    }

    template <typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args)
    {
        log(Level::Trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args)
    {
        log(Level::Debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args)
    {
        log(Level::Info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args)
    {
        log(Level::Warning, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args)
    {
        log(Level::Error, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args)
    {
        log(Level::Critical, format, std::forward<Args>(args)...);
    }
}
