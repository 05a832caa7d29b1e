#pragma once

#include <log/level.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace Log
{
    using ForwardingSink = std::function<void(Level, std::string const&)>;

    /**
     * @brief Writes to spdlog and forwards every message to an optional sink.
     * Messages logged while no sink is attached are stashed, up to stashLimit, and flushed once one is.
     */
    class Logger
    {
      public:
        constexpr static std::size_t stashLimit = 1000;

        void setupForwarding(ForwardingSink sink);
        void setLevel(Level level);
        Level level() const;
        std::size_t stashedCount() const;

        template <typename... Args>
        void log(Level level, fmt::format_string<Args...> format, Args&&... args)
        {
            write(level, fmt::format(format, std::forward<Args>(args)...));
        }

        void write(Level level, std::string const& message);

      private:
        mutable std::recursive_mutex guard_{};
        ForwardingSink sink_{};
        std::deque<std::pair<Level, std::string>> stash_{};
    };
}
