#pragma once

#include <utility/describe.hpp>
#include <utility/enum_string_convert.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <string>
#include <string_view>

namespace Log
{
    BOOST_DEFINE_ENUM_CLASS(Level, Trace, Debug, Info, Warning, Error, Critical, Off)

    namespace Detail
    {
        // Indexed by Log::Level.
        constexpr std::array<spdlog::level::level_enum, 7> spdlogLevels{
            spdlog::level::trace,
            spdlog::level::debug,
            spdlog::level::info,
            spdlog::level::warn,
            spdlog::level::err,
            spdlog::level::critical,
            spdlog::level::off,
        };
    }

    inline spdlog::level::level_enum toSpdlogLevel(Level level)
    {
        const auto index = static_cast<std::size_t>(level);
        return index < Detail::spdlogLevels.size() ? Detail::spdlogLevels[index] : spdlog::level::info;
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum level)
    {
        for (std::size_t i = 0; i != Detail::spdlogLevels.size(); ++i)
        {
            if (Detail::spdlogLevels[i] == level)
                return static_cast<Level>(i);
        }
        return Level::Info;
    }

    /**
     * @brief Parses the level names used in the connections document. Case is ignored, "warn" is accepted
     * for warning and unknown names fall back to info.
     */
    inline Level levelFromString(std::string_view name)
    {
        const std::string str{name};
        if (Utility::Algorithm::toLowerCase(str) == "warn")
            return Level::Warning;
        return Utility::tryEnumFromString<Level>(str).value_or(Level::Info);
    }

    inline std::string levelToString(Level level)
    {
        return Utility::enumToLowerString(level);
    }
}
