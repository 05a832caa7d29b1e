#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>

namespace Utility
{
    enum class OrderOfMagnitude
    {
        None = 0,
        Kibi,
        Mebi,
        Gibi,
        Tebi
    };

    inline OrderOfMagnitude determineOrderOfMagnitude(double value)
    {
        if (value < 1024.0)
            return OrderOfMagnitude::None;
        else if (value < 1024.0 * 1024.0)
            return OrderOfMagnitude::Kibi;
        else if (value < 1024.0 * 1024.0 * 1024.0)
            return OrderOfMagnitude::Mebi;
        else if (value < 1024.0 * 1024.0 * 1024.0 * 1024.0)
            return OrderOfMagnitude::Gibi;
        else
            return OrderOfMagnitude::Tebi;
    }

    inline std::string formatBytes(double value, OrderOfMagnitude magnitude)
    {
        switch (magnitude)
        {
            case OrderOfMagnitude::None:
                return fmt::format("{:.0f} B", value);
            case OrderOfMagnitude::Kibi:
                return fmt::format("{:.2f} KiB", value / 1024.0);
            case OrderOfMagnitude::Mebi:
                return fmt::format("{:.2f} MiB", value / (1024.0 * 1024.0));
            case OrderOfMagnitude::Gibi:
                return fmt::format("{:.2f} GiB", value / (1024.0 * 1024.0 * 1024.0));
            case OrderOfMagnitude::Tebi:
                return fmt::format("{:.2f} TiB", value / (1024.0 * 1024.0 * 1024.0 * 1024.0));
        }
        return std::string{};
    }

    inline std::string formatBytes(std::uint64_t value)
    {
        const auto asDouble = static_cast<double>(value);
        return formatBytes(asDouble, determineOrderOfMagnitude(asDouble));
    }

    inline std::string formatByteRate(double bytesPerSecond)
    {
        return formatBytes(bytesPerSecond, determineOrderOfMagnitude(bytesPerSecond)) + "/s";
    }
}
