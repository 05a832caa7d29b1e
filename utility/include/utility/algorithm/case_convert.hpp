#pragma once

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <string_view>

namespace Utility::Algorithm
{
    /// ASCII only. Used for enumerator names, log levels and OS names reported by the backend.
    inline std::string toLowerCase(std::string_view input)
    {
        std::string result{};
        result.reserve(input.size());
        std::transform(input.begin(), input.end(), std::back_inserter(result), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }
}
