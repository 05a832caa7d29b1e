#pragma once

#include <utility/describe.hpp>
#include <utility/algorithm/case_convert.hpp>

#include <optional>
#include <string>
#include <stdexcept>

namespace Utility
{
    template <typename EnumType>
    std::string enumToString(EnumType const& enumValue)
    {
        char const* result = nullptr;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&result, &enumValue](auto desc) {
            if (enumValue == desc.value)
                result = desc.name;
        });

        if (result == nullptr)
            throw std::invalid_argument("Invalid enum value");
        return result;
    }

    /**
     * @brief Finds the enumerator with the given name. Comparison ignores case, so "connected" matches
     * Connected.
     */
    template <typename EnumType>
    std::optional<EnumType> tryEnumFromString(std::string const& str)
    {
        std::optional<EnumType> enumValue{std::nullopt};
        const auto lowered = Algorithm::toLowerCase(str);
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>(
            [&enumValue, &lowered](auto desc) {
                if (!enumValue && lowered == Algorithm::toLowerCase(desc.name))
                    enumValue = desc.value;
            });
        return enumValue;
    }

    template <typename EnumType>
    EnumType enumFromString(std::string const& str)
    {
        const auto enumValue = tryEnumFromString<EnumType>(str);
        if (!enumValue)
            throw std::invalid_argument("Invalid enum string: " + str);
        return *enumValue;
    }

    template <typename EnumType>
    std::string enumToLowerString(EnumType const& enumValue)
    {
        return Algorithm::toLowerCase(enumToString(enumValue));
    }
}
