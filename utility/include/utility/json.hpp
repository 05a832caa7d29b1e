#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <type_traits>

namespace Utility::Detail
{
    template <typename T>
    void toJsonOptional(nlohmann::json& json, std::optional<T> const& value, char const* name)
    {
        if (value)
            json[name] = *value;
    }

    template <typename T>
    void fromJsonOptional(nlohmann::json const& json, std::optional<T>& value, char const* name)
    {
        if (auto it = json.find(name); it != json.end() && !it->is_null())
            value = it->template get<T>();
        else
            value = std::nullopt;
    }
}

#define TO_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, JSON_NAME) \
    Utility::Detail::toJsonOptional(JSON, CLASS.MEMBER, JSON_NAME)

#define TO_JSON_OPTIONAL(JSON, CLASS, MEMBER) TO_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, #MEMBER)

#define FROM_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, JSON_NAME) \
    Utility::Detail::fromJsonOptional(JSON, CLASS.MEMBER, JSON_NAME)

#define FROM_JSON_OPTIONAL(JSON, CLASS, MEMBER) FROM_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, #MEMBER)
