#pragma once

#include <concepts>
#include <optional>

namespace Utility
{
    /// Satisfied by std::optional only. Optional members are left out of serialized objects when empty.
    template <typename T>
    concept OptionalType = requires { typename T::value_type; } && std::same_as<T, std::optional<typename T::value_type>>;

    template <OptionalType T>
    using StripOptional_t = typename T::value_type;
}
