#pragma once

#include <nlohmann/json.hpp>
#include <utility/describe.hpp>
#include <utility/traits_and_concepts/optional.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <type_traits>

// JSON conversion for every described enum and struct that travels between the orchestration and the backend.
namespace SharedData
{
    template <typename T>
    concept DescribedEnum = std::is_enum_v<T> && boost::describe::has_describe_enumerators<T>::value;

    template <typename T>
    concept DescribedStruct = std::is_class_v<T> && !std::is_union_v<T> &&
        boost::describe::has_describe_members<T>::value;

    // Enumerators travel as lower case names. Reading ignores case.
    template <DescribedEnum EnumT>
    void to_json(nlohmann::json& j, EnumT const& e)
    {
        j = Utility::enumToLowerString<EnumT>(e);
    }
    template <DescribedEnum EnumT>
    void from_json(nlohmann::json const& j, EnumT& e)
    {
        e = Utility::enumFromString<EnumT>(j.template get<std::string>());
    }

    namespace Detail
    {
        template <typename MemberT>
        void writeMember(nlohmann::json& j, char const* name, MemberT const& member)
        {
            if constexpr (Utility::OptionalType<MemberT>)
            {
                if (member)
                    j[name] = *member;
            }
            else
                j[name] = member;
        }

        // Optional members may be absent or null, everything else is required.
        template <typename MemberT>
        void readMember(nlohmann::json const& j, char const* name, MemberT& member)
        {
            const auto iter = j.find(name);
            const bool present = iter != j.end() && !iter->is_null();
            if constexpr (Utility::OptionalType<MemberT>)
            {
                if (present)
                    member = iter->template get<Utility::StripOptional_t<MemberT>>();
                else
                    member = std::nullopt;
            }
            else
            {
                if (!present)
                    throw std::runtime_error(fmt::format("Missing required field '{}' in JSON object", name));
                iter->get_to(member);
            }
        }
    }

    template <DescribedStruct T>
    void to_json(nlohmann::json& j, T const& obj)
    {
        if (!j.is_object())
            j = nlohmann::json::object();

        boost::mp11::mp_for_each<boost::describe::describe_bases<T, boost::describe::mod_any_access>>(
            [&](auto base) {
                to_json(j, static_cast<typename decltype(base)::type const&>(obj));
            });
        boost::mp11::mp_for_each<boost::describe::describe_members<T, boost::describe::mod_any_access>>(
            [&](auto member) {
                Detail::writeMember(j, member.name, obj.*member.pointer);
            });
    }

    template <DescribedStruct T>
    void from_json(nlohmann::json const& j, T& obj)
    {
        boost::mp11::mp_for_each<boost::describe::describe_bases<T, boost::describe::mod_any_access>>(
            [&](auto base) {
                from_json(j, static_cast<typename decltype(base)::type&>(obj));
            });
        boost::mp11::mp_for_each<boost::describe::describe_members<T, boost::describe::mod_any_access>>(
            [&](auto member) {
                Detail::readMember(j, member.name, obj.*member.pointer);
            });
    }
}
