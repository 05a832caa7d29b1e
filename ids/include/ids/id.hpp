#pragma once

#include <nlohmann/json.hpp>

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <compare>
#include <functional>
#include <string>
#include <utility>

namespace Ids
{
    /**
     * @brief A string identifier that only compares with identifiers of the same kind. The Tag keeps a
     * connection id from being passed where a session id is expected.
     *
     * Default constructed ids are invalid.
     */
    template <typename Tag>
    class TypedId
    {
      public:
        TypedId()
            : value_{invalidValue}
        {}
        explicit TypedId(std::string value)
            : value_{std::move(value)}
        {}

        std::string const& value() const
        {
            return value_;
        }

        bool isValid() const
        {
            return value_ != invalidValue;
        }

        friend std::strong_ordering operator<=>(TypedId const& lhs, TypedId const& rhs) = default;
        friend bool operator==(TypedId const& lhs, TypedId const& rhs) = default;

      private:
        static constexpr char const* invalidValue = "INVALID_ID";

        std::string value_;
    };

    template <typename Tag>
    void to_json(nlohmann::json& j, TypedId<Tag> const& id)
    {
        j = id.value();
    }

    template <typename Tag>
    void from_json(nlohmann::json const& j, TypedId<Tag>& id)
    {
        id = TypedId<Tag>{j.get<std::string>()};
    }

    struct IdHash
    {
        template <typename Tag>
        std::size_t operator()(TypedId<Tag> const& id) const
        {
            return std::hash<std::string>{}(id.value());
        }
    };

    inline std::string generateUuid()
    {
        return boost::uuids::to_string(boost::uuids::random_generator()());
    }
}

#define DEFINE_ID_TYPE(name) \
    namespace Ids \
    { \
        struct name##Tag \
        {}; \
        using name = TypedId<name##Tag>; \
\
        inline name make##name(std::string const& value) \
        { \
            return name{value}; \
        } \
\
        inline name generate##name() \
        { \
            return name{generateUuid()}; \
        } \
    }
