#pragma once

#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <optional>
#include <string>

namespace SharedData
{
    namespace Detail
    {
        struct Empty
        {};
        BOOST_DESCRIBE_STRUCT(Empty, (), ())
    }

    /**
     * @brief The reply envelope of every backend command. A reply is either {"error": ...} or the payload,
     * which may carry "success": true next to its members. An explicit "success": false without an error
     * text counts as failure too.
     */
    template <typename Data = Detail::Empty>
    struct ErrorOrSuccess : public Data
    {
        std::optional<std::string> error{std::nullopt};

        ErrorOrSuccess() = default;
        ErrorOrSuccess(Data data)
            : Data{std::move(data)}
        {}

        bool success() const
        {
            return !error.has_value();
        }
        explicit operator bool() const
        {
            return success();
        }

        std::expected<Data, std::string> toExpected() const
        {
            if (error)
                return std::unexpected(*error);
            return static_cast<Data const&>(*this);
        }
    };

    template <typename Data = Detail::Empty>
    ErrorOrSuccess<Data> error(std::string message)
    {
        ErrorOrSuccess<Data> result{};
        result.error = std::move(message);
        return result;
    }

    template <typename Data = Detail::Empty>
    void to_json(nlohmann::json& j, ErrorOrSuccess<Data> const& reply)
    {
        if (reply.error)
        {
            j = nlohmann::json{{"error", *reply.error}};
            return;
        }
        j = nlohmann::json::object();
        to_json(j, static_cast<Data const&>(reply));
        j["success"] = true;
    }

    template <typename Data = Detail::Empty>
    void from_json(nlohmann::json const& j, ErrorOrSuccess<Data>& reply)
    {
        reply.error = std::nullopt;
        if (j.is_object())
        {
            if (auto err = j.find("error"); err != j.end() && !err->is_null())
            {
                reply.error = err->is_string() ? err->template get<std::string>() : err->dump();
                return;
            }
            if (auto flag = j.find("success"); flag != j.end() && flag->is_boolean() && !flag->template get<bool>())
            {
                reply.error = "The backend reported a failure without a reason.";
                return;
            }
        }
        from_json(j, static_cast<Data&>(reply));
    }
}
