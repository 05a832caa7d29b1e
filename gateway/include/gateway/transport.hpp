#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace Gateway
{
    /**
     * @brief The raw channel to the backend, for instance an IPC bridge.
     *
     * A failed request is reported through onReply as {"error": "..."}. Replies and events may be delivered on
     * any thread.
     */
    class Transport
    {
      public:
        using ReplyCallback = std::function<void(nlohmann::json const&)>;
        using EventCallback = std::function<void(std::string const& channel, nlohmann::json const& payload)>;

        virtual ~Transport() = default;

        virtual void invoke(std::string const& channel, nlohmann::json const& payload, ReplyCallback onReply) = 0;
        virtual void setEventCallback(EventCallback onEvent) = 0;
    };
}
