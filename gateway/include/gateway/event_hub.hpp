#pragma once

#include <ids/ids.hpp>
#include <shared_data/events.hpp>

#include <boost/signals2.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Gateway
{
    /**
     * @brief Fans backend push events out to subscribers. Session output is routed per session id, so a
     * terminal only ever sees its own data.
     */
    class EventHub
    {
      public:
        using SessionDataSignal = boost::signals2::signal<void(std::string const&)>;
        using SessionExitSignal = boost::signals2::signal<void(std::optional<int>)>;

        boost::signals2::connection
        onSessionData(Ids::SessionId const& sessionId, std::function<void(std::string const&)> handler);
        boost::signals2::connection
        onSessionExit(Ids::SessionId const& sessionId, std::function<void(std::optional<int>)> handler);
        boost::signals2::connection
        onTransferProgress(std::function<void(SharedData::TransferProgress const&)> handler);
        boost::signals2::connection onTransferSuccess(std::function<void(SharedData::TransferSuccess const&)> handler);
        boost::signals2::connection onTransferError(std::function<void(SharedData::TransferError const&)> handler);
        boost::signals2::connection
        onConnectionStatusChange(std::function<void(SharedData::ConnectionStatusChange const&)> handler);

        /**
         * @brief Number of live session data handlers for the given session.
         */
        std::size_t subscriberCount(Ids::SessionId const& sessionId) const;

        /**
         * @brief Drops the data and exit signals of a session. Connections still held for it become
         * disconnected.
         */
        void forget(Ids::SessionId const& sessionId);
        bool tracks(Ids::SessionId const& sessionId) const;

        /**
         * @brief Decodes a raw event and emits it.
         *
         * @return false if the channel is unknown or the payload could not be decoded. Such events are logged
         * and dropped.
         */
        bool dispatch(std::string_view channel, nlohmann::json const& payload);

        void emit(SharedData::SessionData const& event);
        void emit(SharedData::SessionExit const& event);
        void emit(SharedData::TransferProgress const& event);
        void emit(SharedData::TransferSuccess const& event);
        void emit(SharedData::TransferError const& event);
        void emit(SharedData::ConnectionStatusChange const& event);

      private:
        std::unordered_map<Ids::SessionId, std::unique_ptr<SessionDataSignal>, Ids::IdHash> sessionData_{};
        std::unordered_map<Ids::SessionId, std::unique_ptr<SessionExitSignal>, Ids::IdHash> sessionExit_{};
        boost::signals2::signal<void(SharedData::TransferProgress const&)> transferProgress_{};
        boost::signals2::signal<void(SharedData::TransferSuccess const&)> transferSuccess_{};
        boost::signals2::signal<void(SharedData::TransferError const&)> transferError_{};
        boost::signals2::signal<void(SharedData::ConnectionStatusChange const&)> connectionStatusChange_{};
    };
}
