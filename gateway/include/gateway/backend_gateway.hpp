#pragma once

#include <gateway/error.hpp>
#include <gateway/event_hub.hpp>
#include <ids/ids.hpp>
#include <shared_data/connection_config.hpp>
#include <shared_data/directory_entry.hpp>
#include <shared_data/transfer.hpp>
#include <shared_data/tunnel_config.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Gateway
{
    struct ConnectResult
    {
        std::optional<std::string> detectedOs{std::nullopt};
    };

    struct SpawnRequest
    {
        Ids::SessionId sessionId{};
        Ids::ConnectionId connectionId{};
        int rows{24};
        int cols{80};
    };

    /**
     * @brief Request/response and push-event interface to the backend that owns the actual network
     * connections, shells and file transfers.
     *
     * Every request is asynchronous. Implementations complete each handler exactly once, on the executor
     * the orchestration runs on.
     */
    class BackendGateway
    {
      public:
        template <typename T>
        using Handler = std::function<void(std::expected<T, Error> const&)>;

        virtual ~BackendGateway() = default;

        virtual void connect(SharedData::ConnectionConfig const& config, Handler<ConnectResult> onComplete) = 0;
        virtual void disconnect(Ids::ConnectionId const& connectionId, Handler<void> onComplete) = 0;
        virtual void homePath(Ids::ConnectionId const& connectionId, Handler<std::string> onComplete) = 0;

        virtual void spawnSession(SpawnRequest const& request, Handler<void> onComplete) = 0;
        virtual void write(Ids::SessionId const& sessionId, std::string const& data, Handler<void> onComplete) = 0;
        virtual void resize(Ids::SessionId const& sessionId, int rows, int cols, Handler<void> onComplete) = 0;
        virtual void closeSession(Ids::SessionId const& sessionId, Handler<void> onComplete) = 0;

        /// Completes once the copy finished or failed. Progress arrives through the event hub meanwhile.
        virtual void startTransfer(SharedData::TransferRequest const& request, Handler<void> onComplete) = 0;
        virtual void cancelTransfer(Ids::TransferId const& transferId, Handler<void> onComplete) = 0;

        virtual void listDirectory(
            Ids::ConnectionId const& connectionId,
            std::string const& path,
            Handler<std::vector<SharedData::DirectoryEntry>> onComplete) = 0;
        virtual void rename(
            Ids::ConnectionId const& connectionId,
            std::string const& from,
            std::string const& to,
            Handler<void> onComplete) = 0;

        virtual void saveConnections(nlohmann::json const& document, Handler<void> onComplete) = 0;
        virtual void loadConnections(Handler<nlohmann::json> onComplete) = 0;

        virtual void listTunnels(
            Ids::ConnectionId const& connectionId,
            Handler<std::vector<SharedData::TunnelConfig>> onComplete) = 0;
        virtual void
        startTunnel(Ids::TunnelId const& tunnelId, Ids::ConnectionId const& connectionId, Handler<void> onComplete) = 0;
        virtual void
        stopTunnel(Ids::TunnelId const& tunnelId, Ids::ConnectionId const& connectionId, Handler<void> onComplete) = 0;

        virtual EventHub& events() = 0;
    };
}
