#pragma once

#include <gateway/backend_gateway.hpp>
#include <gateway/transport.hpp>

#include <roar/detail/pimpl_special_functions.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <memory>

namespace Gateway
{
    /**
     * @brief BackendGateway on top of a channel based Transport. Replies and events are re-posted onto the
     * executor before any handler runs.
     */
    class RpcGateway : public BackendGateway
    {
      public:
        RpcGateway(boost::asio::any_io_executor executor, Transport& transport);
        ROAR_PIMPL_SPECIAL_FUNCTIONS(RpcGateway);

        void connect(SharedData::ConnectionConfig const& config, Handler<ConnectResult> onComplete) override;
        void disconnect(Ids::ConnectionId const& connectionId, Handler<void> onComplete) override;
        void homePath(Ids::ConnectionId const& connectionId, Handler<std::string> onComplete) override;

        void spawnSession(SpawnRequest const& request, Handler<void> onComplete) override;
        void write(Ids::SessionId const& sessionId, std::string const& data, Handler<void> onComplete) override;
        void resize(Ids::SessionId const& sessionId, int rows, int cols, Handler<void> onComplete) override;
        void closeSession(Ids::SessionId const& sessionId, Handler<void> onComplete) override;

        void startTransfer(SharedData::TransferRequest const& request, Handler<void> onComplete) override;
        void cancelTransfer(Ids::TransferId const& transferId, Handler<void> onComplete) override;

        void listDirectory(
            Ids::ConnectionId const& connectionId,
            std::string const& path,
            Handler<std::vector<SharedData::DirectoryEntry>> onComplete) override;
        void rename(
            Ids::ConnectionId const& connectionId,
            std::string const& from,
            std::string const& to,
            Handler<void> onComplete) override;

        void saveConnections(nlohmann::json const& document, Handler<void> onComplete) override;
        void loadConnections(Handler<nlohmann::json> onComplete) override;

        void listTunnels(
            Ids::ConnectionId const& connectionId,
            Handler<std::vector<SharedData::TunnelConfig>> onComplete) override;
        void startTunnel(Ids::TunnelId const& tunnelId, Ids::ConnectionId const& connectionId, Handler<void> onComplete)
            override;
        void stopTunnel(Ids::TunnelId const& tunnelId, Ids::ConnectionId const& connectionId, Handler<void> onComplete)
            override;

        EventHub& events() override;

      private:
        struct Implementation;
        std::shared_ptr<Implementation> impl_;
    };
}
