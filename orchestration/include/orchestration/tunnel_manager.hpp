#pragma once

#include <gateway/backend_gateway.hpp>
#include <orchestration/store.hpp>

#include <cstddef>
#include <functional>
#include <memory>

namespace Orchestration
{
    /**
     * @brief Keeps the tunnel list per connection and drives start/stop through the backend.
     */
    class TunnelManager : public std::enable_shared_from_this<TunnelManager>
    {
      public:
        TunnelManager(std::shared_ptr<Gateway::BackendGateway> gateway, std::shared_ptr<Store> store);
        TunnelManager(TunnelManager const&) = delete;
        TunnelManager& operator=(TunnelManager const&) = delete;
        TunnelManager(TunnelManager&&) = delete;
        TunnelManager& operator=(TunnelManager&&) = delete;
        ~TunnelManager() = default;

        void loadTunnels(Ids::ConnectionId const& connectionId, std::function<void(bool)> onLoaded = {});
        void startTunnel(
            Ids::TunnelId const& tunnelId,
            Ids::ConnectionId const& connectionId,
            std::function<void(bool)> onDone = {});
        void stopTunnel(Ids::TunnelId const& tunnelId, Ids::ConnectionId const& connectionId);

        /**
         * @brief Loads the tunnels of the connection and starts every one flagged autoStart.
         * Individual failures are logged and leave that tunnel in error.
         *
         * @param onDone Receives the number of tunnels that were started successfully.
         */
        void autoStart(Ids::ConnectionId const& connectionId, std::function<void(std::size_t)> onDone);

      private:
        std::shared_ptr<Gateway::BackendGateway> gateway_;
        std::shared_ptr<Store> store_;
    };
}
