#pragma once

#include <gateway/backend_gateway.hpp>
#include <orchestration/connection_registry.hpp>
#include <orchestration/options.hpp>
#include <orchestration/session_cache.hpp>
#include <orchestration/store.hpp>
#include <orchestration/tab_router.hpp>
#include <orchestration/transfer_coordinator.hpp>
#include <orchestration/tunnel_manager.hpp>

#include <roar/detail/pimpl_special_functions.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <functional>
#include <memory>
#include <optional>

namespace Orchestration
{
    /**
     * @brief Wires all orchestration components to one store and one backend gateway.
     *
     * Every member function and every gateway completion must run on the given executor.
     */
    class Orchestrator
    {
      public:
        Orchestrator(
            boost::asio::any_io_executor executor,
            std::shared_ptr<Gateway::BackendGateway> gateway,
            Options options = {});
        ROAR_PIMPL_SPECIAL_FUNCTIONS(Orchestrator);

        /// Loads the stored connections.
        void start(std::function<void(bool)> onStarted = {});

        Store& store();
        ConnectionRegistry& connections();
        TabRouter& tabs();
        SessionCache& sessions();
        TransferCoordinator& transfers();
        TunnelManager& tunnels();

        State const& state() const;
        Tab const* activeTab() const;
        std::optional<Ids::ConnectionId> const& activeConnectionId() const;

      private:
        struct Implementation;
        std::unique_ptr<Implementation> impl_;
    };
}
