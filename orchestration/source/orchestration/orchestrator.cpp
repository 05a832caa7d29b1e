#include <orchestration/orchestrator.hpp>
#include <log/log.hpp>

namespace Orchestration
{
    struct Orchestrator::Implementation
    {
        std::shared_ptr<Store> store;
        std::shared_ptr<SessionCache> sessions;
        std::shared_ptr<TunnelManager> tunnels;
        std::shared_ptr<ConnectionRegistry> connections;
        std::shared_ptr<TransferCoordinator> transfers;
        TabRouter tabs;

        Implementation(
            boost::asio::any_io_executor executor,
            std::shared_ptr<Gateway::BackendGateway> const& gateway,
            Options options)
            : store{std::make_shared<Store>(std::move(options))}
            , sessions{std::make_shared<SessionCache>(gateway, store)}
            , tunnels{std::make_shared<TunnelManager>(gateway, store)}
            , connections{std::make_shared<ConnectionRegistry>(gateway, store, sessions, tunnels)}
            , transfers{std::make_shared<TransferCoordinator>(std::move(executor), gateway, store, connections)}
            , tabs{store, connections, sessions}
        {}
    };

    Orchestrator::Orchestrator(
        boost::asio::any_io_executor executor,
        std::shared_ptr<Gateway::BackendGateway> gateway,
        Options options)
        : impl_{std::make_unique<Implementation>(std::move(executor), gateway, std::move(options))}
    {}

    ROAR_PIMPL_SPECIAL_FUNCTIONS_IMPL(Orchestrator);

    void Orchestrator::start(std::function<void(bool)> onStarted)
    {
        Log::info("Starting orchestration.");
        impl_->connections->loadConnections(std::move(onStarted));
    }

    Store& Orchestrator::store()
    {
        return *impl_->store;
    }

    ConnectionRegistry& Orchestrator::connections()
    {
        return *impl_->connections;
    }

    TabRouter& Orchestrator::tabs()
    {
        return impl_->tabs;
    }

    SessionCache& Orchestrator::sessions()
    {
        return *impl_->sessions;
    }

    TransferCoordinator& Orchestrator::transfers()
    {
        return *impl_->transfers;
    }

    TunnelManager& Orchestrator::tunnels()
    {
        return *impl_->tunnels;
    }

    State const& Orchestrator::state() const
    {
        return impl_->store->state();
    }

    Tab const* Orchestrator::activeTab() const
    {
        return impl_->store->state().activeTab();
    }

    std::optional<Ids::ConnectionId> const& Orchestrator::activeConnectionId() const
    {
        return impl_->store->state().activeConnectionId;
    }
}
