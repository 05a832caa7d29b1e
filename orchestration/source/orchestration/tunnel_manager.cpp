#include <orchestration/tunnel_manager.hpp>
#include <orchestration/transitions/tunnels.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <vector>

namespace Orchestration
{
    TunnelManager::TunnelManager(std::shared_ptr<Gateway::BackendGateway> gateway, std::shared_ptr<Store> store)
        : gateway_{std::move(gateway)}
        , store_{std::move(store)}
    {}

    void TunnelManager::loadTunnels(Ids::ConnectionId const& connectionId, std::function<void(bool)> onLoaded)
    {
        gateway_->listTunnels(
            connectionId,
            [weak = weak_from_this(), connectionId, onLoaded = std::move(onLoaded)](
                std::expected<std::vector<SharedData::TunnelConfig>, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (!result)
                {
                    Log::error("Failed to load tunnels of '{}': {}", connectionId.value(), result.error().message);
                    if (onLoaded)
                        onLoaded(false);
                    return;
                }

                self->store_->transition([&](State state) {
                    return Transitions::setTunnels(std::move(state), connectionId, *result);
                });
                if (onLoaded)
                    onLoaded(true);
            });
    }

    void TunnelManager::startTunnel(
        Ids::TunnelId const& tunnelId,
        Ids::ConnectionId const& connectionId,
        std::function<void(bool)> onDone)
    {
        store_->transition([&](State state) {
            return Transitions::setTunnelStatus(std::move(state), connectionId, tunnelId, TunnelStatus::Starting);
        });

        gateway_->startTunnel(
            tunnelId,
            connectionId,
            [weak = weak_from_this(), tunnelId, connectionId, onDone = std::move(onDone)](
                std::expected<void, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (result)
                {
                    Log::info("Tunnel '{}' of '{}' is active.", tunnelId.value(), connectionId.value());
                    self->store_->transition([&](State state) {
                        return Transitions::setTunnelStatus(
                            std::move(state), connectionId, tunnelId, TunnelStatus::Active);
                    });
                }
                else
                {
                    Log::error("Failed to start tunnel '{}': {}", tunnelId.value(), result.error().message);
                    self->store_->transition([&](State state) {
                        return Transitions::setTunnelStatus(
                            std::move(state), connectionId, tunnelId, TunnelStatus::Error, result.error().message);
                    });
                }
                if (onDone)
                    onDone(result.has_value());
            });
    }

    void TunnelManager::stopTunnel(Ids::TunnelId const& tunnelId, Ids::ConnectionId const& connectionId)
    {
        gateway_->stopTunnel(
            tunnelId,
            connectionId,
            [weak = weak_from_this(), tunnelId, connectionId](std::expected<void, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (!result)
                {
                    self->store_->notify(
                        Log::Level::Error, fmt::format("Failed to stop tunnel: {}", result.error().message));
                    return;
                }
                self->store_->transition([&](State state) {
                    return Transitions::setTunnelStatus(
                        std::move(state), connectionId, tunnelId, TunnelStatus::Stopped);
                });
            });
    }

    void TunnelManager::autoStart(Ids::ConnectionId const& connectionId, std::function<void(std::size_t)> onDone)
    {
        if (!onDone)
            onDone = [](std::size_t) {};
        loadTunnels(connectionId, [weak = weak_from_this(), connectionId, onDone = std::move(onDone)](bool loaded) {
            auto self = weak.lock();
            if (!self)
                return;

            std::vector<Ids::TunnelId> pending{};
            if (loaded)
            {
                if (auto iter = self->store_->state().tunnels.find(connectionId);
                    iter != self->store_->state().tunnels.end())
                {
                    for (auto const& tunnel : iter->second)
                    {
                        if (tunnel.config.autoStart && tunnel.status != TunnelStatus::Active)
                            pending.push_back(tunnel.config.id);
                    }
                }
            }

            if (pending.empty())
            {
                onDone(0);
                return;
            }

            Log::info("Auto starting {} tunnel(s) of '{}'.", pending.size(), connectionId.value());
            struct Progress
            {
                std::size_t remaining;
                std::size_t started;
            };
            auto progress = std::make_shared<Progress>(Progress{.remaining = pending.size(), .started = 0});
            for (auto const& tunnelId : pending)
            {
                self->startTunnel(tunnelId, connectionId, [progress, onDone](bool started) {
                    if (started)
                        ++progress->started;
                    if (--progress->remaining == 0)
                        onDone(progress->started);
                });
            }
        });
    }
}
