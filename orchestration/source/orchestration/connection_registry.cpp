#include <orchestration/connection_registry.hpp>
#include <orchestration/jump_chain.hpp>
#include <orchestration/transitions/connections.hpp>
#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>

#include <chrono>
#include <string_view>

namespace Orchestration
{
    namespace
    {
        constexpr std::string_view portForwardingFeature = "port-forwarding";

        std::int64_t nowMillis()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }
    }

    ConnectionRegistry::ConnectionRegistry(
        std::shared_ptr<Gateway::BackendGateway> gateway,
        std::shared_ptr<Store> store,
        std::shared_ptr<SessionCache> sessionCache,
        std::shared_ptr<TunnelManager> tunnelManager)
        : gateway_{std::move(gateway)}
        , store_{std::move(store)}
        , sessionCache_{std::move(sessionCache)}
        , tunnelManager_{std::move(tunnelManager)}
        , statusSubscription_{gateway_->events().onConnectionStatusChange(
              [this](SharedData::ConnectionStatusChange const& event) {
                  onStatusChange(event);
              })}
    {}

    void ConnectionRegistry::connect(Ids::ConnectionId const& id, ConnectHandler onComplete)
    {
        if (Ids::isLocal(id))
        {
            if (onComplete)
                onComplete(true);
            return;
        }

        auto const* entry = find(id);
        if (entry == nullptr)
        {
            store_->notify(Log::Level::Error, fmt::format("Connection '{}' does not exist.", id.value()));
            if (onComplete)
                onComplete(false);
            return;
        }
        if (entry->status == SharedData::ConnectionStatus::Connected)
        {
            if (onComplete)
                onComplete(true);
            return;
        }

        if (auto pending = pendingConnects_.find(id); pending != pendingConnects_.end())
        {
            Log::debug("Connect to '{}' is already in flight.", id.value());
            pending->second.push_back(std::move(onComplete));
            return;
        }
        pendingConnects_[id].push_back(std::move(onComplete));

        const auto jumpServerId = entry->record.jumpServerId;
        Log::info("Connecting to '{}'.", displayNameOf(id));
        store_->transition([&](State state) {
            return Transitions::markConnecting(std::move(state), id);
        });

        auto config = resolveJumpChain(store_->state().connections, id, store_->options().maxJumpDepth);
        if (!config)
        {
            Log::error(
                "Jump host chain of '{}' cannot be resolved ({}): {}",
                id.value(),
                Utility::enumToLowerString(config.error().reason),
                config.error().toString());
            failConnect(id, config.error().toString());
            return;
        }

        if (jumpServerId)
        {
            auto const* jumpHost = find(*jumpServerId);
            if (jumpHost != nullptr && jumpHost->status != SharedData::ConnectionStatus::Connected)
            {
                Log::info("Connecting jump host '{}' of '{}' first.", displayNameOf(*jumpServerId), id.value());
                connect(
                    *jumpServerId,
                    [weak = weak_from_this(), id, jumpServerId = *jumpServerId, config = *config](bool connected) {
                        auto self = weak.lock();
                        if (!self)
                            return;
                        if (self->find(id) == nullptr)
                        {
                            self->completePending(id, false);
                            return;
                        }
                        // The backend gets the complete chain anyway, so the target is still attempted.
                        if (!connected)
                            Log::warn("Jump host '{}' could not be connected on its own.", jumpServerId.value());
                        self->issueConnect(id, config);
                    });
                return;
            }
        }
        issueConnect(id, *config);
    }

    void ConnectionRegistry::issueConnect(Ids::ConnectionId const& id, SharedData::ConnectionConfig const& config)
    {
        Log::debug("Sending connect for '{}' with {} host(s) in the chain.", id.value(), config.nestingDepth());
        gateway_->connect(
            config,
            [weak = weak_from_this(), id](std::expected<Gateway::ConnectResult, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (!result)
                    self->failConnect(id, result.error().message);
                else
                    self->onConnected(id, *result);
            });
    }

    void ConnectionRegistry::onConnected(Ids::ConnectionId const& id, Gateway::ConnectResult const& result)
    {
        if (find(id) == nullptr)
        {
            Log::info("Connection '{}' was deleted while connecting, disconnecting it.", id.value());
            gateway_->disconnect(id, [id](std::expected<void, Gateway::Error> const& disconnected) {
                if (!disconnected)
                    Log::warn(
                        "Disconnect of deleted connection '{}' failed: {}", id.value(), disconnected.error().message);
            });
            completePending(id, false);
            return;
        }

        Log::info("Connected to '{}'.", displayNameOf(id));
        store_->transition([&](State state) {
            return Transitions::markConnected(std::move(state), id, nowMillis(), result.detectedOs);
        });
        saveConnections();
        fetchHomePath(id);

        tunnelManager_->autoStart(id, [weak = weak_from_this(), id](std::size_t started) {
            auto self = weak.lock();
            if (!self || started == 0)
                return;

            auto const* entry = self->find(id);
            if (entry == nullptr || entry->record.hasPinnedFeature(std::string{portForwardingFeature}))
                return;
            self->transitionAndSave([&](State state) {
                return Transitions::pinConnectionFeature(std::move(state), id, std::string{portForwardingFeature});
            });
        });

        completePending(id, true);
    }

    void ConnectionRegistry::failConnect(Ids::ConnectionId const& id, std::string const& message)
    {
        if (find(id) == nullptr)
        {
            Log::debug("Dropping connect failure of deleted connection '{}': {}", id.value(), message);
            completePending(id, false);
            return;
        }

        Log::error("Connection to '{}' failed: {}", id.value(), message);
        store_->transition([&](State state) {
            return Transitions::markConnectFailed(std::move(state), id, message);
        });
        store_->notify(Log::Level::Error, fmt::format("Connection to '{}' failed: {}", displayNameOf(id), message));
        completePending(id, false);
    }

    void ConnectionRegistry::completePending(Ids::ConnectionId const& id, bool connected)
    {
        auto iter = pendingConnects_.find(id);
        if (iter == pendingConnects_.end())
            return;

        auto handlers = std::move(iter->second);
        pendingConnects_.erase(iter);
        for (auto const& handler : handlers)
        {
            if (handler)
                handler(connected);
        }
    }

    void ConnectionRegistry::fetchHomePath(Ids::ConnectionId const& id)
    {
        gateway_->homePath(
            id, [weak = weak_from_this(), id](std::expected<std::string, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self)
                    return;

                std::string homePath = "/";
                if (result && !result->empty())
                    homePath = *result;
                else if (!result)
                    Log::warn("Could not determine home path of '{}': {}", id.value(), result.error().message);

                self->store_->transition([&](State state) {
                    return Transitions::setHomePath(std::move(state), id, homePath);
                });
            });
    }

    void ConnectionRegistry::disconnect(Ids::ConnectionId const& id, std::function<void()> onComplete)
    {
        if (Ids::isLocal(id))
        {
            sessionCache_->clearTerminals(id);
            if (onComplete)
                onComplete();
            return;
        }

        Log::info("Disconnecting '{}'.", displayNameOf(id));
        gateway_->disconnect(
            id,
            [weak = weak_from_this(), id, onComplete = std::move(onComplete)](
                std::expected<void, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (!result)
                    Log::error("Disconnect of '{}' failed: {}", id.value(), result.error().message);

                self->store_->transition([&](State state) {
                    return Transitions::markDisconnected(std::move(state), id);
                });
                self->sessionCache_->clearTerminals(id, false);
                if (onComplete)
                    onComplete();
            });
    }

    void ConnectionRegistry::loadConnections(std::function<void(bool)> onLoaded)
    {
        if (!onLoaded)
            onLoaded = [](bool) {};

        gateway_->loadConnections(
            [weak = weak_from_this(), onLoaded = std::move(onLoaded)](
                std::expected<nlohmann::json, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (!result)
                {
                    self->store_->notify(
                        Log::Level::Error, fmt::format("Failed to load connections: {}", result.error().message));
                    onLoaded(false);
                    return;
                }

                auto fixed = self->stateHolder_.load(*result);
                if (!fixed)
                {
                    self->store_->notify(
                        Log::Level::Error, fmt::format("Connections document is invalid: {}", fixed.error()));
                    onLoaded(false);
                    return;
                }

                auto const& persisted = self->stateHolder_.stateCache();
                self->store_->setOptions(Options::fromPersistence(persisted.options));
                if (persisted.options.logLevel)
                    Log::setLevel(Log::levelFromString(*persisted.options.logLevel));

                self->store_->transition([&](State state) {
                    return Transitions::loadConnections(std::move(state), persisted);
                });
                Log::info("Loaded {} connection(s).", persisted.connections.size());

                if (*fixed)
                    self->saveConnections();
                onLoaded(true);
            });
    }

    void ConnectionRegistry::saveConnections()
    {
        auto& cache = stateHolder_.stateCache();
        cache = Transitions::toPersistence(store_->state(), cache.options);

        gateway_->saveConnections(
            stateHolder_.serialize(), [weak = weak_from_this()](std::expected<void, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self || result)
                    return;
                self->store_->notify(
                    Log::Level::Error, fmt::format("Failed to save connections: {}", result.error().message));
            });
    }

    void ConnectionRegistry::addConnection(Persistence::Connection const& connection, bool temporary)
    {
        store_->transition([&](State state) {
            return Transitions::addConnection(std::move(state), connection);
        });
        if (!temporary)
            saveConnections();
    }

    void ConnectionRegistry::editConnection(Persistence::Connection const& connection)
    {
        transitionAndSave([&](State state) {
            return Transitions::editConnection(std::move(state), connection);
        });
    }

    void ConnectionRegistry::deleteConnection(Ids::ConnectionId const& id)
    {
        auto const* entry = find(id);
        if (entry == nullptr)
            return;

        // A connect still in flight is disconnected once its reply arrives.
        if (entry->status == SharedData::ConnectionStatus::Connected)
            disconnect(id);
        sessionCache_->releaseAllOf(id);

        Log::info("Deleting connection '{}'.", id.value());
        transitionAndSave([&](State state) {
            return Transitions::deleteConnection(std::move(state), id);
        });
    }

    void ConnectionRegistry::importConnections(std::vector<Persistence::Connection> const& connections)
    {
        Log::info("Importing {} connection(s).", connections.size());
        transitionAndSave([&](State state) {
            return Transitions::importConnections(std::move(state), connections);
        });
    }

    void ConnectionRegistry::clearConnections()
    {
        std::vector<Ids::ConnectionId> ids{};
        for (auto const& entry : connections())
            ids.push_back(entry.record.id);

        Log::info("Clearing {} connection(s).", ids.size());
        for (auto const& id : ids)
        {
            auto const* entry = find(id);
            if (entry != nullptr && entry->status == SharedData::ConnectionStatus::Connected)
                disconnect(id);
            sessionCache_->clearTerminals(id, false);
        }
        // every tab goes away, local ones included
        sessionCache_->clearTerminals(Ids::localConnectionId());

        transitionAndSave([](State state) {
            return Transitions::clearConnections(std::move(state));
        });
    }

    void ConnectionRegistry::addFolder(std::string const& name, std::vector<std::string> const& tags)
    {
        transitionAndSave([&](State state) {
            return Transitions::addFolder(std::move(state), name, tags);
        });
    }

    void ConnectionRegistry::deleteFolder(std::string const& name)
    {
        transitionAndSave([&](State state) {
            return Transitions::deleteFolder(std::move(state), name);
        });
    }

    void ConnectionRegistry::renameFolder(
        std::string const& oldName,
        std::string const& newName,
        std::optional<std::vector<std::string>> const& newTags)
    {
        transitionAndSave([&](State state) {
            return Transitions::renameFolder(std::move(state), oldName, newName, newTags);
        });
    }

    void ConnectionRegistry::updateConnectionFolder(Ids::ConnectionId const& id, std::optional<std::string> const& folder)
    {
        transitionAndSave([&](State state) {
            return Transitions::updateConnectionFolder(std::move(state), id, folder);
        });
    }

    void ConnectionRegistry::toggleFavorite(Ids::ConnectionId const& id)
    {
        transitionAndSave([&](State state) {
            return Transitions::toggleFavorite(std::move(state), id);
        });
    }

    void ConnectionRegistry::toggleConnectionFeature(Ids::ConnectionId const& id, std::string const& feature)
    {
        transitionAndSave([&](State state) {
            return Transitions::toggleConnectionFeature(std::move(state), id, feature);
        });
    }

    std::vector<ConnectionEntry> const& ConnectionRegistry::connections() const
    {
        return store_->state().connections;
    }

    ConnectionEntry const* ConnectionRegistry::find(Ids::ConnectionId const& id) const
    {
        return store_->state().findConnection(id);
    }

    void ConnectionRegistry::onStatusChange(SharedData::ConnectionStatusChange const& event)
    {
        if (find(event.connectionId) == nullptr)
        {
            Log::debug("Ignoring status change of unknown connection '{}'.", event.connectionId.value());
            return;
        }

        Log::info(
            "Backend reports '{}' as {}.", event.connectionId.value(), Utility::enumToLowerString(event.status));
        store_->transition([&](State state) {
            return Transitions::applyStatusChange(std::move(state), event.connectionId, event.status, event.error);
        });

        if (event.status == SharedData::ConnectionStatus::Error)
            store_->notify(
                Log::Level::Error,
                fmt::format(
                    "Connection '{}' reported an error: {}",
                    displayNameOf(event.connectionId),
                    event.error.value_or("unknown error")));
    }

    std::string ConnectionRegistry::displayNameOf(Ids::ConnectionId const& id) const
    {
        if (auto const* entry = find(id); entry != nullptr)
            return entry->record.displayName();
        return id.value();
    }
}
