#include <orchestration/session_cache.hpp>
#include <orchestration/transitions/terminals.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <vector>

namespace Orchestration
{
    TerminalResource::TerminalResource(Ids::SessionId sessionId, Ids::ConnectionId owner, std::size_t scrollbackLimit)
        : sessionId_{std::move(sessionId)}
        , owner_{std::move(owner)}
        , scrollbackLimit_{scrollbackLimit}
    {}

    void TerminalResource::attach(TerminalSurface& surface)
    {
        surface_ = &surface;
        if (!scrollback_.empty())
            surface.write(scrollback_);
        if (exited_)
            surface.exited(exitCode_);
    }

    void TerminalResource::detach(TerminalSurface const& surface)
    {
        if (surface_ == &surface)
            surface_ = nullptr;
    }

    bool TerminalResource::attached() const
    {
        return surface_ != nullptr;
    }

    void TerminalResource::feed(std::string const& data)
    {
        scrollback_ += data;
        if (scrollback_.size() > scrollbackLimit_)
            scrollback_.erase(0, scrollback_.size() - scrollbackLimit_);

        if (surface_ != nullptr)
            surface_->write(data);
    }

    void TerminalResource::markExited(std::optional<int> exitCode)
    {
        exited_ = true;
        exitCode_ = exitCode;
        if (surface_ != nullptr)
            surface_->exited(exitCode);
    }

    SessionCache::SessionCache(std::shared_ptr<Gateway::BackendGateway> gateway, std::shared_ptr<Store> store)
        : gateway_{std::move(gateway)}
        , store_{std::move(store)}
    {}

    TerminalResource&
    SessionCache::acquire(Ids::SessionId const& sessionId, Ids::ConnectionId const& owner, TerminalSurface* surface)
    {
        auto iter = resources_.find(sessionId);
        if (iter == resources_.end())
        {
            auto resource =
                std::make_unique<TerminalResource>(sessionId, owner, store_->options().scrollbackLimitBytes);

            // The resource owns the subscriptions, they end with it.
            auto* raw = resource.get();
            resource->dataSubscription_ = gateway_->events().onSessionData(sessionId, [raw](std::string const& data) {
                raw->feed(data);
            });
            resource->exitSubscription_ =
                gateway_->events().onSessionExit(sessionId, [raw](std::optional<int> exitCode) {
                    Log::info("Session '{}' exited.", raw->sessionId().value());
                    raw->markExited(exitCode);
                });

            Log::debug("Created terminal resource for session '{}'.", sessionId.value());
            iter = resources_.emplace(sessionId, std::move(resource)).first;
        }

        if (surface != nullptr)
            iter->second->attach(*surface);
        return *iter->second;
    }

    void SessionCache::ensureSpawned(
        Ids::SessionId const& sessionId,
        Ids::ConnectionId const& connectionId,
        int rows,
        int cols)
    {
        auto& resource = acquire(sessionId, connectionId);
        if (resource.spawned_)
            return;
        resource.spawned_ = true;

        Log::info("Spawning session '{}' on '{}' ({}x{}).", sessionId.value(), connectionId.value(), cols, rows);
        gateway_->spawnSession(
            Gateway::SpawnRequest{.sessionId = sessionId, .connectionId = connectionId, .rows = rows, .cols = cols},
            [weak = weak_from_this(), sessionId](std::expected<void, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self || result)
                    return;

                auto* resource = self->find(sessionId);
                if (resource == nullptr)
                {
                    Log::warn("Spawn of released session '{}' failed: {}", sessionId.value(), result.error().message);
                    return;
                }
                resource->spawnError_ = result.error().message;
                self->store_->notify(
                    Log::Level::Error, fmt::format("Could not open terminal: {}", result.error().toString()));
            });
    }

    void SessionCache::write(Ids::SessionId const& sessionId, std::string const& data)
    {
        gateway_->write(sessionId, data, [sessionId](std::expected<void, Gateway::Error> const& result) {
            if (!result)
                Log::error("Writing to session '{}' failed: {}", sessionId.value(), result.error().message);
        });
    }

    void SessionCache::resize(Ids::SessionId const& sessionId, int rows, int cols)
    {
        gateway_->resize(sessionId, rows, cols, [sessionId](std::expected<void, Gateway::Error> const& result) {
            if (!result)
                Log::error("Resizing session '{}' failed: {}", sessionId.value(), result.error().message);
        });
    }

    void SessionCache::release(Ids::SessionId const& sessionId)
    {
        if (resources_.erase(sessionId) > 0)
            Log::debug("Released terminal resource of session '{}'.", sessionId.value());
        gateway_->events().forget(sessionId);
    }

    void SessionCache::releaseAllOf(Ids::ConnectionId const& owner)
    {
        std::vector<Ids::SessionId> owned{};
        for (auto const& [sessionId, resource] : resources_)
        {
            if (resource->owner() == owner)
                owned.push_back(sessionId);
        }
        for (auto const& sessionId : owned)
            release(sessionId);
    }

    bool SessionCache::contains(Ids::SessionId const& sessionId) const
    {
        return resources_.contains(sessionId);
    }

    TerminalResource* SessionCache::find(Ids::SessionId const& sessionId)
    {
        auto iter = resources_.find(sessionId);
        return iter == resources_.end() ? nullptr : iter->second.get();
    }

    std::size_t SessionCache::size() const
    {
        return resources_.size();
    }

    Ids::SessionId SessionCache::createTerminal(Ids::ConnectionId const& connectionId)
    {
        auto sessionId = Ids::generateTerminalSessionId();
        store_->transition([&](State state) {
            return Transitions::addTerminal(std::move(state), connectionId, sessionId);
        });
        acquire(sessionId, connectionId);
        return sessionId;
    }

    Ids::SessionId SessionCache::ensureTerminal(Ids::ConnectionId const& connectionId)
    {
        auto const& state = store_->state();
        if (auto active = state.activeTerminalIds.find(connectionId); active != state.activeTerminalIds.end())
            return active->second;
        return createTerminal(connectionId);
    }

    void SessionCache::setActiveTerminal(Ids::ConnectionId const& connectionId, Ids::SessionId const& sessionId)
    {
        store_->transition([&](State state) {
            return Transitions::setActiveTerminal(std::move(state), connectionId, sessionId);
        });
    }

    void SessionCache::closeTerminal(Ids::ConnectionId const& connectionId, Ids::SessionId const& sessionId)
    {
        if (auto* resource = find(sessionId); resource != nullptr)
            closeSession(*resource);
        release(sessionId);
        store_->transition([&](State state) {
            return Transitions::removeTerminal(std::move(state), connectionId, sessionId);
        });
    }

    void SessionCache::clearTerminals(Ids::ConnectionId const& connectionId, bool closeSessions)
    {
        std::vector<Ids::SessionId> sessions{};
        if (auto iter = store_->state().terminals.find(connectionId); iter != store_->state().terminals.end())
        {
            for (auto const& terminal : iter->second)
                sessions.push_back(terminal.sessionId);
        }
        for (auto const& [sessionId, resource] : resources_)
        {
            if (resource->owner() == connectionId &&
                std::find(sessions.begin(), sessions.end(), sessionId) == sessions.end())
                sessions.push_back(sessionId);
        }

        for (auto const& sessionId : sessions)
        {
            if (auto* resource = find(sessionId); resource != nullptr && closeSessions)
                closeSession(*resource);
        }
        releaseAllOf(connectionId);
        for (auto const& sessionId : sessions)
            release(sessionId);

        store_->transition([&](State state) {
            return Transitions::clearTerminals(std::move(state), connectionId);
        });
    }

    void SessionCache::closeSession(TerminalResource const& resource)
    {
        if (!resource.spawned() || resource.exited() || resource.spawnError())
            return;

        gateway_->closeSession(
            resource.sessionId(),
            [sessionId = resource.sessionId()](std::expected<void, Gateway::Error> const& result) {
                if (!result)
                    Log::warn("Closing session '{}' failed: {}", sessionId.value(), result.error().message);
            });
    }
}
