#include <gateway/event_hub.hpp>
#include <gateway/command.hpp>
#include <log/log.hpp>

namespace Gateway
{
    namespace
    {
        template <typename SignalT, typename MapT>
        SignalT& signalFor(MapT& map, Ids::SessionId const& sessionId)
        {
            auto& slot = map[sessionId];
            if (!slot)
                slot = std::make_unique<SignalT>();
            return *slot;
        }

        // Emits to the session's subscribers and forgets the signal once nobody listens anymore.
        template <typename MapT, typename... Args>
        void emitFor(MapT& map, Ids::SessionId const& sessionId, Args&&... args)
        {
            auto iter = map.find(sessionId);
            if (iter == map.end())
                return;
            if (iter->second->num_slots() == 0)
            {
                map.erase(iter);
                return;
            }
            (*iter->second)(std::forward<Args>(args)...);
        }
    }

    boost::signals2::connection
    EventHub::onSessionData(Ids::SessionId const& sessionId, std::function<void(std::string const&)> handler)
    {
        return signalFor<SessionDataSignal>(sessionData_, sessionId).connect(std::move(handler));
    }
    boost::signals2::connection
    EventHub::onSessionExit(Ids::SessionId const& sessionId, std::function<void(std::optional<int>)> handler)
    {
        return signalFor<SessionExitSignal>(sessionExit_, sessionId).connect(std::move(handler));
    }
    boost::signals2::connection
    EventHub::onTransferProgress(std::function<void(SharedData::TransferProgress const&)> handler)
    {
        return transferProgress_.connect(std::move(handler));
    }
    boost::signals2::connection
    EventHub::onTransferSuccess(std::function<void(SharedData::TransferSuccess const&)> handler)
    {
        return transferSuccess_.connect(std::move(handler));
    }
    boost::signals2::connection
    EventHub::onTransferError(std::function<void(SharedData::TransferError const&)> handler)
    {
        return transferError_.connect(std::move(handler));
    }
    boost::signals2::connection
    EventHub::onConnectionStatusChange(std::function<void(SharedData::ConnectionStatusChange const&)> handler)
    {
        return connectionStatusChange_.connect(std::move(handler));
    }

    std::size_t EventHub::subscriberCount(Ids::SessionId const& sessionId) const
    {
        auto iter = sessionData_.find(sessionId);
        if (iter == sessionData_.end())
            return 0;
        return iter->second->num_slots();
    }

    void EventHub::forget(Ids::SessionId const& sessionId)
    {
        sessionData_.erase(sessionId);
        sessionExit_.erase(sessionId);
    }

    bool EventHub::tracks(Ids::SessionId const& sessionId) const
    {
        return sessionData_.contains(sessionId) || sessionExit_.contains(sessionId);
    }

    bool EventHub::dispatch(std::string_view channel, nlohmann::json const& payload)
    {
        const auto event = eventFromChannel(channel);
        if (!event)
        {
            Log::warn("Dropping event on unknown channel: {}", channel);
            return false;
        }

        try
        {
            switch (*event)
            {
                case EventType::SessionData:
                    emit(payload.get<SharedData::SessionData>());
                    break;
                case EventType::SessionExit:
                    emit(payload.get<SharedData::SessionExit>());
                    break;
                case EventType::TransferProgress:
                    emit(payload.get<SharedData::TransferProgress>());
                    break;
                case EventType::TransferSuccess:
                    emit(payload.get<SharedData::TransferSuccess>());
                    break;
                case EventType::TransferError:
                    emit(payload.get<SharedData::TransferError>());
                    break;
                case EventType::ConnectionStatusChange:
                    emit(payload.get<SharedData::ConnectionStatusChange>());
                    break;
            }
        }
        catch (nlohmann::json::exception const& e)
        {
            Log::error("Dropping malformed '{}' event: {}", channel, e.what());
            return false;
        }
        catch (std::invalid_argument const& e)
        {
            Log::error("Dropping malformed '{}' event: {}", channel, e.what());
            return false;
        }
        return true;
    }

    void EventHub::emit(SharedData::SessionData const& event)
    {
        emitFor(sessionData_, event.sessionId, event.data);
    }
    void EventHub::emit(SharedData::SessionExit const& event)
    {
        emitFor(sessionExit_, event.sessionId, event.exitCode);
    }
    void EventHub::emit(SharedData::TransferProgress const& event)
    {
        transferProgress_(event);
    }
    void EventHub::emit(SharedData::TransferSuccess const& event)
    {
        transferSuccess_(event);
    }
    void EventHub::emit(SharedData::TransferError const& event)
    {
        transferError_(event);
    }
    void EventHub::emit(SharedData::ConnectionStatusChange const& event)
    {
        connectionStatusChange_(event);
    }
}
