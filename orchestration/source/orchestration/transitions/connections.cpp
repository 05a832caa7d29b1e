#include <orchestration/transitions/connections.hpp>
#include <orchestration/transitions/tabs.hpp>
#include <utility/algorithm/case_convert.hpp>

#include <algorithm>
#include <unordered_map>

namespace Orchestration::Transitions
{
    namespace
    {
        template <typename FunctionT>
        State modifyConnection(State state, Ids::ConnectionId const& id, FunctionT&& fn)
        {
            for (auto& entry : state.connections)
            {
                if (entry.record.id == id)
                {
                    fn(entry);
                    break;
                }
            }
            return state;
        }
    }

    State markConnecting(State state, Ids::ConnectionId const& id)
    {
        return modifyConnection(std::move(state), id, [](ConnectionEntry& entry) {
            entry.status = SharedData::ConnectionStatus::Connecting;
            entry.error = std::nullopt;
        });
    }

    State markConnected(
        State state,
        Ids::ConnectionId const& id,
        std::int64_t nowMillis,
        std::optional<std::string> const& detectedOs)
    {
        return modifyConnection(std::move(state), id, [&](ConnectionEntry& entry) {
            entry.status = SharedData::ConnectionStatus::Connected;
            entry.error = std::nullopt;
            entry.record.lastConnected = nowMillis;
            const bool defaultIcon =
                !entry.record.icon || Utility::Algorithm::toLowerCase(*entry.record.icon) == "server";
            if (detectedOs && !detectedOs->empty() && defaultIcon)
                entry.record.icon = Utility::Algorithm::toLowerCase(*detectedOs);
        });
    }

    State markConnectFailed(State state, Ids::ConnectionId const& id, std::string const& message)
    {
        return modifyConnection(std::move(state), id, [&](ConnectionEntry& entry) {
            if (entry.status == SharedData::ConnectionStatus::Error)
                return;
            entry.status = SharedData::ConnectionStatus::Error;
            entry.error = message;
        });
    }

    State markDisconnected(State state, Ids::ConnectionId const& id)
    {
        return modifyConnection(std::move(state), id, [](ConnectionEntry& entry) {
            entry.status = SharedData::ConnectionStatus::Disconnected;
            entry.error = std::nullopt;
        });
    }

    State applyStatusChange(
        State state,
        Ids::ConnectionId const& id,
        SharedData::ConnectionStatus status,
        std::optional<std::string> const& error)
    {
        return modifyConnection(std::move(state), id, [&](ConnectionEntry& entry) {
            entry.status = status;
            entry.error = status == SharedData::ConnectionStatus::Error ? error : std::nullopt;
        });
    }

    State setHomePath(State state, Ids::ConnectionId const& id, std::string const& homePath)
    {
        return modifyConnection(std::move(state), id, [&](ConnectionEntry& entry) {
            entry.record.homePath = homePath;
        });
    }

    State loadConnections(State state, Persistence::State const& persisted)
    {
        state.connections.clear();
        state.connections.reserve(persisted.connections.size());
        for (auto const& record : persisted.connections)
            state.connections.push_back(ConnectionEntry{.record = record});
        state.folders = persisted.folders;
        return state;
    }

    State addConnection(State state, Persistence::Connection const& connection)
    {
        if (state.findConnection(connection.id) != nullptr)
            return editConnection(std::move(state), connection);
        state.connections.push_back(ConnectionEntry{.record = connection});
        return state;
    }

    State editConnection(State state, Persistence::Connection const& connection)
    {
        return modifyConnection(std::move(state), connection.id, [&](ConnectionEntry& entry) {
            entry.record = connection;
        });
    }

    State deleteConnection(State state, Ids::ConnectionId const& id)
    {
        std::erase_if(state.connections, [&id](ConnectionEntry const& entry) {
            return entry.record.id == id;
        });
        state.terminals.erase(id);
        state.activeTerminalIds.erase(id);
        state.tunnels.erase(id);

        std::vector<Ids::TabId> tabsToClose{};
        for (auto const& tab : state.tabs)
        {
            if (tab.connectionId == id)
                tabsToClose.push_back(tab.id);
        }
        for (auto const& tabId : tabsToClose)
            state = closeTab(std::move(state), tabId);
        return state;
    }

    State importConnections(State state, std::vector<Persistence::Connection> const& imported)
    {
        std::unordered_map<std::string, ConnectionEntry const*> existingByName{};
        for (auto const& entry : state.connections)
            existingByName.emplace(entry.record.name, &entry);

        std::vector<ConnectionEntry> merged{};
        for (auto const& entry : state.connections)
        {
            const bool replaced = std::any_of(imported.begin(), imported.end(), [&](Persistence::Connection const& c) {
                return c.name == entry.record.name;
            });
            if (!replaced)
                merged.push_back(entry);
        }
        for (auto const& connection : imported)
        {
            ConnectionEntry entry{.record = connection};
            if (auto iter = existingByName.find(connection.name); iter != existingByName.end())
            {
                entry.record.id = iter->second->record.id;
                entry.status = iter->second->status;
                entry.error = iter->second->error;
            }

            // the last entry for an id wins, the position of the first is kept
            auto existing = std::find_if(merged.begin(), merged.end(), [&](ConnectionEntry const& e) {
                return e.record.id == entry.record.id;
            });
            if (existing != merged.end())
                *existing = std::move(entry);
            else
                merged.push_back(std::move(entry));
        }

        state.connections = std::move(merged);
        for (auto const& entry : state.connections)
        {
            if (entry.record.folder)
                state = addFolder(std::move(state), *entry.record.folder);
        }
        return state;
    }

    State clearConnections(State state)
    {
        state.connections.clear();
        state.folders.clear();
        state.tabs.clear();
        state.activeTabId = std::nullopt;
        state.activeConnectionId = std::nullopt;
        state.terminals.clear();
        state.activeTerminalIds.clear();
        state.tunnels.clear();
        return state;
    }

    State addFolder(State state, std::string const& name, std::vector<std::string> const& tags)
    {
        const bool exists = std::any_of(state.folders.begin(), state.folders.end(), [&](Persistence::Folder const& f) {
            return f.name == name;
        });
        if (!exists)
            state.folders.push_back(Persistence::Folder{.name = name, .tags = tags});
        return state;
    }

    State deleteFolder(State state, std::string const& name)
    {
        std::erase_if(state.folders, [&name](Persistence::Folder const& f) {
            return f.name == name;
        });
        for (auto& entry : state.connections)
        {
            if (entry.record.folder == name)
                entry.record.folder = std::nullopt;
        }
        return state;
    }

    State renameFolder(
        State state,
        std::string const& oldName,
        std::string const& newName,
        std::optional<std::vector<std::string>> const& newTags)
    {
        for (auto& folder : state.folders)
        {
            if (folder.name == oldName)
            {
                folder.name = newName;
                if (newTags)
                    folder.tags = *newTags;
            }
        }
        for (auto& entry : state.connections)
        {
            if (entry.record.folder == oldName)
                entry.record.folder = newName;
        }
        return state;
    }

    State updateConnectionFolder(State state, Ids::ConnectionId const& id, std::optional<std::string> const& folder)
    {
        state = modifyConnection(std::move(state), id, [&](ConnectionEntry& entry) {
            entry.record.folder = folder;
        });
        if (folder)
            state = addFolder(std::move(state), *folder);
        return state;
    }

    State toggleFavorite(State state, Ids::ConnectionId const& id)
    {
        return modifyConnection(std::move(state), id, [](ConnectionEntry& entry) {
            entry.record.isFavorite = !entry.record.isFavorite;
        });
    }

    State toggleConnectionFeature(State state, Ids::ConnectionId const& id, std::string const& feature)
    {
        return modifyConnection(std::move(state), id, [&](ConnectionEntry& entry) {
            auto& pinned = entry.record.pinnedFeatures;
            if (entry.record.hasPinnedFeature(feature))
                std::erase(pinned, feature);
            else
                pinned.push_back(feature);
        });
    }

    State pinConnectionFeature(State state, Ids::ConnectionId const& id, std::string const& feature)
    {
        return modifyConnection(std::move(state), id, [&](ConnectionEntry& entry) {
            if (!entry.record.hasPinnedFeature(feature))
                entry.record.pinnedFeatures.push_back(feature);
        });
    }

    Persistence::State toPersistence(State const& state, Persistence::OrchestrationOptions const& options)
    {
        Persistence::State persisted{.connections = {}, .folders = state.folders, .options = options};
        persisted.connections.reserve(state.connections.size());
        for (auto const& entry : state.connections)
            persisted.connections.push_back(entry.record);
        return persisted;
    }
}
