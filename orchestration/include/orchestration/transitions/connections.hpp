#pragma once

#include <orchestration/state.hpp>
#include <persistence/state/state.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Pure state transitions for the connection registry. Each takes the current state and returns the next one.
 */
namespace Orchestration::Transitions
{
    State markConnecting(State state, Ids::ConnectionId const& id);
    State markConnected(
        State state,
        Ids::ConnectionId const& id,
        std::int64_t nowMillis,
        std::optional<std::string> const& detectedOs = std::nullopt);
    /// Sets status error with the message, unless the connection already is in error.
    State markConnectFailed(State state, Ids::ConnectionId const& id, std::string const& message);
    State markDisconnected(State state, Ids::ConnectionId const& id);
    /// Applies a backend status push.
    State applyStatusChange(
        State state,
        Ids::ConnectionId const& id,
        SharedData::ConnectionStatus status,
        std::optional<std::string> const& error);
    State setHomePath(State state, Ids::ConnectionId const& id, std::string const& homePath);

    State loadConnections(State state, Persistence::State const& persisted);
    State addConnection(State state, Persistence::Connection const& connection);
    /// Replaces the stored record, the runtime status is kept.
    State editConnection(State state, Persistence::Connection const& connection);
    /// Removes the connection together with its tabs, terminal bookkeeping and tunnels.
    State deleteConnection(State state, Ids::ConnectionId const& id);
    /// Imported connections replace existing ones with the same name, keeping the existing id.
    State importConnections(State state, std::vector<Persistence::Connection> const& imported);

    /// Removes all connections, folders and tabs.
    State clearConnections(State state);

    State addFolder(State state, std::string const& name, std::vector<std::string> const& tags = {});
    State deleteFolder(State state, std::string const& name);
    State renameFolder(
        State state,
        std::string const& oldName,
        std::string const& newName,
        std::optional<std::vector<std::string>> const& newTags = std::nullopt);
    State updateConnectionFolder(State state, Ids::ConnectionId const& id, std::optional<std::string> const& folder);

    State toggleFavorite(State state, Ids::ConnectionId const& id);
    State toggleConnectionFeature(State state, Ids::ConnectionId const& id, std::string const& feature);
    /// Adds the feature if it is not pinned yet.
    State pinConnectionFeature(State state, Ids::ConnectionId const& id, std::string const& feature);

    /// The persisted part of the state. Runtime status never ends up in here.
    Persistence::State toPersistence(State const& state, Persistence::OrchestrationOptions const& options);
}
