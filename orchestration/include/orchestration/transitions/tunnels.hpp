#pragma once

#include <orchestration/state.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Orchestration::Transitions
{
    /// Replaces the tunnel list of a connection. Tunnels that were known before keep their status.
    State setTunnels(
        State state,
        Ids::ConnectionId const& connectionId,
        std::vector<SharedData::TunnelConfig> const& configs);
    State setTunnelStatus(
        State state,
        Ids::ConnectionId const& connectionId,
        Ids::TunnelId const& tunnelId,
        TunnelStatus status,
        std::optional<std::string> const& error = std::nullopt);
}
