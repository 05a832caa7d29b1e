#pragma once

#include <orchestration/state.hpp>

namespace Orchestration::Transitions
{
    /// Records a new terminal for the connection and makes it the active one.
    State addTerminal(State state, Ids::ConnectionId const& connectionId, Ids::SessionId const& sessionId);
    State removeTerminal(State state, Ids::ConnectionId const& connectionId, Ids::SessionId const& sessionId);
    State setActiveTerminal(State state, Ids::ConnectionId const& connectionId, Ids::SessionId const& sessionId);
    State clearTerminals(State state, Ids::ConnectionId const& connectionId);
}
