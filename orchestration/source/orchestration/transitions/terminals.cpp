#include <orchestration/transitions/terminals.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace Orchestration::Transitions
{
    State addTerminal(State state, Ids::ConnectionId const& connectionId, Ids::SessionId const& sessionId)
    {
        auto& terminals = state.terminals[connectionId];
        terminals.push_back(TerminalEntry{
            .sessionId = sessionId,
            .title = fmt::format("Terminal {}", terminals.size() + 1),
        });
        state.activeTerminalIds[connectionId] = sessionId;
        return state;
    }

    State removeTerminal(State state, Ids::ConnectionId const& connectionId, Ids::SessionId const& sessionId)
    {
        auto iter = state.terminals.find(connectionId);
        if (iter == state.terminals.end())
            return state;

        std::erase_if(iter->second, [&sessionId](TerminalEntry const& entry) {
            return entry.sessionId == sessionId;
        });

        auto active = state.activeTerminalIds.find(connectionId);
        if (iter->second.empty())
        {
            state.terminals.erase(iter);
            state.activeTerminalIds.erase(connectionId);
        }
        else if (active != state.activeTerminalIds.end() && active->second == sessionId)
        {
            active->second = iter->second.back().sessionId;
        }
        return state;
    }

    State setActiveTerminal(State state, Ids::ConnectionId const& connectionId, Ids::SessionId const& sessionId)
    {
        auto iter = state.terminals.find(connectionId);
        if (iter == state.terminals.end())
            return state;
        const bool known = std::any_of(iter->second.begin(), iter->second.end(), [&](TerminalEntry const& entry) {
            return entry.sessionId == sessionId;
        });
        if (known)
            state.activeTerminalIds[connectionId] = sessionId;
        return state;
    }

    State clearTerminals(State state, Ids::ConnectionId const& connectionId)
    {
        state.terminals.erase(connectionId);
        state.activeTerminalIds.erase(connectionId);
        return state;
    }
}
