#include <orchestration/transitions/tunnels.hpp>

#include <algorithm>

namespace Orchestration::Transitions
{
    State setTunnels(
        State state,
        Ids::ConnectionId const& connectionId,
        std::vector<SharedData::TunnelConfig> const& configs)
    {
        auto const& previous = state.tunnels[connectionId];
        std::vector<TunnelEntry> next{};
        next.reserve(configs.size());
        for (auto const& config : configs)
        {
            TunnelEntry entry{.config = config};
            auto known = std::find_if(previous.begin(), previous.end(), [&](TunnelEntry const& e) {
                return e.config.id == config.id;
            });
            if (known != previous.end())
            {
                entry.status = known->status;
                entry.error = known->error;
            }
            next.push_back(std::move(entry));
        }
        state.tunnels[connectionId] = std::move(next);
        return state;
    }

    State setTunnelStatus(
        State state,
        Ids::ConnectionId const& connectionId,
        Ids::TunnelId const& tunnelId,
        TunnelStatus status,
        std::optional<std::string> const& error)
    {
        auto iter = state.tunnels.find(connectionId);
        if (iter == state.tunnels.end())
            return state;
        for (auto& entry : iter->second)
        {
            if (entry.config.id == tunnelId)
            {
                entry.status = status;
                entry.error = error;
            }
        }
        return state;
    }
}
