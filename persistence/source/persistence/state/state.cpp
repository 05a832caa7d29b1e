#include <persistence/state/state.hpp>

namespace Persistence
{
    void to_json(nlohmann::json& j, State const& state)
    {
        j = nlohmann::json::object();

        j["connections"] = state.connections;
        j["folders"] = state.folders;
        j["options"] = state.options;
    }
    void from_json(nlohmann::json const& j, State& state)
    {
        if (j.contains("connections"))
            j["connections"].get_to(state.connections);
        if (j.contains("folders"))
            j["folders"].get_to(state.folders);
        if (j.contains("options"))
            j["options"].get_to(state.options);
    }
}
