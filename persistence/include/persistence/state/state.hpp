#pragma once

#include <persistence/state/connection.hpp>
#include <persistence/state/folder.hpp>
#include <persistence/state/orchestration_options.hpp>

#include <nlohmann/json.hpp>

#include <vector>

namespace Persistence
{
    struct State
    {
        std::vector<Connection> connections{};
        std::vector<Folder> folders{};
        OrchestrationOptions options{};
    };

    void to_json(nlohmann::json& j, State const& state);
    void from_json(nlohmann::json const& j, State& state);
}
