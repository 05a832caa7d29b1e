#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace Persistence
{
    struct Folder
    {
        std::string name{};
        std::vector<std::string> tags{};
    };

    void to_json(nlohmann::json& j, Folder const& folder);
    void from_json(nlohmann::json const& j, Folder& folder);
}
