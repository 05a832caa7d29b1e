#include <persistence/state/folder.hpp>

namespace Persistence
{
    void to_json(nlohmann::json& j, Folder const& folder)
    {
        j = nlohmann::json{{"name", folder.name}, {"tags", folder.tags}};
    }

    void from_json(nlohmann::json const& j, Folder& folder)
    {
        // older documents stored folders as plain names
        if (j.is_string())
        {
            folder = Folder{.name = j.get<std::string>()};
            return;
        }
        j.at("name").get_to(folder.name);
        folder.tags = j.value("tags", std::vector<std::string>{});
    }
}
