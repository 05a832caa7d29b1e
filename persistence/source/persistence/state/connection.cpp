#include <persistence/state/connection.hpp>
#include <utility/json.hpp>

#include <algorithm>

namespace Persistence
{
    bool Connection::hasPinnedFeature(std::string const& feature) const
    {
        return std::find(pinnedFeatures.begin(), pinnedFeatures.end(), feature) != pinnedFeatures.end();
    }

    void to_json(nlohmann::json& j, Connection const& connection)
    {
        j = nlohmann::json::object();
        j["id"] = connection.id;
        j["name"] = connection.name;
        j["host"] = connection.host;
        j["port"] = connection.port;
        j["username"] = connection.username;
        TO_JSON_OPTIONAL(j, connection, password);
        TO_JSON_OPTIONAL(j, connection, privateKeyPath);
        TO_JSON_OPTIONAL(j, connection, jumpServerId);
        TO_JSON_OPTIONAL(j, connection, lastConnected);
        TO_JSON_OPTIONAL(j, connection, createdAt);
        TO_JSON_OPTIONAL(j, connection, icon);
        TO_JSON_OPTIONAL(j, connection, folder);
        TO_JSON_OPTIONAL(j, connection, homePath);
        j["tags"] = connection.tags;
        j["pinnedFeatures"] = connection.pinnedFeatures;
        j["isFavorite"] = connection.isFavorite;
    }

    void from_json(nlohmann::json const& j, Connection& connection)
    {
        j.at("id").get_to(connection.id);
        connection.name = j.value("name", std::string{});
        j.at("host").get_to(connection.host);
        connection.port = j.value("port", std::uint16_t{22});
        connection.username = j.value("username", std::string{});
        FROM_JSON_OPTIONAL(j, connection, password);
        FROM_JSON_OPTIONAL(j, connection, privateKeyPath);
        FROM_JSON_OPTIONAL(j, connection, jumpServerId);
        FROM_JSON_OPTIONAL(j, connection, lastConnected);
        FROM_JSON_OPTIONAL(j, connection, createdAt);
        FROM_JSON_OPTIONAL(j, connection, icon);
        FROM_JSON_OPTIONAL(j, connection, folder);
        FROM_JSON_OPTIONAL(j, connection, homePath);
        connection.tags = j.value("tags", std::vector<std::string>{});
        connection.pinnedFeatures = j.value("pinnedFeatures", std::vector<std::string>{});
        connection.isFavorite = j.value("isFavorite", false);
    }
}
