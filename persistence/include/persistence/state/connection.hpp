#pragma once

#include <ids/ids.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Persistence
{
    /**
     * @brief A saved connection as it is written to the connections document. Runtime status is not part of
     * it.
     */
    struct Connection
    {
        Ids::ConnectionId id{};
        std::string name{};
        std::string host{};
        std::uint16_t port{22};
        std::string username{};
        std::optional<std::string> password{std::nullopt};
        std::optional<std::string> privateKeyPath{std::nullopt};
        std::optional<Ids::ConnectionId> jumpServerId{std::nullopt};
        // milliseconds since the unix epoch
        std::optional<std::int64_t> lastConnected{std::nullopt};
        std::optional<std::int64_t> createdAt{std::nullopt};
        std::optional<std::string> icon{std::nullopt};
        std::optional<std::string> folder{std::nullopt};
        std::optional<std::string> homePath{std::nullopt};
        std::vector<std::string> tags{};
        std::vector<std::string> pinnedFeatures{};
        bool isFavorite{false};

        std::string displayName() const
        {
            return name.empty() ? host : name;
        }

        bool hasPinnedFeature(std::string const& feature) const;
    };

    void to_json(nlohmann::json& j, Connection const& connection);
    void from_json(nlohmann::json const& j, Connection& connection);
}
