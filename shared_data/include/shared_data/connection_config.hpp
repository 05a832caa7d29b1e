#pragma once

#include <ids/ids.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace SharedData
{
    struct PasswordAuth
    {
        std::string password{};
    };

    struct PrivateKeyAuth
    {
        std::string keyPath{};
        std::optional<std::string> passphrase{std::nullopt};
    };

    using AuthMethod = std::variant<PasswordAuth, PrivateKeyAuth>;

    /**
     * @brief Everything the backend needs to open a connection. A connection reached through a jump host
     * carries the complete configuration of that host, which may itself carry another one.
     */
    struct ConnectionConfig
    {
        Ids::ConnectionId id{};
        std::string name{};
        std::string host{};
        std::uint16_t port{22};
        std::string username{};
        AuthMethod authMethod{PasswordAuth{}};
        std::shared_ptr<ConnectionConfig const> jumpHost{};

        /**
         * @brief Number of hosts in the chain, this one included.
         */
        std::size_t nestingDepth() const;
    };

    void to_json(nlohmann::json& j, AuthMethod const& auth);
    void from_json(nlohmann::json const& j, AuthMethod& auth);
    void to_json(nlohmann::json& j, ConnectionConfig const& config);
    void from_json(nlohmann::json const& j, ConnectionConfig& config);
}
