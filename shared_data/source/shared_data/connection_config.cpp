#include <shared_data/connection_config.hpp>
#include <utility/overloaded.hpp>

#include <stdexcept>

namespace SharedData
{
    std::size_t ConnectionConfig::nestingDepth() const
    {
        std::size_t depth = 1;
        for (auto hop = jumpHost; hop; hop = hop->jumpHost)
            ++depth;
        return depth;
    }

    void to_json(nlohmann::json& j, AuthMethod const& auth)
    {
        std::visit(
            Utility::Overloaded{
                [&j](PasswordAuth const& password) {
                    j = nlohmann::json{
                        {"type", "Password"},
                        {"password", password.password},
                    };
                },
                [&j](PrivateKeyAuth const& key) {
                    j = nlohmann::json{
                        {"type", "PrivateKey"},
                        {"key_path", key.keyPath},
                        {"passphrase", key.passphrase ? nlohmann::json(*key.passphrase) : nlohmann::json(nullptr)},
                    };
                },
            },
            auth);
    }

    void from_json(nlohmann::json const& j, AuthMethod& auth)
    {
        const auto type = j.at("type").get<std::string>();
        if (type == "Password")
        {
            auth = PasswordAuth{.password = j.value("password", std::string{})};
        }
        else if (type == "PrivateKey")
        {
            PrivateKeyAuth key{.keyPath = j.at("key_path").get<std::string>()};
            if (auto it = j.find("passphrase"); it != j.end() && !it->is_null())
                key.passphrase = it->get<std::string>();
            auth = std::move(key);
        }
        else
            throw std::invalid_argument("Unknown authentication method: " + type);
    }

    void to_json(nlohmann::json& j, ConnectionConfig const& config)
    {
        j = nlohmann::json{
            {"id", config.id},
            {"name", config.name},
            {"host", config.host},
            {"port", config.port},
            {"username", config.username},
            {"auth_method", config.authMethod},
            {"jump_host", config.jumpHost ? nlohmann::json(*config.jumpHost) : nlohmann::json(nullptr)},
        };
    }

    void from_json(nlohmann::json const& j, ConnectionConfig& config)
    {
        j.at("id").get_to(config.id);
        config.name = j.value("name", std::string{});
        j.at("host").get_to(config.host);
        config.port = j.value("port", std::uint16_t{22});
        j.at("username").get_to(config.username);
        j.at("auth_method").get_to(config.authMethod);
        if (auto it = j.find("jump_host"); it != j.end() && !it->is_null())
            config.jumpHost = std::make_shared<ConnectionConfig const>(it->get<ConnectionConfig>());
        else
            config.jumpHost.reset();
    }
}
