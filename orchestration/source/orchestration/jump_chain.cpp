#include <orchestration/jump_chain.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <memory>
#include <unordered_set>

namespace Orchestration
{
    namespace
    {
        Persistence::Connection const*
        findRecord(std::vector<ConnectionEntry> const& connections, Ids::ConnectionId const& id)
        {
            auto iter = std::find_if(connections.begin(), connections.end(), [&id](ConnectionEntry const& entry) {
                return entry.record.id == id;
            });
            return iter == connections.end() ? nullptr : &iter->record;
        }
    }

    std::string JumpChainError::toString() const
    {
        switch (reason)
        {
            case JumpChainFailure::MissingConnection:
                return fmt::format("Jump host '{}' does not exist (hop {}).", connectionId.value(), depth);
            case JumpChainFailure::Cycle:
                return fmt::format(
                    "Jump host chain contains a cycle, '{}' is reached again at hop {}.", connectionId.value(), depth);
            case JumpChainFailure::TooDeep:
                return fmt::format("Jump host chain is deeper than {} hosts.", depth);
        }
        return "Unknown jump host chain error.";
    }

    SharedData::ConnectionConfig toConnectionConfig(Persistence::Connection const& connection)
    {
        SharedData::ConnectionConfig config{
            .id = connection.id,
            .name = connection.name,
            .host = connection.host,
            .port = connection.port,
            .username = connection.username,
        };

        if (connection.privateKeyPath && !connection.privateKeyPath->empty())
            config.authMethod = SharedData::PrivateKeyAuth{
                .keyPath = *connection.privateKeyPath,
                .passphrase = connection.password,
            };
        else
            config.authMethod = SharedData::PasswordAuth{.password = connection.password.value_or("")};

        return config;
    }

    std::expected<SharedData::ConnectionConfig, JumpChainError> resolveJumpChain(
        std::vector<ConnectionEntry> const& connections,
        Ids::ConnectionId const& target,
        std::size_t maxDepth)
    {
        // Walk from the target towards the outermost jump host, then nest backwards.
        std::vector<Persistence::Connection const*> chain{};
        std::unordered_set<Ids::ConnectionId, Ids::IdHash> visited{};

        std::optional<Ids::ConnectionId> current = target;
        while (current)
        {
            const auto depth = chain.size() + 1;
            if (visited.contains(*current))
                return std::unexpected(
                    JumpChainError{.reason = JumpChainFailure::Cycle, .connectionId = *current, .depth = depth});
            if (depth > maxDepth)
                return std::unexpected(
                    JumpChainError{.reason = JumpChainFailure::TooDeep, .connectionId = *current, .depth = maxDepth});

            auto const* record = findRecord(connections, *current);
            if (record == nullptr)
                return std::unexpected(JumpChainError{
                    .reason = JumpChainFailure::MissingConnection, .connectionId = *current, .depth = depth});

            visited.insert(*current);
            chain.push_back(record);
            current = record->jumpServerId;
        }

        std::shared_ptr<SharedData::ConnectionConfig const> jumpHost{};
        for (auto iter = chain.rbegin(); iter != chain.rend(); ++iter)
        {
            auto config = toConnectionConfig(**iter);
            config.jumpHost = std::move(jumpHost);
            jumpHost = std::make_shared<SharedData::ConnectionConfig const>(std::move(config));
        }
        return *jumpHost;
    }
}
