#pragma once

#include <orchestration/state.hpp>
#include <shared_data/connection_config.hpp>
#include <utility/describe.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace Orchestration
{
    BOOST_DEFINE_ENUM_CLASS(JumpChainFailure, MissingConnection, Cycle, TooDeep)

    struct JumpChainError
    {
        JumpChainFailure reason{JumpChainFailure::MissingConnection};
        // The connection at which the walk stopped.
        Ids::ConnectionId connectionId{};
        // Number of hosts visited before the failure, the target included.
        std::size_t depth{0};

        std::string toString() const;
    };

    /**
     * @brief Converts a stored connection into the configuration sent to the backend, without jump host.
     * A private key takes precedence over a password. The password then serves as the key passphrase.
     */
    SharedData::ConnectionConfig toConnectionConfig(Persistence::Connection const& connection);

    /**
     * @brief Resolves the jump host chain of a connection into one nested configuration.
     *
     * The walk follows jumpServerId lookups and stops on the first id it has already seen, on an id that
     * does not exist, or when more than maxDepth hosts would be involved.
     *
     * @param connections All known connections.
     * @param target The connection to reach.
     * @param maxDepth Maximum number of hosts in the chain, the target included.
     */
    std::expected<SharedData::ConnectionConfig, JumpChainError> resolveJumpChain(
        std::vector<ConnectionEntry> const& connections,
        Ids::ConnectionId const& target,
        std::size_t maxDepth);
}
