#pragma once

#include <ids/ids.hpp>
#include <shared_data/connection_status.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace SharedData
{
    struct SessionData
    {
        Ids::SessionId sessionId{};
        std::string data{};
    };

    struct SessionExit
    {
        Ids::SessionId sessionId{};
        std::optional<int> exitCode{std::nullopt};
    };

    struct TransferProgress
    {
        Ids::TransferId transferId{};
        std::uint64_t transferred{0};
        std::uint64_t total{0};
    };

    struct TransferSuccess
    {
        Ids::TransferId transferId{};
        std::optional<Ids::ConnectionId> destinationConnectionId{std::nullopt};
    };

    struct TransferError
    {
        Ids::TransferId transferId{};
        std::string error{};
    };

    struct ConnectionStatusChange
    {
        Ids::ConnectionId connectionId{};
        ConnectionStatus status{ConnectionStatus::Disconnected};
        std::optional<std::string> error{std::nullopt};
    };

    void to_json(nlohmann::json& j, SessionData const& event);
    void from_json(nlohmann::json const& j, SessionData& event);
    void to_json(nlohmann::json& j, SessionExit const& event);
    void from_json(nlohmann::json const& j, SessionExit& event);
    void to_json(nlohmann::json& j, TransferProgress const& event);
    void from_json(nlohmann::json const& j, TransferProgress& event);
    void to_json(nlohmann::json& j, TransferSuccess const& event);
    void from_json(nlohmann::json const& j, TransferSuccess& event);
    void to_json(nlohmann::json& j, TransferError const& event);
    void from_json(nlohmann::json const& j, TransferError& event);
    void to_json(nlohmann::json& j, ConnectionStatusChange const& event);
    void from_json(nlohmann::json const& j, ConnectionStatusChange& event);
}
