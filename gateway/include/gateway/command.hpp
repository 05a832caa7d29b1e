#pragma once

#include <shared_data/transfer.hpp>
#include <utility/describe.hpp>

#include <optional>
#include <string_view>

namespace Gateway
{
    BOOST_DEFINE_ENUM_CLASS(
        Command,
        Connect,
        Disconnect,
        HomePath,
        SpawnSession,
        Write,
        Resize,
        CloseSession,
        TransferPut,
        TransferGet,
        TransferCrossCopy,
        CancelTransfer,
        ListDirectory,
        Rename,
        SaveConnections,
        LoadConnections,
        ListTunnels,
        StartTunnel,
        StopTunnel)

    BOOST_DEFINE_ENUM_CLASS(
        EventType,
        SessionData,
        SessionExit,
        TransferProgress,
        TransferSuccess,
        TransferError,
        ConnectionStatusChange)

    /**
     * @brief The backend channel a command is invoked on.
     */
    std::string_view channelName(Command command);
    std::optional<Command> commandFromChannel(std::string_view channel);

    std::string_view eventChannelName(EventType event);
    std::optional<EventType> eventFromChannel(std::string_view channel);

    Command transferCommand(SharedData::TransferKind kind);
}
