#include <gateway/command.hpp>

#include <stdexcept>

namespace Gateway
{
    std::string_view channelName(Command command)
    {
        switch (command)
        {
            case Command::Connect:
                return "ssh:connect";
            case Command::Disconnect:
                return "ssh:disconnect";
            case Command::HomePath:
                return "sftp:cwd";
            case Command::SpawnSession:
                return "terminal:spawn";
            case Command::Write:
                return "terminal:write";
            case Command::Resize:
                return "terminal:resize";
            case Command::CloseSession:
                return "terminal:kill";
            case Command::TransferPut:
                return "sftp:put";
            case Command::TransferGet:
                return "sftp:get";
            case Command::TransferCrossCopy:
                return "sftp:copyToServer";
            case Command::CancelTransfer:
                return "sftp:cancelTransfer";
            case Command::ListDirectory:
                return "sftp:list";
            case Command::Rename:
                return "sftp:rename";
            case Command::SaveConnections:
                return "connections:save";
            case Command::LoadConnections:
                return "connections:get";
            case Command::ListTunnels:
                return "tunnel:list";
            case Command::StartTunnel:
                return "tunnel:start";
            case Command::StopTunnel:
                return "tunnel:stop";
        }
        throw std::invalid_argument("Invalid command");
    }

    std::optional<Command> commandFromChannel(std::string_view channel)
    {
        std::optional<Command> result{std::nullopt};
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<Command>>([&](auto desc) {
            if (!result && channelName(desc.value) == channel)
                result = desc.value;
        });
        return result;
    }

    std::string_view eventChannelName(EventType event)
    {
        switch (event)
        {
            case EventType::SessionData:
                return "terminal:data";
            case EventType::SessionExit:
                return "terminal:closed";
            case EventType::TransferProgress:
                return "transfer-progress";
            case EventType::TransferSuccess:
                return "transfer-success";
            case EventType::TransferError:
                return "transfer-error";
            case EventType::ConnectionStatusChange:
                return "ssh:status-change";
        }
        throw std::invalid_argument("Invalid event type");
    }

    std::optional<EventType> eventFromChannel(std::string_view channel)
    {
        std::optional<EventType> result{std::nullopt};
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EventType>>([&](auto desc) {
            if (!result && eventChannelName(desc.value) == channel)
                result = desc.value;
        });
        return result;
    }

    Command transferCommand(SharedData::TransferKind kind)
    {
        switch (kind)
        {
            case SharedData::TransferKind::Put:
                return Command::TransferPut;
            case SharedData::TransferKind::Get:
                return Command::TransferGet;
            case SharedData::TransferKind::CrossCopy:
                return Command::TransferCrossCopy;
        }
        throw std::invalid_argument("Invalid transfer kind");
    }
}
