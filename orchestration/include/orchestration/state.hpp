#pragma once

#include <ids/ids.hpp>
#include <log/level.hpp>
#include <persistence/state/connection.hpp>
#include <persistence/state/folder.hpp>
#include <shared_data/connection_status.hpp>
#include <shared_data/transfer.hpp>
#include <shared_data/tunnel_config.hpp>
#include <utility/describe.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Orchestration
{
    BOOST_DEFINE_ENUM_CLASS(TabType, Connection, Settings, PortForwarding)
    BOOST_DEFINE_ENUM_CLASS(TabView, Dashboard, Terminal, Files, PortForwarding, Snippets)
    BOOST_DEFINE_ENUM_CLASS(TransferStatus, Pending, Transferring, Completed, Failed, Cancelled)
    BOOST_DEFINE_ENUM_CLASS(TunnelStatus, Stopped, Starting, Active, Error)

    inline bool isTerminalStatus(TransferStatus status)
    {
        return status == TransferStatus::Completed || status == TransferStatus::Failed ||
            status == TransferStatus::Cancelled;
    }

    struct ConnectionEntry
    {
        Persistence::Connection record{};
        SharedData::ConnectionStatus status{SharedData::ConnectionStatus::Disconnected};
        std::optional<std::string> error{std::nullopt};
    };

    struct Tab
    {
        Ids::TabId id{};
        TabType type{TabType::Connection};
        std::string title{};
        std::optional<Ids::ConnectionId> connectionId{std::nullopt};
        TabView view{TabView::Terminal};
    };

    struct TerminalEntry
    {
        Ids::SessionId sessionId{};
        std::string title{};
    };

    struct TransferProgress
    {
        std::uint64_t transferred{0};
        std::uint64_t total{0};
        double percentage{0.0};
    };

    struct Transfer
    {
        using Clock = std::chrono::steady_clock;

        Ids::TransferId id{};
        SharedData::TransferEndpoint source{};
        SharedData::TransferEndpoint destination{};
        TransferStatus status{TransferStatus::Pending};
        TransferProgress progress{};
        // bytes per second, advisory only
        double speed{0.0};
        std::optional<std::string> error{std::nullopt};
        std::optional<std::string> label{std::nullopt};
        Clock::time_point startTime{};
        Clock::time_point lastUpdated{};
        // transferred bytes at the start of the current speed window
        std::uint64_t speedBaseline{0};

        bool isTerminal() const
        {
            return isTerminalStatus(status);
        }

        SharedData::TransferKind kind() const
        {
            return SharedData::transferKindFor(source, destination);
        }
    };

    struct TunnelEntry
    {
        SharedData::TunnelConfig config{};
        TunnelStatus status{TunnelStatus::Stopped};
        std::optional<std::string> error{std::nullopt};
    };

    struct Notification
    {
        Log::Level level{Log::Level::Info};
        std::string message{};
    };

    /**
     * @brief The complete plain-data state of the orchestration. It is only ever replaced as a whole through
     * Store::transition. Live shell resources are not part of it, they are kept by the SessionCache.
     */
    struct State
    {
        std::vector<ConnectionEntry> connections{};
        std::vector<Persistence::Folder> folders{};

        std::vector<Tab> tabs{};
        std::optional<Ids::TabId> activeTabId{std::nullopt};
        std::optional<Ids::ConnectionId> activeConnectionId{std::nullopt};

        std::map<Ids::ConnectionId, std::vector<TerminalEntry>> terminals{};
        std::map<Ids::ConnectionId, Ids::SessionId> activeTerminalIds{};

        std::vector<Transfer> transfers{};

        std::map<Ids::ConnectionId, std::vector<TunnelEntry>> tunnels{};

        ConnectionEntry const* findConnection(Ids::ConnectionId const& id) const;
        Tab const* findTab(Ids::TabId const& id) const;
        Transfer const* findTransfer(Ids::TransferId const& id) const;
        Tab const* activeTab() const;
    };
}
