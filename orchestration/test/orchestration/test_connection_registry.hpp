#pragma once

#include "fixture.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace Orchestration::Test
{
    using ::testing::_;

    class ConnectionRegistryTests : public OrchestrationFixture
    {
      protected:
        ConnectionRegistry& registry()
        {
            return orchestrator_.connections();
        }
    };

    TEST_F(ConnectionRegistryTests, LocalConnectNeverReachesBackend)
    {
        EXPECT_CALL(*gateway_, connect(_, _)).Times(0);

        std::optional<bool> connected{};
        registry().connect(Ids::localConnectionId(), [&](bool result) {
            connected = result;
        });
        EXPECT_EQ(connected, true);
    }

    TEST_F(ConnectionRegistryTests, JumpHostIsConnectedFirst)
    {
        addConnections({makeConnection("bastion"), makeConnection("db", "bastion")});

        std::vector<SharedData::ConnectionConfig> configs{};
        EXPECT_CALL(*gateway_, connect(_, _))
            .Times(2)
            .WillRepeatedly([&](SharedData::ConnectionConfig const& config, auto onComplete) {
                configs.push_back(config);
                onComplete(Gateway::ConnectResult{});
            });

        registry().connect(Ids::makeConnectionId("db"));

        ASSERT_EQ(configs.size(), 2u);
        EXPECT_EQ(configs[0].id, Ids::makeConnectionId("bastion"));
        EXPECT_EQ(configs[0].jumpHost, nullptr);
        EXPECT_EQ(configs[1].id, Ids::makeConnectionId("db"));
        ASSERT_NE(configs[1].jumpHost, nullptr);
        EXPECT_EQ(configs[1].jumpHost->id, Ids::makeConnectionId("bastion"));
        EXPECT_EQ(configs[1].jumpHost->host, "bastion.example.com");

        EXPECT_EQ(statusOf("bastion"), SharedData::ConnectionStatus::Connected);
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Connected);
    }

    TEST_F(ConnectionRegistryTests, ConnectedJumpHostIsNotConnectedAgain)
    {
        addConnections({makeConnection("bastion"), makeConnection("db", "bastion")});
        registry().connect(Ids::makeConnectionId("bastion"));

        EXPECT_CALL(*gateway_, connect(_, _))
            .WillOnce([](SharedData::ConnectionConfig const& config, auto onComplete) {
                EXPECT_EQ(config.id, Ids::makeConnectionId("db"));
                onComplete(Gateway::ConnectResult{});
            });
        registry().connect(Ids::makeConnectionId("db"));
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Connected);
    }

    TEST_F(ConnectionRegistryTests, CyclicJumpChainFailsWithoutBackendCall)
    {
        addConnections({makeConnection("a", "b"), makeConnection("b", "a")});
        EXPECT_CALL(*gateway_, connect(_, _)).Times(0);

        std::optional<bool> connected{};
        registry().connect(Ids::makeConnectionId("a"), [&](bool result) {
            connected = result;
        });

        EXPECT_EQ(connected, false);
        EXPECT_EQ(statusOf("a"), SharedData::ConnectionStatus::Error);
        ASSERT_EQ(notifications_.size(), 1u);
        EXPECT_EQ(notifications_[0].level, Log::Level::Error);
        EXPECT_NE(notifications_[0].message.find("cycle"), std::string::npos);
    }

    TEST_F(ConnectionRegistryTests, BackendFailureSetsError)
    {
        addConnections({makeConnection("db")});
        EXPECT_CALL(*gateway_, connect(_, _))
            .WillOnce([](SharedData::ConnectionConfig const&, auto onComplete) {
                onComplete(std::unexpected(
                    Gateway::Error{.command = Gateway::Command::Connect, .message = "Authentication failed"}));
            });

        registry().connect(Ids::makeConnectionId("db"));

        auto const* entry = registry().find(Ids::makeConnectionId("db"));
        ASSERT_NE(entry, nullptr);
        EXPECT_EQ(entry->status, SharedData::ConnectionStatus::Error);
        EXPECT_EQ(entry->error, std::string{"Authentication failed"});
        EXPECT_EQ(notifications_.size(), 1u);
    }

    TEST_F(ConnectionRegistryTests, RetryFromErrorIsAllowed)
    {
        addConnections({makeConnection("db")});
        EXPECT_CALL(*gateway_, connect(_, _))
            .WillOnce([](SharedData::ConnectionConfig const&, auto onComplete) {
                onComplete(std::unexpected(Gateway::Error{.command = Gateway::Command::Connect, .message = "timeout"}));
            })
            .WillOnce([](SharedData::ConnectionConfig const&, auto onComplete) {
                onComplete(Gateway::ConnectResult{});
            });

        registry().connect(Ids::makeConnectionId("db"));
        registry().connect(Ids::makeConnectionId("db"));
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Connected);
    }

    TEST_F(ConnectionRegistryTests, ConcurrentConnectsShareOneRequest)
    {
        addConnections({makeConnection("db")});

        Gateway::BackendGateway::Handler<Gateway::ConnectResult> pending{};
        EXPECT_CALL(*gateway_, connect(_, _)).WillOnce(::testing::SaveArg<1>(&pending));

        int completions = 0;
        registry().connect(Ids::makeConnectionId("db"), [&](bool connected) {
            EXPECT_TRUE(connected);
            ++completions;
        });
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Connecting);
        registry().connect(Ids::makeConnectionId("db"), [&](bool connected) {
            EXPECT_TRUE(connected);
            ++completions;
        });

        ASSERT_TRUE(pending);
        pending(Gateway::ConnectResult{});
        EXPECT_EQ(completions, 2);
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Connected);
    }

    TEST_F(ConnectionRegistryTests, SuccessfulConnectFetchesHomePathAndDetectsOs)
    {
        addConnections({makeConnection("db")});
        EXPECT_CALL(*gateway_, connect(_, _))
            .WillOnce([](SharedData::ConnectionConfig const&, auto onComplete) {
                onComplete(Gateway::ConnectResult{.detectedOs = "Debian"});
            });

        registry().connect(Ids::makeConnectionId("db"));

        auto const* entry = registry().find(Ids::makeConnectionId("db"));
        ASSERT_NE(entry, nullptr);
        EXPECT_EQ(entry->record.homePath, std::string{"/home/admin"});
        EXPECT_EQ(entry->record.icon, std::string{"debian"});
        EXPECT_TRUE(entry->record.lastConnected);
    }

    TEST_F(ConnectionRegistryTests, AutoStartedTunnelPinsPortForwarding)
    {
        addConnections({makeConnection("db")});
        EXPECT_CALL(*gateway_, listTunnels(_, _))
            .WillOnce([](Ids::ConnectionId const& id, auto onComplete) {
                onComplete(std::vector<SharedData::TunnelConfig>{
                    {.id = Ids::makeTunnelId("pg"), .connectionId = id, .name = "postgres", .autoStart = true},
                    {.id = Ids::makeTunnelId("redis"), .connectionId = id, .name = "redis", .autoStart = false},
                });
            });
        EXPECT_CALL(*gateway_, startTunnel(Ids::makeTunnelId("pg"), _, _))
            .WillOnce([](auto const&, auto const&, auto onComplete) {
                onComplete(succeeded());
            });

        registry().connect(Ids::makeConnectionId("db"));

        auto const* entry = registry().find(Ids::makeConnectionId("db"));
        ASSERT_NE(entry, nullptr);
        EXPECT_TRUE(entry->record.hasPinnedFeature("port-forwarding"));

        auto const& tunnels = orchestrator_.state().tunnels.at(Ids::makeConnectionId("db"));
        ASSERT_EQ(tunnels.size(), 2u);
        EXPECT_EQ(tunnels[0].status, TunnelStatus::Active);
        EXPECT_EQ(tunnels[1].status, TunnelStatus::Stopped);
    }

    TEST_F(ConnectionRegistryTests, FailingAutoStartDoesNotFailConnect)
    {
        addConnections({makeConnection("db")});
        ON_CALL(*gateway_, listTunnels(_, _)).WillByDefault([](Ids::ConnectionId const& id, auto onComplete) {
            onComplete(std::vector<SharedData::TunnelConfig>{
                {.id = Ids::makeTunnelId("pg"), .connectionId = id, .name = "postgres", .autoStart = true},
            });
        });
        ON_CALL(*gateway_, startTunnel(_, _, _)).WillByDefault([](auto const&, auto const&, auto onComplete) {
            onComplete(failed(Gateway::Command::StartTunnel, "Port in use"));
        });

        registry().connect(Ids::makeConnectionId("db"));

        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Connected);
        auto const& tunnel = orchestrator_.state().tunnels.at(Ids::makeConnectionId("db")).front();
        EXPECT_EQ(tunnel.status, TunnelStatus::Error);
        EXPECT_EQ(tunnel.error, std::string{"Port in use"});
        EXPECT_FALSE(registry().find(Ids::makeConnectionId("db"))->record.hasPinnedFeature("port-forwarding"));
    }

    TEST_F(ConnectionRegistryTests, DisconnectAlwaysEndsDisconnected)
    {
        addConnections({makeConnection("db")});
        registry().connect(Ids::makeConnectionId("db"));

        EXPECT_CALL(*gateway_, disconnect(_, _)).WillOnce([](Ids::ConnectionId const&, auto onComplete) {
            onComplete(failed(Gateway::Command::Disconnect, "Session not found"));
        });

        bool done = false;
        registry().disconnect(Ids::makeConnectionId("db"), [&]() {
            done = true;
        });
        EXPECT_TRUE(done);
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Disconnected);
    }

    TEST_F(ConnectionRegistryTests, DisconnectReleasesTerminals)
    {
        addConnections({makeConnection("db")});
        registry().connect(Ids::makeConnectionId("db"));
        orchestrator_.sessions().createTerminal(Ids::makeConnectionId("db"));
        ASSERT_EQ(orchestrator_.sessions().size(), 1u);

        registry().disconnect(Ids::makeConnectionId("db"));
        EXPECT_EQ(orchestrator_.sessions().size(), 0u);
        EXPECT_FALSE(orchestrator_.state().terminals.contains(Ids::makeConnectionId("db")));
    }

    TEST_F(ConnectionRegistryTests, DeleteConnectedConnectionDisconnectsFirst)
    {
        addConnections({makeConnection("db")});
        registry().connect(Ids::makeConnectionId("db"));
        orchestrator_.tabs().openTab(Ids::makeConnectionId("db"));

        EXPECT_CALL(*gateway_, disconnect(Ids::makeConnectionId("db"), _)).Times(1);
        registry().deleteConnection(Ids::makeConnectionId("db"));

        EXPECT_EQ(registry().find(Ids::makeConnectionId("db")), nullptr);
        EXPECT_TRUE(orchestrator_.tabs().tabs().empty());
        EXPECT_FALSE(orchestrator_.activeConnectionId());
    }

    TEST_F(ConnectionRegistryTests, DeletingWhileConnectingDropsTheLateConnection)
    {
        addConnections({makeConnection("db")});

        Gateway::BackendGateway::Handler<Gateway::ConnectResult> pending{};
        EXPECT_CALL(*gateway_, connect(_, _)).WillOnce(::testing::SaveArg<1>(&pending));
        EXPECT_CALL(*gateway_, disconnect(Ids::makeConnectionId("db"), _)).Times(1);
        EXPECT_CALL(*gateway_, homePath(_, _)).Times(0);
        EXPECT_CALL(*gateway_, listTunnels(_, _)).Times(0);

        std::optional<bool> connected{};
        registry().connect(Ids::makeConnectionId("db"), [&](bool result) {
            connected = result;
        });
        registry().deleteConnection(Ids::makeConnectionId("db"));
        EXPECT_FALSE(connected);

        ASSERT_TRUE(pending);
        pending(Gateway::ConnectResult{});

        EXPECT_EQ(connected, false);
        EXPECT_EQ(registry().find(Ids::makeConnectionId("db")), nullptr);
        EXPECT_FALSE(orchestrator_.state().tunnels.contains(Ids::makeConnectionId("db")));
    }

    TEST_F(ConnectionRegistryTests, ClearConnectionsReleasesEverything)
    {
        addConnections({makeConnection("db"), makeConnection("web")});
        registry().connect(Ids::makeConnectionId("db"));
        orchestrator_.tabs().openTab(Ids::makeConnectionId("db"));
        orchestrator_.tabs().openTab(Ids::localConnectionId());
        const auto remote = orchestrator_.sessions().createTerminal(Ids::makeConnectionId("db"));
        const auto local = orchestrator_.sessions().createTerminal(Ids::localConnectionId());
        orchestrator_.sessions().ensureSpawned(local, Ids::localConnectionId(), 24, 80);

        EXPECT_CALL(*gateway_, disconnect(Ids::makeConnectionId("db"), _)).Times(1);
        EXPECT_CALL(*gateway_, disconnect(Ids::makeConnectionId("web"), _)).Times(0);
        EXPECT_CALL(*gateway_, closeSession(local, _)).Times(1);

        registry().clearConnections();

        EXPECT_TRUE(registry().connections().empty());
        EXPECT_TRUE(orchestrator_.tabs().tabs().empty());
        EXPECT_EQ(orchestrator_.sessions().size(), 0u);
        EXPECT_FALSE(gateway_->events().tracks(remote));
        EXPECT_FALSE(gateway_->events().tracks(local));
        EXPECT_TRUE(orchestrator_.state().terminals.empty());
        EXPECT_TRUE(orchestrator_.state().activeTerminalIds.empty());
        EXPECT_TRUE(orchestrator_.state().tunnels.empty());
    }

    TEST_F(ConnectionRegistryTests, CapitalizedServerIconIsReplacedByDetectedOs)
    {
        auto connection = makeConnection("db");
        connection.icon = "Server";
        addConnections({connection});
        EXPECT_CALL(*gateway_, connect(_, _))
            .WillOnce([](SharedData::ConnectionConfig const&, auto onComplete) {
                onComplete(Gateway::ConnectResult{.detectedOs = "Ubuntu"});
            });

        registry().connect(Ids::makeConnectionId("db"));

        EXPECT_EQ(registry().find(Ids::makeConnectionId("db"))->record.icon, std::string{"ubuntu"});
    }

    TEST_F(ConnectionRegistryTests, PersistedMutationsSaveDocument)
    {
        nlohmann::json saved{};
        EXPECT_CALL(*gateway_, saveConnections(_, _))
            .WillRepeatedly([&](nlohmann::json const& document, auto onComplete) {
                saved = document;
                onComplete(succeeded());
            });

        registry().addConnection(makeConnection("db"));
        registry().toggleFavorite(Ids::makeConnectionId("db"));
        registry().addFolder("Production");

        ASSERT_EQ(saved["connections"].size(), 1u);
        EXPECT_EQ(saved["connections"][0]["id"], "db");
        EXPECT_EQ(saved["connections"][0]["isFavorite"], true);
        EXPECT_EQ(saved["folders"][0]["name"], "Production");
        EXPECT_TRUE(saved.contains("options"));
    }

    TEST_F(ConnectionRegistryTests, TemporaryConnectionIsNotSaved)
    {
        EXPECT_CALL(*gateway_, saveConnections(_, _)).Times(0);
        registry().addConnection(makeConnection("db"), true);
        EXPECT_NE(registry().find(Ids::makeConnectionId("db")), nullptr);
    }

    TEST_F(ConnectionRegistryTests, SaveFailureIsNotified)
    {
        ON_CALL(*gateway_, saveConnections(_, _)).WillByDefault([](nlohmann::json const&, auto onComplete) {
            onComplete(failed(Gateway::Command::SaveConnections, "Disk full"));
        });
        registry().addConnection(makeConnection("db"));

        ASSERT_EQ(notifications_.size(), 1u);
        EXPECT_NE(notifications_[0].message.find("Disk full"), std::string::npos);
    }

    TEST_F(ConnectionRegistryTests, LoadResetsStatusAndAppliesOptions)
    {
        EXPECT_CALL(*gateway_, loadConnections(_)).WillOnce([](auto onComplete) {
            onComplete(nlohmann::json{
                {"connections",
                 nlohmann::json::array(
                     {{{"id", "db"}, {"name", "db"}, {"host", "db.example.com"}, {"username", "admin"}},
                      {{"id", "db"}, {"name", "duplicate"}, {"host", "other"}, {"username", "admin"}}})},
                {"folders", nlohmann::json::array({"Production"})},
                {"options", {{"maxJumpDepth", 3}, {"logLevel", "off"}}},
            });
        });

        bool loaded = false;
        orchestrator_.start([&](bool result) {
            loaded = result;
        });

        EXPECT_TRUE(loaded);
        ASSERT_EQ(registry().connections().size(), 1u);
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Disconnected);
        EXPECT_EQ(orchestrator_.state().folders.size(), 1u);
        EXPECT_EQ(orchestrator_.store().options().maxJumpDepth, 3u);
        EXPECT_EQ(orchestrator_.store().options().speedWindow, std::chrono::milliseconds{500});
    }

    TEST_F(ConnectionRegistryTests, LoadFailureIsReported)
    {
        EXPECT_CALL(*gateway_, loadConnections(_)).WillOnce([](auto onComplete) {
            onComplete(std::unexpected(
                Gateway::Error{.command = Gateway::Command::LoadConnections, .message = "No such file"}));
        });

        std::optional<bool> loaded{};
        orchestrator_.start([&](bool result) {
            loaded = result;
        });
        EXPECT_EQ(loaded, false);
        EXPECT_EQ(notifications_.size(), 1u);
    }

    TEST_F(ConnectionRegistryTests, StatusChangeEventUpdatesConnection)
    {
        addConnections({makeConnection("db")});
        registry().connect(Ids::makeConnectionId("db"));

        gateway_->events().emit(SharedData::ConnectionStatusChange{
            .connectionId = Ids::makeConnectionId("db"),
            .status = SharedData::ConnectionStatus::Error,
            .error = "Connection reset by peer",
        });

        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Error);
        ASSERT_EQ(notifications_.size(), 1u);
        EXPECT_NE(notifications_[0].message.find("Connection reset by peer"), std::string::npos);

        gateway_->events().emit(SharedData::ConnectionStatusChange{
            .connectionId = Ids::makeConnectionId("unknown"),
            .status = SharedData::ConnectionStatus::Error,
        });
        EXPECT_EQ(notifications_.size(), 1u);
    }
}
