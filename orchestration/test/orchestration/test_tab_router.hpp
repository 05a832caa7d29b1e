#pragma once

#include "fixture.hpp"

#include <gtest/gtest.h>

namespace Orchestration::Test
{
    using ::testing::_;

    class TabRouterTests : public OrchestrationFixture
    {
      protected:
        TabRouter& router()
        {
            return orchestrator_.tabs();
        }

        Ids::ConnectionId const db_{Ids::makeConnectionId("db")};
    };

    TEST_F(TabRouterTests, OpeningTwiceReusesTabAndConnectsOnce)
    {
        addConnections({makeConnection("db")});
        EXPECT_CALL(*gateway_, connect(_, _)).Times(1);

        const auto first = router().openTab(db_);
        const auto second = router().openTab(db_, TabView::Files);

        ASSERT_TRUE(first);
        EXPECT_EQ(first, second);
        ASSERT_EQ(router().tabs().size(), 1u);
        EXPECT_EQ(router().tabs().front().view, TabView::Files);
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Connected);
    }

    TEST_F(TabRouterTests, ConnectionInErrorIsRetriedOnOpen)
    {
        addConnections({makeConnection("db")});
        EXPECT_CALL(*gateway_, connect(_, _))
            .WillOnce([](SharedData::ConnectionConfig const&,
                         Gateway::BackendGateway::Handler<Gateway::ConnectResult> onComplete) {
                onComplete(std::unexpected(Gateway::Error{.command = Gateway::Command::Connect, .message = "refused"}));
            })
            .WillOnce([](SharedData::ConnectionConfig const&,
                         Gateway::BackendGateway::Handler<Gateway::ConnectResult> onComplete) {
                onComplete(Gateway::ConnectResult{});
            });

        router().openTab(db_);
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Error);
        router().openTab(db_);
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Connected);
        EXPECT_EQ(router().tabs().size(), 1u);
    }

    TEST_F(TabRouterTests, LocalTabsAreNeverReused)
    {
        EXPECT_CALL(*gateway_, connect(_, _)).Times(0);

        const auto first = router().openTab(Ids::localConnectionId());
        const auto second = router().openTab(Ids::localConnectionId(), TabView::Files);

        ASSERT_TRUE(first && second);
        EXPECT_NE(*first, *second);
        ASSERT_EQ(router().tabs().size(), 2u);
        EXPECT_EQ(router().tabs().back().view, TabView::Files);
        EXPECT_EQ(router().activeTab()->id, *second);
    }

    TEST_F(TabRouterTests, UnknownConnectionOpensNothing)
    {
        EXPECT_FALSE(router().openTab(Ids::makeConnectionId("nope")));
        EXPECT_TRUE(router().tabs().empty());
    }

    TEST_F(TabRouterTests, ClosingLastTabDisconnects)
    {
        addConnections({makeConnection("db")});
        const auto tab = router().openTab(db_);
        ASSERT_EQ(statusOf("db"), SharedData::ConnectionStatus::Connected);

        EXPECT_CALL(*gateway_, disconnect(db_, _)).Times(1);
        router().closeTab(*tab);

        EXPECT_TRUE(router().tabs().empty());
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Disconnected);
        EXPECT_FALSE(router().activeConnectionId());
    }

    TEST_F(TabRouterTests, ClosingLastLocalTabClosesLocalTerminals)
    {
        const auto first = router().openTab(Ids::localConnectionId());
        const auto second = router().openTab(Ids::localConnectionId());
        const auto terminal = orchestrator_.sessions().createTerminal(Ids::localConnectionId());
        orchestrator_.sessions().ensureSpawned(terminal, Ids::localConnectionId(), 24, 80);

        EXPECT_CALL(*gateway_, closeSession(terminal, _)).Times(1);
        router().closeTab(*first);
        EXPECT_TRUE(orchestrator_.sessions().contains(terminal));

        router().closeTab(*second);
        EXPECT_FALSE(orchestrator_.sessions().contains(terminal));
        EXPECT_FALSE(orchestrator_.state().terminals.contains(Ids::localConnectionId()));
    }

    TEST_F(TabRouterTests, SnippetsTabDoesNotKeepLocalTerminalsAlive)
    {
        const auto local = router().openTab(Ids::localConnectionId());
        const auto snippets = router().openSnippetsTab();
        const auto terminal = orchestrator_.sessions().createTerminal(Ids::localConnectionId());

        router().closeTab(*local);
        EXPECT_FALSE(orchestrator_.sessions().contains(terminal));
        EXPECT_NE(orchestrator_.state().findTab(snippets), nullptr);
    }

    TEST_F(TabRouterTests, ClosingSnippetsTabLeavesLocalTerminals)
    {
        router().openTab(Ids::localConnectionId());
        const auto snippets = router().openSnippetsTab();
        const auto terminal = orchestrator_.sessions().createTerminal(Ids::localConnectionId());

        router().closeTab(snippets);
        EXPECT_TRUE(orchestrator_.sessions().contains(terminal));
    }

    TEST_F(TabRouterTests, SingletonTabs)
    {
        const auto forwarding = router().openPortForwardingTab();
        const auto settings = router().openSettingsTab();
        const auto snippets = router().openSnippetsTab();

        EXPECT_EQ(router().openPortForwardingTab(), forwarding);
        EXPECT_EQ(router().openSettingsTab(), settings);
        EXPECT_EQ(router().openSnippetsTab(), snippets);
        EXPECT_EQ(router().tabs().size(), 3u);
        EXPECT_EQ(router().activeTab()->id, snippets);
    }

    TEST_F(TabRouterTests, ActiveConnectionFollowsActiveTab)
    {
        addConnections({makeConnection("db"), makeConnection("web")});
        const auto dbTab = router().openTab(db_);
        router().openTab(Ids::makeConnectionId("web"));
        EXPECT_EQ(router().activeConnectionId(), Ids::makeConnectionId("web"));

        router().activateTab(*dbTab);
        EXPECT_EQ(router().activeConnectionId(), db_);

        router().openSettingsTab();
        EXPECT_FALSE(router().activeConnectionId());
    }

    TEST_F(TabRouterTests, ReorderMovesTab)
    {
        addConnections({makeConnection("a"), makeConnection("b"), makeConnection("c")});
        const auto a = router().openTab(Ids::makeConnectionId("a"));
        router().openTab(Ids::makeConnectionId("b"));
        router().openTab(Ids::makeConnectionId("c"));

        router().reorderTabs(0, 2);
        EXPECT_EQ(router().tabs().back().id, *a);

        router().reorderTabs(0, 7);
        EXPECT_EQ(router().tabs().back().id, *a);
    }
}
