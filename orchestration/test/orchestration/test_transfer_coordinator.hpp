#pragma once

#include "fixture.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

namespace Orchestration::Test
{
    using ::testing::_;
    using namespace std::chrono_literals;

    class TransferCoordinatorTests : public OrchestrationFixture
    {
      protected:
        void SetUp() override
        {
            addConnections({makeConnection("db"), makeConnection("web")});
            auto options = orchestrator_.store().options();
            options.transferAutoRemove = 20ms;
            orchestrator_.store().setOptions(options);
        }

        TransferCoordinator& coordinator()
        {
            return orchestrator_.transfers();
        }

        Transfer const* find(Ids::TransferId const& id) const
        {
            return orchestrator_.state().findTransfer(id);
        }

        void progress(Ids::TransferId const& id, std::uint64_t transferred, std::uint64_t total)
        {
            gateway_->events().emit(
                SharedData::TransferProgress{.transferId = id, .transferred = transferred, .total = total});
        }

        static SharedData::TransferEndpoint local(std::string const& path)
        {
            return {.connectionId = Ids::localConnectionId(), .path = path};
        }

        static SharedData::TransferEndpoint remote(std::string const& connection, std::string const& path)
        {
            return {.connectionId = Ids::makeConnectionId(connection), .path = path};
        }

        Gateway::BackendGateway::Handler<void> pending_{};
    };

    TEST_F(TransferCoordinatorTests, UploadRunsToCompletionAndIsRemoved)
    {
        constexpr std::uint64_t size = 1024 * 1024;
        SharedData::TransferRequest request{};
        EXPECT_CALL(*gateway_, startTransfer(_, _))
            .WillOnce(::testing::DoAll(::testing::SaveArg<0>(&request), ::testing::SaveArg<1>(&pending_)));

        const auto id = coordinator().transfer(local("/tmp/dump.sql"), remote("db", "/srv/dump.sql"));
        EXPECT_EQ(statusOf("db"), SharedData::ConnectionStatus::Connected);
        EXPECT_EQ(request.transferId, id);
        EXPECT_EQ(request.kind, SharedData::TransferKind::Put);
        EXPECT_EQ(request.destination.path, "/srv/dump.sql");
        EXPECT_EQ(coordinator().activeTransferCount(), 1u);

        progress(id, 0, size);
        EXPECT_EQ(find(id)->status, TransferStatus::Transferring);
        EXPECT_DOUBLE_EQ(find(id)->progress.percentage, 0.0);

        progress(id, size / 2, size);
        EXPECT_DOUBLE_EQ(find(id)->progress.percentage, 50.0);

        progress(id, size, size);
        EXPECT_DOUBLE_EQ(find(id)->progress.percentage, 100.0);

        gateway_->events().emit(SharedData::TransferSuccess{.transferId = id});
        EXPECT_EQ(find(id)->status, TransferStatus::Completed);
        EXPECT_EQ(coordinator().activeTransferCount(), 0u);

        ASSERT_TRUE(pending_);
        pending_(succeeded());
        EXPECT_EQ(find(id)->status, TransferStatus::Completed);

        runFor(200ms);
        EXPECT_EQ(find(id), nullptr);
    }

    TEST_F(TransferCoordinatorTests, ReplyAloneCompletesTransfer)
    {
        std::vector<Ids::ConnectionId> refreshed{};
        boost::signals2::scoped_connection subscription{
            coordinator().onDestinationChanged([&refreshed](Ids::ConnectionId const& id) {
                refreshed.push_back(id);
            })};

        EXPECT_CALL(*gateway_, startTransfer(_, _))
            .WillOnce([](SharedData::TransferRequest const&, Gateway::BackendGateway::Handler<void> onComplete) {
                onComplete(succeeded());
            });

        const auto id = coordinator().transfer(remote("db", "/var/log/syslog"), local("/tmp/syslog"));
        EXPECT_EQ(find(id)->status, TransferStatus::Completed);
        EXPECT_DOUBLE_EQ(find(id)->progress.percentage, 100.0);
        ASSERT_EQ(refreshed.size(), 1u);
        EXPECT_EQ(refreshed.front(), Ids::localConnectionId());
    }

    TEST_F(TransferCoordinatorTests, RequestKindFollowsEndpoints)
    {
        std::vector<SharedData::TransferKind> kinds{};
        EXPECT_CALL(*gateway_, startTransfer(_, _))
            .Times(3)
            .WillRepeatedly([&kinds](SharedData::TransferRequest const& request, Gateway::BackendGateway::Handler<void> const&) {
                kinds.push_back(request.kind);
            });

        coordinator().transfer(local("/a"), remote("db", "/a"));
        coordinator().transfer(remote("db", "/b"), local("/b"));
        coordinator().transfer(remote("db", "/c"), remote("web", "/c"));

        EXPECT_EQ(
            kinds,
            (std::vector<SharedData::TransferKind>{
                SharedData::TransferKind::Put, SharedData::TransferKind::Get, SharedData::TransferKind::CrossCopy}));
        EXPECT_EQ(statusOf("web"), SharedData::ConnectionStatus::Connected);
    }

    TEST_F(TransferCoordinatorTests, BackendErrorFailsTransfer)
    {
        EXPECT_CALL(*gateway_, startTransfer(_, _)).WillOnce(::testing::SaveArg<1>(&pending_));

        const auto id = coordinator().transfer(local("/tmp/big.iso"), remote("db", "/srv/big.iso"), "big.iso");
        gateway_->events().emit(SharedData::TransferError{.transferId = id, .error = "disk full"});

        EXPECT_EQ(find(id)->status, TransferStatus::Failed);
        EXPECT_EQ(find(id)->error, std::string{"disk full"});
        ASSERT_EQ(notifications_.size(), 1u);
        EXPECT_EQ(notifications_.front().message, "Transfer of 'big.iso' failed: disk full");

        pending_(failed(Gateway::Command::TransferPut, "disk full"));
        EXPECT_EQ(notifications_.size(), 1u);
    }

    TEST_F(TransferCoordinatorTests, CancelStaysCancelledDespiteLateSuccess)
    {
        EXPECT_CALL(*gateway_, startTransfer(_, _)).WillOnce(::testing::SaveArg<1>(&pending_));
        EXPECT_CALL(*gateway_, cancelTransfer(_, _)).Times(1);

        const auto id = coordinator().transfer(local("/tmp/a"), remote("db", "/a"));
        progress(id, 10, 100);
        coordinator().cancelTransfer(id);
        EXPECT_EQ(find(id)->status, TransferStatus::Cancelled);

        gateway_->events().emit(SharedData::TransferSuccess{.transferId = id});
        pending_(succeeded());
        progress(id, 100, 100);

        EXPECT_EQ(find(id)->status, TransferStatus::Cancelled);
        EXPECT_EQ(find(id)->progress.transferred, 10u);
    }

    TEST_F(TransferCoordinatorTests, FailedCancelRemovesRecord)
    {
        EXPECT_CALL(*gateway_, startTransfer(_, _)).WillOnce(::testing::SaveArg<1>(&pending_));
        EXPECT_CALL(*gateway_, cancelTransfer(_, _))
            .WillOnce([](Ids::TransferId const&, Gateway::BackendGateway::Handler<void> onComplete) {
                onComplete(failed(Gateway::Command::CancelTransfer, "no such transfer"));
            });

        const auto id = coordinator().transfer(local("/tmp/a"), remote("db", "/a"));
        coordinator().cancelTransfer(id);
        EXPECT_EQ(find(id), nullptr);
    }

    TEST_F(TransferCoordinatorTests, FinishedTransferCannotBeCancelled)
    {
        EXPECT_CALL(*gateway_, cancelTransfer(_, _)).Times(0);
        const auto id = coordinator().transfer(local("/tmp/a"), remote("db", "/a"));
        ASSERT_EQ(find(id)->status, TransferStatus::Completed);
        coordinator().cancelTransfer(id);
        EXPECT_EQ(find(id)->status, TransferStatus::Completed);
    }

    TEST_F(TransferCoordinatorTests, CopyWithinOneConnectionRenames)
    {
        EXPECT_CALL(*gateway_, startTransfer(_, _)).Times(0);
        EXPECT_CALL(*gateway_, rename(Ids::makeConnectionId("db"), "/home/admin/a.txt", "/srv/a.txt", _)).Times(1);
        EXPECT_CALL(*gateway_, rename(Ids::makeConnectionId("db"), "/home/admin/logs/", "/srv/logs", _)).Times(1);

        const auto ids = coordinator().copy(
            Ids::makeConnectionId("db"),
            {"/home/admin/a.txt", "/home/admin/logs/"},
            Ids::makeConnectionId("db"),
            "/srv/");

        EXPECT_TRUE(ids.empty());
        EXPECT_TRUE(coordinator().transfers().empty());
    }

    TEST_F(TransferCoordinatorTests, CopyCreatesOneTransferPerItem)
    {
        const auto ids = coordinator().copy(
            Ids::localConnectionId(), {"/tmp/a.txt", "/tmp/b.txt"}, Ids::makeConnectionId("db"), "/srv");

        ASSERT_EQ(ids.size(), 2u);
        EXPECT_EQ(find(ids[0])->label, std::string{"a.txt"});
        EXPECT_EQ(find(ids[1])->destination.path, "/srv/b.txt");
    }

    TEST_F(TransferCoordinatorTests, PreflightFailureFailsOnlyThatItem)
    {
        EXPECT_CALL(*gateway_, connect(_, _))
            .WillOnce([](SharedData::ConnectionConfig const&,
                         Gateway::BackendGateway::Handler<Gateway::ConnectResult> onComplete) {
                onComplete(std::unexpected(Gateway::Error{.command = Gateway::Command::Connect, .message = "timeout"}));
            })
            .WillOnce([](SharedData::ConnectionConfig const&,
                         Gateway::BackendGateway::Handler<Gateway::ConnectResult> onComplete) {
                onComplete(Gateway::ConnectResult{});
            });
        EXPECT_CALL(*gateway_, startTransfer(_, _)).Times(1);

        const auto ids = coordinator().copy(
            Ids::localConnectionId(), {"/tmp/a.txt", "/tmp/b.txt"}, Ids::makeConnectionId("db"), "/srv");

        ASSERT_EQ(ids.size(), 2u);
        EXPECT_EQ(find(ids[0])->status, TransferStatus::Failed);
        EXPECT_EQ(find(ids[1])->status, TransferStatus::Completed);
    }

    TEST_F(TransferCoordinatorTests, RemoveStopsTimer)
    {
        const auto id = coordinator().transfer(local("/tmp/a"), remote("db", "/a"));
        coordinator().removeTransfer(id);
        EXPECT_EQ(find(id), nullptr);

        runFor(100ms);
        EXPECT_TRUE(coordinator().transfers().empty());
    }

    TEST_F(TransferCoordinatorTests, StartingTwiceSendsOnce)
    {
        EXPECT_CALL(*gateway_, startTransfer(_, _)).Times(1);
        const auto id = coordinator().addTransfer(local("/tmp/a"), remote("db", "/a"));
        EXPECT_EQ(find(id)->status, TransferStatus::Pending);

        coordinator().startTransfer(id);
        coordinator().startTransfer(id);
    }

    TEST(TransferCoordinatorClockTests, SpeedUsesInjectedClock)
    {
        boost::asio::io_context context{};
        auto gateway = std::make_shared<::testing::NiceMock<GatewayMock>>();
        auto store = std::make_shared<Store>(Options{.speedWindow = 1000ms});
        auto sessions = std::make_shared<SessionCache>(gateway, store);
        auto tunnels = std::make_shared<TunnelManager>(gateway, store);
        auto registry = std::make_shared<ConnectionRegistry>(gateway, store, sessions, tunnels);
        registry->addConnection(makeConnection("web"), true);

        Transfer::Clock::time_point now{};
        auto coordinator = std::make_shared<TransferCoordinator>(
            context.get_executor(), gateway, store, registry, [&now]() {
                return now;
            });

        EXPECT_CALL(*gateway, startTransfer(_, _)).WillOnce(::testing::Return());
        const auto id = coordinator->transfer(
            {.connectionId = Ids::makeConnectionId("web"), .path = "/a"},
            {.connectionId = Ids::localConnectionId(), .path = "/a"});
        ASSERT_NE(store->state().findTransfer(id), nullptr);

        now += 2s;
        gateway->events().emit(SharedData::TransferProgress{.transferId = id, .transferred = 4000, .total = 8000});
        EXPECT_DOUBLE_EQ(store->state().findTransfer(id)->speed, 2000.0);

        now += 500ms;
        gateway->events().emit(SharedData::TransferProgress{.transferId = id, .transferred = 6000, .total = 8000});
        EXPECT_DOUBLE_EQ(store->state().findTransfer(id)->speed, 2000.0);
        EXPECT_DOUBLE_EQ(store->state().findTransfer(id)->progress.percentage, 75.0);
    }
}
