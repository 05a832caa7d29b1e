#pragma once

#include "gateway_mock.hpp"

#include <orchestration/orchestrator.hpp>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Orchestration::Test
{
    inline Persistence::Connection
    makeConnection(std::string const& id, std::optional<std::string> const& jumpServerId = std::nullopt)
    {
        Persistence::Connection connection{
            .id = Ids::makeConnectionId(id),
            .name = id,
            .host = id + ".example.com",
            .username = "admin",
            .password = "secret",
        };
        if (jumpServerId)
            connection.jumpServerId = Ids::makeConnectionId(*jumpServerId);
        return connection;
    }

    class OrchestrationFixture : public ::testing::Test
    {
      protected:
        void addConnections(std::vector<Persistence::Connection> const& connections)
        {
            for (auto const& connection : connections)
                orchestrator_.connections().addConnection(connection, true);
        }

        SharedData::ConnectionStatus statusOf(std::string const& id) const
        {
            auto const* entry = orchestrator_.state().findConnection(Ids::makeConnectionId(id));
            EXPECT_NE(entry, nullptr);
            return entry == nullptr ? SharedData::ConnectionStatus::Disconnected : entry->status;
        }

        void runFor(std::chrono::milliseconds duration)
        {
            context_.restart();
            context_.run_for(duration);
        }

        boost::asio::io_context context_{};
        std::shared_ptr<::testing::NiceMock<GatewayMock>> gateway_{
            std::make_shared<::testing::NiceMock<GatewayMock>>()};
        Orchestrator orchestrator_{context_.get_executor(), gateway_};
        std::vector<Notification> notifications_{};
        boost::signals2::scoped_connection notificationSubscription_{
            orchestrator_.store().onNotification([this](Notification const& notification) {
                notifications_.push_back(notification);
            })};
    };
}
