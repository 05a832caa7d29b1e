#pragma once

#include <gateway/backend_gateway.hpp>
#include <orchestration/connection_registry.hpp>
#include <orchestration/store.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/signals2.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Orchestration
{
    /**
     * @brief Tracks every file transfer as its own state machine and drives it through the backend.
     *
     * Terminal transfers are removed automatically after the configured delay.
     */
    class TransferCoordinator : public std::enable_shared_from_this<TransferCoordinator>
    {
      public:
        using Clock = Transfer::Clock;

        TransferCoordinator(
            boost::asio::any_io_executor executor,
            std::shared_ptr<Gateway::BackendGateway> gateway,
            std::shared_ptr<Store> store,
            std::shared_ptr<ConnectionRegistry> registry,
            std::function<Clock::time_point()> clock = &Clock::now);
        TransferCoordinator(TransferCoordinator const&) = delete;
        TransferCoordinator& operator=(TransferCoordinator const&) = delete;
        TransferCoordinator(TransferCoordinator&&) = delete;
        TransferCoordinator& operator=(TransferCoordinator&&) = delete;
        ~TransferCoordinator();

        /**
         * @brief Creates a pending transfer record. Nothing is sent to the backend.
         */
        Ids::TransferId addTransfer(
            SharedData::TransferEndpoint const& source,
            SharedData::TransferEndpoint const& destination,
            std::optional<std::string> const& label = std::nullopt);

        /**
         * @brief Connects every remote endpoint that is not connected yet and then sends the transfer request
         * that fits the endpoints: put, get or cross copy.
         */
        void startTransfer(Ids::TransferId const& id);

        /// addTransfer followed by startTransfer.
        Ids::TransferId transfer(
            SharedData::TransferEndpoint const& source,
            SharedData::TransferEndpoint const& destination,
            std::optional<std::string> const& label = std::nullopt);

        /**
         * @brief Copies several items into a destination directory. Items on the same connection are moved by
         * renaming them instead, without a transfer record. Each item fails on its own.
         *
         * @return The ids of the created transfers.
         */
        std::vector<Ids::TransferId> copy(
            Ids::ConnectionId const& sourceConnectionId,
            std::vector<std::string> const& sourcePaths,
            Ids::ConnectionId const& destinationConnectionId,
            std::string const& destinationDirectory);

        /// Renames within one connection.
        void move(
            Ids::ConnectionId const& connectionId,
            std::string const& from,
            std::string const& to,
            std::function<void(bool)> onDone = {});

        void updateProgress(Ids::TransferId const& id, std::uint64_t transferred, std::uint64_t total);
        void completeTransfer(Ids::TransferId const& id);
        void failTransfer(Ids::TransferId const& id, std::string const& message);

        /**
         * @brief Asks the backend to cancel. The transfer becomes cancelled if it agrees and is removed if the
         * cancel request fails.
         */
        void cancelTransfer(Ids::TransferId const& id);

        /// Removes the record immediately and stops its removal timer.
        void removeTransfer(Ids::TransferId const& id);

        std::vector<Transfer> const& transfers() const;
        std::size_t activeTransferCount() const;

        /**
         * @brief Emitted when a transfer into a connection finished, so listings of it can be refreshed.
         */
        boost::signals2::connection onDestinationChanged(std::function<void(Ids::ConnectionId const&)> handler);

      private:
        void connectEndpoints(std::vector<Ids::ConnectionId> pending, std::function<void(bool)> onDone);
        void sendTransfer(Ids::TransferId const& id);
        /// Applies a terminal transition and schedules the removal if the transfer was still live.
        template <typename FunctionT>
        bool finish(Ids::TransferId const& id, FunctionT&& fn);
        void scheduleRemoval(Ids::TransferId const& id);

      private:
        boost::asio::any_io_executor executor_;
        std::shared_ptr<Gateway::BackendGateway> gateway_;
        std::shared_ptr<Store> store_;
        std::shared_ptr<ConnectionRegistry> registry_;
        std::function<Clock::time_point()> clock_;
        std::unordered_map<Ids::TransferId, std::unique_ptr<boost::asio::steady_timer>, Ids::IdHash> removalTimers_{};
        boost::signals2::signal<void(Ids::ConnectionId const&)> destinationChanged_{};
        boost::signals2::scoped_connection progressSubscription_{};
        boost::signals2::scoped_connection successSubscription_{};
        boost::signals2::scoped_connection errorSubscription_{};
    };
}
