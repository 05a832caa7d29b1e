#include <orchestration/transfer_coordinator.hpp>
#include <orchestration/transitions/transfers.hpp>
#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>
#include <utility/format_bytes.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>

namespace Orchestration
{
    namespace
    {
        std::string baseName(std::string const& path)
        {
            auto trimmed = path;
            while (trimmed.size() > 1 && (trimmed.back() == '/' || trimmed.back() == '\\'))
                trimmed.pop_back();
            const auto pos = trimmed.find_last_of("/\\");
            return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
        }

        std::string joinPath(std::string const& directory, std::string const& name)
        {
            if (directory.empty())
                return name;
            if (directory.back() == '/' || directory.back() == '\\')
                return directory + name;
            return directory + '/' + name;
        }

        std::string describe(Transfer const& transfer)
        {
            if (transfer.label)
                return *transfer.label;
            return baseName(transfer.source.path);
        }
    }

    TransferCoordinator::TransferCoordinator(
        boost::asio::any_io_executor executor,
        std::shared_ptr<Gateway::BackendGateway> gateway,
        std::shared_ptr<Store> store,
        std::shared_ptr<ConnectionRegistry> registry,
        std::function<Clock::time_point()> clock)
        : executor_{std::move(executor)}
        , gateway_{std::move(gateway)}
        , store_{std::move(store)}
        , registry_{std::move(registry)}
        , clock_{std::move(clock)}
        , progressSubscription_{gateway_->events().onTransferProgress(
              [this](SharedData::TransferProgress const& event) {
                  updateProgress(event.transferId, event.transferred, event.total);
              })}
        , successSubscription_{gateway_->events().onTransferSuccess([this](SharedData::TransferSuccess const& event) {
            completeTransfer(event.transferId);
        })}
        , errorSubscription_{gateway_->events().onTransferError([this](SharedData::TransferError const& event) {
            failTransfer(event.transferId, event.error);
        })}
    {}

    TransferCoordinator::~TransferCoordinator()
    {
        for (auto& [id, timer] : removalTimers_)
            timer->cancel();
    }

    Ids::TransferId TransferCoordinator::addTransfer(
        SharedData::TransferEndpoint const& source,
        SharedData::TransferEndpoint const& destination,
        std::optional<std::string> const& label)
    {
        const auto now = clock_();
        Transfer transfer{
            .id = Ids::generateTransferId(),
            .source = source,
            .destination = destination,
            .label = label,
            .startTime = now,
            .lastUpdated = now,
        };
        auto id = transfer.id;
        store_->transition([&](State state) {
            return Transitions::addTransfer(std::move(state), std::move(transfer));
        });
        return id;
    }

    void TransferCoordinator::startTransfer(Ids::TransferId const& id)
    {
        auto const* transfer = store_->state().findTransfer(id);
        if (transfer == nullptr || transfer->status != TransferStatus::Pending)
        {
            Log::warn("Transfer '{}' cannot be started, it is unknown or already running.", id.value());
            return;
        }

        std::vector<Ids::ConnectionId> remotes{};
        for (auto const* endpoint : {&transfer->source, &transfer->destination})
        {
            if (Ids::isLocal(endpoint->connectionId) ||
                std::find(remotes.begin(), remotes.end(), endpoint->connectionId) != remotes.end())
                continue;
            auto const* connection = store_->state().findConnection(endpoint->connectionId);
            if (connection == nullptr || connection->status != SharedData::ConnectionStatus::Connected)
                remotes.push_back(endpoint->connectionId);
        }

        Log::info(
            "Starting {} transfer '{}': {}:{} -> {}:{}",
            Utility::enumToLowerString(transfer->kind()),
            id.value(),
            transfer->source.connectionId.value(),
            transfer->source.path,
            transfer->destination.connectionId.value(),
            transfer->destination.path);

        connectEndpoints(std::move(remotes), [weak = weak_from_this(), id](bool connected) {
            auto self = weak.lock();
            if (!self)
                return;
            if (!connected)
            {
                self->failTransfer(id, "Could not connect to the transfer endpoints.");
                return;
            }
            self->sendTransfer(id);
        });
    }

    Ids::TransferId TransferCoordinator::transfer(
        SharedData::TransferEndpoint const& source,
        SharedData::TransferEndpoint const& destination,
        std::optional<std::string> const& label)
    {
        auto id = addTransfer(source, destination, label);
        startTransfer(id);
        return id;
    }

    std::vector<Ids::TransferId> TransferCoordinator::copy(
        Ids::ConnectionId const& sourceConnectionId,
        std::vector<std::string> const& sourcePaths,
        Ids::ConnectionId const& destinationConnectionId,
        std::string const& destinationDirectory)
    {
        std::vector<Ids::TransferId> ids{};
        for (auto const& path : sourcePaths)
        {
            const auto name = baseName(path);
            const auto target = joinPath(destinationDirectory, name);
            if (sourceConnectionId == destinationConnectionId)
            {
                move(sourceConnectionId, path, target);
                continue;
            }
            ids.push_back(transfer(
                SharedData::TransferEndpoint{.connectionId = sourceConnectionId, .path = path},
                SharedData::TransferEndpoint{.connectionId = destinationConnectionId, .path = target},
                name));
        }
        return ids;
    }

    void TransferCoordinator::move(
        Ids::ConnectionId const& connectionId,
        std::string const& from,
        std::string const& to,
        std::function<void(bool)> onDone)
    {
        gateway_->rename(
            connectionId,
            from,
            to,
            [weak = weak_from_this(), connectionId, from, onDone = std::move(onDone)](
                std::expected<void, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (result)
                    self->destinationChanged_(connectionId);
                else
                    self->store_->notify(
                        Log::Level::Error, fmt::format("Could not move '{}': {}", from, result.error().message));
                if (onDone)
                    onDone(result.has_value());
            });
    }

    void TransferCoordinator::connectEndpoints(std::vector<Ids::ConnectionId> pending, std::function<void(bool)> onDone)
    {
        if (pending.empty())
        {
            onDone(true);
            return;
        }

        auto next = pending.front();
        pending.erase(pending.begin());
        registry_->connect(
            next,
            [weak = weak_from_this(), pending = std::move(pending), onDone = std::move(onDone)](bool connected) {
                auto self = weak.lock();
                if (!self)
                    return;
                if (!connected)
                    onDone(false);
                else
                    self->connectEndpoints(pending, onDone);
            });
    }

    void TransferCoordinator::sendTransfer(Ids::TransferId const& id)
    {
        auto const* transfer = store_->state().findTransfer(id);
        if (transfer == nullptr || transfer->isTerminal())
            return;

        gateway_->startTransfer(
            SharedData::TransferRequest{
                .transferId = id,
                .kind = transfer->kind(),
                .source = transfer->source,
                .destination = transfer->destination,
            },
            [weak = weak_from_this(), id](std::expected<void, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self)
                    return;
                if (result)
                    self->completeTransfer(id);
                else
                    self->failTransfer(id, result.error().message);
            });
    }

    void TransferCoordinator::updateProgress(Ids::TransferId const& id, std::uint64_t transferred, std::uint64_t total)
    {
        store_->transition([&](State state) {
            return Transitions::updateTransferProgress(
                std::move(state), id, transferred, total, clock_(), store_->options());
        });
    }

    template <typename FunctionT>
    bool TransferCoordinator::finish(Ids::TransferId const& id, FunctionT&& fn)
    {
        auto const* transfer = store_->state().findTransfer(id);
        if (transfer == nullptr || transfer->isTerminal())
            return false;

        store_->transition(std::forward<FunctionT>(fn));
        scheduleRemoval(id);
        return true;
    }

    void TransferCoordinator::completeTransfer(Ids::TransferId const& id)
    {
        auto const* transfer = store_->state().findTransfer(id);
        if (transfer == nullptr)
            return;
        const auto destination = transfer->destination.connectionId;

        const bool completed = finish(id, [&id](State state) {
            return Transitions::completeTransfer(std::move(state), id);
        });
        if (completed)
        {
            auto const& done = *store_->state().findTransfer(id);
            const auto seconds = std::chrono::duration<double>(clock_() - done.startTime).count();
            const auto transferred = static_cast<double>(done.progress.transferred);
            Log::info(
                "Transfer '{}' completed, {} copied at {}.",
                id.value(),
                Utility::formatBytes(done.progress.transferred),
                Utility::formatByteRate(seconds > 0.0 ? transferred / seconds : 0.0));
            destinationChanged_(destination);
        }
    }

    void TransferCoordinator::failTransfer(Ids::TransferId const& id, std::string const& message)
    {
        auto const* transfer = store_->state().findTransfer(id);
        if (transfer == nullptr)
            return;
        const auto name = describe(*transfer);

        const bool failed = finish(id, [&](State state) {
            return Transitions::failTransfer(std::move(state), id, message);
        });
        if (failed)
            store_->notify(Log::Level::Error, fmt::format("Transfer of '{}' failed: {}", name, message));
    }

    void TransferCoordinator::cancelTransfer(Ids::TransferId const& id)
    {
        auto const* transfer = store_->state().findTransfer(id);
        if (transfer == nullptr || transfer->isTerminal())
            return;

        Log::info("Cancelling transfer '{}'.", id.value());
        gateway_->cancelTransfer(
            id, [weak = weak_from_this(), id](std::expected<void, Gateway::Error> const& result) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (result)
                {
                    self->finish(id, [&id](State state) {
                        return Transitions::cancelTransfer(std::move(state), id);
                    });
                    return;
                }
                Log::warn(
                    "Cancel of transfer '{}' failed, assuming it already finished: {}",
                    id.value(),
                    result.error().message);
                self->removeTransfer(id);
            });
    }

    void TransferCoordinator::removeTransfer(Ids::TransferId const& id)
    {
        if (auto timer = removalTimers_.find(id); timer != removalTimers_.end())
        {
            timer->second->cancel();
            removalTimers_.erase(timer);
        }
        store_->transition([&id](State state) {
            return Transitions::removeTransfer(std::move(state), id);
        });
    }

    void TransferCoordinator::scheduleRemoval(Ids::TransferId const& id)
    {
        auto timer = std::make_unique<boost::asio::steady_timer>(executor_, store_->options().transferAutoRemove);
        timer->async_wait([weak = weak_from_this(), id](boost::system::error_code const& ec) {
            if (ec)
                return;
            auto self = weak.lock();
            if (!self)
                return;

            Log::debug("Removing finished transfer '{}'.", id.value());
            self->removalTimers_.erase(id);
            self->store_->transition([&id](State state) {
                return Transitions::removeTransfer(std::move(state), id);
            });
        });
        removalTimers_[id] = std::move(timer);
    }

    std::vector<Transfer> const& TransferCoordinator::transfers() const
    {
        return store_->state().transfers;
    }

    std::size_t TransferCoordinator::activeTransferCount() const
    {
        auto const& transfers = store_->state().transfers;
        return static_cast<std::size_t>(std::count_if(transfers.begin(), transfers.end(), [](Transfer const& t) {
            return !t.isTerminal();
        }));
    }

    boost::signals2::connection
    TransferCoordinator::onDestinationChanged(std::function<void(Ids::ConnectionId const&)> handler)
    {
        return destinationChanged_.connect(std::move(handler));
    }
}
