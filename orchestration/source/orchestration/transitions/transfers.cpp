#include <orchestration/transitions/transfers.hpp>

#include <algorithm>

namespace Orchestration::Transitions
{
    namespace
    {
        template <typename FunctionT>
        State modifyLiveTransfer(State state, Ids::TransferId const& id, FunctionT&& fn)
        {
            for (auto& transfer : state.transfers)
            {
                if (transfer.id == id)
                {
                    if (!transfer.isTerminal())
                        fn(transfer);
                    break;
                }
            }
            return state;
        }
    }

    double clampedPercentage(std::uint64_t transferred, std::uint64_t total)
    {
        if (total == 0)
            return 0.0;
        return std::clamp(static_cast<double>(transferred) / static_cast<double>(total) * 100.0, 0.0, 100.0);
    }

    State addTransfer(State state, Transfer transfer)
    {
        state.transfers.push_back(std::move(transfer));
        return state;
    }

    State updateTransferProgress(
        State state,
        Ids::TransferId const& id,
        std::uint64_t transferred,
        std::uint64_t total,
        Transfer::Clock::time_point now,
        Options const& options)
    {
        return modifyLiveTransfer(std::move(state), id, [&](Transfer& transfer) {
            transfer.status = TransferStatus::Transferring;
            transfer.progress = TransferProgress{
                .transferred = transferred,
                .total = total,
                .percentage = clampedPercentage(transferred, total),
            };

            const auto elapsed = now - transfer.lastUpdated;
            if (elapsed < options.speedWindow)
                return;

            const auto seconds = std::chrono::duration<double>(elapsed).count();
            const auto bytes = transferred > transfer.speedBaseline ? transferred - transfer.speedBaseline : 0;
            const auto current = seconds > 0.0 ? static_cast<double>(bytes) / seconds : 0.0;

            if (transfer.speed == 0.0)
                transfer.speed = current;
            else
                transfer.speed = transfer.speed * (1.0 - options.speedSmoothing) + current * options.speedSmoothing;

            transfer.lastUpdated = now;
            transfer.speedBaseline = transferred;
        });
    }

    State completeTransfer(State state, Ids::TransferId const& id)
    {
        return modifyLiveTransfer(std::move(state), id, [](Transfer& transfer) {
            const auto total = transfer.progress.total == 0 ? 1 : transfer.progress.total;
            transfer.progress = TransferProgress{.transferred = total, .total = total, .percentage = 100.0};
            transfer.status = TransferStatus::Completed;
        });
    }

    State failTransfer(State state, Ids::TransferId const& id, std::string const& message)
    {
        return modifyLiveTransfer(std::move(state), id, [&](Transfer& transfer) {
            transfer.status = TransferStatus::Failed;
            transfer.error = message;
        });
    }

    State cancelTransfer(State state, Ids::TransferId const& id)
    {
        return modifyLiveTransfer(std::move(state), id, [](Transfer& transfer) {
            transfer.status = TransferStatus::Cancelled;
        });
    }

    State removeTransfer(State state, Ids::TransferId const& id)
    {
        std::erase_if(state.transfers, [&id](Transfer const& transfer) {
            return transfer.id == id;
        });
        return state;
    }
}
