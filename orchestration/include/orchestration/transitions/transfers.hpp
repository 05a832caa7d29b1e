#pragma once

#include <orchestration/options.hpp>
#include <orchestration/state.hpp>

#include <cstdint>
#include <string>

namespace Orchestration::Transitions
{
    /**
     * @brief transferred / total * 100 clamped to [0, 100], 0 if the total is unknown.
     */
    double clampedPercentage(std::uint64_t transferred, std::uint64_t total);

    State addTransfer(State state, Transfer transfer);

    /**
     * @brief Applies a progress observation. Ignored once the transfer is terminal.
     * The speed is re-estimated once per speed window as an exponential moving average.
     */
    State updateTransferProgress(
        State state,
        Ids::TransferId const& id,
        std::uint64_t transferred,
        std::uint64_t total,
        Transfer::Clock::time_point now,
        Options const& options);

    /// Snaps progress to 100% and marks the transfer completed.
    State completeTransfer(State state, Ids::TransferId const& id);
    State failTransfer(State state, Ids::TransferId const& id, std::string const& message);
    State cancelTransfer(State state, Ids::TransferId const& id);
    State removeTransfer(State state, Ids::TransferId const& id);
}
