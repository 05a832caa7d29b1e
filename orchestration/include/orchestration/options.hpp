#pragma once

#include <persistence/state/orchestration_options.hpp>

#include <chrono>
#include <cstddef>

namespace Orchestration
{
    /**
     * @brief Resolved runtime tunables. Built from the persisted options after defaults were applied.
     */
    struct Options
    {
        std::size_t maxJumpDepth{10};
        std::chrono::milliseconds transferAutoRemove{5000};
        std::chrono::milliseconds speedWindow{500};
        double speedSmoothing{0.3};
        std::size_t scrollbackLimitBytes{1024 * 1024};

        static Options fromPersistence(Persistence::OrchestrationOptions options);
    };
}
