#include <orchestration/options.hpp>
#include <log/log.hpp>

#include <algorithm>

namespace Orchestration
{
    Options Options::fromPersistence(Persistence::OrchestrationOptions options)
    {
        options.useDefaultsFrom(Persistence::OrchestrationOptions::defaults());

        Options result{
            .maxJumpDepth = std::max<std::size_t>(1, *options.maxJumpDepth),
            .transferAutoRemove = std::chrono::seconds{std::max(0, *options.transferAutoRemoveSeconds)},
            .speedWindow = std::chrono::milliseconds{std::max(1, *options.speedWindowMilliseconds)},
            .speedSmoothing = std::clamp(*options.speedSmoothing, 0.0, 1.0),
            .scrollbackLimitBytes = *options.scrollbackLimitBytes,
        };
        if (result.speedSmoothing != *options.speedSmoothing)
            Log::warn("Speed smoothing {} is outside [0, 1], using {}.", *options.speedSmoothing, result.speedSmoothing);
        return result;
    }
}
