#include <persistence/state/orchestration_options.hpp>
#include <utility/json.hpp>

namespace Persistence
{
    void OrchestrationOptions::useDefaultsFrom(OrchestrationOptions const& other)
    {
        if (!maxJumpDepth.has_value())
            maxJumpDepth = other.maxJumpDepth;
        if (!transferAutoRemoveSeconds.has_value())
            transferAutoRemoveSeconds = other.transferAutoRemoveSeconds;
        if (!speedWindowMilliseconds.has_value())
            speedWindowMilliseconds = other.speedWindowMilliseconds;
        if (!speedSmoothing.has_value())
            speedSmoothing = other.speedSmoothing;
        if (!scrollbackLimitBytes.has_value())
            scrollbackLimitBytes = other.scrollbackLimitBytes;
        if (!logLevel.has_value())
            logLevel = other.logLevel;
    }

    OrchestrationOptions OrchestrationOptions::defaults()
    {
        return OrchestrationOptions{
            .maxJumpDepth = 10,
            .transferAutoRemoveSeconds = 5,
            .speedWindowMilliseconds = 500,
            .speedSmoothing = 0.3,
            .scrollbackLimitBytes = 1024 * 1024,
            .logLevel = "info",
        };
    }

    void to_json(nlohmann::json& j, OrchestrationOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, maxJumpDepth);
        TO_JSON_OPTIONAL(j, options, transferAutoRemoveSeconds);
        TO_JSON_OPTIONAL(j, options, speedWindowMilliseconds);
        TO_JSON_OPTIONAL(j, options, speedSmoothing);
        TO_JSON_OPTIONAL(j, options, scrollbackLimitBytes);
        TO_JSON_OPTIONAL(j, options, logLevel);
    }
    void from_json(nlohmann::json const& j, OrchestrationOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, maxJumpDepth);
        FROM_JSON_OPTIONAL(j, options, transferAutoRemoveSeconds);
        FROM_JSON_OPTIONAL(j, options, speedWindowMilliseconds);
        FROM_JSON_OPTIONAL(j, options, speedSmoothing);
        FROM_JSON_OPTIONAL(j, options, scrollbackLimitBytes);
        FROM_JSON_OPTIONAL(j, options, logLevel);
    }
}
