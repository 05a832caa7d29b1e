#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace Persistence
{
    struct OrchestrationOptions
    {
        std::optional<std::size_t> maxJumpDepth{std::nullopt};
        std::optional<int> transferAutoRemoveSeconds{std::nullopt};
        std::optional<int> speedWindowMilliseconds{std::nullopt};
        std::optional<double> speedSmoothing{std::nullopt};
        std::optional<std::size_t> scrollbackLimitBytes{std::nullopt};
        std::optional<std::string> logLevel{std::nullopt};

        void useDefaultsFrom(OrchestrationOptions const& other);

        static OrchestrationOptions defaults();
    };
    void to_json(nlohmann::json& j, OrchestrationOptions const& options);
    void from_json(nlohmann::json const& j, OrchestrationOptions& options);
}
