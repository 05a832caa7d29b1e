#pragma once

#include <gateway/command.hpp>

#include <fmt/format.h>

#include <string>

namespace Gateway
{
    struct Error
    {
        Command command{Command::Connect};
        std::string message{};

        std::string toString() const
        {
            return fmt::format("{} failed: {}", channelName(command), message);
        }
    };
}
