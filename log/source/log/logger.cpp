#include <log/logger.hpp>

#include <spdlog/spdlog.h>

namespace Log
{
    void Logger::setupForwarding(ForwardingSink sink)
    {
        std::scoped_lock lock{guard_};
        sink_ = std::move(sink);
        if (!sink_)
            return;

        for (auto const& [level, message] : stash_)
            sink_(level, message);
        stash_.clear();
    }

    void Logger::setLevel(Level level)
    {
        spdlog::set_level(toSpdlogLevel(level));
    }

    Level Logger::level() const
    {
        return fromSpdlogLevel(spdlog::get_level());
    }

    std::size_t Logger::stashedCount() const
    {
        std::scoped_lock lock{guard_};
        return stash_.size();
    }

    void Logger::write(Level level, std::string const& message)
    {
        ForwardingSink sink{};
        {
            std::scoped_lock lock{guard_};
            if (sink_)
                sink = sink_;
            else
            {
                if (stash_.size() >= stashLimit)
                    stash_.pop_front();
                stash_.emplace_back(level, message);
            }
        }
        if (sink)
            sink(level, message);

        spdlog::log(toSpdlogLevel(level), "{}", message);
    }
}
