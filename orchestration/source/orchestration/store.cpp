#include <orchestration/store.hpp>
#include <log/log.hpp>

namespace Orchestration
{
    Store::Store(Options options)
        : options_{std::move(options)}
    {}

    void Store::setOptions(Options options)
    {
        options_ = std::move(options);
    }

    boost::signals2::connection Store::onChange(std::function<void(State const&)> handler)
    {
        return onChange_.connect(std::move(handler));
    }

    boost::signals2::connection Store::onNotification(std::function<void(Notification const&)> handler)
    {
        return onNotification_.connect(std::move(handler));
    }

    void Store::notify(Notification const& notification)
    {
        Log::log(notification.level, "{}", notification.message);
        onNotification_(notification);
    }

    void Store::notify(Log::Level level, std::string message)
    {
        notify(Notification{.level = level, .message = std::move(message)});
    }
}
