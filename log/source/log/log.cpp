#include <log/log.hpp>

namespace Log::Detail
{
    Logger logger{};
}

void Log::setupForwarding(ForwardingSink sink)
{
    Detail::logger.setupForwarding(std::move(sink));
}
