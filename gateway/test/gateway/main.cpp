#include "test_command.hpp"
#include "test_event_hub.hpp"
#include "test_rpc_gateway.hpp"

#include <log/log.hpp>

#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    Log::setLevel(Log::Level::Off);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
