#include "test_connection_config.hpp"
#include "test_events.hpp"
#include "test_error_or_success.hpp"
#include "test_described_json.hpp"

#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
