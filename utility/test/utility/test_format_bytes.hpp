#pragma once

#include <utility/format_bytes.hpp>

#include <gtest/gtest.h>

namespace Utility::Test
{
    TEST(FormatBytesTests, SmallValuesAreShownInBytes)
    {
        EXPECT_EQ(formatBytes(std::uint64_t{0}), "0 B");
        EXPECT_EQ(formatBytes(std::uint64_t{1023}), "1023 B");
    }

    TEST(FormatBytesTests, MagnitudeSwitchesAtPowersOf1024)
    {
        EXPECT_EQ(determineOrderOfMagnitude(1024.0), OrderOfMagnitude::Kibi);
        EXPECT_EQ(determineOrderOfMagnitude(1024.0 * 1024.0 - 1.0), OrderOfMagnitude::Kibi);
        EXPECT_EQ(determineOrderOfMagnitude(1024.0 * 1024.0), OrderOfMagnitude::Mebi);
    }

    TEST(FormatBytesTests, FormatsWithTwoDecimals)
    {
        EXPECT_EQ(formatBytes(std::uint64_t{1536}), "1.50 KiB");
        EXPECT_EQ(formatBytes(std::uint64_t{3} * 1024 * 1024), "3.00 MiB");
    }

    TEST(FormatBytesTests, ByteRateHasPerSecondSuffix)
    {
        EXPECT_EQ(formatByteRate(2048.0), "2.00 KiB/s");
    }
}
