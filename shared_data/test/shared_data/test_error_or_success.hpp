#pragma once

#include <shared_data/error_or_success.hpp>
#include <shared_data/directory_entry.hpp>

#include <gtest/gtest.h>

namespace SharedData::Test
{
    struct HomePath
    {
        std::string path{};
    };
    BOOST_DESCRIBE_STRUCT(HomePath, (), (path))

    TEST(ErrorOrSuccessTests, ErrorReplyIsRecognized)
    {
        const auto reply = nlohmann::json::parse(R"({"error": "permission denied"})").get<ErrorOrSuccess<HomePath>>();
        EXPECT_FALSE(reply.success());
        EXPECT_EQ(reply.error, "permission denied");
    }

    TEST(ErrorOrSuccessTests, NonStringErrorIsDumped)
    {
        const auto reply = nlohmann::json::parse(R"({"error": {"code": 5}})").get<ErrorOrSuccess<>>();
        ASSERT_TRUE(reply.error);
        EXPECT_EQ(*reply.error, R"({"code":5})");
    }

    TEST(ErrorOrSuccessTests, SuccessReplyCarriesData)
    {
        const auto reply =
            nlohmann::json::parse(R"({"path": "/home/admin", "success": true})").get<ErrorOrSuccess<HomePath>>();
        EXPECT_TRUE(reply.success());
        EXPECT_EQ(reply.path, "/home/admin");
    }

    TEST(ErrorOrSuccessTests, SerializesSuccessFlag)
    {
        const nlohmann::json j = ErrorOrSuccess<HomePath>{HomePath{.path = "/"}};
        EXPECT_EQ(j["success"], true);
        EXPECT_EQ(j["path"], "/");

        const nlohmann::json e = error<HomePath>("nope");
        EXPECT_EQ(e["error"], "nope");
        EXPECT_FALSE(e.contains("success"));
    }

    TEST(ErrorOrSuccessTests, ExplicitFailureWithoutReasonIsAnError)
    {
        const auto reply = nlohmann::json::parse(R"({"success": false})").get<ErrorOrSuccess<>>();
        EXPECT_FALSE(reply.success());
        EXPECT_FALSE(reply.toExpected().has_value());
    }

    TEST(ErrorOrSuccessTests, ToExpectedCarriesPayload)
    {
        const auto reply = nlohmann::json::parse(R"({"path": "/srv"})").get<ErrorOrSuccess<HomePath>>();
        const auto expected = reply.toExpected();
        ASSERT_TRUE(expected.has_value());
        EXPECT_EQ(expected->path, "/srv");
    }
}
