// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <cstdlib>
#include <gtest/gtest.h>
#include <hangul_ai/types.hpp>

using namespace hangul_ai;

// =============================================================================
// Enums
// =============================================================================

TEST(TypesTest, ConnectionStateEnum)
{
    EXPECT_EQ(json(ConnectionState::Disconnected), "disconnected");
    EXPECT_EQ(json(ConnectionState::Connecting), "connecting");
    EXPECT_EQ(json(ConnectionState::Connected), "connected");
    EXPECT_EQ(json(ConnectionState::Error), "error");
}

TEST(TypesTest, SystemMessageModeEnum)
{
    EXPECT_EQ(json(SystemMessageMode::Append), "append");
    EXPECT_EQ(json(SystemMessageMode::Replace), "replace");
    EXPECT_EQ(json("replace").get<SystemMessageMode>(), SystemMessageMode::Replace);
}

TEST(TypesTest, SystemMessageConfigOmitsUnsetFields)
{
    SystemMessageConfig config;
    config.content = "You are a tutor";

    json j = config;
    EXPECT_FALSE(j.contains("mode"));
    EXPECT_EQ(j["content"], "You are a tutor");

    auto parsed = json{{"mode", "replace"}}.get<SystemMessageConfig>();
    EXPECT_EQ(parsed.mode, SystemMessageMode::Replace);
    EXPECT_FALSE(parsed.content.has_value());
}

TEST(TypesTest, ProtocolVersion)
{
    EXPECT_EQ(kProtocolVersion, 2);
}

// =============================================================================
// Learning types
// =============================================================================

TEST(TypesTest, LearningContextKeys)
{
    LearningContext ctx;
    ctx.current_level = 2;
    ctx.recent_mistakes = {"ㄱ"};
    ctx.accuracy = 0.5f;
    ctx.total_attempts = 9;

    json j = ctx;
    EXPECT_EQ(j["current_level"], 2);
    EXPECT_TRUE(j["current_target"].is_null());
    EXPECT_EQ(j["recent_mistakes"], json::array({"ㄱ"}));
    EXPECT_FLOAT_EQ(j["accuracy"].get<float>(), 0.5f);
    EXPECT_EQ(j["total_attempts"], 9);
}

TEST(TypesTest, LearningContextDefaultsForMissingKeys)
{
    auto ctx = json{{"current_level", 7}, {"current_target", "나무"}}.get<LearningContext>();

    EXPECT_EQ(ctx.current_level, 7u);
    EXPECT_EQ(ctx.current_target, std::string("나무"));
    EXPECT_TRUE(ctx.recent_mistakes.empty());
    EXPECT_FLOAT_EQ(ctx.accuracy, 0.0f);
    EXPECT_EQ(ctx.total_attempts, 0u);

    auto empty = json::object().get<LearningContext>();
    EXPECT_EQ(empty.current_level, 0u);
    EXPECT_FALSE(empty.current_target.has_value());
}

TEST(TypesTest, AssistantAnswerToolUsedIsNull)
{
    json j = AssistantAnswer{"답", std::nullopt};
    EXPECT_EQ(j, (json{{"content", "답"}, {"tool_used", nullptr}}));

    auto parsed = json{{"content", "x"}, {"tool_used", "search"}}.get<AssistantAnswer>();
    EXPECT_EQ(parsed.tool_used, std::string("search"));
}

TEST(TypesTest, ServiceStatusKeys)
{
    ServiceStatus status{true, false, true, true, "GitHub Copilot is ready"};
    json j = status;

    EXPECT_EQ(j.size(), 5u);
    EXPECT_EQ(j["available"], true);
    EXPECT_EQ(j["running"], false);
    EXPECT_EQ(j["cli_installed"], true);
    EXPECT_EQ(j["cli_authenticated"], true);
    EXPECT_EQ(j["message"], "GitHub Copilot is ready");
}

// =============================================================================
// Service options
// =============================================================================

class ServiceOptionsEnvTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        clear();
    }

    void TearDown() override
    {
        clear();
    }

    static void clear()
    {
        ::unsetenv(ServiceOptions::ENV_CLI_PATH);
        ::unsetenv(ServiceOptions::ENV_GH_PATH);
        ::unsetenv(ServiceOptions::ENV_LOG_LEVEL);
        ::unsetenv(ServiceOptions::ENV_TIMEOUT_SECS);
    }
};

TEST_F(ServiceOptionsEnvTest, Defaults)
{
    auto opts = ServiceOptions::from_env();

    EXPECT_EQ(opts.cli_path, "copilot");
    EXPECT_EQ(opts.gh_path, "gh");
    EXPECT_EQ(opts.log_level, "info");
    EXPECT_EQ(opts.event_timeout, std::chrono::seconds(60));
    EXPECT_FALSE(opts.cwd.has_value());
    EXPECT_FALSE(opts.environment.has_value());
}

TEST_F(ServiceOptionsEnvTest, ReadsEnvironment)
{
    ::setenv(ServiceOptions::ENV_CLI_PATH, "/opt/copilot/index.js", 1);
    ::setenv(ServiceOptions::ENV_GH_PATH, "/usr/local/bin/gh", 1);
    ::setenv(ServiceOptions::ENV_LOG_LEVEL, "debug", 1);
    ::setenv(ServiceOptions::ENV_TIMEOUT_SECS, "15", 1);

    auto opts = ServiceOptions::from_env();

    EXPECT_EQ(opts.cli_path, "/opt/copilot/index.js");
    EXPECT_EQ(opts.gh_path, "/usr/local/bin/gh");
    EXPECT_EQ(opts.log_level, "debug");
    EXPECT_EQ(opts.event_timeout, std::chrono::seconds(15));
}

TEST_F(ServiceOptionsEnvTest, InvalidTimeoutKeepsDefault)
{
    ::setenv(ServiceOptions::ENV_TIMEOUT_SECS, "soon", 1);
    EXPECT_EQ(ServiceOptions::from_env().event_timeout, std::chrono::seconds(60));

    ::setenv(ServiceOptions::ENV_TIMEOUT_SECS, "0", 1);
    EXPECT_EQ(ServiceOptions::from_env().event_timeout, std::chrono::seconds(60));
}

TEST_F(ServiceOptionsEnvTest, HugeTimeoutIsClampedToOneDay)
{
    ::setenv(ServiceOptions::ENV_TIMEOUT_SECS, "10000000", 1);
    EXPECT_EQ(ServiceOptions::from_env().event_timeout, std::chrono::hours(24));

    ::setenv(ServiceOptions::ENV_TIMEOUT_SECS, "99999999999999999999", 1);
    auto opts = ServiceOptions::from_env();
    EXPECT_EQ(opts.event_timeout, std::chrono::hours(24));

    // Converting to milliseconds must not overflow
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(opts.event_timeout);
    EXPECT_EQ(ms.count(), 86400000);
}
