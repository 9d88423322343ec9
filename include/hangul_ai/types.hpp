// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file types.hpp
/// @brief Value types exchanged between the assistant service, the Copilot CLI and the host

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hangul_ai
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

// =============================================================================
// Protocol Version
// =============================================================================

/// Protocol version spoken by the Copilot CLI server in `--server` mode
inline constexpr int kProtocolVersion = 2;

// =============================================================================
// Enums
// =============================================================================

/// Connection state of a CLI-backed connection
enum class ConnectionState
{
    Disconnected,
    Connecting,
    Connected,
    Error
};

/// How the session system message relates to the assistant's default persona
enum class SystemMessageMode
{
    Append,
    Replace
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    ConnectionState,
    {
        {ConnectionState::Disconnected, "disconnected"},
        {ConnectionState::Connecting, "connecting"},
        {ConnectionState::Connected, "connected"},
        {ConnectionState::Error, "error"},
    }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    SystemMessageMode,
    {
        {SystemMessageMode::Append, "append"},
        {SystemMessageMode::Replace, "replace"},
    }
)

// =============================================================================
// Session Configuration
// =============================================================================

/// System message configuration
struct SystemMessageConfig
{
    std::optional<SystemMessageMode> mode;
    std::optional<std::string> content;
};

inline void to_json(json& j, const SystemMessageConfig& c)
{
    j = json::object();
    if (c.mode)
        j["mode"] = *c.mode;
    if (c.content)
        j["content"] = *c.content;
}

inline void from_json(const json& j, SystemMessageConfig& c)
{
    if (j.contains("mode"))
        c.mode = j.at("mode").get<SystemMessageMode>();
    if (j.contains("content"))
        c.content = j.at("content").get<std::string>();
}

/// Configuration for one conversational session
struct SessionConfig
{
    std::optional<std::string> model;
    std::optional<SystemMessageConfig> system_message;

    /// Ask the server for assistant.message_delta events
    bool streaming = false;
};

// =============================================================================
// Learning Domain Types
// =============================================================================

/// Snapshot of the learner's progress, used to decorate a prompt
struct LearningContext
{
    uint32_t current_level = 0;
    std::optional<std::string> current_target;
    std::vector<std::string> recent_mistakes;
    float accuracy = 0.0f;
    uint32_t total_attempts = 0;
};

inline void to_json(json& j, const LearningContext& c)
{
    j = json{
        {"current_level", c.current_level},
        {"current_target", nullptr},
        {"recent_mistakes", c.recent_mistakes},
        {"accuracy", c.accuracy},
        {"total_attempts", c.total_attempts},
    };
    if (c.current_target)
        j["current_target"] = *c.current_target;
}

inline void from_json(const json& j, LearningContext& c)
{
    c.current_level = j.value("current_level", 0u);
    if (j.contains("current_target") && !j.at("current_target").is_null())
        c.current_target = j.at("current_target").get<std::string>();
    c.recent_mistakes = j.value("recent_mistakes", std::vector<std::string>{});
    c.accuracy = j.value("accuracy", 0.0f);
    c.total_attempts = j.value("total_attempts", 0u);
}

/// Aggregated answer for one conversational request
struct AssistantAnswer
{
    std::string content;
    std::optional<std::string> tool_used;
};

inline void to_json(json& j, const AssistantAnswer& a)
{
    j = json{{"content", a.content}, {"tool_used", nullptr}};
    if (a.tool_used)
        j["tool_used"] = *a.tool_used;
}

inline void from_json(const json& j, AssistantAnswer& a)
{
    j.at("content").get_to(a.content);
    if (j.contains("tool_used") && !j.at("tool_used").is_null())
        a.tool_used = j.at("tool_used").get<std::string>();
}

/// Result of probing for the Copilot CLI and the GitHub CLI login
struct AvailabilityVerdict
{
    bool cli_installed = false;
    bool cli_authenticated = false;
    bool available = false;
    std::string message;
};

inline void to_json(json& j, const AvailabilityVerdict& v)
{
    j = json{
        {"cli_installed", v.cli_installed},
        {"cli_authenticated", v.cli_authenticated},
        {"available", v.available},
        {"message", v.message},
    };
}

/// Service status reported to the host by check/init/status
struct ServiceStatus
{
    bool available = false;
    bool running = false;
    bool cli_installed = false;
    bool cli_authenticated = false;
    std::string message;
};

inline void to_json(json& j, const ServiceStatus& s)
{
    j = json{
        {"available", s.available},
        {"running", s.running},
        {"cli_installed", s.cli_installed},
        {"cli_authenticated", s.cli_authenticated},
        {"message", s.message},
    };
}

// =============================================================================
// Service Options
// =============================================================================

/// Options for the assistant service and the CLI process it drives
struct ServiceOptions
{
    static constexpr const char* ENV_CLI_PATH = "HANGUL_AI_CLI_PATH";
    static constexpr const char* ENV_GH_PATH = "HANGUL_AI_GH_PATH";
    static constexpr const char* ENV_LOG_LEVEL = "HANGUL_AI_LOG_LEVEL";
    static constexpr const char* ENV_TIMEOUT_SECS = "HANGUL_AI_TIMEOUT_SECS";

    /// Copilot CLI executable
    std::string cli_path = "copilot";

    /// Extra arguments placed before the server arguments
    std::vector<std::string> cli_args;

    /// GitHub CLI executable, used for the extension and auth probes
    std::string gh_path = "gh";

    /// Log level passed to the CLI and applied to our logger
    std::string log_level = "info";

    /// Working directory for the CLI process (empty = inherit)
    std::optional<std::string> cwd;

    /// Replacement environment for the CLI process (nullopt = inherit)
    std::optional<std::map<std::string, std::string>> environment;

    /// Maximum wait for the next session event
    std::chrono::seconds event_timeout{60};

    /// Timeout for individual JSON-RPC requests
    std::chrono::milliseconds request_timeout{30000};

    /// Upper bound for HANGUL_AI_TIMEOUT_SECS (one day)
    static constexpr long kMaxEventTimeoutSecs = 86400;

    /// Build options from HANGUL_AI_* environment variables, defaults elsewhere
    static ServiceOptions from_env()
    {
        ServiceOptions opts;
        if (const char* v = std::getenv(ENV_CLI_PATH); v != nullptr && v[0] != '\0')
            opts.cli_path = v;
        if (const char* v = std::getenv(ENV_GH_PATH); v != nullptr && v[0] != '\0')
            opts.gh_path = v;
        if (const char* v = std::getenv(ENV_LOG_LEVEL); v != nullptr && v[0] != '\0')
            opts.log_level = v;
        if (const char* v = std::getenv(ENV_TIMEOUT_SECS); v != nullptr && v[0] != '\0')
        {
            char* end = nullptr;
            long secs = std::strtol(v, &end, 10);
            if (end != v && *end == '\0' && secs > 0)
                opts.event_timeout =
                    std::chrono::seconds(std::min<long>(secs, kMaxEventTimeoutSecs));
        }
        return opts;
    }
};

} // namespace hangul_ai
