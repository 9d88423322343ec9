// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file commands.hpp
/// @brief Host-facing commands returning a uniform {success, data, error} envelope

#include <hangul_ai/service.hpp>
#include <hangul_ai/types.hpp>
#include <optional>
#include <string>

namespace hangul_ai
{

// =============================================================================
// Response Envelope
// =============================================================================

template <typename T>
struct CommandResponse
{
    bool success = false;
    std::optional<T> data;
    std::optional<std::string> error;

    static CommandResponse ok(T value)
    {
        return CommandResponse{true, std::move(value), std::nullopt};
    }

    static CommandResponse fail(std::string message)
    {
        return CommandResponse{false, std::nullopt, std::move(message)};
    }
};

template <>
struct CommandResponse<void>
{
    bool success = false;
    std::optional<std::string> error;

    static CommandResponse ok()
    {
        return CommandResponse{true, std::nullopt};
    }

    static CommandResponse fail(std::string message)
    {
        return CommandResponse{false, std::move(message)};
    }
};

template <typename T>
void to_json(json& j, const CommandResponse<T>& r)
{
    j = json{{"success", r.success}, {"data", nullptr}, {"error", nullptr}};
    if (r.data)
        j["data"] = *r.data;
    if (r.error)
        j["error"] = *r.error;
}

inline void to_json(json& j, const CommandResponse<void>& r)
{
    j = json{{"success", r.success}, {"data", nullptr}, {"error", nullptr}};
    if (r.error)
        j["error"] = *r.error;
}

// =============================================================================
// Commands
// =============================================================================
//
// check, init and status always succeed. The others report AssistantError
// text in the error field.

/// Availability only; running is always false
CommandResponse<ServiceStatus> check_command(const AssistantService& service);
CommandResponse<ServiceStatus> init_command(AssistantService& service);
CommandResponse<ServiceStatus> status_command(const AssistantService& service);

CommandResponse<AssistantAnswer> ask_command(
    AssistantService& service,
    const std::string& prompt,
    std::optional<LearningContext> context = std::nullopt
);

CommandResponse<AssistantAnswer> hint_command(
    AssistantService& service,
    const std::string& target,
    const std::string& user_input,
    uint32_t level
);

CommandResponse<AssistantAnswer> explain_command(AssistantService& service, const std::string& text);

CommandResponse<AssistantAnswer> analyze_mistake_command(
    AssistantService& service, const std::string& expected, const std::string& actual
);

CommandResponse<void> shutdown_command(AssistantService& service);

// =============================================================================
// Dispatch
// =============================================================================

/// Run a command named by the host with JSON arguments
///
/// Names: "check", "init", "status", "ask", "hint", "explain",
/// "analyze_mistake", "shutdown". Argument keys are snake_case.
/// @return Serialized envelope; unknown names and bad arguments give success=false
json dispatch_command(AssistantService& service, const std::string& name, const json& args);

} // namespace hangul_ai
