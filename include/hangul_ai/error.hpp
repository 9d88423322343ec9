// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file error.hpp
/// @brief Error taxonomy surfaced by the assistant service

#include <stdexcept>
#include <string>

namespace hangul_ai
{

/// Failure categories of the assistant service
enum class AssistantErrorCode
{
    /// Operation attempted with no live connection
    NotInitialized,
    /// Conversational call rejected because the service is not running
    NotRunning,
    /// Copilot CLI binary not found
    CliNotFound,
    /// GitHub CLI not logged in
    NotAuthenticated,
    /// Connection construction or start failed
    StartFailed,
    /// Session creation failed
    SessionFailed,
    /// Send failed, the session reported an error, or stop failed
    SendFailed,
    /// No event within the watchdog window
    Timeout,
};

/// Exception for assistant service failures
class AssistantError : public std::runtime_error
{
  public:
    explicit AssistantError(AssistantErrorCode code, const std::string& detail = {})
        : std::runtime_error(describe(code, detail)), code_(code), detail_(detail)
    {
    }

    AssistantErrorCode code() const
    {
        return code_;
    }

    /// Underlying cause for StartFailed/SessionFailed/SendFailed, empty otherwise
    const std::string& detail() const
    {
        return detail_;
    }

    /// User-facing text for a code and its detail
    static std::string describe(AssistantErrorCode code, const std::string& detail)
    {
        switch (code)
        {
        case AssistantErrorCode::NotInitialized:
            return "Copilot service not initialized";
        case AssistantErrorCode::NotRunning:
            return "AI assistant not running. Copilot CLI may not be installed.";
        case AssistantErrorCode::CliNotFound:
            return "GitHub Copilot CLI not found. Please install it from "
                   "https://docs.github.com/en/copilot/github-copilot-in-the-cli";
        case AssistantErrorCode::NotAuthenticated:
            return "GitHub Copilot CLI not authenticated. Run 'gh auth login' and "
                   "'gh extension install github/gh-copilot'";
        case AssistantErrorCode::StartFailed:
            return "Failed to start Copilot client: " + detail;
        case AssistantErrorCode::SessionFailed:
            return "Failed to create session: " + detail;
        case AssistantErrorCode::SendFailed:
            return "Failed to send message: " + detail;
        case AssistantErrorCode::Timeout:
            return "Session timeout";
        }
        return "Unknown assistant error";
    }

  private:
    AssistantErrorCode code_;
    std::string detail_;
};

} // namespace hangul_ai
