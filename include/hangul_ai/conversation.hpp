// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file conversation.hpp
/// @brief One question, one session: prompt building and answer collection

#include <chrono>
#include <hangul_ai/connection.hpp>
#include <hangul_ai/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hangul_ai
{

// =============================================================================
// Tutor Persona and Prompt Templates
// =============================================================================

/// System message that replaces the assistant's default persona
extern const char* const kTutorPersona;

/// Append the learner's context block to a prompt
std::string build_prompt(const std::string& prompt, const std::optional<LearningContext>& context);

/// Render mistakes as ["a", "b"] with quotes and backslashes escaped
std::string format_mistakes(const std::vector<std::string>& mistakes);

std::string hint_prompt(const std::string& target, const std::string& user_input, uint32_t level);
std::string explain_prompt(const std::string& text);
std::string mistake_prompt(const std::string& expected, const std::string& actual);

// =============================================================================
// Conversation
// =============================================================================

struct ConversationOptions
{
    /// Maximum wait for each event while the answer streams in
    std::chrono::milliseconds event_timeout = std::chrono::seconds(60);

    /// Ask the server for delta events
    bool streaming = true;

    std::optional<std::string> model;
};

/// Destroys a session when it goes out of scope
/// Failures are logged; the guard never throws.
class SessionGuard
{
  public:
    explicit SessionGuard(std::shared_ptr<ConversationSession> session)
        : session_(std::move(session))
    {
    }

    ~SessionGuard();

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    ConversationSession& operator*() const
    {
        return *session_;
    }
    ConversationSession* operator->() const
    {
        return session_.get();
    }

  private:
    std::shared_ptr<ConversationSession> session_;
};

/// Ask one question in a fresh session and wait for the whole answer
/// @throws AssistantError SessionFailed, SendFailed or Timeout
AssistantAnswer ask(
    AssistantConnection& connection,
    const std::string& prompt,
    const std::optional<LearningContext>& context = std::nullopt,
    const ConversationOptions& options = {}
);

} // namespace hangul_ai
