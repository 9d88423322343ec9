// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file service.hpp
/// @brief AssistantService: the tutor's entry point to the AI assistant

#include <future>
#include <hangul_ai/availability.hpp>
#include <hangul_ai/connection_handle.hpp>
#include <hangul_ai/conversation.hpp>
#include <hangul_ai/types.hpp>
#include <memory>
#include <optional>
#include <string>

namespace hangul_ai
{

/// Status message used whenever the service is up
inline constexpr const char* kServiceReadyMessage = "AI assistant ready";

/// Availability check, lifecycle and conversational requests
///
/// The host owns one instance for the lifetime of the application.
/// Futures returned by the conversational calls must complete before the
/// service is destroyed.
///
/// Example usage:
/// @code
/// AssistantService service(ServiceOptions::from_env());
/// auto status = service.init();
/// if (status.running)
/// {
///     auto answer = service.explain("한").get();
///     std::cout << answer.content << std::endl;
/// }
/// service.shutdown();
/// @endcode
class AssistantService
{
  public:
    /// Wire the real CLI probe and CLI-backed connections
    explicit AssistantService(ServiceOptions options = ServiceOptions::from_env());

    AssistantService(
        ServiceOptions options,
        std::shared_ptr<AvailabilityProbe> probe,
        ConnectionFactory factory
    );

    /// Best-effort shutdown
    ~AssistantService();

    AssistantService(const AssistantService&) = delete;
    AssistantService& operator=(const AssistantService&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    AvailabilityVerdict check() const;

    /// Start the assistant if it is available; never throws
    ServiceStatus init();

    ServiceStatus status() const;

    /// @throws AssistantError SendFailed if the connection failed to stop
    void shutdown();

    bool is_running() const
    {
        return handle_.is_running();
    }

    // =========================================================================
    // Conversational Requests
    // =========================================================================
    //
    // Every future fails with AssistantError(NotRunning) when the service is
    // not running, before any session is created.

    std::future<AssistantAnswer>
    ask(const std::string& prompt, std::optional<LearningContext> context = std::nullopt);

    /// Hint for the next key while typing target
    std::future<AssistantAnswer>
    hint(const std::string& target, const std::string& user_input, uint32_t level);

    /// Meaning, pronunciation and key sequence of a character or word
    std::future<AssistantAnswer> explain(const std::string& text);

    std::future<AssistantAnswer>
    analyze_mistake(const std::string& expected, const std::string& actual);

    const ServiceOptions& options() const
    {
        return options_;
    }

  private:
    ConversationOptions conversation_options() const;

    ServiceOptions options_;
    std::shared_ptr<AvailabilityProbe> probe_;
    ConnectionHandle handle_;
};

} // namespace hangul_ai
