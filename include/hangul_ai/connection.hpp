// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file connection.hpp
/// @brief Abstract assistant connection, sessions and event streams

#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <hangul_ai/events.hpp>
#include <hangul_ai/types.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace hangul_ai
{

// =============================================================================
// Event Streams
// =============================================================================

/// Outcome of waiting for the next event
enum class NextStatus
{
    Received,
    TimedOut,
    Closed
};

struct NextEvent
{
    NextStatus status = NextStatus::Closed;
    std::optional<StreamEvent> event;
};

/// Ordered stream of events from one session
class EventStream
{
  public:
    virtual ~EventStream() = default;

    /// Wait up to timeout for the next event
    /// Queued events are still delivered after the stream has been closed.
    virtual NextEvent next(std::chrono::milliseconds timeout) = 0;
};

/// Thread-safe FIFO event stream fed by a session
class EventQueue : public EventStream
{
  public:
    /// Append an event; ignored once closed
    void push(StreamEvent event);

    /// Wake waiters; pending events remain readable
    void close();

    bool is_closed() const;

    NextEvent next(std::chrono::milliseconds timeout) override;

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StreamEvent> events_;
    bool closed_ = false;
};

// =============================================================================
// Sessions
// =============================================================================

/// Short-lived conversational session on an assistant connection
class ConversationSession
{
  public:
    virtual ~ConversationSession() = default;

    virtual const std::string& session_id() const = 0;

    /// Open a new stream receiving every event dispatched after this call
    virtual std::unique_ptr<EventStream> subscribe() = 0;

    /// Send a prompt
    /// @return Future resolving to the message ID
    virtual std::future<std::string> send(const std::string& prompt) = 0;

    /// Tear the session down on the assistant side
    virtual std::future<void> destroy() = 0;
};

// =============================================================================
// Connections
// =============================================================================

/// Long-lived connection to the assistant process
class AssistantConnection
{
  public:
    virtual ~AssistantConnection() = default;

    virtual std::future<void> start() = 0;
    virtual std::future<void> stop() = 0;

    virtual std::future<std::shared_ptr<ConversationSession>> create_session(
        SessionConfig config
    ) = 0;
};

} // namespace hangul_ai
