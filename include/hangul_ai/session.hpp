// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file session.hpp
/// @brief Conversation session backed by the Copilot CLI JSON-RPC server

#include <chrono>
#include <hangul_ai/connection.hpp>
#include <hangul_ai/events.hpp>
#include <hangul_ai/jsonrpc.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hangul_ai
{

class SessionRegistry;

/// A Copilot conversation session
///
/// Events routed here by the connection are fanned out to every open
/// subscription, each with its own queue.
///
/// Example usage:
/// @code
/// auto session = connection.create_session(config).get();
/// auto stream = session->subscribe();
/// session->send("Hello!").get();
/// auto next = stream->next(std::chrono::seconds(60));
/// @endcode
class CopilotSession : public ConversationSession
{
  public:
    /// Create a session (called by CopilotConnection)
    CopilotSession(
        std::string session_id,
        std::shared_ptr<JsonRpcClient> rpc,
        std::weak_ptr<SessionRegistry> registry = {},
        std::chrono::milliseconds request_timeout = std::chrono::milliseconds{30000}
    );

    ~CopilotSession() override;

    CopilotSession(const CopilotSession&) = delete;
    CopilotSession& operator=(const CopilotSession&) = delete;

    const std::string& session_id() const override
    {
        return session_id_;
    }

    std::unique_ptr<EventStream> subscribe() override;

    /// session.send
    std::future<std::string> send(const std::string& prompt) override;

    /// session.destroy; closes every open stream and leaves the registry first
    std::future<void> destroy() override;

    /// Deliver an event to all open streams (called by CopilotConnection)
    void dispatch_event(const StreamEvent& event);

    /// Close every open stream so readers see the end of the conversation
    void close_streams();

    /// Number of streams still referenced by a subscriber
    size_t subscriber_count() const;

  private:
    std::string session_id_;
    std::shared_ptr<JsonRpcClient> rpc_;
    std::weak_ptr<SessionRegistry> registry_;
    std::chrono::milliseconds request_timeout_;

    mutable std::mutex streams_mutex_;
    std::vector<std::weak_ptr<EventQueue>> streams_;
};

// =============================================================================
// SessionRegistry - live sessions of one connection
// =============================================================================

/// Sessions by id, used to route session.event notifications
class SessionRegistry
{
  public:
    void add(const std::shared_ptr<CopilotSession>& session);
    void remove(const std::string& session_id);

    /// @return nullptr if no such session is registered
    std::shared_ptr<CopilotSession> find(const std::string& session_id) const;

    /// Remove and return every registered session
    std::vector<std::shared_ptr<CopilotSession>> take_all();

    /// Close the streams of every registered session
    void close_all_streams();

    size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CopilotSession>> sessions_;
};

} // namespace hangul_ai
