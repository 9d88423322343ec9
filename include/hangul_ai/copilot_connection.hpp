// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file copilot_connection.hpp
/// @brief Assistant connection to a Copilot CLI server over stdio

#include <atomic>
#include <hangul_ai/connection.hpp>
#include <hangul_ai/jsonrpc.hpp>
#include <hangul_ai/process.hpp>
#include <hangul_ai/session.hpp>
#include <hangul_ai/transport.hpp>
#include <hangul_ai/types.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace hangul_ai
{

/// Build the params of a session.create request
json build_session_create_request(const SessionConfig& config);

/// Connection to the Copilot CLI running in `--server --stdio` mode
///
/// Example usage:
/// @code
/// CopilotConnection connection(ServiceOptions::from_env());
/// connection.start().get();
/// auto session = connection.create_session(config).get();
/// ...
/// connection.stop().get();
/// @endcode
class CopilotConnection : public AssistantConnection
{
  public:
    /// Spawn the CLI on start()
    explicit CopilotConnection(ServiceOptions options);

    /// Speak JSON-RPC over an already connected transport; no process is spawned
    explicit CopilotConnection(std::unique_ptr<ITransport> transport, ServiceOptions options = {});

    ~CopilotConnection() override;

    CopilotConnection(const CopilotConnection&) = delete;
    CopilotConnection& operator=(const CopilotConnection&) = delete;

    /// Spawn (if needed), connect and verify the protocol version
    /// @throws std::runtime_error on version mismatch
    std::future<void> start() override;

    /// Close every stream, destroy every session, terminate the CLI
    std::future<void> stop() override;

    /// session.create
    std::future<std::shared_ptr<ConversationSession>> create_session(SessionConfig config) override;

    ConnectionState state() const
    {
        return state_.load();
    }

    /// Number of sessions not yet destroyed
    size_t session_count() const
    {
        return sessions_->size();
    }

    /// Resolve the executable and arguments, wrapping .js entry points with node
    static std::pair<std::string, std::vector<std::string>>
    resolve_cli_command(const std::string& cli_path, const std::vector<std::string>& args);

  private:
    void start_cli_server();
    void connect_to_server();
    void verify_protocol_version();
    void teardown(bool graceful);

    void handle_session_event(const json& params);
    json handle_server_request(const std::string& method, const json& params);

    ServiceOptions options_;
    std::unique_ptr<ITransport> transport_;
    std::unique_ptr<Process> process_;
    std::shared_ptr<JsonRpcClient> rpc_;
    std::shared_ptr<SessionRegistry> sessions_;

    std::mutex mutex_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
};

} // namespace hangul_ai
