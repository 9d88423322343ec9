// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file jsonrpc.hpp
/// @brief JSON-RPC 2.0 client for the Copilot CLI server

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <hangul_ai/transport.hpp>
#include <hangul_ai/types.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>

namespace hangul_ai
{

// =============================================================================
// JSON-RPC 2.0 Exceptions
// =============================================================================

/// JSON-RPC error codes (standard and custom)
enum class JsonRpcErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    ServerError = -32000,

    RequestCancelled = -32800,
    ConnectionClosed = -32801,
    Timeout = -32802,
};

/// Exception for JSON-RPC errors, local or reported by the server
class JsonRpcError : public std::runtime_error
{
  public:
    JsonRpcError(JsonRpcErrorCode code, const std::string& message, const json& data = nullptr)
        : std::runtime_error(message), code_(code), data_(data)
    {
    }

    JsonRpcErrorCode code() const
    {
        return code_;
    }
    const json& data() const
    {
        return data_;
    }

  private:
    JsonRpcErrorCode code_;
    json data_;
};

// =============================================================================
// JSON-RPC 2.0 Message Types
// =============================================================================

/// Request ID (string or integer)
using JsonRpcId = std::variant<std::string, int64_t>;

json id_to_json(const JsonRpcId& id);

/// @throws std::runtime_error for ids that are neither string nor integer
JsonRpcId id_from_json(const json& j);

/// Request or notification (no id)
struct JsonRpcRequest
{
    std::string method;
    json params;
    std::optional<JsonRpcId> id;

    json to_json() const;
    static JsonRpcRequest from_json(const json& j);

    bool is_notification() const
    {
        return !id.has_value();
    }
};

struct JsonRpcErrorObject
{
    int code = 0;
    std::string message;
    json data;

    json to_json() const;
    static JsonRpcErrorObject from_json(const json& j);
};

struct JsonRpcResponse
{
    JsonRpcId id;
    std::optional<json> result;
    std::optional<JsonRpcErrorObject> error;

    json to_json() const;
    static JsonRpcResponse from_json(const json& j);

    bool is_error() const
    {
        return error.has_value();
    }
};

// =============================================================================
// JSON-RPC Client
// =============================================================================

/// Handler for incoming notifications
using NotificationHandler = std::function<void(const std::string& method, const json& params)>;

/// Handler for incoming requests; returns the result or throws JsonRpcError
using RequestHandler = std::function<json(const std::string& method, const json& params)>;

/// Called once when the read loop ends because the peer closed the stream
using CloseHandler = std::function<void()>;

/// Bidirectional JSON-RPC 2.0 client
///
/// A background thread reads framed messages and dispatches responses to
/// pending requests, notifications and requests to the installed handlers.
/// A second thread fails requests whose deadline has passed.
class JsonRpcClient
{
  public:
    /// @param transport The underlying transport (takes ownership)
    explicit JsonRpcClient(std::unique_ptr<ITransport> transport);
    ~JsonRpcClient();

    JsonRpcClient(const JsonRpcClient&) = delete;
    JsonRpcClient& operator=(const JsonRpcClient&) = delete;

    /// Start the reader and timeout threads
    void start();

    /// Close the transport, join the threads and fail everything pending
    void stop();

    bool is_running() const
    {
        return running_;
    }

    void set_notification_handler(NotificationHandler handler);
    void set_request_handler(RequestHandler handler);
    void set_close_handler(CloseHandler handler);

    /// Send a request
    /// @param timeout 0 = no timeout
    /// @return Future resolving to the result, or holding JsonRpcError.
    ///         Once the client is stopped or the peer has closed the stream
    ///         the future already holds ConnectionClosed.
    /// @throws TransportError if the request cannot be written
    std::future<json> invoke(
        const std::string& method,
        const json& params = nullptr,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{30000}
    );

    /// Send a notification (no response expected)
    void notify(const std::string& method, const json& params = nullptr);

  private:
    struct PendingRequest
    {
        std::promise<json> promise;
        std::chrono::steady_clock::time_point deadline;
    };

    void send_message(const json& message);
    void send_response(const JsonRpcId& id, const json& result);
    void send_error_response(const JsonRpcId& id, int code, const std::string& message);

    void read_loop();
    void timeout_loop();
    void dispatch_message(const json& message);
    void handle_response(const json& message);
    void handle_notification(const JsonRpcRequest& request);
    void handle_request(const JsonRpcRequest& request);

    /// Remove a pending request; nullptr if it is no longer pending
    std::shared_ptr<PendingRequest> take_pending(int64_t id);
    void fail_all_pending(JsonRpcErrorCode code, const std::string& message);

    std::unique_ptr<ITransport> transport_;
    MessageFramer framer_;
    std::atomic<int64_t> next_id_{1};
    std::atomic<bool> running_{false};

    std::thread read_thread_;
    std::thread timeout_thread_;
    std::mutex write_mutex_;

    std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    std::map<int64_t, std::shared_ptr<PendingRequest>> pending_requests_;
    bool closed_ = false; // guarded by pending_mutex_

    std::mutex handlers_mutex_;
    NotificationHandler notification_handler_;
    RequestHandler request_handler_;
    CloseHandler close_handler_;
};

} // namespace hangul_ai
