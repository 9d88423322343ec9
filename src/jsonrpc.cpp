// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <hangul_ai/jsonrpc.hpp>
#include <hangul_ai/logging.hpp>

#include <algorithm>
#include <vector>

namespace hangul_ai
{

// =============================================================================
// Message Types
// =============================================================================

json id_to_json(const JsonRpcId& id)
{
    return std::visit([](const auto& v) -> json { return v; }, id);
}

JsonRpcId id_from_json(const json& j)
{
    if (j.is_string())
        return j.get<std::string>();
    if (j.is_number_integer())
        return j.get<int64_t>();
    throw std::runtime_error("Invalid JSON-RPC id type");
}

json JsonRpcRequest::to_json() const
{
    json j = {{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.is_null())
        j["params"] = params;
    if (id)
        j["id"] = id_to_json(*id);
    return j;
}

JsonRpcRequest JsonRpcRequest::from_json(const json& j)
{
    JsonRpcRequest req;
    req.method = j.at("method").get<std::string>();
    if (j.contains("params"))
        req.params = j.at("params");
    if (j.contains("id") && !j.at("id").is_null())
        req.id = id_from_json(j.at("id"));
    return req;
}

json JsonRpcErrorObject::to_json() const
{
    json j = {{"code", code}, {"message", message}};
    if (!data.is_null())
        j["data"] = data;
    return j;
}

JsonRpcErrorObject JsonRpcErrorObject::from_json(const json& j)
{
    JsonRpcErrorObject err;
    err.code = j.at("code").get<int>();
    err.message = j.at("message").get<std::string>();
    if (j.contains("data"))
        err.data = j.at("data");
    return err;
}

json JsonRpcResponse::to_json() const
{
    json j = {{"jsonrpc", "2.0"}, {"id", id_to_json(id)}};
    if (result)
        j["result"] = *result;
    if (error)
        j["error"] = error->to_json();
    return j;
}

JsonRpcResponse JsonRpcResponse::from_json(const json& j)
{
    JsonRpcResponse resp;
    if (j.contains("id") && !j.at("id").is_null())
        resp.id = id_from_json(j.at("id"));
    if (j.contains("result"))
        resp.result = j.at("result");
    if (j.contains("error"))
        resp.error = JsonRpcErrorObject::from_json(j.at("error"));
    return resp;
}

// =============================================================================
// JsonRpcClient - lifecycle
// =============================================================================

JsonRpcClient::JsonRpcClient(std::unique_ptr<ITransport> transport)
    : transport_(std::move(transport)), framer_(*transport_)
{
}

JsonRpcClient::~JsonRpcClient()
{
    stop();
}

void JsonRpcClient::start()
{
    if (running_.exchange(true))
        return;

    read_thread_ = std::thread([this] { read_loop(); });
    timeout_thread_ = std::thread([this] { timeout_loop(); });
}

void JsonRpcClient::stop()
{
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        closed_ = true;
        running_ = false;
    }
    pending_cv_.notify_all();

    // Closing the transport unblocks the reader
    if (transport_)
        transport_->close();

    if (read_thread_.joinable() && read_thread_.get_id() != std::this_thread::get_id())
        read_thread_.join();
    if (timeout_thread_.joinable())
        timeout_thread_.join();

    fail_all_pending(JsonRpcErrorCode::ConnectionClosed, "Connection closed");
}

void JsonRpcClient::set_notification_handler(NotificationHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    notification_handler_ = std::move(handler);
}

void JsonRpcClient::set_request_handler(RequestHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    request_handler_ = std::move(handler);
}

void JsonRpcClient::set_close_handler(CloseHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    close_handler_ = std::move(handler);
}

// =============================================================================
// JsonRpcClient - outgoing
// =============================================================================

std::future<json> JsonRpcClient::invoke(
    const std::string& method, const json& params, std::chrono::milliseconds timeout
)
{
    int64_t id = next_id_++;

    auto pending = std::make_shared<PendingRequest>();
    pending->deadline = timeout.count() > 0 ? std::chrono::steady_clock::now() + timeout
                                            : std::chrono::steady_clock::time_point::max();
    auto future = pending->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (closed_)
        {
            pending->promise.set_exception(std::make_exception_ptr(
                JsonRpcError(JsonRpcErrorCode::ConnectionClosed, "Connection closed")
            ));
            return future;
        }
        pending_requests_[id] = pending;
    }
    pending_cv_.notify_all();

    try
    {
        send_message(JsonRpcRequest{method, params, JsonRpcId{id}}.to_json());
    }
    catch (const TransportError&)
    {
        take_pending(id);
        throw;
    }

    logger()->trace("rpc -> {} (id={})", method, id);
    return future;
}

void JsonRpcClient::notify(const std::string& method, const json& params)
{
    send_message(JsonRpcRequest{method, params, std::nullopt}.to_json());
}

void JsonRpcClient::send_response(const JsonRpcId& id, const json& result)
{
    send_message(JsonRpcResponse{id, result, std::nullopt}.to_json());
}

void JsonRpcClient::send_error_response(const JsonRpcId& id, int code, const std::string& message)
{
    send_message(
        JsonRpcResponse{id, std::nullopt, JsonRpcErrorObject{code, message, nullptr}}.to_json()
    );
}

void JsonRpcClient::send_message(const json& message)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    framer_.write_message(message.dump());
}

// =============================================================================
// JsonRpcClient - background threads
// =============================================================================

void JsonRpcClient::read_loop()
{
    bool peer_closed = false;

    while (running_)
    {
        try
        {
            dispatch_message(json::parse(framer_.read_message()));
        }
        catch (const ConnectionClosedError&)
        {
            peer_closed = running_.load();
            break;
        }
        catch (const json::exception& e)
        {
            logger()->warn("Dropping malformed JSON-RPC message: {}", e.what());
        }
        catch (const TransportError& e)
        {
            if (!running_)
                break;
            logger()->warn("Transport error on JSON-RPC channel: {}", e.what());
            if (!transport_->is_open())
            {
                peer_closed = true;
                break;
            }
        }
        catch (const std::runtime_error& e)
        {
            logger()->warn("Dropping invalid JSON-RPC message: {}", e.what());
        }
    }

    if (!peer_closed)
        return;

    logger()->debug("JSON-RPC peer closed the connection");
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        closed_ = true;
        running_ = false;
    }
    pending_cv_.notify_all();
    fail_all_pending(JsonRpcErrorCode::ConnectionClosed, "Connection closed");

    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = close_handler_;
    }
    if (handler)
        handler();
}

void JsonRpcClient::timeout_loop()
{
    using clock = std::chrono::steady_clock;

    std::unique_lock<std::mutex> lock(pending_mutex_);
    while (running_)
    {
        auto now = clock::now();
        auto next_deadline = clock::time_point::max();
        std::vector<std::shared_ptr<PendingRequest>> expired;

        for (auto it = pending_requests_.begin(); it != pending_requests_.end();)
        {
            if (it->second->deadline <= now)
            {
                expired.push_back(it->second);
                it = pending_requests_.erase(it);
            }
            else
            {
                next_deadline = std::min(next_deadline, it->second->deadline);
                ++it;
            }
        }

        if (!expired.empty())
        {
            lock.unlock();
            for (auto& pending : expired)
                pending->promise.set_exception(std::make_exception_ptr(
                    JsonRpcError(JsonRpcErrorCode::Timeout, "Request timed out")
                ));
            lock.lock();
            continue;
        }

        auto stopped = [this] { return !running_.load(); };
        if (next_deadline == clock::time_point::max())
            pending_cv_.wait_for(lock, std::chrono::milliseconds(250), stopped);
        else
            pending_cv_.wait_until(lock, next_deadline, stopped);
    }
}

void JsonRpcClient::dispatch_message(const json& message)
{
    bool has_id = message.contains("id") && !message.at("id").is_null();

    if (has_id && !message.contains("method") &&
        (message.contains("result") || message.contains("error")))
    {
        handle_response(message);
        return;
    }

    if (message.contains("method"))
    {
        auto request = JsonRpcRequest::from_json(message);
        if (request.is_notification())
            handle_notification(request);
        else
            handle_request(request);
        return;
    }

    logger()->debug("Ignoring JSON-RPC message without method or id");
}

void JsonRpcClient::handle_response(const json& message)
{
    auto response = JsonRpcResponse::from_json(message);

    // Outgoing ids are always integers
    const auto* id = std::get_if<int64_t>(&response.id);
    if (id == nullptr)
        return;

    auto pending = take_pending(*id);
    if (!pending)
        return;

    if (response.is_error())
    {
        const auto& err = *response.error;
        pending->promise.set_exception(std::make_exception_ptr(
            JsonRpcError(static_cast<JsonRpcErrorCode>(err.code), err.message, err.data)
        ));
    }
    else
    {
        pending->promise.set_value(response.result.value_or(nullptr));
    }
}

void JsonRpcClient::handle_notification(const JsonRpcRequest& request)
{
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = notification_handler_;
    }
    if (!handler)
        return;

    try
    {
        handler(request.method, request.params);
    }
    catch (const std::exception& e)
    {
        logger()->warn("Notification handler for '{}' failed: {}", request.method, e.what());
    }
}

void JsonRpcClient::handle_request(const JsonRpcRequest& request)
{
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = request_handler_;
    }

    if (!handler)
    {
        send_error_response(
            *request.id,
            static_cast<int>(JsonRpcErrorCode::MethodNotFound),
            "Method not found: " + request.method
        );
        return;
    }

    try
    {
        send_response(*request.id, handler(request.method, request.params));
    }
    catch (const JsonRpcError& e)
    {
        send_error_response(*request.id, static_cast<int>(e.code()), e.what());
    }
    catch (const std::exception& e)
    {
        send_error_response(
            *request.id, static_cast<int>(JsonRpcErrorCode::InternalError), e.what()
        );
    }
}

std::shared_ptr<JsonRpcClient::PendingRequest> JsonRpcClient::take_pending(int64_t id)
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_requests_.find(id);
    if (it == pending_requests_.end())
        return nullptr;
    auto pending = it->second;
    pending_requests_.erase(it);
    return pending;
}

void JsonRpcClient::fail_all_pending(JsonRpcErrorCode code, const std::string& message)
{
    std::map<int64_t, std::shared_ptr<PendingRequest>> to_fail;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        to_fail.swap(pending_requests_);
    }
    for (auto& [id, pending] : to_fail)
        pending->promise.set_exception(std::make_exception_ptr(JsonRpcError(code, message)));
}

} // namespace hangul_ai
