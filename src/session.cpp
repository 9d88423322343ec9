// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <hangul_ai/logging.hpp>
#include <hangul_ai/session.hpp>

namespace hangul_ai
{

namespace
{

/// Subscriber's handle on a queue shared with the session
/// The session only keeps a weak reference, so dropping the handle unsubscribes.
class SubscribedStream : public EventStream
{
  public:
    explicit SubscribedStream(std::shared_ptr<EventQueue> queue) : queue_(std::move(queue)) {}

    ~SubscribedStream() override
    {
        queue_->close();
    }

    NextEvent next(std::chrono::milliseconds timeout) override
    {
        return queue_->next(timeout);
    }

  private:
    std::shared_ptr<EventQueue> queue_;
};

} // namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

CopilotSession::CopilotSession(
    std::string session_id,
    std::shared_ptr<JsonRpcClient> rpc,
    std::weak_ptr<SessionRegistry> registry,
    std::chrono::milliseconds request_timeout
)
    : session_id_(std::move(session_id)),
      rpc_(std::move(rpc)),
      registry_(std::move(registry)),
      request_timeout_(request_timeout)
{
}

CopilotSession::~CopilotSession()
{
    // Server-side teardown is explicit (destroy()); only release local readers here
    close_streams();
}

// =============================================================================
// Messaging
// =============================================================================

std::future<std::string> CopilotSession::send(const std::string& prompt)
{
    return std::async(
        std::launch::async,
        [this, prompt]()
        {
            json params;
            params["sessionId"] = session_id_;
            params["prompt"] = prompt;

            auto response = rpc_->invoke("session.send", params, request_timeout_).get();
            if (response.is_object() && response.contains("messageId") &&
                response["messageId"].is_string())
                return response["messageId"].get<std::string>();
            return std::string{};
        }
    );
}

// =============================================================================
// Event Handling
// =============================================================================

std::unique_ptr<EventStream> CopilotSession::subscribe()
{
    auto queue = std::make_shared<EventQueue>();
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.push_back(queue);
    }
    return std::make_unique<SubscribedStream>(std::move(queue));
}

void CopilotSession::dispatch_event(const StreamEvent& event)
{
    std::vector<std::shared_ptr<EventQueue>> live;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.erase(
            std::remove_if(
                streams_.begin(),
                streams_.end(),
                [](const std::weak_ptr<EventQueue>& w) { return w.expired(); }
            ),
            streams_.end()
        );
        for (const auto& weak : streams_)
            if (auto queue = weak.lock())
                live.push_back(std::move(queue));
    }

    logger()->trace("session {} event {}", session_id_, event.type_string);
    for (const auto& queue : live)
        queue->push(event);
}

void CopilotSession::close_streams()
{
    std::vector<std::weak_ptr<EventQueue>> streams;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams.swap(streams_);
    }
    for (const auto& weak : streams)
        if (auto queue = weak.lock())
            queue->close();
}

size_t CopilotSession::subscriber_count() const
{
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return static_cast<size_t>(std::count_if(
        streams_.begin(),
        streams_.end(),
        [](const std::weak_ptr<EventQueue>& w) { return !w.expired(); }
    ));
}

// =============================================================================
// Lifecycle
// =============================================================================

std::future<void> CopilotSession::destroy()
{
    return std::async(
        std::launch::async,
        [this]()
        {
            close_streams();
            if (auto registry = registry_.lock())
                registry->remove(session_id_);

            // Nobody is left to tell once the CLI has gone away
            if (!rpc_->is_running())
                return;

            json params;
            params["sessionId"] = session_id_;
            rpc_->invoke("session.destroy", params, request_timeout_).get();
        }
    );
}

// =============================================================================
// SessionRegistry
// =============================================================================

void SessionRegistry::add(const std::shared_ptr<CopilotSession>& session)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session->session_id()] = session;
}

void SessionRegistry::remove(const std::string& session_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

std::shared_ptr<CopilotSession> SessionRegistry::find(const std::string& session_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return (it != sessions_.end()) ? it->second : nullptr;
}

std::vector<std::shared_ptr<CopilotSession>> SessionRegistry::take_all()
{
    std::map<std::string, std::shared_ptr<CopilotSession>> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taken.swap(sessions_);
    }

    std::vector<std::shared_ptr<CopilotSession>> result;
    result.reserve(taken.size());
    for (auto& [id, session] : taken)
        result.push_back(std::move(session));
    return result;
}

void SessionRegistry::close_all_streams()
{
    std::vector<std::shared_ptr<CopilotSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_)
            sessions.push_back(session);
    }
    for (const auto& session : sessions)
        session->close_streams();
}

size_t SessionRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace hangul_ai
