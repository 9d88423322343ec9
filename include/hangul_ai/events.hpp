// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file events.hpp
/// @brief Session events streamed by the assistant while it answers

#include <hangul_ai/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace hangul_ai
{

// =============================================================================
// Event Data Types
// =============================================================================

/// Incremental fragment of the assistant's answer
struct AssistantMessageDeltaData
{
    std::string message_id;
    std::string delta_content;
};

inline void from_json(const json& j, AssistantMessageDeltaData& d)
{
    d.message_id = j.value("messageId", std::string{});
    j.at("deltaContent").get_to(d.delta_content);
}

/// Complete assistant message
struct AssistantMessageData
{
    std::string message_id;
    std::string content;
};

inline void from_json(const json& j, AssistantMessageData& d)
{
    d.message_id = j.value("messageId", std::string{});
    j.at("content").get_to(d.content);
}

/// The assistant finished the current turn
struct SessionIdleData
{
};

inline void from_json(const json&, SessionIdleData&) {}

/// The session failed while producing an answer
struct SessionErrorData
{
    std::string error_type;
    std::string message;
    std::optional<std::string> stack;
};

inline void from_json(const json& j, SessionErrorData& d)
{
    d.error_type = j.value("errorType", std::string{});
    j.at("message").get_to(d.message);
    if (j.contains("stack") && j.at("stack").is_string())
        d.stack = j.at("stack").get<std::string>();
}

// =============================================================================
// Stream Event (Discriminated Union)
// =============================================================================

enum class StreamEventType
{
    AssistantMessageDelta,
    AssistantMessage,
    SessionIdle,
    SessionError,
    Other
};

/// Event payload; kinds the aggregator does not act on keep their raw JSON
using StreamEventData = std::variant<
    AssistantMessageDeltaData,
    AssistantMessageData,
    SessionIdleData,
    SessionErrorData,
    json>;

/// One event from a session's stream
struct StreamEvent
{
    std::string id;
    std::string timestamp;
    StreamEventType type = StreamEventType::Other;
    std::string type_string;
    StreamEventData data;

    template <typename T>
    bool is() const
    {
        return std::holds_alternative<T>(data);
    }

    /// @return nullptr if the event carries another payload
    template <typename T>
    const T* try_as() const
    {
        return std::get_if<T>(&data);
    }

    static StreamEvent delta(std::string text)
    {
        StreamEvent e;
        e.type = StreamEventType::AssistantMessageDelta;
        e.type_string = "assistant.message_delta";
        e.data = AssistantMessageDeltaData{{}, std::move(text)};
        return e;
    }

    static StreamEvent message(std::string text)
    {
        StreamEvent e;
        e.type = StreamEventType::AssistantMessage;
        e.type_string = "assistant.message";
        e.data = AssistantMessageData{{}, std::move(text)};
        return e;
    }

    static StreamEvent idle()
    {
        StreamEvent e;
        e.type = StreamEventType::SessionIdle;
        e.type_string = "session.idle";
        e.data = SessionIdleData{};
        return e;
    }

    static StreamEvent error(std::string message)
    {
        StreamEvent e;
        e.type = StreamEventType::SessionError;
        e.type_string = "session.error";
        e.data = SessionErrorData{"error", std::move(message), std::nullopt};
        return e;
    }

    static StreamEvent other(std::string type_string, json payload = json::object())
    {
        StreamEvent e;
        e.type = StreamEventType::Other;
        e.type_string = std::move(type_string);
        e.data = std::move(payload);
        return e;
    }
};

/// Parse the "event" object of a session.event notification
/// @throws json::exception if a known event kind is missing required fields
inline StreamEvent parse_stream_event(const json& j)
{
    StreamEvent event;
    event.id = j.value("id", std::string{});
    event.timestamp = j.value("timestamp", std::string{});
    event.type_string = j.at("type").get<std::string>();

    static const json kEmpty = json::object();
    const json& data = j.contains("data") ? j.at("data") : kEmpty;

    static const std::map<std::string, StreamEventType> type_map = {
        {"assistant.message_delta", StreamEventType::AssistantMessageDelta},
        {"assistant.message", StreamEventType::AssistantMessage},
        {"session.idle", StreamEventType::SessionIdle},
        {"session.error", StreamEventType::SessionError},
    };

    auto it = type_map.find(event.type_string);
    event.type = it != type_map.end() ? it->second : StreamEventType::Other;

    switch (event.type)
    {
    case StreamEventType::AssistantMessageDelta:
        event.data = data.get<AssistantMessageDeltaData>();
        break;
    case StreamEventType::AssistantMessage:
        event.data = data.get<AssistantMessageData>();
        break;
    case StreamEventType::SessionIdle:
        event.data = SessionIdleData{};
        break;
    case StreamEventType::SessionError:
        event.data = data.get<SessionErrorData>();
        break;
    case StreamEventType::Other:
        event.data = data;
        break;
    }

    return event;
}

} // namespace hangul_ai
