// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file aggregator.hpp
/// @brief Folds a session's event stream into one answer

#include <chrono>
#include <hangul_ai/connection.hpp>
#include <hangul_ai/events.hpp>
#include <string>

namespace hangul_ai
{

/// What the fold does after an event
enum class FoldStep
{
    Continue,
    Done,
    Failed
};

/// Accumulates assistant text across delta, full-message and idle events
///
/// - delta: appended
/// - full message: taken only when nothing has been accumulated yet
/// - idle: done
/// - error: failed, accumulated text is discarded
/// - anything else: ignored
class ResponseAggregator
{
  public:
    FoldStep feed(const StreamEvent& event);

    const std::string& content() const
    {
        return content_;
    }

    /// Error message of the session.error that failed the fold
    const std::string& error() const
    {
        return error_;
    }

    bool finished() const
    {
        return finished_;
    }

  private:
    std::string content_;
    std::string error_;
    bool finished_ = false;
};

/// Read events until idle, error, close or timeout
/// @param event_timeout Maximum wait for each event, re-armed after every event
/// @return Accumulated text; partial text if the stream closed before idle
/// @throws AssistantError SendFailed on session.error, Timeout when a wait expires
std::string collect_answer(EventStream& stream, std::chrono::milliseconds event_timeout);

} // namespace hangul_ai
