// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <hangul_ai/aggregator.hpp>
#include <hangul_ai/error.hpp>
#include <hangul_ai/logging.hpp>

namespace hangul_ai
{

FoldStep ResponseAggregator::feed(const StreamEvent& event)
{
    if (finished_)
        return error_.empty() ? FoldStep::Done : FoldStep::Failed;

    switch (event.type)
    {
    case StreamEventType::AssistantMessageDelta:
        if (const auto* data = event.try_as<AssistantMessageDeltaData>())
            content_ += data->delta_content;
        return FoldStep::Continue;

    case StreamEventType::AssistantMessage:
        // Streaming servers send the full text after the deltas
        if (content_.empty())
            if (const auto* data = event.try_as<AssistantMessageData>())
                content_ = data->content;
        return FoldStep::Continue;

    case StreamEventType::SessionIdle:
        finished_ = true;
        return FoldStep::Done;

    case StreamEventType::SessionError:
    {
        const auto* data = event.try_as<SessionErrorData>();
        error_ = (data != nullptr && !data->message.empty()) ? data->message : "Session error";
        content_.clear();
        finished_ = true;
        return FoldStep::Failed;
    }

    case StreamEventType::Other:
        break;
    }
    return FoldStep::Continue;
}

std::string collect_answer(EventStream& stream, std::chrono::milliseconds event_timeout)
{
    ResponseAggregator aggregator;

    while (true)
    {
        auto next = stream.next(event_timeout);

        if (next.status == NextStatus::TimedOut)
        {
            logger()->error("Timed out waiting for assistant response");
            throw AssistantError(AssistantErrorCode::Timeout);
        }

        if (next.status == NextStatus::Closed)
        {
            logger()->debug("Event stream closed before idle");
            return aggregator.content();
        }

        switch (aggregator.feed(*next.event))
        {
        case FoldStep::Continue:
            break;
        case FoldStep::Done:
            return aggregator.content();
        case FoldStep::Failed:
            logger()->error("Assistant session error: {}", aggregator.error());
            throw AssistantError(AssistantErrorCode::SendFailed, aggregator.error());
        }
    }
}

} // namespace hangul_ai
