// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <hangul_ai/connection.hpp>

namespace hangul_ai
{

void EventQueue::push(StreamEvent event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void EventQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::is_closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

NextEvent EventQueue::next(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });

    if (!events_.empty())
    {
        NextEvent result{NextStatus::Received, std::move(events_.front())};
        events_.pop_front();
        return result;
    }
    if (ready && closed_)
        return NextEvent{NextStatus::Closed, std::nullopt};
    return NextEvent{NextStatus::TimedOut, std::nullopt};
}

} // namespace hangul_ai
