// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file connection_handle.hpp
/// @brief Owner of the single live assistant connection

#include <atomic>
#include <functional>
#include <hangul_ai/availability.hpp>
#include <hangul_ai/connection.hpp>
#include <memory>
#include <mutex>

namespace hangul_ai
{

/// Builds a fresh, not yet started connection
using ConnectionFactory = std::function<std::shared_ptr<AssistantConnection>()>;

/// Holds at most one started connection
///
/// Invariant: is_running() is true exactly when a connection is held.
/// Only one handle per process may hold a connection at a time.
class ConnectionHandle
{
  public:
    ConnectionHandle(std::shared_ptr<AvailabilityProbe> probe, ConnectionFactory factory);
    ~ConnectionHandle();

    ConnectionHandle(const ConnectionHandle&) = delete;
    ConnectionHandle& operator=(const ConnectionHandle&) = delete;

    /// Probe, build and start a connection; no-op if one is held
    /// @throws AssistantError CliNotFound, NotAuthenticated or StartFailed
    void start();

    /// Stop and release the held connection; no-op if none is held
    /// @throws AssistantError SendFailed if the connection failed to stop (it is released anyway)
    void stop();

    bool is_running() const
    {
        return running_.load();
    }

    /// The held connection
    /// @throws AssistantError NotInitialized if none is held
    std::shared_ptr<AssistantConnection> acquire() const;

  private:
    std::shared_ptr<AvailabilityProbe> probe_;
    ConnectionFactory factory_;

    /// Serializes start() and stop(); taken before mutex_
    std::mutex lifecycle_mutex_;
    mutable std::mutex mutex_;
    std::shared_ptr<AssistantConnection> connection_;
    std::atomic<bool> running_{false};
};

} // namespace hangul_ai
