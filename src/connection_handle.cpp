// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <hangul_ai/connection_handle.hpp>
#include <hangul_ai/error.hpp>
#include <hangul_ai/logging.hpp>

namespace hangul_ai
{

namespace
{

/// Set while any handle in the process holds a connection
std::atomic<bool> g_connection_live{false};

} // namespace

ConnectionHandle::ConnectionHandle(
    std::shared_ptr<AvailabilityProbe> probe, ConnectionFactory factory
)
    : probe_(std::move(probe)), factory_(std::move(factory))
{
}

ConnectionHandle::~ConnectionHandle()
{
    try
    {
        stop();
    }
    catch (const AssistantError& e)
    {
        logger()->warn("Error stopping assistant connection: {}", e.what());
    }
}

void ConnectionHandle::start()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);

    if (connection_)
    {
        logger()->debug("Assistant connection already running");
        return;
    }

    logger()->debug("Checking Copilot CLI availability...");
    auto verdict = check_availability(*probe_);

    if (!verdict.cli_installed)
    {
        logger()->warn("Copilot CLI not installed");
        throw AssistantError(AssistantErrorCode::CliNotFound);
    }
    if (!verdict.cli_authenticated)
    {
        logger()->warn("GitHub CLI not authenticated");
        throw AssistantError(AssistantErrorCode::NotAuthenticated);
    }

    bool expected = false;
    if (!g_connection_live.compare_exchange_strong(expected, true))
    {
        logger()->error("Another assistant connection is already running in this process");
        throw AssistantError(
            AssistantErrorCode::StartFailed, "another connection is already running"
        );
    }

    std::shared_ptr<AssistantConnection> connection;
    try
    {
        logger()->debug("Starting assistant connection...");
        connection = factory_();
        if (!connection)
            throw std::runtime_error("connection factory returned no connection");
        connection->start().get();
    }
    catch (const std::exception& e)
    {
        g_connection_live = false;
        logger()->error("Failed to start assistant connection: {}", e.what());
        throw AssistantError(AssistantErrorCode::StartFailed, e.what());
    }

    connection_ = std::move(connection);
    running_ = true;
    logger()->info("Copilot AI assistant ready");
}

void ConnectionHandle::stop()
{
    // Held until the process-wide slot is free again
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    std::shared_ptr<AssistantConnection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connection_)
            return;
        connection = std::move(connection_);
        connection_.reset();
        running_ = false;
    }

    logger()->info("Stopping assistant connection...");
    try
    {
        connection->stop().get();
    }
    catch (const std::exception& e)
    {
        g_connection_live = false;
        logger()->error("Failed to stop assistant connection: {}", e.what());
        throw AssistantError(AssistantErrorCode::SendFailed, e.what());
    }
    g_connection_live = false;
    logger()->info("Assistant connection stopped");
}

std::shared_ptr<AssistantConnection> ConnectionHandle::acquire() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connection_)
        throw AssistantError(AssistantErrorCode::NotInitialized);
    return connection_;
}

} // namespace hangul_ai
