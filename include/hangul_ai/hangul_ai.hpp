// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file hangul_ai.hpp
/// @brief Master include for the Hangul tutor AI assistant library
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <hangul_ai/aggregator.hpp>
#include <hangul_ai/availability.hpp>
#include <hangul_ai/commands.hpp>
#include <hangul_ai/connection.hpp>
#include <hangul_ai/connection_handle.hpp>
#include <hangul_ai/conversation.hpp>
#include <hangul_ai/copilot_connection.hpp>
#include <hangul_ai/error.hpp>
#include <hangul_ai/events.hpp>
#include <hangul_ai/jsonrpc.hpp>
#include <hangul_ai/logging.hpp>
#include <hangul_ai/process.hpp>
#include <hangul_ai/service.hpp>
#include <hangul_ai/session.hpp>
#include <hangul_ai/transport.hpp>
#include <hangul_ai/types.hpp>

namespace hangul_ai
{

/// Library version string
inline constexpr const char* kLibraryVersion = "0.1.0";

} // namespace hangul_ai
