// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file logging.hpp
/// @brief Library logger (spdlog)

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace hangul_ai
{

/// Name of the logger registered with spdlog
inline constexpr const char* kLoggerName = "hangul_ai";

/// Library logger, created and registered on first use
std::shared_ptr<spdlog::logger> logger();

/// Set the library log level from a name ("trace", "debug", "info", "warn", "error", "off")
/// Unknown names fall back to info.
void set_log_level(const std::string& level);

} // namespace hangul_ai
