// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <hangul_ai/logging.hpp>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hangul_ai
{

std::shared_ptr<spdlog::logger> logger()
{
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(
        once,
        []()
        {
            // The host may have registered its own sink under our name
            instance = spdlog::get(kLoggerName);
            if (!instance)
            {
                instance = spdlog::stderr_color_mt(kLoggerName);
                instance->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
                instance->set_level(spdlog::level::info);
            }
        }
    );
    return instance;
}

void set_log_level(const std::string& level)
{
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off")
        parsed = spdlog::level::info;
    logger()->set_level(parsed);
}

} // namespace hangul_ai
