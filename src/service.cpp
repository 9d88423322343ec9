// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <hangul_ai/copilot_connection.hpp>
#include <hangul_ai/error.hpp>
#include <hangul_ai/logging.hpp>
#include <hangul_ai/service.hpp>

namespace hangul_ai
{

// =============================================================================
// Constructor / Destructor
// =============================================================================

AssistantService::AssistantService(ServiceOptions options)
    : AssistantService(
          options,
          std::make_shared<CliAvailabilityProbe>(options.cli_path, options.gh_path),
          [options]() -> std::shared_ptr<AssistantConnection>
          { return std::make_shared<CopilotConnection>(options); }
      )
{
}

AssistantService::AssistantService(
    ServiceOptions options, std::shared_ptr<AvailabilityProbe> probe, ConnectionFactory factory
)
    : options_(std::move(options)), probe_(probe), handle_(std::move(probe), std::move(factory))
{
    set_log_level(options_.log_level);
}

AssistantService::~AssistantService()
{
    try
    {
        shutdown();
    }
    catch (const AssistantError& e)
    {
        logger()->warn("Error during assistant shutdown: {}", e.what());
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

AvailabilityVerdict AssistantService::check() const
{
    return check_availability(*probe_);
}

ServiceStatus AssistantService::init()
{
    logger()->info("Initializing AI assistant...");

    auto verdict = check();
    if (!verdict.available)
    {
        logger()->warn("AI assistant unavailable: {}", verdict.message);
        return ServiceStatus{
            false, false, verdict.cli_installed, verdict.cli_authenticated, verdict.message
        };
    }

    try
    {
        handle_.start();
        return ServiceStatus{true, true, true, true, kServiceReadyMessage};
    }
    catch (const AssistantError& e)
    {
        logger()->error("Failed to start AI assistant: {}", e.what());
        switch (e.code())
        {
        case AssistantErrorCode::CliNotFound:
            return ServiceStatus{
                false, false, false, false,
                "GitHub Copilot CLI not found. Install it to enable AI assistant."
            };
        case AssistantErrorCode::NotAuthenticated:
            return ServiceStatus{
                false, false, true, false,
                "GitHub CLI not authenticated. Run 'gh auth login' first."
            };
        default:
            return ServiceStatus{
                false, false, true, true, std::string("Failed to start: ") + e.what()
            };
        }
    }
}

ServiceStatus AssistantService::status() const
{
    auto verdict = check();
    bool running = handle_.is_running();

    ServiceStatus status;
    status.available = verdict.available && running;
    status.running = running;
    status.cli_installed = verdict.cli_installed;
    status.cli_authenticated = verdict.cli_authenticated;

    if (running)
        status.message = kServiceReadyMessage;
    else if (!verdict.cli_installed)
        status.message = "GitHub Copilot CLI not installed";
    else if (!verdict.cli_authenticated)
        status.message = "GitHub CLI not authenticated";
    else
        status.message = "AI assistant not running";
    return status;
}

void AssistantService::shutdown()
{
    handle_.stop();
}

// =============================================================================
// Conversational Requests
// =============================================================================

ConversationOptions AssistantService::conversation_options() const
{
    ConversationOptions opts;
    opts.event_timeout = options_.event_timeout;
    return opts;
}

std::future<AssistantAnswer>
AssistantService::ask(const std::string& prompt, std::optional<LearningContext> context)
{
    return std::async(
        std::launch::async,
        [this, prompt, context = std::move(context)]()
        {
            if (!handle_.is_running())
                throw AssistantError(AssistantErrorCode::NotRunning);

            auto connection = handle_.acquire();
            return hangul_ai::ask(*connection, prompt, context, conversation_options());
        }
    );
}

std::future<AssistantAnswer>
AssistantService::hint(const std::string& target, const std::string& user_input, uint32_t level)
{
    return ask(hint_prompt(target, user_input, level));
}

std::future<AssistantAnswer> AssistantService::explain(const std::string& text)
{
    return ask(explain_prompt(text));
}

std::future<AssistantAnswer>
AssistantService::analyze_mistake(const std::string& expected, const std::string& actual)
{
    return ask(mistake_prompt(expected, actual));
}

} // namespace hangul_ai
