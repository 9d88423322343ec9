// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <hangul_ai/commands.hpp>
#include <hangul_ai/error.hpp>
#include <hangul_ai/logging.hpp>

namespace hangul_ai
{

namespace
{

CommandResponse<AssistantAnswer> await_answer(const char* what, std::future<AssistantAnswer> answer)
{
    try
    {
        return CommandResponse<AssistantAnswer>::ok(answer.get());
    }
    catch (const AssistantError& e)
    {
        logger()->error("Assistant {} failed: {}", what, e.what());
        return CommandResponse<AssistantAnswer>::fail(e.what());
    }
}

} // namespace

// =============================================================================
// Lifecycle Commands
// =============================================================================

CommandResponse<ServiceStatus> check_command(const AssistantService& service)
{
    logger()->debug("Checking Copilot availability...");
    auto verdict = service.check();
    return CommandResponse<ServiceStatus>::ok(ServiceStatus{
        verdict.available, false, verdict.cli_installed, verdict.cli_authenticated,
        verdict.message
    });
}

CommandResponse<ServiceStatus> init_command(AssistantService& service)
{
    return CommandResponse<ServiceStatus>::ok(service.init());
}

CommandResponse<ServiceStatus> status_command(const AssistantService& service)
{
    return CommandResponse<ServiceStatus>::ok(service.status());
}

CommandResponse<void> shutdown_command(AssistantService& service)
{
    logger()->info("Shutting down AI assistant...");
    try
    {
        service.shutdown();
        return CommandResponse<void>::ok();
    }
    catch (const AssistantError& e)
    {
        logger()->error("Failed to shut down AI assistant: {}", e.what());
        return CommandResponse<void>::fail(e.what());
    }
}

// =============================================================================
// Conversational Commands
// =============================================================================

CommandResponse<AssistantAnswer> ask_command(
    AssistantService& service, const std::string& prompt, std::optional<LearningContext> context
)
{
    logger()->debug("Assistant ask: {}", prompt);
    return await_answer("ask", service.ask(prompt, std::move(context)));
}

CommandResponse<AssistantAnswer> hint_command(
    AssistantService& service,
    const std::string& target,
    const std::string& user_input,
    uint32_t level
)
{
    logger()->debug("Assistant hint: target='{}', input='{}'", target, user_input);
    return await_answer("hint", service.hint(target, user_input, level));
}

CommandResponse<AssistantAnswer> explain_command(AssistantService& service, const std::string& text)
{
    logger()->debug("Assistant explain: {}", text);
    return await_answer("explain", service.explain(text));
}

CommandResponse<AssistantAnswer> analyze_mistake_command(
    AssistantService& service, const std::string& expected, const std::string& actual
)
{
    logger()->debug("Assistant analyze mistake: expected='{}', actual='{}'", expected, actual);
    return await_answer("analyze_mistake", service.analyze_mistake(expected, actual));
}

// =============================================================================
// Dispatch
// =============================================================================

json dispatch_command(AssistantService& service, const std::string& name, const json& args)
{
    try
    {
        if (name == "check")
            return check_command(service);
        if (name == "init")
            return init_command(service);
        if (name == "status")
            return status_command(service);
        if (name == "shutdown")
            return shutdown_command(service);
        if (name == "ask")
        {
            std::optional<LearningContext> context;
            if (args.contains("context") && !args.at("context").is_null())
                context = args.at("context").get<LearningContext>();
            return ask_command(service, args.at("prompt").get<std::string>(), std::move(context));
        }
        if (name == "hint")
            return hint_command(
                service,
                args.at("target").get<std::string>(),
                args.at("user_input").get<std::string>(),
                args.at("level").get<uint32_t>()
            );
        if (name == "explain")
            return explain_command(service, args.at("text").get<std::string>());
        if (name == "analyze_mistake")
            return analyze_mistake_command(
                service,
                args.at("expected").get<std::string>(),
                args.at("actual").get<std::string>()
            );
    }
    catch (const json::exception& e)
    {
        return CommandResponse<void>::fail(std::string("Invalid arguments: ") + e.what());
    }

    return CommandResponse<void>::fail("Unknown command: " + name);
}

} // namespace hangul_ai
