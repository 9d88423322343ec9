// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <hangul_ai/availability.hpp>
#include <hangul_ai/logging.hpp>
#include <hangul_ai/process.hpp>

namespace hangul_ai
{

namespace
{

/// Run a probe command; spawn failures count as a non-zero exit
CapturedOutput run_probe(const std::string& executable, const std::vector<std::string>& args)
{
    try
    {
        return run_captured(executable, args);
    }
    catch (const ProcessError& e)
    {
        logger()->warn("Could not run {}: {}", executable, e.what());
        return CapturedOutput{};
    }
}

} // namespace

// =============================================================================
// CliAvailabilityProbe
// =============================================================================

CliAvailabilityProbe::CliAvailabilityProbe(std::string cli_path, std::string gh_path)
    : cli_path_(std::move(cli_path)), gh_path_(std::move(gh_path))
{
}

bool CliAvailabilityProbe::probe_installed() const
{
    // Standalone CLI first, then the gh extension
    if (run_probe(cli_path_, {"--version"}).success())
        return true;

    bool installed = run_probe(gh_path_, {"copilot", "--version"}).success();
    if (!installed)
        logger()->warn("GitHub Copilot CLI not found");
    return installed;
}

bool CliAvailabilityProbe::probe_authenticated() const
{
    // gh writes the report to stderr on some versions, so the exit code is not used
    auto result = run_probe(gh_path_, {"auth", "status"});
    bool authenticated = is_authenticated_output(result.out + result.err);
    if (!authenticated)
        logger()->warn("GitHub CLI not authenticated");
    return authenticated;
}

// =============================================================================
// Verdict
// =============================================================================

bool is_authenticated_output(const std::string& output)
{
    return output.find("Logged in to") != std::string::npos &&
           output.find("Active account: true") != std::string::npos;
}

AvailabilityVerdict check_availability(const AvailabilityProbe& probe)
{
    AvailabilityVerdict verdict;
    verdict.cli_installed = probe.probe_installed();
    verdict.cli_authenticated = probe.probe_authenticated();
    verdict.available = verdict.cli_installed && verdict.cli_authenticated;

    if (verdict.available)
        verdict.message = kReadyMessage;
    else if (verdict.cli_installed)
        verdict.message = kNotAuthenticatedMessage;
    else
        verdict.message = kNotInstalledMessage;

    logger()->debug(
        "Availability: installed={} authenticated={}", verdict.cli_installed,
        verdict.cli_authenticated
    );
    return verdict;
}

} // namespace hangul_ai
