// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file availability.hpp
/// @brief Checks that the Copilot CLI is installed and the GitHub CLI is logged in

#include <hangul_ai/types.hpp>
#include <string>

namespace hangul_ai
{

/// Verdict messages
inline constexpr const char* kReadyMessage = "GitHub Copilot is ready";
inline constexpr const char* kNotAuthenticatedMessage =
    "GitHub CLI not authenticated. Run 'gh auth login' to enable AI assistant.";
inline constexpr const char* kNotInstalledMessage =
    "GitHub Copilot CLI not found. Install it to enable AI assistant.";

/// Source of the two availability facts
/// Implementations never throw; a check that cannot run answers false.
class AvailabilityProbe
{
  public:
    virtual ~AvailabilityProbe() = default;

    virtual bool probe_installed() const = 0;
    virtual bool probe_authenticated() const = 0;
};

/// Probe that runs the real command-line tools
///
/// - installed: `<cli_path> --version` or `<gh_path> copilot --version` exits 0
/// - authenticated: `<gh_path> auth status` reports a logged in, active account
class CliAvailabilityProbe : public AvailabilityProbe
{
  public:
    CliAvailabilityProbe(std::string cli_path = "copilot", std::string gh_path = "gh");

    bool probe_installed() const override;
    bool probe_authenticated() const override;

  private:
    std::string cli_path_;
    std::string gh_path_;
};

/// True if `gh auth status` output shows a logged in, active account
bool is_authenticated_output(const std::string& output);

/// Combine both probes into a verdict
AvailabilityVerdict check_availability(const AvailabilityProbe& probe);

} // namespace hangul_ai
