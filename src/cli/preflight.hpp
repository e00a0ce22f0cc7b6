#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
};

// Runs all checks that must pass before any marker is touched.
// Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const Config& config);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_copier(const CopierConfig& copier);
std::vector<PreflightIssue> check_flag_dirs(const FlagPaths& flags);
