#include "preflight.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <system_error>

std::vector<PreflightIssue> check_copier(const CopierConfig& copier) {
    std::vector<PreflightIssue> issues;

    if (!platform::find_program(copier.program)) {
        issues.push_back({
            fmt::format("'{}' is not installed or not executable", copier.program),
            "Install rsync (e.g. sudo apt install rsync) or set rsync_path in the config"
        });
    }
    return issues;
}

std::vector<PreflightIssue> check_flag_dirs(const FlagPaths& flags) {
    std::vector<PreflightIssue> issues;
    namespace fs = std::filesystem;

    // Each marker's directory must exist; markers themselves are created on demand
    for (const auto& marker : {flags.running, flags.failed, flags.stop}) {
        fs::path parent = fs::path(marker).parent_path();
        if (parent.empty()) continue;
        std::error_code ec;
        if (!fs::is_directory(parent, ec)) {
            issues.push_back({
                fmt::format("Marker directory does not exist: {}", parent.string()),
                "Create it or point flags: in the config elsewhere"
            });
        }
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const Config& config) {
    std::vector<PreflightIssue> all;

    auto copier_issues = check_copier(config.copier());
    all.insert(all.end(), copier_issues.begin(), copier_issues.end());

    auto flag_issues = check_flag_dirs(config.flags());
    all.insert(all.end(), flag_issues.begin(), flag_issues.end());

    return all;
}
