#pragma once

#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <managers/run_log.hpp>

// Command implementations behind main(). Each returns the process exit code.
class BacksetCLI {
public:
    explicit BacksetCLI(std::filesystem::path config_path);

    int run_backup();
    int run_status();
    int run_stop();
    int run_resume();

    static int run_init(const std::filesystem::path& path);

private:
    std::filesystem::path config_path_;
    RunLog log_;

    // Load the config, printing the error on failure.
    std::optional<Config> load_config();
};
