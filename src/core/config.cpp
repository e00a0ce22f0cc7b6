#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

// Read a scalar as a string. Missing keys, YAML nulls and the literal "null"
// all come back empty so callers only have one "unset" case to check.
static std::string scalar_or_empty(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) return "";
    std::string s = value.as<std::string>("");
    trim(s);
    if (s == "null") return "";
    return s;
}

static FlagPaths parse_flag_paths(const YAML::Node& node) {
    FlagPaths flags;
    flags.running = DEFAULT_RUNNING_FLAG;
    flags.failed = DEFAULT_FAIL_FLAG;
    flags.stop = DEFAULT_STOP_FLAG;

    if (!node || !node.IsMap()) return flags;

    auto running = scalar_or_empty(node, "running");
    auto failed = scalar_or_empty(node, "failed");
    auto stop = scalar_or_empty(node, "stop");
    if (!running.empty()) flags.running = running;
    if (!failed.empty()) flags.failed = failed;
    if (!stop.empty()) flags.stop = stop;
    return flags;
}

static Result<std::vector<BackupTask>> parse_backups(const YAML::Node& node) {
    std::vector<BackupTask> backups;

    // No backups: section is valid; the run warns and succeeds.
    if (!node || node.IsNull()) {
        return Result<std::vector<BackupTask>>::Ok(backups);
    }
    if (!node.IsSequence()) {
        return Result<std::vector<BackupTask>>::Err("'backups' must be a list of {source, destination} entries");
    }

    for (size_t i = 0; i < node.size(); ++i) {
        const YAML::Node entry = node[i];
        if (!entry.IsMap()) {
            return Result<std::vector<BackupTask>>::Err(
                fmt::format("Invalid backup entry {}: expected a map", i));
        }

        BackupTask task;
        task.source = scalar_or_empty(entry, "source");
        task.destination = scalar_or_empty(entry, "destination");

        if (task.source.empty()) {
            return Result<std::vector<BackupTask>>::Err(
                fmt::format("Invalid source path in backup entry {}", i));
        }
        if (task.destination.empty()) {
            return Result<std::vector<BackupTask>>::Err(
                fmt::format("Invalid destination in backup entry {}", i));
        }
        backups.push_back(task);
    }

    return Result<std::vector<BackupTask>>::Ok(backups);
}

// Optional integer key. Absent or null gives the fallback; anything present
// must convert cleanly.
static Result<int> parse_int_option(const YAML::Node& root, const char* key, int fallback,
                                    const fs::path& path) {
    const YAML::Node value = root[key];
    if (!value || value.IsNull()) return Result<int>::Ok(fallback);

    auto not_an_integer = [&](const std::string& shown) {
        return Result<int>::Err(fmt::format("{} must be an integer (got '{}') in {}",
                                            key, shown, path.string()));
    };
    if (!value.IsScalar()) return not_an_integer("a list or map");

    try {
        return Result<int>::Ok(value.as<int>());
    } catch (const YAML::BadConversion&) {
        return not_an_integer(value.Scalar());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Configuration file not found: " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        config.path_ = path;

        config.log_file_ = scalar_or_empty(root, "log_file");
        if (config.log_file_.empty()) {
            return Result<Config>::Err("log_file not defined in " + path.string());
        }

        config.copier_.program = scalar_or_empty(root, "rsync_path");
        if (config.copier_.program.empty()) config.copier_.program = DEFAULT_RSYNC_PATH;

        // An explicitly empty rsync_opts is honored; only a missing key gets the default.
        if (root["rsync_opts"]) {
            config.copier_.options = scalar_or_empty(root, "rsync_opts");
        } else {
            config.copier_.options = DEFAULT_RSYNC_OPTS;
        }

        auto max_parallel = parse_int_option(root, "max_parallel", DEFAULT_MAX_PARALLEL, path);
        if (max_parallel.is_err()) return Result<Config>::Err(max_parallel.error);
        config.max_parallel_ = max_parallel.value;
        if (config.max_parallel_ < 1) {
            return Result<Config>::Err(fmt::format(
                "max_parallel must be at least 1 (got {}) in {}",
                config.max_parallel_, path.string()));
        }

        auto poll_interval = parse_int_option(root, "poll_interval_ms", JOB_POLL_INTERVAL_MS, path);
        if (poll_interval.is_err()) return Result<Config>::Err(poll_interval.error);
        config.poll_interval_ms_ = poll_interval.value;
        if (config.poll_interval_ms_ < 1) {
            return Result<Config>::Err(fmt::format(
                "poll_interval_ms must be positive (got {}) in {}",
                config.poll_interval_ms_, path.string()));
        }

        config.state_file_ = scalar_or_empty(root, "state_file");
        config.flags_ = parse_flag_paths(root["flags"]);

        auto backups = parse_backups(root["backups"]);
        if (backups.is_err()) {
            return Result<Config>::Err(backups.error);
        }
        config.backups_ = backups.value;

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse configuration: ") + e.what());
    }
}

fs::path get_default_config_path() {
    return platform::executable_dir() / DEFAULT_CONFIG_NAME;
}

Result<void> create_default_config(const fs::path& path) {
    if (fs::exists(path)) {
        return Result<void>::Err("Refusing to overwrite existing config at " + path.string());
    }

    const char* default_config = R"(# backset configuration
# Each entry copies <source> into <destination>/<basename of source>.

log_file: "/var/log/backup_sets.log"

# Options passed to rsync before the source and destination arguments
rsync_opts: "-a --delete"

# Number of copies allowed to run at once (1 = sequential)
max_parallel: 1

# Optional: where to record the outcome of the last run (read by 'backset status')
# state_file: "/var/lib/backset/last_run.yaml"

# Optional: marker file locations
# flags:
#   running: "/mnt/.backup_running"
#   failed: "/mnt/.backup_failed"
#   stop: "/mnt/.backup_stop"

backups:
  - source: "/data/example"
    destination: "/mnt/backup"
)";

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
