#include "backset_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <managers/backup_runner.hpp>
#include <managers/control_plane.hpp>
#include <managers/rsync_copier.hpp>
#include <managers/state_store.hpp>
#include <platform/signals.hpp>
#include <fmt/format.h>
#include <iostream>

namespace fs = std::filesystem;

BacksetCLI::BacksetCLI(fs::path config_path)
    : config_path_(std::move(config_path)) {}

std::optional<Config> BacksetCLI::load_config() {
    auto result = Config::load(config_path_);
    if (result.is_err()) {
        log_.error(result.error);
        return std::nullopt;
    }
    return result.value;
}

// ── run ─────────────────────────────────────────────────────

int BacksetCLI::run_backup() {
    auto config = load_config();
    if (!config) return 1;

    log_.set_path(config->log_file());
    log_.write("Loaded configuration from: " + config->path().string());
    log_.write("LOG_FILE: " + config->log_file());
    log_.write("RSYNC_OPTS: " + config->copier().options);

    auto issues = run_preflight_checks(*config);
    if (!issues.empty()) {
        for (const auto& issue : issues) {
            log_.error(issue.message);
            log_.write("  " + issue.fix);
        }
        return 1;
    }

    platform::install_interrupt_handlers();

    log_.write("==========================================");
    log_.write("Backup script started");
    log_.write("==========================================");

    FileMarkerStore store;
    ControlPlane flags(store, config->flags());
    RsyncCopier copier(config->copier(), config->log_file());

    RunnerOptions options;
    options.max_parallel = config->max_parallel();
    options.poll_interval_ms = config->poll_interval_ms();
    options.should_stop = platform::interrupt_requested;

    BackupRunner runner(flags, copier, log_.sink(), options);

    std::string started = now_iso();
    ExitStatus status = runner.run(config->backups());
    std::string finished = now_iso();

    log_.write(fmt::format("Backup run finished: {} after {}", exit_status_name(status),
                           format_duration(started, finished)));

    // An instance that found the running marker must not overwrite the record
    // the active instance is about to write
    if (status != ExitStatus::AlreadyRunning && !config->state_file().empty()) {
        RunRecord record;
        record.started = started;
        record.finished = finished;
        record.status = exit_status_name(status);
        record.tasks = static_cast<int>(config->backups().size());
        record.succeeded = static_cast<int>(runner.report().succeeded);
        if (runner.report().failure) {
            record.failed_source = runner.report().failure->task.source;
        }
        record.failed_reason = runner.failure_reason();

        auto saved = StateStore(config->state_file()).save(record);
        if (saved.is_err()) {
            log_.error(saved.error);
        }
    }

    platform::remove_interrupt_handlers();
    return exit_code_for(status);
}

// ── status ──────────────────────────────────────────────────

int BacksetCLI::run_status() {
    auto result = Config::load(config_path_);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    const Config& config = result.value;

    FileMarkerStore store;
    ControlPlane flags(store, config.flags());

    std::cout << theme::section("Markers");
    std::cout << theme::marker("running", config.flags().running, flags.running());
    std::cout << theme::marker("failed", config.flags().failed, flags.failed());
    std::cout << theme::marker("stop", config.flags().stop, flags.stop_requested());

    std::cout << theme::section("Last run");
    if (config.state_file().empty()) {
        std::cout << theme::info("No state_file configured");
        std::cout << "\n";
        return 0;
    }

    auto record = StateStore(config.state_file()).load();
    if (!record) {
        std::cout << theme::info("No run recorded yet");
        std::cout << "\n";
        return 0;
    }

    std::string summary = fmt::format("{} at {} ({}), {}/{} succeeded",
                                      record->status, record->started,
                                      format_duration(record->started, record->finished),
                                      record->succeeded, record->tasks);
    if (record->status == "success" || record->status == "skipped") {
        std::cout << theme::ok(summary);
    } else {
        std::cout << theme::fail(summary);
        if (!record->failed_reason.empty()) {
            std::cout << theme::step(record->failed_reason);
        }
    }
    std::cout << "\n";
    return 0;
}

// ── stop / resume ───────────────────────────────────────────

int BacksetCLI::run_stop() {
    auto result = Config::load(config_path_);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }

    FileMarkerStore store;
    ControlPlane flags(store, result.value.flags());
    auto created = flags.request_stop();
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }
    std::cout << theme::ok("Backups paused: " + flags.paths().stop);
    if (flags.running()) {
        std::cout << theme::step("A run is in progress; it will finish normally");
    }
    return 0;
}

int BacksetCLI::run_resume() {
    auto result = Config::load(config_path_);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }

    FileMarkerStore store;
    ControlPlane flags(store, result.value.flags());
    auto removed = flags.clear_stop();
    if (removed.is_err()) {
        std::cout << theme::fail(removed.error);
        return 1;
    }
    std::cout << theme::ok("Backups resumed");
    return 0;
}

// ── init ────────────────────────────────────────────────────

int BacksetCLI::run_init(const fs::path& path) {
    auto created = create_default_config(path);
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + path.string());
    std::cout << theme::step("Edit log_file and backups: before the first run");
    return 0;
}
