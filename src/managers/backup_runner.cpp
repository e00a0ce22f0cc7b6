#include "backup_runner.hpp"
#include <fmt/format.h>

BackupRunner::BackupRunner(ControlPlane& flags, Copier& copier, StatusCallback log,
                           RunnerOptions options)
    : flags_(flags), copier_(copier), log_(std::move(log)), options_(std::move(options)) {}

ExitStatus BackupRunner::run(const std::vector<BackupTask>& tasks) {
    report_ = PoolReport{};
    failure_reason_.clear();

    const auto& paths = flags_.paths();

    if (flags_.stop_requested()) {
        log(fmt::format("Stop flag detected at {} - exiting without running backups", paths.stop));
        log(fmt::format("Remove the stop flag to allow backups: rm {}", paths.stop));
        return ExitStatus::SkippedByStop;
    }

    if (flags_.running()) {
        log(fmt::format("Backup script is already running (flag exists: {})", paths.running));
        log(fmt::format("If this is incorrect, remove the flag: rm {}", paths.running));
        failure_reason_ = "another run holds " + paths.running;
        return ExitStatus::AlreadyRunning;
    }

    // Everything below runs with the running marker held; the guard clears it
    // on every return path.
    RunGuard guard(flags_, log_);
    if (!guard.error().empty()) {
        // Nothing was acquired, so the running marker is untouched
        return fail("Cannot create running flag: " + guard.error());
    }
    if (!guard.held()) {
        log(fmt::format("Backup script is already running (flag exists: {})", paths.running));
        failure_reason_ = "another run acquired " + paths.running;
        return ExitStatus::AlreadyRunning;
    }

    if (flags_.failed()) {
        auto cleared = flags_.clear_failed();
        if (cleared.is_err()) {
            return fail("Cannot remove old fail flag: " + cleared.error);
        }
        log("Removed old fail flag");
    }

    JobPoolOptions pool_options;
    pool_options.limit = options_.max_parallel;
    pool_options.poll_interval_ms = options_.poll_interval_ms;
    pool_options.should_stop = options_.should_stop;

    try {
        JobPool pool(copier_, log_, pool_options);
        report_ = pool.execute(tasks);
    } catch (const std::exception& e) {
        return fail(std::string("Unexpected error during backup: ") + e.what());
    }

    if (report_.failure) {
        const auto& f = *report_.failure;
        return fail(fmt::format("Backup of {} failed ({}): {}", f.task.source,
                                failure_kind_name(f.kind), f.message));
    }

    if (report_.interrupted) {
        failure_reason_ = "interrupted";
        log("Backup run interrupted before completion");
        return ExitStatus::Interrupted;
    }

    log("==========================================");
    log(fmt::format("All backups completed successfully! ({} of {})",
                    report_.succeeded, tasks.size()));
    log("==========================================");
    return ExitStatus::Success;
}

ExitStatus BackupRunner::fail(const std::string& reason) {
    failure_reason_ = reason;
    log("ERROR: " + reason);

    auto marked = flags_.mark_failed();
    if (marked.is_ok()) {
        log("Created fail flag: " + flags_.paths().failed);
    } else {
        log("ERROR: " + marked.error);
    }
    return ExitStatus::Failed;
}

void BackupRunner::log(const std::string& msg) const {
    if (log_) log_(msg);
}
