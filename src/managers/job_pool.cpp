#include "job_pool.hpp"
#include "task_validation.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

JobPool::JobPool(Copier& copier, StatusCallback log, JobPoolOptions options)
    : copier_(copier), log_(std::move(log)), options_(std::move(options)) {
    if (options_.limit < 1) options_.limit = 1;
    if (options_.poll_interval_ms < 1) options_.poll_interval_ms = 1;
}

PoolReport JobPool::execute(const std::vector<BackupTask>& tasks) {
    if (tasks.empty()) {
        log("WARNING: No backups defined in configuration file");
        return PoolReport{};
    }

    log(fmt::format("Found {} backup(s) to process", tasks.size()));

    PoolReport report = (options_.limit == 1) ? run_sequential(tasks) : run_bounded(tasks);

    if (report.ok()) {
        log("All backup jobs completed successfully");
    }
    return report;
}

// ── Sequential mode ─────────────────────────────────────────

PoolReport JobPool::run_sequential(const std::vector<BackupTask>& tasks) {
    PoolReport report;
    log("Starting backup process (sequential mode)");

    for (size_t i = 0; i < tasks.size(); ++i) {
        if (stop_requested()) {
            report.interrupted = true;
            log("Interrupt received - no further backups will be started");
            break;
        }

        std::vector<JobRecord> slot;
        if (auto failure = admit(tasks[i], i, slot, report)) {
            report.failure = failure;
            break;
        }

        // Blocks for the whole copy
        JobRecord& rec = slot.front();
        CopyOutcome outcome = rec.job->wait();
        auto failure = settle(rec, outcome, report);
        log(fmt::format("Reaped job {} ({}): exit {}", i + 1, rec.task.folder_name(),
                        rec.exit_code));
        if (failure) {
            report.failure = failure;
            break;
        }
    }

    return report;
}

// ── Bounded-parallel mode ───────────────────────────────────

PoolReport JobPool::run_bounded(const std::vector<BackupTask>& tasks) {
    PoolReport report;
    std::vector<JobRecord> in_flight;
    size_t next = 0;
    const size_t limit = static_cast<size_t>(options_.limit);

    log(fmt::format("Starting backup process (parallel mode, up to {} concurrent jobs)", limit));

    while (true) {
        if (stop_requested()) {
            report.interrupted = true;
            log(fmt::format("Interrupt received - no further backups will be started "
                            "({} job(s) left running)", in_flight.size()));
            break;
        }

        while (!report.failure && next < tasks.size() && in_flight.size() < limit) {
            size_t index = next++;
            if (auto failure = admit(tasks[index], index, in_flight, report)) {
                report.failure = failure;
                log(fmt::format("Aborting: no further backups will be started, "
                                "waiting for {} in-flight job(s)", in_flight.size()));
            }
        }

        if (in_flight.empty()) break;

        if (reap_finished(in_flight, report) == 0) {
            wait_tick();
        }
    }

    return report;
}

// ── Admission and reaping ───────────────────────────────────

std::optional<TaskFailure> JobPool::admit(const BackupTask& task, size_t index,
                                          std::vector<JobRecord>& in_flight,
                                          PoolReport& report) {
    auto dest = task.destination_path();
    log("========================================");
    log("Starting backup: " + task.folder_name());
    log("Source: " + task.source);
    log("Destination: " + dest.string());
    log("========================================");

    if (auto failure = prepare_task(task, index, log_)) {
        log("ERROR: " + failure->message);
        return failure;
    }

    auto job = copier_.start(task, dest);
    if (!job) {
        TaskFailure f{FailureKind::LaunchFailed};
        f.index = index;
        f.task = task;
        f.message = "Copier could not be started for: " + task.source;
        log("ERROR: " + f.message);
        return f;
    }

    JobRecord rec{index, task, std::move(job)};
    in_flight.push_back(std::move(rec));
    report.admitted++;
    log(fmt::format("Admitted job {} ({}), {} in flight", index + 1, task.folder_name(),
                    in_flight.size()));
    return std::nullopt;
}

std::optional<TaskFailure> JobPool::settle(JobRecord& rec, const CopyOutcome& outcome,
                                           PoolReport& report) {
    rec.exit_code = outcome.exit_code;

    if (outcome.success) {
        report.succeeded++;
        log("Successfully completed backup: " + rec.task.folder_name());
        return std::nullopt;
    }

    TaskFailure f{outcome.launch_failed ? FailureKind::LaunchFailed : FailureKind::CopyFailed};
    f.index = rec.index;
    f.task = rec.task;
    f.exit_code = outcome.exit_code;
    f.message = "Rsync failed for: " + rec.task.source;
    if (!outcome.message.empty()) f.message += " (" + outcome.message + ")";
    log("ERROR: " + f.message);
    return f;
}

size_t JobPool::reap_finished(std::vector<JobRecord>& in_flight, PoolReport& report) {
    size_t reaped = 0;

    // Reap order is in-flight order; within one tick that decides which failure is "first"
    for (auto it = in_flight.begin(); it != in_flight.end();) {
        auto outcome = it->job->poll();
        if (!outcome) {
            ++it;
            continue;
        }

        auto failure = settle(*it, *outcome, report);
        if (failure && !report.failure) {
            report.failure = failure;
            log(fmt::format("Aborting: no further backups will be started, "
                            "waiting for {} in-flight job(s)", in_flight.size() - 1));
        }

        log(fmt::format("Reaped job {} ({}): exit {}", it->index + 1, it->task.folder_name(),
                        it->exit_code));
        it = in_flight.erase(it);
        ++reaped;
    }
    return reaped;
}

void JobPool::wait_tick() const {
    int remaining = options_.poll_interval_ms;
    while (remaining > 0 && !stop_requested()) {
        int slice = std::min(remaining, POLL_SLICE_MS);
        platform::sleep_ms(slice);
        remaining -= slice;
    }
}

bool JobPool::stop_requested() const {
    return options_.should_stop && options_.should_stop();
}

void JobPool::log(const std::string& msg) const {
    if (log_) log_(msg);
}
