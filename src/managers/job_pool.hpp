#pragma once

#include <memory>
#include <optional>
#include <functional>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "copier.hpp"

struct JobPoolOptions {
    int limit = 1;                              // max in-flight copies; 1 = sequential
    int poll_interval_ms = JOB_POLL_INTERVAL_MS;    // between in-flight checks in parallel mode
    std::function<bool()> should_stop;          // polled between steps; true stops admission
};

struct PoolReport {
    size_t admitted = 0;
    size_t succeeded = 0;
    std::optional<TaskFailure> failure;         // first failure observed while reaping
    bool interrupted = false;

    bool ok() const { return !failure && !interrupted; }
};

// Runs a task list through a copier with at most `limit` copies in flight.
// The first failure stops admission; copies already running are allowed to
// finish and are reaped before execute() returns.
class JobPool {
public:
    JobPool(Copier& copier, StatusCallback log, JobPoolOptions options);

    PoolReport execute(const std::vector<BackupTask>& tasks);

private:
    struct JobRecord {
        size_t index;
        BackupTask task;
        std::unique_ptr<CopyJob> job;
        int exit_code = -1;
    };

    Copier& copier_;
    StatusCallback log_;
    JobPoolOptions options_;

    PoolReport run_sequential(const std::vector<BackupTask>& tasks);
    PoolReport run_bounded(const std::vector<BackupTask>& tasks);

    // Validate and launch one task. Returns the failure if it could not start.
    std::optional<TaskFailure> admit(const BackupTask& task, size_t index,
                                     std::vector<JobRecord>& in_flight,
                                     PoolReport& report);

    // Record a finished job's outcome. Returns the failure, if any.
    std::optional<TaskFailure> settle(JobRecord& rec, const CopyOutcome& outcome,
                                      PoolReport& report);

    // Poll every in-flight job once and remove the finished ones.
    // Returns the number reaped.
    size_t reap_finished(std::vector<JobRecord>& in_flight, PoolReport& report);

    // Sleep for the poll interval, waking early if a stop is requested.
    void wait_tick() const;

    bool stop_requested() const;
    void log(const std::string& msg) const;
};
