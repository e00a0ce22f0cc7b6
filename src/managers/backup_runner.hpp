#pragma once

#include <functional>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "control_plane.hpp"
#include "copier.hpp"
#include "job_pool.hpp"

struct RunnerOptions {
    int max_parallel = DEFAULT_MAX_PARALLEL;
    int poll_interval_ms = JOB_POLL_INTERVAL_MS;
    std::function<bool()> should_stop;          // interruption check (SIGINT/SIGTERM)
};

// Top-level run sequence: honor the stop and running markers, hold the
// running marker for the duration of the run, drive the job pool and record
// failures in the failed marker.
class BackupRunner {
public:
    BackupRunner(ControlPlane& flags, Copier& copier, StatusCallback log,
                 RunnerOptions options = {});

    ExitStatus run(const std::vector<BackupTask>& tasks);

    // Pool outcome of the last run() (empty if the run never reached the pool).
    const PoolReport& report() const { return report_; }

    // Message describing why the last run failed, empty on success.
    const std::string& failure_reason() const { return failure_reason_; }

private:
    ControlPlane& flags_;
    Copier& copier_;
    StatusCallback log_;
    RunnerOptions options_;
    PoolReport report_;
    std::string failure_reason_;

    ExitStatus fail(const std::string& reason);
    void log(const std::string& msg) const;
};
