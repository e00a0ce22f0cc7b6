#pragma once

#include <optional>
#include <core/types.hpp>

// Check a task right before its copy starts: the source must be a directory,
// the destination base must be a directory, and the per-task destination
// folder is created if missing. Returns the failure, or std::nullopt if the
// copier may be started.
std::optional<TaskFailure> prepare_task(const BackupTask& task, size_t index,
                                        const StatusCallback& log);
