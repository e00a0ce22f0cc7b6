#include "task_validation.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

static TaskFailure make_failure(FailureKind kind, const BackupTask& task, size_t index,
                                std::string message) {
    TaskFailure f{kind};
    f.index = index;
    f.task = task;
    f.message = std::move(message);
    return f;
}

std::optional<TaskFailure> prepare_task(const BackupTask& task, size_t index,
                                        const StatusCallback& log) {
    std::error_code ec;

    if (!fs::is_directory(task.source, ec)) {
        return make_failure(FailureKind::SourceMissing, task, index,
                            "Source directory does not exist: " + task.source);
    }

    if (!fs::is_directory(task.destination, ec)) {
        return make_failure(FailureKind::DestinationBaseMissing, task, index,
                            "Destination base directory does not exist: " + task.destination);
    }

    fs::path dest = task.destination_path();
    if (fs::is_directory(dest, ec)) return std::nullopt;

    if (log) log("Creating destination directory: " + dest.string());
    fs::create_directories(dest, ec);
    std::error_code check_ec;
    if (ec || !fs::is_directory(dest, check_ec)) {
        std::string reason = ec ? ec.message() : "not a directory";
        return make_failure(FailureKind::DestinationCreateFailed, task, index,
                            "Failed to create destination: " + dest.string() + " (" + reason + ")");
    }
    return std::nullopt;
}
