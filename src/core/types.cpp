#include "types.hpp"

std::string BackupTask::folder_name() const {
    std::filesystem::path p(source);
    // "/data/photos/" has an empty filename; step back to the directory itself
    if (!p.has_filename() && p.has_parent_path()) {
        p = p.parent_path();
    }
    return p.filename().string();
}

std::filesystem::path BackupTask::destination_path() const {
    return std::filesystem::path(destination) / folder_name();
}

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::SourceMissing:           return "source missing";
        case FailureKind::DestinationBaseMissing:  return "destination base missing";
        case FailureKind::DestinationCreateFailed: return "destination create failed";
        case FailureKind::LaunchFailed:            return "copier launch failed";
        case FailureKind::CopyFailed:              return "copy failed";
    }
    return "unknown";
}

const char* exit_status_name(ExitStatus status) {
    switch (status) {
        case ExitStatus::Success:        return "success";
        case ExitStatus::SkippedByStop:  return "skipped";
        case ExitStatus::AlreadyRunning: return "already-running";
        case ExitStatus::Failed:         return "failed";
        case ExitStatus::Interrupted:    return "interrupted";
    }
    return "unknown";
}

int exit_code_for(ExitStatus status) {
    switch (status) {
        case ExitStatus::Success:
        case ExitStatus::SkippedByStop:
            return 0;
        default:
            return 1;
    }
}
