#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <filesystem>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct FlagPaths {
    std::string running;
    std::string failed;
    std::string stop;
};

struct CopierConfig {
    std::string program;        // rsync binary, looked up on PATH when relative
    std::string options;        // raw option string, split on whitespace at launch
};

// One source tree copied into a destination base directory.
struct BackupTask {
    std::string source;         // directory to copy
    std::string destination;    // base directory; the copy lands in destination/<basename(source)>

    // Name of the source folder, ignoring any trailing slash.
    std::string folder_name() const;

    std::filesystem::path destination_path() const;
};

enum class FailureKind {
    SourceMissing,
    DestinationBaseMissing,
    DestinationCreateFailed,
    LaunchFailed,
    CopyFailed,
};

const char* failure_kind_name(FailureKind kind);

struct TaskFailure {
    FailureKind kind;
    size_t index = 0;           // position in the task list
    BackupTask task;
    int exit_code = -1;         // copier exit code, -1 if the copier never ran
    std::string message;
};

// Terminal outcome of one copier invocation.
struct CopyOutcome {
    bool success = false;
    bool launch_failed = false;     // the copier program never started
    int exit_code = -1;
    std::string message;
};

enum class ExitStatus {
    Success,
    SkippedByStop,
    AlreadyRunning,
    Failed,
    Interrupted,
};

const char* exit_status_name(ExitStatus status);

// Process exit code for a run outcome: 0 for success and stop-flag skips, 1 otherwise.
int exit_code_for(ExitStatus status);

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
