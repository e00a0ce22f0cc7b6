#pragma once

#include <memory>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

// One in-progress copy. Owned by the scheduler until its outcome is reaped.
class CopyJob {
public:
    virtual ~CopyJob() = default;

    // Non-blocking: the outcome once the copy has finished, std::nullopt before.
    virtual std::optional<CopyOutcome> poll() = 0;

    // Block until the copy finishes.
    virtual CopyOutcome wait() = 0;
};

// Starts copies of a validated task into its destination directory.
class Copier {
public:
    virtual ~Copier() = default;

    virtual std::unique_ptr<CopyJob> start(const BackupTask& task,
                                           const std::filesystem::path& destination) = 0;
};
