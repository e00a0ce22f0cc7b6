#pragma once

#include <string>
#include <vector>
#include "copier.hpp"

// Runs `<program> <options...> <source>/ <destination>/` as a child process.
// The child's output is appended to output_log; only its exit code is used.
class RsyncCopier : public Copier {
public:
    RsyncCopier(const CopierConfig& config, std::string output_log);

    std::unique_ptr<CopyJob> start(const BackupTask& task,
                                   const std::filesystem::path& destination) override;

    // Argument list after the program name, exposed for logging.
    std::vector<std::string> build_args(const BackupTask& task,
                                        const std::filesystem::path& destination) const;

    const std::string& program() const { return program_; }

private:
    std::string program_;
    std::vector<std::string> options_;
    std::string output_log_;
};
