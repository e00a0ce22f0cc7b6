#include "rsync_copier.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

namespace {

// Trailing slashes make rsync copy the directory's contents rather than the
// directory itself, so the destination folder name is chosen by the task.
std::string with_trailing_slash(std::string p) {
    if (p.empty() || p.back() != '/') p += '/';
    return p;
}

CopyOutcome outcome_from_exit(int exit_code, const std::string& program) {
    CopyOutcome out;
    out.exit_code = exit_code;
    out.success = (exit_code == 0);
    if (exit_code == EXEC_FAILED_EXIT_CODE) {
        out.launch_failed = true;
        out.message = fmt::format("{} could not be executed (exit {})", program, exit_code);
    } else if (exit_code != 0) {
        out.message = fmt::format("{} exited with status {}", program, exit_code);
    }
    return out;
}

class ProcessCopyJob : public CopyJob {
public:
    ProcessCopyJob(platform::ProcessHandle proc, std::string program)
        : proc_(std::move(proc)), program_(std::move(program)) {}

    std::optional<CopyOutcome> poll() override {
        if (!proc_.valid()) return launch_failure();
        auto code = proc_.try_wait();
        if (!code) return std::nullopt;
        return outcome_from_exit(*code, program_);
    }

    CopyOutcome wait() override {
        if (!proc_.valid()) return launch_failure();
        return outcome_from_exit(proc_.wait(), program_);
    }

private:
    CopyOutcome launch_failure() const {
        CopyOutcome out;
        out.exit_code = -1;
        out.launch_failed = true;
        out.message = fmt::format("failed to start {}", program_);
        return out;
    }

    platform::ProcessHandle proc_;
    std::string program_;
};

} // namespace

RsyncCopier::RsyncCopier(const CopierConfig& config, std::string output_log)
    : program_(config.program.empty() ? DEFAULT_RSYNC_PATH : config.program),
      options_(split_words(config.options)),
      output_log_(std::move(output_log)) {}

std::vector<std::string> RsyncCopier::build_args(const BackupTask& task,
                                                 const std::filesystem::path& destination) const {
    std::vector<std::string> args = options_;
    args.push_back(with_trailing_slash(task.source));
    args.push_back(with_trailing_slash(destination.string()));
    return args;
}

std::unique_ptr<CopyJob> RsyncCopier::start(const BackupTask& task,
                                            const std::filesystem::path& destination) {
    auto proc = platform::spawn(program_, build_args(task, destination), output_log_);
    return std::make_unique<ProcessCopyJob>(std::move(proc), program_);
}
