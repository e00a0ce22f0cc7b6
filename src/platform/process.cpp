#include "process.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <cerrno>

namespace platform {

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

// A still-running child is left alone; it finishes or is reaped by init.
ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.exit_code_.reset();
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.exit_code_.reset();
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

std::optional<int> ProcessHandle::try_wait() {
    if (exit_code_) return exit_code_;
    if (pid_ <= 0) return -1;

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, WNOHANG);
    } while (ret < 0 && errno == EINTR);

    if (ret == 0) return std::nullopt;  // still running
    exit_code_ = (ret == pid_) ? decode_status(status) : -1;
    return exit_code_;
}

int ProcessHandle::wait() {
    if (exit_code_) return *exit_code_;
    if (pid_ <= 0) return -1;

    int status = 0;
    pid_t ret;
    // Interrupt handlers are installed without SA_RESTART; keep waiting through them.
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);

    exit_code_ = (ret == pid_) ? decode_status(status) : -1;
    return *exit_code_;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log) {
    ProcessHandle handle;

    // Build argv before forking so the child only calls async-signal-safe functions
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!output_log.empty()) {
            int fd = open(output_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDOUT_FILENO);
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(EXEC_FAILED_EXIT_CODE);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

} // namespace platform
