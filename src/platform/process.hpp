#pragma once

#include <string>
#include <vector>
#include <optional>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Non-blocking check. Returns the exit code once the child has exited,
    // std::nullopt while it is still running. Safe to call again after exit.
    std::optional<int> try_wait();

    // Block until the process exits. Returns exit code (128 + signo if killed
    // by a signal, -1 for an invalid handle).
    int wait();

private:
    int pid_ = -1;
    std::optional<int> exit_code_;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& output_log);
};

// Spawn a child process.
// output_log: if non-empty, append the child's stdout and stderr to this file.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log = "");

} // namespace platform
