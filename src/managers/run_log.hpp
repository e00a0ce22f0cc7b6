#pragma once

#include <string>
#include <mutex>
#include <core/types.hpp>

// Append-only run log. Every line is "[YYYY-MM-DD HH:MM:SS] message", written
// to the configured file and echoed to stdout. Copier output is appended to
// the same file by the child processes themselves.
class RunLog {
public:
    RunLog() = default;
    explicit RunLog(std::string path, bool echo = true);

    // Switch the sink file once configuration has been loaded.
    void set_path(const std::string& path);
    const std::string& path() const { return path_; }

    void write(const std::string& msg);
    void error(const std::string& msg) { write("ERROR: " + msg); }
    void warning(const std::string& msg) { write("WARNING: " + msg); }

    // Callback form handed to the scheduler and runner.
    StatusCallback sink();

private:
    std::string path_;
    bool echo_ = true;
    std::mutex mutex_;
};
