#include "run_log.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <iostream>

RunLog::RunLog(std::string path, bool echo)
    : path_(std::move(path)), echo_(echo) {}

void RunLog::set_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    path_ = path;
    if (!path_.empty()) {
        std::error_code ec;
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    }
}

void RunLog::write(const std::string& msg) {
    std::string line = fmt::format("[{}] {}", now_log_stamp(), msg);

    std::lock_guard<std::mutex> lock(mutex_);
    if (echo_) {
        std::cout << line << "\n" << std::flush;
    }
    if (path_.empty()) return;

    // Reopened per line: rsync children append to the same file between writes
    std::ofstream out(path_, std::ios::app);
    if (out) {
        out << line << "\n";
    }
}

StatusCallback RunLog::sink() {
    return [this](const std::string& msg) { write(msg); };
}
