#include "platform.hpp"
#include <cstdlib>
#include <unistd.h>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace platform {

fs::path executable_dir() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return fs::current_path();
    }
    return exe.parent_path();
}

static bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::optional<fs::path> find_program(const std::string& program) {
    if (program.empty()) return std::nullopt;

    if (program.find('/') != std::string::npos) {
        if (is_executable_file(program)) return fs::path(program);
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/bin:/bin";

    std::istringstream dirs(search);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / program;
        if (is_executable_file(candidate)) return candidate;
    }
    return std::nullopt;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
