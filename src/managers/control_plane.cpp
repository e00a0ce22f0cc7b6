#include "control_plane.hpp"
#include <fmt/format.h>
#include <filesystem>
#include <system_error>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

// ── FileMarkerStore ─────────────────────────────────────────

bool FileMarkerStore::exists(const std::string& name) const {
    std::error_code ec;
    return fs::exists(name, ec);
}

Result<void> FileMarkerStore::create(const std::string& name) {
    int fd = open(name.c_str(), O_WRONLY | O_CREAT, 0644);
    if (fd < 0) {
        return Result<void>::Err(fmt::format("cannot create {}: {}", name, std::strerror(errno)));
    }
    close(fd);
    return Result<void>::Ok();
}

Result<bool> FileMarkerStore::create_exclusive(const std::string& name) {
    int fd = open(name.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        if (errno == EEXIST) return Result<bool>::Ok(false);
        return Result<bool>::Err(fmt::format("cannot create {}: {}", name, std::strerror(errno)));
    }
    close(fd);
    return Result<bool>::Ok(true);
}

Result<void> FileMarkerStore::remove(const std::string& name) {
    std::error_code ec;
    fs::remove(name, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("cannot remove {}: {}", name, ec.message()));
    }
    return Result<void>::Ok();
}

// ── ControlPlane ────────────────────────────────────────────

ControlPlane::ControlPlane(MarkerStore& store, FlagPaths paths)
    : store_(store), paths_(std::move(paths)) {}

// ── RunGuard ────────────────────────────────────────────────

RunGuard::RunGuard(ControlPlane& flags, StatusCallback log)
    : flags_(flags), log_(std::move(log)) {
    auto acquired = flags_.acquire_running();
    if (acquired.is_err()) {
        error_ = acquired.error;
        return;
    }
    held_ = acquired.value;
    if (held_ && log_) {
        log_("Created running flag: " + flags_.paths().running);
    }
}

RunGuard::~RunGuard() {
    if (!held_) return;

    auto released = flags_.release_running();
    if (!log_) return;
    if (released.is_ok()) {
        log_("Removed running flag");
    } else {
        log_("ERROR: " + released.error);
    }
}
