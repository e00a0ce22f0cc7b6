#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct RunRecord {
    std::string started;            // ISO timestamp
    std::string finished;           // ISO timestamp
    std::string status;             // exit_status_name()
    int tasks = 0;
    int succeeded = 0;
    std::string failed_source;      // "" unless a task failed
    std::string failed_reason;
};

// Last-run record kept as YAML so operators and `backset status` can see what
// the previous invocation did without parsing the log.
class StateStore {
public:
    explicit StateStore(fs::path state_path);

    // std::nullopt if no record exists or it cannot be parsed.
    std::optional<RunRecord> load() const;
    Result<void> save(const RunRecord& record) const;

    const fs::path& path() const { return state_path_; }

private:
    fs::path state_path_;
};
