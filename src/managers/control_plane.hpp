#pragma once

#include <string>
#include <core/types.hpp>

// Durable presence/absence markers, addressed by name. The filesystem store
// uses the name as a file path; tests substitute an in-memory store.
class MarkerStore {
public:
    virtual ~MarkerStore() = default;

    virtual bool exists(const std::string& name) const = 0;

    // Create the marker. Succeeds if it is already present.
    virtual Result<void> create(const std::string& name) = 0;

    // Create the marker only if absent. Ok(false) means someone else holds it.
    virtual Result<bool> create_exclusive(const std::string& name) = 0;

    // Remove the marker. Succeeds if it is already absent.
    virtual Result<void> remove(const std::string& name) = 0;
};

class FileMarkerStore : public MarkerStore {
public:
    bool exists(const std::string& name) const override;
    Result<void> create(const std::string& name) override;
    Result<bool> create_exclusive(const std::string& name) override;
    Result<void> remove(const std::string& name) override;
};

// The three cross-invocation flags: running (mutual exclusion), stop
// (operator pause) and failed (last run did not complete cleanly).
class ControlPlane {
public:
    ControlPlane(MarkerStore& store, FlagPaths paths);

    bool stop_requested() const { return store_.exists(paths_.stop); }
    bool running() const { return store_.exists(paths_.running); }
    bool failed() const { return store_.exists(paths_.failed); }

    Result<bool> acquire_running() { return store_.create_exclusive(paths_.running); }
    Result<void> release_running() { return store_.remove(paths_.running); }

    Result<void> mark_failed() { return store_.create(paths_.failed); }
    Result<void> clear_failed() { return store_.remove(paths_.failed); }

    Result<void> request_stop() { return store_.create(paths_.stop); }
    Result<void> clear_stop() { return store_.remove(paths_.stop); }

    const FlagPaths& paths() const { return paths_; }

private:
    MarkerStore& store_;
    FlagPaths paths_;
};

// Scoped ownership of the running marker. The constructor tries to create it;
// the destructor removes it on every exit path if it was acquired.
class RunGuard {
public:
    RunGuard(ControlPlane& flags, StatusCallback log);
    ~RunGuard();

    RunGuard(const RunGuard&) = delete;
    RunGuard& operator=(const RunGuard&) = delete;

    // True if this instance created the running marker.
    bool held() const { return held_; }

    // Non-empty if the marker could not be written at all.
    const std::string& error() const { return error_; }

private:
    ControlPlane& flags_;
    StatusCallback log_;
    bool held_ = false;
    std::string error_;
};
