#include "state_store.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>

StateStore::StateStore(fs::path state_path)
    : state_path_(std::move(state_path)) {}

std::optional<RunRecord> StateStore::load() const {
    if (!fs::exists(state_path_)) {
        return std::nullopt;
    }

    try {
        YAML::Node root = YAML::LoadFile(state_path_.string());
        if (!root["last_run"] || !root["last_run"].IsMap()) {
            return std::nullopt;
        }

        const YAML::Node n = root["last_run"];
        RunRecord r;
        r.started = n["started"].as<std::string>("");
        r.finished = n["finished"].as<std::string>("");
        r.status = n["status"].as<std::string>("");
        r.tasks = n["tasks"].as<int>(0);
        r.succeeded = n["succeeded"].as<int>(0);
        r.failed_source = n["failed_source"].as<std::string>("");
        r.failed_reason = n["failed_reason"].as<std::string>("");
        return r;
    } catch (const YAML::Exception&) {
        // Corrupted state file is treated as "no previous run"
        return std::nullopt;
    }
}

Result<void> StateStore::save(const RunRecord& record) const {
    try {
        if (state_path_.has_parent_path()) {
            fs::create_directories(state_path_.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "last_run" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "started" << YAML::Value << record.started;
        out << YAML::Key << "finished" << YAML::Value << record.finished;
        out << YAML::Key << "status" << YAML::Value << record.status;
        out << YAML::Key << "tasks" << YAML::Value << record.tasks;
        out << YAML::Key << "succeeded" << YAML::Value << record.succeeded;
        out << YAML::Key << "failed_source" << YAML::Value << record.failed_source;
        out << YAML::Key << "failed_reason" << YAML::Value << record.failed_reason;
        out << YAML::EndMap;
        out << YAML::EndMap;

        std::ofstream fout(state_path_.string());
        if (!fout) {
            return Result<void>::Err("Cannot write state file " + state_path_.string());
        }
        fout << out.c_str() << "\n";
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to save state: " + std::string(e.what()));
    }
}
