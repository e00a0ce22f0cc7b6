#include <gtest/gtest.h>
#include <managers/state_store.hpp>
#include "fakes.hpp"
#include <fstream>

TEST(StateStore, MissingFileHasNoRecord) {
    TempTree tree("state_missing");
    StateStore store(tree.root / "last_run.yaml");
    EXPECT_FALSE(store.load().has_value());
}

TEST(StateStore, SaveThenLoad) {
    TempTree tree("state_save");
    StateStore store(tree.root / "state" / "last_run.yaml");

    RunRecord record;
    record.started = "2025-01-15T02:00:00";
    record.finished = "2025-01-15T02:14:09";
    record.status = "failed";
    record.tasks = 4;
    record.succeeded = 2;
    record.failed_source = "/data/photos";
    record.failed_reason = "Backup of /data/photos failed: rsync exited with status 23";

    auto saved = store.save(record);
    ASSERT_TRUE(saved.is_ok()) << saved.error;

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->started, record.started);
    EXPECT_EQ(loaded->finished, record.finished);
    EXPECT_EQ(loaded->status, "failed");
    EXPECT_EQ(loaded->tasks, 4);
    EXPECT_EQ(loaded->succeeded, 2);
    EXPECT_EQ(loaded->failed_source, "/data/photos");
    EXPECT_EQ(loaded->failed_reason, record.failed_reason);
}

TEST(StateStore, SaveReplacesPreviousRecord) {
    TempTree tree("state_replace");
    StateStore store(tree.root / "last_run.yaml");

    RunRecord first;
    first.status = "failed";
    first.failed_source = "/data/a";
    ASSERT_TRUE(store.save(first).is_ok());

    RunRecord second;
    second.status = "success";
    second.tasks = 1;
    second.succeeded = 1;
    ASSERT_TRUE(store.save(second).is_ok());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, "success");
    EXPECT_TRUE(loaded->failed_source.empty());
}

TEST(StateStore, CorruptFileHasNoRecord) {
    TempTree tree("state_corrupt");
    auto path = tree.root / "last_run.yaml";
    std::ofstream(path) << "last_run: [not: closed\n";

    StateStore store(path);
    EXPECT_FALSE(store.load().has_value());
}

TEST(StateStore, UnrelatedYamlHasNoRecord) {
    TempTree tree("state_other");
    auto path = tree.root / "last_run.yaml";
    std::ofstream(path) << "something_else: 1\n";

    EXPECT_FALSE(StateStore(path).load().has_value());
}
