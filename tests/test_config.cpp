#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <fstream>
#include <unistd.h>

class ConfigTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("backset_config_" + std::to_string(getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path write(const std::string& yaml, const std::string& name = "backup_config.yaml") {
        fs::path p = dir / name;
        std::ofstream out(p);
        out << yaml;
        return p;
    }
};

TEST_F(ConfigTest, LoadsFullConfig) {
    auto path = write(R"(
log_file: /var/log/backup_sets.log
rsync_opts: "-a --delete --exclude=.cache"
rsync_path: /usr/local/bin/rsync
max_parallel: 3
poll_interval_ms: 500
state_file: /var/lib/backset/last_run.yaml
flags:
  running: /tmp/run.flag
  failed: /tmp/fail.flag
  stop: /tmp/stop.flag
backups:
  - source: /data/photos
    destination: /mnt/backup
  - source: /home/user/docs/
    destination: /mnt/backup2
)");

    auto result = Config::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& c = result.value;

    EXPECT_EQ(c.log_file(), "/var/log/backup_sets.log");
    EXPECT_EQ(c.copier().options, "-a --delete --exclude=.cache");
    EXPECT_EQ(c.copier().program, "/usr/local/bin/rsync");
    EXPECT_EQ(c.max_parallel(), 3);
    EXPECT_EQ(c.poll_interval_ms(), 500);
    EXPECT_EQ(c.state_file(), "/var/lib/backset/last_run.yaml");
    EXPECT_EQ(c.flags().running, "/tmp/run.flag");
    EXPECT_EQ(c.flags().failed, "/tmp/fail.flag");
    EXPECT_EQ(c.flags().stop, "/tmp/stop.flag");
    ASSERT_EQ(c.backups().size(), 2u);
    EXPECT_EQ(c.backups()[0].source, "/data/photos");
    EXPECT_EQ(c.backups()[1].destination, "/mnt/backup2");
    EXPECT_EQ(c.backups()[1].folder_name(), "docs");
    EXPECT_EQ(c.path(), path);
}

TEST_F(ConfigTest, Defaults) {
    auto path = write(R"(
log_file: /tmp/backup.log
backups:
  - source: /data/a
    destination: /mnt/b
)");

    auto result = Config::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& c = result.value;

    EXPECT_EQ(c.copier().options, DEFAULT_RSYNC_OPTS);
    EXPECT_EQ(c.copier().program, DEFAULT_RSYNC_PATH);
    EXPECT_EQ(c.max_parallel(), 1);
    EXPECT_EQ(c.poll_interval_ms(), JOB_POLL_INTERVAL_MS);
    EXPECT_TRUE(c.state_file().empty());
    EXPECT_EQ(c.flags().running, "/mnt/.backup_running");
    EXPECT_EQ(c.flags().failed, "/mnt/.backup_failed");
    EXPECT_EQ(c.flags().stop, "/mnt/.backup_stop");
}

TEST_F(ConfigTest, PartialFlagsKeepDefaults) {
    auto path = write(R"(
log_file: /tmp/backup.log
flags:
  stop: /srv/pause
)");

    auto result = Config::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.flags().stop, "/srv/pause");
    EXPECT_EQ(result.value.flags().running, "/mnt/.backup_running");
}

TEST_F(ConfigTest, ExplicitEmptyOptionsAreHonored) {
    auto path = write("log_file: /tmp/backup.log\nrsync_opts: \"\"\n");

    auto result = Config::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.copier().options, "");
}

TEST_F(ConfigTest, MissingBackupsIsEmptyList) {
    auto path = write("log_file: /tmp/backup.log\n");

    auto result = Config::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_TRUE(result.value.backups().empty());
}

TEST_F(ConfigTest, MissingFile) {
    auto result = Config::load(dir / "nope.yaml");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Configuration file not found"), std::string::npos);
}

TEST_F(ConfigTest, MissingLogFile) {
    auto path = write("rsync_opts: -a\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("log_file not defined"), std::string::npos);
}

TEST_F(ConfigTest, NullLogFile) {
    auto path = write("log_file: null\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("log_file not defined"), std::string::npos);
}

TEST_F(ConfigTest, NullSourceNamesEntry) {
    auto path = write(R"(
log_file: /tmp/backup.log
backups:
  - source: /data/a
    destination: /mnt/b
  - source: null
    destination: /mnt/b
)");

    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error, "Invalid source path in backup entry 1");
}

TEST_F(ConfigTest, MissingDestinationNamesEntry) {
    auto path = write(R"(
log_file: /tmp/backup.log
backups:
  - source: /data/a
)");

    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error, "Invalid destination in backup entry 0");
}

TEST_F(ConfigTest, RejectsZeroParallel) {
    auto path = write("log_file: /tmp/backup.log\nmax_parallel: 0\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("max_parallel must be at least 1"), std::string::npos);
}

TEST_F(ConfigTest, RejectsZeroPollInterval) {
    auto path = write("log_file: /tmp/backup.log\npoll_interval_ms: 0\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("poll_interval_ms must be positive"), std::string::npos);
}

TEST_F(ConfigTest, RejectsNonIntegerParallel) {
    auto path = write("log_file: /tmp/backup.log\nmax_parallel: four\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("max_parallel must be an integer (got 'four')"), std::string::npos);
}

TEST_F(ConfigTest, RejectsFractionalPollInterval) {
    auto path = write("log_file: /tmp/backup.log\npoll_interval_ms: 2.5\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("poll_interval_ms must be an integer (got '2.5')"), std::string::npos);
}

TEST_F(ConfigTest, RejectsListForParallel) {
    auto path = write("log_file: /tmp/backup.log\nmax_parallel: [2, 3]\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("max_parallel must be an integer"), std::string::npos);
}

TEST_F(ConfigTest, NullParallelUsesDefault) {
    auto path = write("log_file: /tmp/backup.log\nmax_parallel:\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.max_parallel(), DEFAULT_MAX_PARALLEL);
}

TEST_F(ConfigTest, RejectsMalformedYaml) {
    auto path = write("log_file: [unterminated\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Failed to parse configuration"), std::string::npos);
}

TEST_F(ConfigTest, DefaultConfigLoadsAndIsNotOverwritten) {
    fs::path path = dir / "nested" / "backup_config.yaml";

    auto created = create_default_config(path);
    ASSERT_TRUE(created.is_ok()) << created.error;

    auto loaded = Config::load(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.log_file(), "/var/log/backup_sets.log");
    EXPECT_EQ(loaded.value.copier().options, "-a --delete");
    ASSERT_EQ(loaded.value.backups().size(), 1u);

    auto again = create_default_config(path);
    EXPECT_TRUE(again.is_err());
}
