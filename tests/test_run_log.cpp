#include <gtest/gtest.h>
#include <managers/run_log.hpp>
#include "fakes.hpp"
#include <fstream>
#include <regex>

static std::vector<std::string> read_lines(const std::filesystem::path& p) {
    std::vector<std::string> lines;
    std::ifstream in(p);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

TEST(RunLog, TimestampedLines) {
    TempTree tree("runlog");
    auto path = tree.root / "backup.log";
    RunLog log(path.string(), false);

    log.write("Backup script started");
    log.error("Source directory does not exist: /data/x");
    log.warning("No backups defined in configuration file");

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 3u);
    std::regex stamped(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] .+)");
    for (const auto& l : lines) {
        EXPECT_TRUE(std::regex_match(l, stamped)) << l;
    }
    EXPECT_NE(lines[0].find("] Backup script started"), std::string::npos);
    EXPECT_NE(lines[1].find("] ERROR: Source directory"), std::string::npos);
    EXPECT_NE(lines[2].find("] WARNING: No backups"), std::string::npos);
}

TEST(RunLog, AppendsToExistingFile) {
    TempTree tree("runlog_append");
    auto path = tree.root / "backup.log";
    std::ofstream(path) << "previous run\n";

    RunLog log(path.string(), false);
    log.sink()("next run");

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "previous run");
}

TEST(RunLog, SetPathCreatesParentDirectory) {
    TempTree tree("runlog_dir");
    auto path = tree.root / "logs" / "nested" / "backup.log";

    RunLog log("", false);
    log.write("dropped: no file yet");
    log.set_path(path.string());
    log.write("kept");

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("kept"), std::string::npos);
}
