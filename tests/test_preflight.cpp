#include <gtest/gtest.h>
#include <cli/preflight.hpp>
#include "fakes.hpp"

TEST(Preflight, CopierOnPath) {
    CopierConfig found{"sh", "-a"};
    EXPECT_TRUE(check_copier(found).empty());

    CopierConfig missing{"backset-no-such-rsync", "-a"};
    auto issues = check_copier(missing);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_NE(issues[0].message.find("backset-no-such-rsync"), std::string::npos);
    EXPECT_FALSE(issues[0].fix.empty());
}

TEST(Preflight, MarkerDirectoriesMustExist) {
    TempTree tree("preflight");
    FlagPaths ok{tree.marker("running"), tree.marker("failed"), tree.marker("stop")};
    EXPECT_TRUE(check_flag_dirs(ok).empty());

    FlagPaths bad = ok;
    bad.stop = (tree.root / "unmounted" / "stop").string();
    auto issues = check_flag_dirs(bad);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_NE(issues[0].message.find("unmounted"), std::string::npos);
}
