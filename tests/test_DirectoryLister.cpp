#include <gtest/gtest.h>

#include "DirectoryLister.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;
using test_support::TempDir;


TEST(DirectoryListerTest, EmptyDirectoryGivesNoEntries) {
    TempDir dir;
    std::vector<std::string> entries{"stale"};
    EXPECT_EQ(DirectoryLister::list(dir.path(), entries), PathError::NONE);
    EXPECT_TRUE(entries.empty());
}

TEST(DirectoryListerTest, EntriesAreSortedAscending) {
    TempDir dir;
    test_support::writeFile(dir / "zeta.txt", "");
    test_support::writeFile(dir / "Alpha.txt", "");
    test_support::writeFile(dir / "beta.csv", "");
    fs::create_directory(dir / "mid");

    std::vector<std::string> entries;
    ASSERT_EQ(DirectoryLister::list(dir.path(), entries), PathError::NONE);
    EXPECT_EQ(entries, (std::vector<std::string>{"Alpha.txt", "beta.csv", "mid", "zeta.txt"}));
}

TEST(DirectoryListerTest, DoesNotRecurse) {
    TempDir dir;
    fs::create_directories(dir / "sub" / "deeper");
    test_support::writeFile(dir / "sub" / "inner.txt", "");

    std::vector<std::string> entries;
    ASSERT_EQ(DirectoryLister::list(dir.path(), entries), PathError::NONE);
    EXPECT_EQ(entries, (std::vector<std::string>{"sub"}));
}

TEST(DirectoryListerTest, FileIsNotADirectory) {
    TempDir dir;
    test_support::writeFile(dir / "file.txt", "x");

    std::vector<std::string> entries;
    EXPECT_EQ(DirectoryLister::list(dir / "file.txt", entries), PathError::NOT_A_DIRECTORY);
}

TEST(DirectoryListerTest, MissingPathIsNotFound) {
    TempDir dir;
    std::vector<std::string> entries;
    EXPECT_EQ(DirectoryLister::list(dir / "nope", entries), PathError::NOT_FOUND);
}
