#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

using namespace std;
using namespace arbiter;
namespace fs = std::filesystem;

TEST(IoUtilsTest, ReadWriteFile) {
    scoped_directory dir(fs::temp_directory_path());
    write_file_content(dir.path() / "a.txt", "1 2\n3\n");
    EXPECT_EQ(read_file_content(dir.path() / "a.txt"), "1 2\n3\n");
    EXPECT_THROW(read_file_content(dir.path() / "missing.txt"), internal_error);
}

TEST(IoUtilsTest, ReadFilePrefix) {
    scoped_directory dir(fs::temp_directory_path());
    write_file_content(dir.path() / "out", "abcdef");

    bool truncated = false;
    EXPECT_EQ(read_file_prefix(dir.path() / "out", 4, truncated), "abcd");
    EXPECT_TRUE(truncated);

    EXPECT_EQ(read_file_prefix(dir.path() / "out", 6, truncated), "abcdef");
    EXPECT_FALSE(truncated);

    EXPECT_EQ(read_file_prefix(dir.path() / "out", 100, truncated), "abcdef");
    EXPECT_FALSE(truncated);
}

TEST(IoUtilsTest, SafePath) {
    EXPECT_EQ(assert_safe_path("main.cpp"), "main.cpp");
    EXPECT_EQ(assert_safe_path("bin/main"), "bin/main");
    EXPECT_THROW(assert_safe_path("../etc/passwd"), runtime_error);
    EXPECT_THROW(assert_safe_path("/etc/passwd"), runtime_error);
}

TEST(IoUtilsTest, ScopedDirectoryRemovedOnDestruction) {
    fs::path path;
    {
        scoped_directory dir(fs::temp_directory_path());
        path = dir.path();
        write_file_content(path / "file", "x");
        EXPECT_TRUE(fs::is_directory(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(IoUtilsTest, ScopedDirectoryKept) {
    fs::path path;
    {
        scoped_directory dir(fs::temp_directory_path(), true);
        path = dir.path();
    }
    EXPECT_TRUE(fs::is_directory(path));
    fs::remove_all(path);
}

TEST(IoUtilsTest, ScopedDirectoryMove) {
    scoped_directory outer;
    fs::path path;
    {
        scoped_directory inner(fs::temp_directory_path());
        path = inner.path();
        outer = move(inner);
    }
    EXPECT_TRUE(fs::is_directory(path));
    EXPECT_EQ(outer.path(), path);
}
