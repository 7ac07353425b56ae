#include <gtest/gtest.h>
#include "test_util.hpp"
#include "work_area.hpp"

namespace fs = std::filesystem;

TEST(WorkArea, OpensDistinctDirectories) {
    TempDir root;
    WorkArea a = WorkArea::open(root.path());
    WorkArea b = WorkArea::open(root.path());
    EXPECT_TRUE(fs::is_directory(a.path()));
    EXPECT_TRUE(fs::is_directory(b.path()));
    EXPECT_NE(a.path(), b.path());
    EXPECT_TRUE(is_strictly_inside(root.path(), a.path()));
}

TEST(WorkArea, CloseRemovesContents) {
    TempDir root;
    WorkArea area = WorkArea::open(root.path());
    fs::path dir = area.path();
    fs::create_directories(dir / "nested" / "deeper");
    write_file(dir / "nested" / "deeper" / "data.csv", "a,b\n1,2\n");

    area.close();
    EXPECT_FALSE(area.is_open());
    EXPECT_FALSE(fs::exists(dir));
    area.close();
}

TEST(WorkArea, DestructorRemovesDirectory) {
    TempDir root;
    fs::path dir;
    {
        WorkArea area = WorkArea::open(root.path());
        dir = area.path();
        write_file(dir / "script.py", "print(1)\n");
    }
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_EQ(entry_count(root.path()), 0u);
}

TEST(WorkArea, MovedFromDoesNotRemove) {
    TempDir root;
    WorkArea a = WorkArea::open(root.path());
    fs::path dir = a.path();
    WorkArea b(std::move(a));
    EXPECT_FALSE(a.is_open());
    a.close();
    EXPECT_TRUE(fs::exists(dir));
    EXPECT_EQ(b.path(), dir);
}

TEST(WorkArea, ResolvesNamesInside) {
    TempDir root;
    WorkArea area = WorkArea::open(root.path());

    auto plain = area.resolve_inside("data.csv");
    ASSERT_TRUE(plain);
    EXPECT_EQ(*plain, area.path() / "data.csv");

    auto nested = area.resolve_inside("inputs/2024/data.csv");
    ASSERT_TRUE(nested);
    EXPECT_EQ(*nested, area.path() / "inputs" / "2024" / "data.csv");

    auto dotted = area.resolve_inside("inputs/../data.csv");
    ASSERT_TRUE(dotted);
    EXPECT_EQ(*dotted, area.path() / "data.csv");
}

TEST(WorkArea, RejectsEscapingNames) {
    TempDir root;
    WorkArea area = WorkArea::open(root.path());

    EXPECT_FALSE(area.resolve_inside(""));
    EXPECT_FALSE(area.resolve_inside("/etc/passwd"));
    EXPECT_FALSE(area.resolve_inside("../escape.txt"));
    EXPECT_FALSE(area.resolve_inside("a/../../escape.txt"));
    EXPECT_FALSE(area.resolve_inside("."));
    EXPECT_FALSE(area.resolve_inside(std::string("bad\0name", 8)));
}

TEST(WorkArea, RejectsSymlinkOutside) {
    TempDir root;
    TempDir outside;
    WorkArea area = WorkArea::open(root.path());
    fs::create_directory_symlink(outside.path(), area.path() / "link");

    EXPECT_FALSE(area.resolve_inside("link/file.txt"));
}

TEST(IsStrictlyInside, ComparesComponents) {
    EXPECT_TRUE(is_strictly_inside("/a/b", "/a/b/c"));
    EXPECT_FALSE(is_strictly_inside("/a/b", "/a/b"));
    EXPECT_FALSE(is_strictly_inside("/a/b", "/a/bc"));
    EXPECT_FALSE(is_strictly_inside("/a/b", "/a"));
    EXPECT_TRUE(is_strictly_inside("/a/b/", "/a/b/c"));
}
