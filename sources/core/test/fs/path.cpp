#include <gtest/gtest.h>

#include "fs/path.hpp"

using namespace rvfs;

TEST(VfsPathTest, Empty) {
    VfsPath path;
    ASSERT_TRUE(path.isRoot());
    ASSERT_EQ(path.string(), "/");
    ASSERT_EQ(path.segmentCount(), 0);
}

TEST(VfsPathTest, Construct) {
    VfsPath path = "/etc/hosts";
    ASSERT_FALSE(path.isRoot());
    ASSERT_EQ(path.count(), 10);
}

TEST(VfsPathTest, StringFormat) {
    ASSERT_EQ(detail::BuildPathText("Users", "Init"), "/Users/Init");
    ASSERT_EQ(detail::BuildPathText(), "/");
}

TEST(VfsPathTest, Verify) {
    ASSERT_TRUE(VerifyPathText("/"));
    ASSERT_TRUE(VerifyPathText("/etc"));
    ASSERT_TRUE(VerifyPathText("/etc/hosts"));

    // Paths must be absolute
    ASSERT_FALSE(VerifyPathText(""));
    ASSERT_FALSE(VerifyPathText("etc/hosts"));

    // No trailing separators
    ASSERT_FALSE(VerifyPathText("/etc/"));

    // No empty segments
    ASSERT_FALSE(VerifyPathText("//etc"));
    ASSERT_FALSE(VerifyPathText("/etc//hosts"));

    ASSERT_FALSE(VerifyPathText(VfsStringView("/etc\0hosts", 10)));
}

TEST(VfsPathTest, SegmentCount) {
    auto path = BuildPath("Users", "admin", "Documents", "notes.txt");
    ASSERT_EQ(path.segmentCount(), 4);
}

TEST(VfsPathTest, SegmentCountOne) {
    auto path = BuildPath("Users");
    ASSERT_EQ(path.segmentCount(), 1);
}

TEST(VfsPathTest, Iterate) {
    auto path = BuildPath("Users", "admin", "notes.txt");
    auto begin = path.begin();
    auto end = path.end();

    ASSERT_NE(begin, end);

    auto segment = *begin;
    ASSERT_EQ(segment, "Users") << segment;
    ++begin;

    segment = *begin;
    ASSERT_EQ(segment, "admin") << segment;
    ++begin;

    segment = *begin;
    ASSERT_EQ(segment, "notes.txt") << segment;
    ++begin;

    ASSERT_EQ(begin, end);
}

TEST(VfsPathTest, IterateRoot) {
    VfsPath path;
    ASSERT_EQ(path.begin(), path.end());
}

TEST(VfsPathTest, Parent) {
    VfsPath path = "/Users/admin/notes.txt";
    ASSERT_EQ(path.parent(), VfsPath("/Users/admin"));
    ASSERT_EQ(path.parent().parent(), VfsPath("/Users"));
    ASSERT_EQ(path.parent().parent().parent(), VfsPath());
}

TEST(VfsPathTest, Name) {
    VfsPath path = "/Users/admin/notes.txt";
    ASSERT_EQ(path.name(), "notes.txt");
    ASSERT_EQ(VfsPath("/Users").name(), "Users");
    ASSERT_EQ(VfsPath().name(), "");
}

TEST(VfsPathTest, Join) {
    ASSERT_EQ(VfsPath().join("Users"), VfsPath("/Users"));
    ASSERT_EQ(VfsPath("/Users").join("admin"), VfsPath("/Users/admin"));
}

TEST(VfsPathTest, Order) {
    ASSERT_LT(VfsPath("/a"), VfsPath("/b"));
    ASSERT_LT(VfsPath("/a"), VfsPath("/a/b"));
}

TEST(VfsPathTest, Parse) {
    VfsPath path;
    ASSERT_EQ(ParsePath("/etc/hosts", &path), RvfsStatusSuccess);
    ASSERT_EQ(path, VfsPath("/etc/hosts"));
}

TEST(VfsPathTest, ParseInvalid) {
    VfsPath path = "/etc";
    ASSERT_EQ(ParsePath("etc/hosts", &path), RvfsStatusInvalidPath);
    ASSERT_EQ(ParsePath("/etc/", &path), RvfsStatusInvalidPath);

    // A failed parse leaves the path untouched
    ASSERT_EQ(path, VfsPath("/etc"));
}

TEST(VfsPathTest, RemotePath) {
    ASSERT_EQ(GetVfsPath(kDefaultVfsPrefix, "/etc/hosts"), "fs/os/etc/hosts");
    ASSERT_EQ(GetVfsPath(kDefaultVfsPrefix, VfsPath()), "fs/os/");
    ASSERT_EQ(GetVfsPath("fs/tsk", "/dev/sda1"), "fs/tsk/dev/sda1");
}
