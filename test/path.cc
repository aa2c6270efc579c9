#include "temporary_directory.hh"

#include <evalbox/path.hh>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

// NOLINTNEXTLINE
TEST(path, path_absolute) {
    EXPECT_EQ(path_absolute("/foo/bar/"), "/foo/bar");
    EXPECT_EQ(path_absolute("/foo/bar/////"), "/foo/bar");
    EXPECT_EQ(path_absolute("/foo/bar/../"), "/foo");
    EXPECT_EQ(path_absolute("/foo/bar/.."), "/foo");
    EXPECT_EQ(path_absolute("/foo/bar/xd"), "/foo/bar/xd");
    EXPECT_EQ(path_absolute("/foo/bar/////xd"), "/foo/bar/xd");
    EXPECT_EQ(path_absolute("/foo/bar/../xd"), "/foo/xd");
    EXPECT_EQ(path_absolute("/foo/bar/./../xd/."), "/foo/xd");
    EXPECT_EQ(path_absolute("/.."), "/");
    EXPECT_EQ(path_absolute(".."), "/");
    EXPECT_EQ(path_absolute("/////"), "/");
    EXPECT_EQ(path_absolute(""), "/");
    EXPECT_EQ(path_absolute("/lol/../.foo."), "/.foo.");
    EXPECT_EQ(path_absolute("./f"), "/f");

    EXPECT_EQ(path_absolute("../../a", "/foo/bar"), "/a");
    EXPECT_EQ(path_absolute("../../a/../b", "/foo/bar"), "/b");
    EXPECT_EQ(path_absolute("../", "/foo/bar"), "/foo");
    EXPECT_EQ(path_absolute("gg", "/foo/bar"), "/foo/bar/gg");
    EXPECT_EQ(path_absolute("../../../..", "/foo/bar"), "/");
    EXPECT_EQ(path_absolute("/abs", "/foo/bar"), "/abs");
}

// NOLINTNEXTLINE
TEST(path, path_is_within) {
    EXPECT_TRUE(path_is_within("/foo", "/foo"));
    EXPECT_TRUE(path_is_within("/foo/bar", "/foo"));
    EXPECT_TRUE(path_is_within("/foo/bar/baz", "/foo"));
    EXPECT_FALSE(path_is_within("/foobar", "/foo"));
    EXPECT_FALSE(path_is_within("/fo", "/foo"));
    EXPECT_FALSE(path_is_within("/", "/foo"));
    EXPECT_TRUE(path_is_within("/", "/"));
    EXPECT_TRUE(path_is_within("/anything/at/all", "/"));
}

// NOLINTNEXTLINE
TEST(path, path_resolve_existing_prefix) {
    TemporaryDirectory tmp_dir;
    // mkdtemp() may have been given a path with a symlink in it
    auto real_tmp = path_resolve_existing_prefix(tmp_dir.path());
    ASSERT_EQ(mkdir((real_tmp + "/dir").c_str(), 0755), 0);
    ASSERT_EQ(symlink((real_tmp + "/dir").c_str(), (real_tmp + "/link").c_str()), 0);
    ASSERT_EQ(symlink("/", (real_tmp + "/root_link").c_str()), 0);

    EXPECT_EQ(path_resolve_existing_prefix(real_tmp + "/dir"), real_tmp + "/dir");
    EXPECT_EQ(path_resolve_existing_prefix(real_tmp + "/link"), real_tmp + "/dir");
    EXPECT_EQ(path_resolve_existing_prefix(real_tmp + "/link/a/b"), real_tmp + "/dir/a/b");
    EXPECT_EQ(path_resolve_existing_prefix(real_tmp + "/missing/x"), real_tmp + "/missing/x");
    EXPECT_EQ(path_resolve_existing_prefix(real_tmp + "/root_link/etc"), "/etc");
    EXPECT_EQ(path_resolve_existing_prefix("/"), "/");
    // .. applies to the symlink target, not to the symlink
    EXPECT_EQ(path_resolve_existing_prefix(real_tmp + "/root_link/../etc"), "/etc");
    EXPECT_EQ(
        path_resolve_existing_prefix(real_tmp + "/link/../missing/../dir"), real_tmp + "/dir"
    );
    EXPECT_EQ(path_resolve_existing_prefix(real_tmp + "//dir/./x/"), real_tmp + "/dir/x");
}

// NOLINTNEXTLINE
TEST(path, get_cwd) {
    auto cwd = get_cwd();
    ASSERT_FALSE(cwd.empty());
    EXPECT_EQ(cwd.front(), '/');
}
