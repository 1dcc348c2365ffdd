#include "filesystem/filesystem.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <pwd.h>

using test_support::temp_dir_t;
using test_support::scoped_env_t;

namespace {

std::vector<std::string> filenames(const std::vector<filesystem::path_t>& paths) {
    std::vector<std::string> result;
    for (const auto& path : paths) {
        result.push_back(path.filename());
    }
    return result;
}

} // namespace

TEST(PathTest, IsAbsoluteAndNormalized) {
    EXPECT_EQ(filesystem::path_t("/a/b/../c/./d").string(), "/a/c/d");
    EXPECT_EQ(filesystem::path_t("x/y").string(), (std::filesystem::current_path() / "x/y").lexically_normal().string());
}

TEST(PathTest, DropsTrailingSeparator) {
    EXPECT_EQ(filesystem::path_t("/a/b/").string(), "/a/b");
    EXPECT_EQ(filesystem::path_t("/a/b/"), filesystem::path_t("/a/b"));
    EXPECT_EQ(filesystem::path_t("/").string(), "/");
}

TEST(PathTest, JoinMustStayInsideBase) {
    const auto base = filesystem::path_t("/srv/data");

    EXPECT_EQ((base / filesystem::relative_path_t("photos.tar")).string(), "/srv/data/photos.tar");
    EXPECT_THROW(base / filesystem::relative_path_t("../escape"), std::runtime_error);
    EXPECT_THROW(base / filesystem::relative_path_t("."), std::runtime_error);
    EXPECT_THROW(filesystem::relative_path_t("/absolute"), std::runtime_error);
}

TEST(PathTest, FormatsAsPlainString) {
    EXPECT_EQ(std::format("'{}'", filesystem::path_t("/a/b")), "'/a/b'");
}

TEST(ExpandHomeTest, ExpandsTildeAgainstHome) {
    scoped_env_t home("HOME", "/home/tester");

    EXPECT_EQ(filesystem::expand_home("~"), "/home/tester");
    EXPECT_EQ(filesystem::expand_home("~/docs/2024"), "/home/tester/docs/2024");
}

TEST(ExpandHomeTest, IgnoresTrailingSeparatorOfHome) {
    {
        scoped_env_t home("HOME", "/home/tester/");
        EXPECT_EQ(filesystem::expand_home("~/docs"), "/home/tester/docs");
    }
    {
        scoped_env_t home("HOME", "/");
        EXPECT_EQ(filesystem::expand_home("~/docs"), "/docs");
        EXPECT_EQ(filesystem::expand_home("~"), "/");
    }
}

TEST(ExpandHomeTest, LeavesOtherPathsUnchanged) {
    scoped_env_t home("HOME", "/home/tester");

    EXPECT_EQ(filesystem::expand_home(""), "");
    EXPECT_EQ(filesystem::expand_home("/srv/~/data"), "/srv/~/data");
    EXPECT_EQ(filesystem::expand_home("relative/~"), "relative/~");
    EXPECT_EQ(filesystem::expand_home("~no_such_user_archive_dirs/x"), "~no_such_user_archive_dirs/x");
}

TEST(ExpandHomeTest, ExpandsNamedUser) {
    const passwd* pw = getpwnam("root");
    if (!pw || !pw->pw_dir) {
        GTEST_SKIP() << "no passwd entry for root";
    }

    EXPECT_EQ(filesystem::expand_home("~root/projects"), std::string(pw->pw_dir) + "/projects");
}

TEST(ResolveTest, ExpandsAndNormalizes) {
    scoped_env_t home("HOME", "/home/tester");

    EXPECT_EQ(filesystem::resolve("~/a/../b/"), filesystem::path_t("/home/tester/b"));
    EXPECT_THROW(filesystem::resolve(""), std::runtime_error);
}

TEST(ListTest, ListsOneLevelSorted) {
    temp_dir_t tmp;
    tmp.mkdir("b/nested");
    tmp.mkdir("a");
    tmp.mkdir(".hidden");
    tmp.write("c.txt", "c");

    const auto dir = filesystem::path_t(tmp.path());
    EXPECT_EQ(filenames(filesystem::list(dir, !filesystem::list_predicate_t::is_hidden)), (std::vector<std::string>{ "a", "b", "c.txt" }));
    EXPECT_EQ(filenames(filesystem::list(dir, filesystem::list_predicate_t::is_dir)), (std::vector<std::string>{ ".hidden", "a", "b" }));
}

TEST(ListTest, CombinesPredicates) {
    temp_dir_t tmp;
    tmp.mkdir("a");
    tmp.mkdir("b");
    tmp.mkdir(".git");
    tmp.write("notes.txt", "n");
    std::filesystem::create_directory_symlink(tmp.path() / "a", tmp.path() / "link");

    using predicate_t = filesystem::list_predicate_t;
    const auto dir = filesystem::path_t(tmp.path());

    EXPECT_EQ(filenames(filesystem::list(dir, predicate_t::is_dir)), (std::vector<std::string>{ ".git", "a", "b", "link" }));
    EXPECT_EQ(filenames(filesystem::list(dir, !predicate_t::is_hidden && !predicate_t::is_symlink && predicate_t::is_dir)), (std::vector<std::string>{ "a", "b" }));
}

TEST(ListTest, MatchesExtension) {
    temp_dir_t tmp;
    tmp.write("b.tar", "");
    tmp.write("a.tar", "");
    tmp.write("c.tar.gz", "");
    tmp.write("tar", "");

    EXPECT_EQ(filenames(filesystem::list(filesystem::path_t(tmp.path()), filesystem::list_predicate_t::extension(".tar"))), (std::vector<std::string>{ "a.tar", "b.tar" }));
}

TEST(ListTest, MissingDirectoryThrows) {
    temp_dir_t tmp;
    EXPECT_THROW(filesystem::list(filesystem::path_t(tmp.path() / "missing"), filesystem::list_predicate_t::is_dir), std::runtime_error);
}

TEST(FilesystemTest, StatusQueries) {
    temp_dir_t tmp;
    const auto dir = filesystem::path_t(tmp.mkdir("dir"));
    const auto file = filesystem::path_t(tmp.write("file", "12345"));
    const auto missing = filesystem::path_t(tmp.path() / "missing");
    std::filesystem::create_symlink(tmp.path() / "missing", tmp.path() / "broken");
    const auto broken = filesystem::path_t(tmp.path() / "broken");

    EXPECT_TRUE(filesystem::exists(dir));
    EXPECT_TRUE(filesystem::is_directory(dir));
    EXPECT_FALSE(filesystem::is_regular_file(dir));

    EXPECT_TRUE(filesystem::is_regular_file(file));
    EXPECT_FALSE(filesystem::is_directory(file));
    EXPECT_EQ(filesystem::file_size(file), 5u);

    EXPECT_FALSE(filesystem::exists(missing));
    EXPECT_FALSE(filesystem::is_directory(missing));
    EXPECT_FALSE(filesystem::is_symlink(missing));
    EXPECT_THROW(filesystem::file_size(missing), std::runtime_error);

    EXPECT_FALSE(filesystem::exists(broken));
    EXPECT_TRUE(filesystem::is_symlink(broken));
    EXPECT_FALSE(filesystem::is_directory(broken));
}

TEST(FilesystemTest, CreateAndRemove) {
    temp_dir_t tmp;
    const auto nested = filesystem::path_t(tmp.path() / "a/b/c");

    filesystem::create_directories(nested);
    EXPECT_TRUE(filesystem::is_directory(nested));

    const auto file = filesystem::path_t(tmp.write("a/b/c/file.tar", "x"));
    EXPECT_TRUE(filesystem::remove(file));
    EXPECT_FALSE(filesystem::remove(file));
    EXPECT_FALSE(filesystem::exists(file));

    EXPECT_THROW(filesystem::create_directories(filesystem::path_t(file.to_native_path() / "below-a-file")), std::runtime_error);
}

TEST(FilesystemTest, AccessChecks) {
    temp_dir_t tmp;
    const auto script = filesystem::path_t(tmp.script("run.sh", "exit 0"));
    const auto plain = filesystem::path_t(tmp.write("plain.txt", "x"));
    std::filesystem::permissions(plain.to_native_path(), std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

    EXPECT_TRUE(filesystem::is_readable(plain));
    EXPECT_TRUE(filesystem::is_writable(plain));
    EXPECT_FALSE(filesystem::is_executable(plain));
    EXPECT_TRUE(filesystem::is_executable(script));
    EXPECT_FALSE(filesystem::is_readable(filesystem::path_t(tmp.path() / "missing")));
}
