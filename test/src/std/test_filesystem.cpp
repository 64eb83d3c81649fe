/**
 * @file test_filesystem.cpp
 * @brief Unit tests for filesystem.hpp utilities
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include "../../../src/std/filesystem.hpp"
#include "../test.hpp"

namespace fs = std::filesystem;

TEST_CASE("ns_fs::read_file and write_file keep raw bytes")
{
  ns_test::TempDir tmp;
  fs::path path_file = tmp.path() / "blob";
  std::string bytes("\x00\xff\nline\r\n", 9);
  REQUIRE(ns_fs::write_file(path_file, bytes));
  auto content = ns_fs::read_file(path_file);
  REQUIRE(content);
  CHECK(*content == bytes);
  // Replaces instead of appending
  REQUIRE(ns_fs::write_file(path_file, "short"));
  CHECK(ns_fs::read_file(path_file).value() == "short");
}

TEST_CASE("ns_fs::read_file and write_file fail on missing directories")
{
  ns_test::TempDir tmp;
  CHECK_FALSE(ns_fs::read_file(tmp.path() / "missing"));
  CHECK_FALSE(ns_fs::write_file(tmp.path() / "missing" / "file", "x"));
}

TEST_CASE("ns_fs::sorted_entries orders by file name")
{
  ns_test::TempDir tmp;
  ns_test::write(tmp.path() / "b.conf", "");
  ns_test::write(tmp.path() / "a.conf", "");
  ns_test::write(tmp.path() / "c" / "nested", "");
  auto entries = ns_fs::sorted_entries(tmp.path());
  REQUIRE(entries);
  REQUIRE(entries->size() == 3);
  CHECK((*entries)[0].filename() == "a.conf");
  CHECK((*entries)[1].filename() == "b.conf");
  CHECK((*entries)[2].filename() == "c");
  CHECK_FALSE(ns_fs::sorted_entries(tmp.path() / "missing"));
}

TEST_CASE("ns_fs::lstat and lexists do not follow symbolic links")
{
  ns_test::TempDir tmp;
  fs::path path_link = tmp.path() / "dangling";
  fs::create_symlink(tmp.path() / "nowhere", path_link);
  CHECK(ns_fs::lexists(path_link));
  CHECK_FALSE(fs::exists(path_link));
  auto st = ns_fs::lstat(path_link);
  REQUIRE(st);
  CHECK(S_ISLNK(st->st_mode));
  CHECK_FALSE(ns_fs::lexists(tmp.path() / "nowhere"));
  CHECK_FALSE(ns_fs::lstat(tmp.path() / "nowhere"));
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
