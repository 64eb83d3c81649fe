/**
 * @file test_file.cpp
 * @brief Unit tests for file.hpp subjects
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <format>
#include <string>
#include <sys/stat.h>
#include <vector>

#include "../../../src/subjects/file.hpp"
#include "../test.hpp"

namespace fs = std::filesystem;

using ns_engine::Mode;

namespace
{

/**
 * @brief Names of the changes recorded by a subject, prerequisites first
 */
std::vector<std::string> change_names(ns_engine::Subject const& subject)
{
  std::vector<std::string> ret;
  for (auto const* assertion : subject.assertions())
  {
    for (auto const& change : assertion->changes()) { ret.push_back(change.name()); }
  }
  return ret;
}

mode_t mode_of(fs::path const& path)
{
  struct stat st{};
  ::lstat(path.c_str(), &st);
  return st.st_mode & 0777;
}

} // namespace

TEST_CASE("File is created with its missing parents")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_file = tmp.path() / "a" / "b" / "config";
  auto file = ns_file::File::create(path_file);
  file->is_present();

  REQUIRE(file->apply(report.log(), Mode::Modify));
  CHECK(fs::is_regular_file(path_file));
  CHECK(change_names(*file) == std::vector<std::string>{"directory created", "directory created", "file created"});

  // Converged, nothing left to do
  auto again = ns_file::File::create(path_file);
  again->is_present();
  REQUIRE(again->apply(report.log(), Mode::Modify));
  CHECK_FALSE(again->changed());
}

TEST_CASE("File without create_parents fails on a missing parent")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  auto file = ns_file::File::create(tmp.path() / "missing" / "config");
  file->is_present(false);
  CHECK_FALSE(file->apply(report.log(), Mode::Modify));
}

TEST_CASE("File content is written and reported as a diff")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_file = tmp.path() / "hosts";
  ns_test::write(path_file, "127.0.0.1 localhost\n");
  auto file = ns_file::File::create(path_file);
  file->has_lines({"127.0.0.1 localhost", "::1 localhost"});

  REQUIRE(file->apply(report.log(), Mode::Modify));
  CHECK(ns_test::read(path_file) == "127.0.0.1 localhost\n::1 localhost\n");
  CHECK(change_names(*file) == std::vector<std::string>{"content changed"});
  CHECK(report.str().find("+ ::1 localhost") != std::string::npos);

  REQUIRE(file->apply(report.log(), Mode::Modify));
  CHECK_FALSE(file->changed());
}

TEST_CASE("File content without final newline")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_file = tmp.path() / "motd";
  auto file = ns_file::File::create(path_file);
  file->has_lines({"Welcome"}, false);
  REQUIRE(file->apply(report.log(), Mode::Modify));
  CHECK(ns_test::read(path_file) == "Welcome");
  // The missing terminator is marked in the details
  CHECK(report.str().find("+ Welcome^m") != std::string::npos);
}

TEST_CASE("File in pretend mode touches nothing")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_file = tmp.path() / "dir" / "config";
  auto file = ns_file::File::create(path_file);
  file->is_present().has_content("x").has_mode(0600);

  REQUIRE(file->apply(report.log(), Mode::Pretend));
  CHECK(file->changed());
  CHECK_FALSE(ns_fs::lexists(tmp.path() / "dir"));
  // Mode of a missing file cannot be queried, it is reported as failed
  CHECK(report.str().find("has mode: 600") != std::string::npos);
}

TEST_CASE("File mode is corrected")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_file = tmp.path() / "secret";
  ns_test::write(path_file, "");
  ::chmod(path_file.c_str(), 0644);
  auto file = ns_file::File::create(path_file);
  file->is_present().has_mode(0600);
  REQUIRE(file->apply(report.log(), Mode::Modify));
  CHECK(mode_of(path_file) == 0600);
  CHECK(report.str().find("- 644") != std::string::npos);
  CHECK(report.str().find("+ 600") != std::string::npos);
}

TEST_CASE("File replaces a directory at its path")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_file = tmp.path() / "entry";
  fs::create_directories(path_file / "child");
  auto file = ns_file::File::create(path_file);
  file->is_present();
  REQUIRE(file->apply(report.log(), Mode::Modify));
  CHECK(fs::is_regular_file(path_file));
  CHECK(change_names(*file) == std::vector<std::string>{"directory removed", "file created"});
}

TEST_CASE("File cannot reconcile a fifo")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_fifo = tmp.path() / "fifo";
  REQUIRE(::mkfifo(path_fifo.c_str(), 0644) == 0);
  auto file = ns_file::File::create(path_fifo);
  file->is_present();
  CHECK_FALSE(file->apply(report.log(), Mode::Modify));
  auto absent = ns_file::File::create(path_fifo);
  absent->is_absent();
  CHECK_FALSE(absent->apply(report.log(), Mode::Modify));
}

TEST_CASE("Entry is removed when absent")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_dir = tmp.path() / "cache";
  ns_test::write(path_dir / "a" / "b", "x");
  auto directory = ns_file::Directory::create(path_dir);
  directory->is_absent();
  REQUIRE(directory->apply(report.log(), Mode::Modify));
  CHECK_FALSE(ns_fs::lexists(path_dir));
  REQUIRE(directory->apply(report.log(), Mode::Modify));
  CHECK_FALSE(directory->changed());
}

TEST_CASE("Symlink is created and retargeted without following it")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_link = tmp.path() / "link";
  auto link = ns_file::Symlink::create(path_link);
  link->has_target("/nonexistent/first");
  REQUIRE(link->apply(report.log(), Mode::Modify));
  CHECK(fs::read_symlink(path_link) == fs::path("/nonexistent/first"));

  auto retarget = ns_file::Symlink::create(path_link);
  retarget->has_target("/nonexistent/second");
  REQUIRE(retarget->apply(report.log(), Mode::Modify));
  CHECK(fs::read_symlink(path_link) == fs::path("/nonexistent/second"));
  CHECK(change_names(*retarget) == std::vector<std::string>{"symlink changed"});
}

TEST_CASE("Directory mode of synthesized parents follows the entry")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_file = tmp.path() / "private" / "key";
  auto file = ns_file::File::create(path_file);
  file->is_present().has_mode(0640);
  REQUIRE(file->apply(report.log(), Mode::Modify));
  CHECK(mode_of(tmp.path() / "private") == 0750);
  CHECK(mode_of(path_file) == 0640);
}

TEST_CASE("Owner of the current user is already satisfied")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  auto user = ns_user::current().value();
  fs::path path_file = tmp.path() / "owned";
  auto file = ns_file::File::create(path_file);
  file->with_default_owner(user.username, user.groupname).is_present();
  REQUIRE(file->has_assertion<ns_file::HasOwner>());
  REQUIRE(file->apply(report.log(), Mode::Modify));
  CHECK(change_names(*file) == std::vector<std::string>{"file created"});
}

TEST_CASE("File content is copied from a source, binary content as a size summary")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  ns_test::write(tmp.path() / "source.bin", std::string("\xff\x00\xfe", 3));
  auto file = ns_file::File::create(tmp.path() / "copy.bin");
  REQUIRE(file->has_content_from(tmp.path() / "source.bin"));
  REQUIRE(file->apply(report.log(), Mode::Modify));
  CHECK(ns_test::read(tmp.path() / "copy.bin") == std::string("\xff\x00\xfe", 3));
  CHECK(report.str().find("+3") != std::string::npos);
  CHECK_FALSE(ns_file::File::create(tmp.path() / "x")->has_content_from(tmp.path() / "missing"));
}

TEST_CASE("Long diffs are summarized")
{
  std::string from, to;
  for (int i = 0; i < 300; ++i) { to += std::format("line {}\n", i); }
  auto details = ns_file::ns_change::content_details(from, to);
  REQUIRE_FALSE(details.empty());
  CHECK(details.front().content.find("Diff too long to be shown") != std::string::npos);
  CHECK(details[1].content == "+ 300 lines");
  CHECK(details[2].content == "- 0 lines");
}

TEST_CASE("Diffs of large unrelated files are summarized")
{
  std::string from, to;
  for (int i = 0; i < 20000; ++i)
  {
    from += std::format("old {}\n", i);
    to += std::format("new {}\n", i);
  }
  auto details = ns_file::ns_change::content_details(from, to);
  REQUIRE(details.size() > 3);
  CHECK(details.front().content.find("Diff too long to be shown") != std::string::npos);
  CHECK(details[1].content == "+ 20000 lines");
  CHECK(details[2].content == "- 20000 lines");
}

TEST_CASE("Diff formatting skips empty lines")
{
  auto lines = ns_file::ns_change::format_diff({"--- \n", "", "+++ \n", "+a\n"});
  REQUIRE(lines.size() == 1);
  CHECK(lines.front().content == "+ a");
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
