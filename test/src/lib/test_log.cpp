/**
 * @file test_log.cpp
 * @brief Unit tests for log.hpp logging utilities
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

#include "../../../src/lib/log.hpp"
#include "../test.hpp"

namespace fs = std::filesystem;

TEST_CASE("ns_log::set_level changes the console level")
{
  ns_log::set_level(ns_log::Level::DEBUG);
  CHECK(ns_log::get_level() == ns_log::Level::DEBUG);
  ns_log::set_level(ns_log::Level::WARN);
  CHECK(ns_log::get_level() == ns_log::Level::WARN);
  ns_log::set_level(ns_log::Level::CRITICAL);
}

TEST_CASE("ns_log::Location formats as file::line")
{
  ns_log::Location loc{"/src/subjects/file.hpp", 42};
  CHECK(loc.get() == "file.hpp::42");
}

TEST_CASE("Every level reaches the sink file regardless of the console level")
{
  ns_test::TempDir tmp;
  fs::path path_file_log = tmp.path() / "caerbannog.log";
  ns_log::set_sink_file(path_file_log);
  ns_log::set_level(ns_log::Level::CRITICAL);

  logger("D::Checking '{}'", "/etc/hosts");
  logger("I::Role {} applied", "shell");
  logger("W::Alias '{}' is not a string", "ll");
  logger("E::Failed roles: {}", "editor");

  std::string content = ns_test::read(path_file_log);
  CHECK(content.find("D::test_log.cpp::") != std::string::npos);
  CHECK(content.find("Checking '/etc/hosts'") != std::string::npos);
  CHECK(content.find("I::test_log.cpp::") != std::string::npos);
  CHECK(content.find("W::test_log.cpp::") != std::string::npos);
  CHECK(content.find("E::test_log.cpp::") != std::string::npos);
  CHECK(content.find("Failed roles: editor") != std::string::npos);
  ns_log::set_sink_file("/dev/null");
}

TEST_CASE("Quiet messages are discarded")
{
  ns_test::TempDir tmp;
  fs::path path_file_log = tmp.path() / "quiet.log";
  ns_log::set_sink_file(path_file_log);
  logger("Q::Nothing to see");
  CHECK(ns_test::read(path_file_log).empty());
  ns_log::set_sink_file("/dev/null");
}

TEST_CASE("Messages are kept in a single line")
{
  ns_test::TempDir tmp;
  fs::path path_file_log = tmp.path() / "lines.log";
  ns_log::set_sink_file(path_file_log);
  logger("I::{}", "first\nsecond");
  std::string content = ns_test::read(path_file_log);
  CHECK(content.find("firstsecond\n") != std::string::npos);
  CHECK(std::ranges::count(content, '\n') == 1);
  ns_log::set_sink_file("/dev/null");
}

TEST_CASE("A forked child does not write to the sink of the parent")
{
  ns_test::TempDir tmp;
  fs::path path_file_log = tmp.path() / "fork.log";
  ns_log::set_sink_file(path_file_log);
  pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0)
  {
    logger("E::From the child");
    _exit(0);
  }
  int status = 0;
  waitpid(pid, &status, 0);
  CHECK(ns_test::read(path_file_log).find("From the child") == std::string::npos);
  ns_log::set_sink_file("/dev/null");
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
