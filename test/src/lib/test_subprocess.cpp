/**
 * @file test_subprocess.cpp
 * @brief Unit tests for subprocess.hpp process spawning
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "../../../src/lib/subprocess.hpp"

using ns_subprocess::Subprocess;
using ns_subprocess::Stream;

TEST_CASE("ns_subprocess::to_carray is null terminated")
{
  std::vector<std::string> args{"pacman", "--sync", "vim"};
  auto arr = ns_subprocess::to_carray(args);
  CHECK(std::string_view{arr[0]} == "pacman");
  CHECK(std::string_view{arr[2]} == "vim");
  CHECK(arr[3] == nullptr);
  CHECK(ns_subprocess::to_carray({})[0] == nullptr);
}

TEST_CASE("Subprocess pipes the standard streams")
{
  std::istringstream input("root:x:0:\nwheel:x:10:\n");
  std::ostringstream output;
  auto child = Subprocess("/bin/sh")
    .with_args("-c", "grep wheel")
    .with_stdio(Stream::Pipe)
    .with_streams(input, output, std::cerr)
    .spawn();
  REQUIRE(child->get_pid().has_value());
  auto code = child->wait();
  REQUIRE(code);
  CHECK(*code == 0);
  CHECK(output.str() == "wheel:x:10:\n");
  CHECK_FALSE(child->get_pid().has_value());
}

TEST_CASE("Subprocess passes container arguments and replaces the environment")
{
  setenv("CBN_TEST_PARENT", "parent", 1);
  std::ostringstream output;
  std::vector<std::string> script{"-c", "printf '%s:%s:%s' \"$1\" \"$CBN_TEST_SCOPE\" \"$CBN_TEST_PARENT\"", "sh", "nginx.service"};
  auto code = Subprocess("/bin/sh")
    .with_args(script)
    .with_env(ns_env::Env{{"CBN_TEST_SCOPE", "user"}})
    .with_stdio(Stream::Pipe)
    .with_streams(std::cin, output, std::cerr)
    .spawn()
    ->wait();
  REQUIRE(code);
  CHECK(output.str() == "nginx.service:user:");
  unsetenv("CBN_TEST_PARENT");
}

TEST_CASE("Subprocess without an environment keeps the one of the parent")
{
  setenv("CBN_TEST_PARENT", "parent", 1);
  auto out = ns_subprocess::check_output({"sh", "-c", "printf '%s' \"$CBN_TEST_PARENT\""});
  REQUIRE(out);
  CHECK(*out == "parent");
  auto replaced = ns_subprocess::check_output({"sh", "-c", "printf '%s' \"$CBN_TEST_PARENT\""}, ns_env::Env{});
  REQUIRE(replaced);
  CHECK(*replaced == "");
  unsetenv("CBN_TEST_PARENT");
}

TEST_CASE("Subprocess reports the exit code")
{
  auto code = Subprocess("/bin/sh")
    .with_args("-c", "exit 3")
    .with_stdio(Stream::Null)
    .spawn()
    ->wait();
  REQUIRE(code);
  CHECK(*code == 3);
}

TEST_CASE("Subprocess reports a missing program as exit code 127")
{
  auto code = Subprocess("/nonexistent/caerbannog")
    .with_stdio(Stream::Null)
    .spawn()
    ->wait();
  REQUIRE(code);
  CHECK(*code == 127);
}

TEST_CASE("ns_subprocess::call searches PATH")
{
  auto ok = ns_subprocess::call({"true"}, Stream::Null);
  REQUIRE(ok);
  CHECK(*ok == 0);
  auto fail = ns_subprocess::call({"false"}, Stream::Null);
  REQUIRE(fail);
  CHECK(*fail != 0);
  CHECK_FALSE(ns_subprocess::call({"caerbannog-missing-program"}));
  CHECK_FALSE(ns_subprocess::call({}));
}

TEST_CASE("ns_subprocess::check_call fails on non zero exit codes")
{
  CHECK(ns_subprocess::check_call({"sh", "-c", "exit 0"}));
  auto err = ns_subprocess::check_call({"sh", "-c", "exit 4"});
  REQUIRE_FALSE(err);
  CHECK(err.error().find("exit code 4") != std::string::npos);
}

TEST_CASE("ns_subprocess::check_output captures stdout")
{
  auto out = ns_subprocess::check_output({"sh", "-c", "echo pass; echo word >&2"});
  REQUIRE(out);
  CHECK(*out == "pass\n");
  CHECK_FALSE(ns_subprocess::check_output({"sh", "-c", "echo partial; exit 1"}));
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
