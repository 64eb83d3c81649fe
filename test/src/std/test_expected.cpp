/**
 * @file test_expected.cpp
 * @brief Unit tests for expected.hpp error handling utilities
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "../../../src/std/expected.hpp"

namespace
{

Value<int> parse_mode(std::string const& str)
{
  return_if(str.empty(), Error("E::Empty mode"));
  return_if(str.find_first_not_of("01234567") != std::string::npos, Error("E::Invalid mode '{}'", str));
  return std::stoi(str, nullptr, 8);
}

Value<int> parse_both(std::string const& file, std::string const& dir)
{
  int mode_file = Pop(parse_mode(file));
  int mode_dir = Pop(parse_mode(dir), "E::Invalid directory mode");
  return mode_file | mode_dir;
}

Value<void> check_mode(std::string const& str)
{
  Pop(parse_mode(str));
  return {};
}

int throwing_stoi(std::string const& str)
{
  return std::stoi(str);
}

Value<std::string> role_that_throws()
{
  throw std::runtime_error("role exploded");
}

Value<std::string> role_that_fails()
{
  return Error("E::Role failed with code {}", 3);
}

Value<int> sum_with_try(std::string const& a, std::string const& b)
{
  int x = Try(throwing_stoi(a));
  int y = Try(throwing_stoi(b), "E::Second operand is invalid");
  return x + y;
}

} // namespace

TEST_CASE("Value holds a value or an error")
{
  Value<int> ok = 0644;
  Value<int> err = std::unexpected<std::string>("bad");
  REQUIRE(ok.has_value());
  CHECK(*ok == 0644);
  REQUIRE_FALSE(err.has_value());
  CHECK(err.error() == "bad");
}

TEST_CASE("Value<void> signals success without a value")
{
  CHECK(check_mode("755").has_value());
  auto err = check_mode("9");
  REQUIRE_FALSE(err.has_value());
  CHECK(err.error() == "Invalid mode '9'");
}

TEST_CASE("Error formats the message without the level prefix")
{
  auto err = parse_mode("");
  REQUIRE_FALSE(err);
  CHECK(err.error() == "Empty mode");

  auto code = role_that_fails();
  REQUIRE_FALSE(code);
  CHECK(code.error() == "Role failed with code 3");
}

TEST_CASE("Pop unwraps values and propagates errors")
{
  auto ok = parse_both("644", "755");
  REQUIRE(ok);
  CHECK(*ok == (0644 | 0755));

  auto err_first = parse_both("x", "755");
  REQUIRE_FALSE(err_first);
  CHECK(err_first.error() == "Invalid mode 'x'");

  // The context message is logged, the original error is kept
  auto err_second = parse_both("644", "8");
  REQUIRE_FALSE(err_second);
  CHECK(err_second.error() == "Invalid mode '8'");
}

TEST_CASE("Try converts exceptions into errors")
{
  auto ok = sum_with_try("2", "40");
  REQUIRE(ok);
  CHECK(*ok == 42);

  auto err = sum_with_try("2", "forty");
  REQUIRE_FALSE(err);
  CHECK_FALSE(err.error().empty());
}

TEST_CASE("Catch wraps plain expressions")
{
  auto ok = Catch(throwing_stoi("7"));
  REQUIRE(ok);
  CHECK(*ok == 7);

  auto err = Catch(throwing_stoi("seven"));
  CHECK_FALSE(err);

  auto err_void = Catch([]{ throw std::logic_error("void failure"); }());
  REQUIRE_FALSE(err_void);
  CHECK(err_void.error() == "void failure");
}

TEST_CASE("Catch keeps the result of Value returning calls")
{
  auto failed = Catch(role_that_fails());
  REQUIRE_FALSE(failed);
  CHECK(failed.error() == "Role failed with code 3");

  auto thrown = Catch(role_that_throws());
  REQUIRE_FALSE(thrown);
  CHECK(thrown.error() == "role exploded");

  auto ok = Catch(Value<std::string>("fine"));
  REQUIRE(ok);
  CHECK(*ok == "fine");
}

TEST_CASE("forward keeps the state of the Value")
{
  auto err = parse_mode("z").forward("W::Mode was not parsed");
  REQUIRE_FALSE(err);
  CHECK(err.error() == "Invalid mode 'z'");

  auto ok = parse_mode("600").forward("W::Mode was not parsed");
  REQUIRE(ok);
  CHECK(*ok == 0600);
}

TEST_CASE("discard tolerates errors")
{
  Value<int> err = parse_mode("");
  err.discard("D::Ignoring empty mode");
  CHECK_FALSE(err);
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
