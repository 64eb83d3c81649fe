/**
 * @file test_enum.cpp
 * @brief Unit tests for enum.hpp enumerations
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include "../../../src/std/enum.hpp"

ENUM(Scope, SYSTEM, USER);
ENUM(Action, CREATE, UPDATE, DELETE, TRIGGER);

TEST_CASE("ENUM defaults to NONE")
{
  Scope scope;
  CHECK(scope == Scope::NONE);
  CHECK(std::string(scope) == "NONE");
}

TEST_CASE("ENUM converts to its name")
{
  Action action = Action::UPDATE;
  std::string name = action;
  CHECK(name == "UPDATE");
  CHECK(Action(Action::TRIGGER).lower() == "trigger");
}

TEST_CASE("ENUM size counts NONE")
{
  CHECK(Scope::size == 3);
  CHECK(Action::size == 5);
}

TEST_CASE("ENUM from_string ignores case")
{
  auto user = Scope::from_string("user");
  REQUIRE(user.has_value());
  CHECK(user.value() == Scope::USER);

  auto system = Scope::from_string("SyStEm");
  REQUIRE(system.has_value());
  CHECK(system.value() == Scope::SYSTEM);
}

TEST_CASE("ENUM from_string rejects unknown names and NONE")
{
  CHECK_FALSE(Scope::from_string("session").has_value());
  CHECK_FALSE(Scope::from_string("").has_value());
  CHECK_FALSE(Scope::from_string("none").has_value());
}

TEST_CASE("ENUM works in switch statements")
{
  auto describe = [](Action action) -> std::string
  {
    switch(action)
    {
      case Action::CREATE: return "created";
      case Action::UPDATE: return "updated";
      case Action::DELETE: return "deleted";
      case Action::TRIGGER: return "triggered";
      case Action::NONE: break;
    }
    return "none";
  };
  CHECK(describe(Action::CREATE) == "created");
  CHECK(describe(Action::DELETE) == "deleted");
  CHECK(describe(Action{}) == "none");
}

TEST_CASE("ENUM values compare and copy")
{
  Action a = Action::CREATE;
  Action b = a;
  CHECK(a == b);
  b = Action::DELETE;
  CHECK(a != b);
  CHECK(a.get() < b.get());
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
