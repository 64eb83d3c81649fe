/**
 * @file test_merge.cpp
 * @brief Unit tests for merge.hpp
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include "../../../src/vars/merge.hpp"

using ns_vars::json;
using ns_vars::MergeStrategy;

TEST_CASE("ns_vars::unify merges the keys of both trees")
{
  CHECK(ns_vars::unify(json{{"a", 1}}, json{{"b", 2}}).value() == json{{"a", 1}, {"b", 2}});
  CHECK(ns_vars::unify(json{{"a", 1}}, json{{"a", 2}}).value() == json{{"a", 2}});
  CHECK(ns_vars::unify(json::object(), json::object()).value() == json::object());
}

TEST_CASE("ns_vars::unify merges nested trees recursively")
{
  json base = json::parse(R"({"a": {"x": 1, "deep": {"k": "base"}}, "list": [1, 2]})");
  json overlay = json::parse(R"({"a": {"y": 2, "deep": {"j": "overlay"}}, "list": [3]})");
  json expected = json::parse(R"({"a": {"x": 1, "y": 2, "deep": {"k": "base", "j": "overlay"}}, "list": [3]})");
  CHECK(ns_vars::unify(base, overlay).value() == expected);
}

TEST_CASE("ns_vars::unify overlay scalar wins over a tree and the reverse")
{
  CHECK(ns_vars::unify(json::parse(R"({"a": {"x": 1}})"), json{{"a", 5}}).value() == json{{"a", 5}});
  CHECK(ns_vars::unify(json{{"a", 5}}, json::parse(R"({"a": {"x": 1}})")).value()
    == json::parse(R"({"a": {"x": 1}})"));
}

TEST_CASE("ns_vars::unify replace keeps only the overlay")
{
  auto unified = ns_vars::unify(json::parse(R"({"a": {"x": 1}, "b": 1})")
    , json::parse(R"({"a": {"y": 2}})")
    , MergeStrategy::REPLACE
  );
  REQUIRE(unified);
  CHECK(unified.value() == json::parse(R"({"a": {"y": 2}})"));
}

TEST_CASE("ns_vars::unify hint of the base selects the strategy and is kept")
{
  auto unified = ns_vars::unify(json::parse(R"({"a": 1, "$conflict": "replace"})"), json{{"b", 2}});
  REQUIRE(unified);
  CHECK(unified.value() == json::parse(R"({"b": 2, "$conflict": "replace"})"));
}

TEST_CASE("ns_vars::unify hint of the overlay wins over the base")
{
  auto unified = ns_vars::unify(json::parse(R"({"a": 1, "$conflict": "replace"})")
    , json::parse(R"({"b": 2, "$conflict": "merge"})")
  );
  REQUIRE(unified);
  CHECK(unified.value() == json::parse(R"({"a": 1, "b": 2, "$conflict": "merge"})"));
}

TEST_CASE("ns_vars::unify hint applies to its own level only")
{
  // The nested level has no hint, so it is merged although the top level replaces
  json base = json::parse(R"({"a": {"x": 1}, "b": 1})");
  json overlay = json::parse(R"({"$conflict": "merge", "a": {"y": 2, "$conflict": "replace"}})");
  auto unified = ns_vars::unify(base, overlay, MergeStrategy::REPLACE);
  REQUIRE(unified);
  CHECK(unified.value() == json::parse(R"({"$conflict": "merge", "b": 1, "a": {"y": 2, "$conflict": "replace"}})"));

  auto nested = ns_vars::unify(json::parse(R"({"a": {"x": 1}})")
    , json::parse(R"({"a": {"y": 2}})")
    , MergeStrategy::REPLACE
  );
  REQUIRE(nested);
  CHECK(nested.value() == json::parse(R"({"a": {"y": 2}})"));
}

TEST_CASE("ns_vars::unify error strategy refuses even without conflicting keys")
{
  auto unified = ns_vars::unify(json{{"a", 1}}, json{{"b", 2}}, MergeStrategy::ERROR);
  REQUIRE_FALSE(unified);
  CHECK(unified.error() == "Refusing to merge conflicting dictionaries");
  CHECK_FALSE(ns_vars::unify(json::parse(R"({"$conflict": "error"})"), json::object()));
  // Raised from a nested level as well
  CHECK_FALSE(ns_vars::unify(json::parse(R"({"a": {"$conflict": "error", "x": 1}})")
    , json::parse(R"({"a": {"x": 2}})")
  ));
}

TEST_CASE("ns_vars::unify rejects invalid hints and non trees")
{
  CHECK_FALSE(ns_vars::unify(json::parse(R"({"$conflict": "overwrite"})"), json::object()));
  CHECK_FALSE(ns_vars::unify(json::parse(R"({"$conflict": 1})"), json::object()));
  CHECK_FALSE(ns_vars::unify(json::array(), json::object()));
  CHECK_FALSE(ns_vars::unify(json::object(), json(3)));
  // Hints are matched without regard to case
  CHECK(ns_vars::unify(json::parse(R"({"$conflict": "Replace"})"), json{{"b", 2}}));
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
