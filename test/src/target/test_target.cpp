/**
 * @file test_target.cpp
 * @brief Unit tests for target.hpp
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../../../src/target/target.hpp"

using Names = std::vector<std::string>;

namespace
{

/**
 * @brief a0 requires b0 and b1, which require c0, c1 and c2
 */
void declare_layers(ns_target::Registry& registry)
{
  registry.target("a0").depends_on({"b1", "b0"}).has_roles({"a0-role"});
  registry.target("b0").depends_on({"c0", "c1"}).has_roles({"b0-role"});
  registry.target("b1").depends_on({"c2"}).has_roles({"b1-role"});
  registry.target("c0").has_roles({"c0-role"});
  registry.target("c1").has_roles({"c1-role"});
  registry.target("c2").has_roles({"c2-role"});
}

Names execute(ns_target::Target const& target
  , std::optional<std::set<std::string>> const& limit = std::nullopt
  , std::set<std::string> const& skip = {})
{
  Names applied;
  target.execute([&](std::string const& role){ applied.push_back(role); }, limit, skip);
  return applied;
}

} // namespace

TEST_CASE("Registry creates targets on first reference")
{
  ns_target::Registry registry;
  // Forward reference, c is declared after a requires it
  registry.target("a").depends_on({"c"});
  registry.target("b");
  registry.target("c").has_roles({"shell"});
  CHECK(registry.names() == Names{"a", "b", "c"});
  CHECK(registry.find("missing") == nullptr);
  REQUIRE(registry.target("a").dependencies().size() == 1);
  CHECK(registry.target("a").dependencies().front()->roles() == Names{"shell"});
  // Same target on a second reference
  CHECK(&registry.target("a") == registry.find("a"));
}

TEST_CASE("resolve_order lists the deepest targets first, then by name")
{
  ns_target::Registry registry;
  declare_layers(registry);
  CHECK(ns_target::resolve_names(registry.target("a0")).value() == Names{"c0", "c1", "c2", "b0", "b1", "a0"});
  CHECK(ns_target::resolve_names(registry.target("c2")).value() == Names{"c2"});
}

TEST_CASE("resolve_order keeps the minimum depth of a target")
{
  ns_target::Registry registry;
  // c0 is reachable at depth 1 and at depth 2
  registry.target("a0").depends_on({"b0", "c0"});
  registry.target("b0").depends_on({"c0"});
  CHECK(ns_target::resolve_names(registry.target("a0")).value() == Names{"b0", "c0", "a0"});
}

TEST_CASE("resolve_order reports dependency cycles")
{
  ns_target::Registry registry;
  registry.target("a").depends_on({"b"});
  registry.target("b").depends_on({"c"});
  registry.target("c").depends_on({"a"});
  auto order = ns_target::resolve_order(registry.target("a"));
  REQUIRE_FALSE(order);
  CHECK(order.error().find("cycle") != std::string::npos);
}

TEST_CASE("Target executes the required targets before its roles")
{
  ns_target::Registry registry;
  declare_layers(registry);
  CHECK(execute(registry.target("a0"))
    == Names{"c2-role", "b1-role", "c0-role", "c1-role", "b0-role", "a0-role"});
}

TEST_CASE("Target required through two paths executes twice")
{
  ns_target::Registry registry;
  registry.target("top").depends_on({"left", "right"}).has_roles({"top"});
  registry.target("left").depends_on({"base"}).has_roles({"left"});
  registry.target("right").depends_on({"base"}).has_roles({"right"});
  registry.target("base").has_roles({"base"});
  CHECK(execute(registry.target("top")) == Names{"base", "left", "base", "right", "top"});
}

TEST_CASE("Target role limit and skip list")
{
  ns_target::Registry registry;
  declare_layers(registry);
  CHECK(execute(registry.target("a0"), std::set<std::string>{"c0-role", "a0-role"})
    == Names{"c0-role", "a0-role"});
  CHECK(execute(registry.target("b0"), std::nullopt, {"c1-role"}) == Names{"c0-role", "b0-role"});
  CHECK(execute(registry.target("b0"), std::set<std::string>{}) == Names{});
  // Skip wins over the limit
  CHECK(execute(registry.target("c0"), std::set<std::string>{"c0-role"}, {"c0-role"}) == Names{});
}

TEST_CASE("Registry current target and targeted checks")
{
  ns_target::Registry registry;
  declare_layers(registry);
  CHECK_FALSE(registry.current());
  CHECK_FALSE(registry.select("missing"));
  REQUIRE(registry.select("b0"));
  CHECK(registry.current().value()->name() == "b0");
  CHECK(registry.is_targeted("b0").value());
  CHECK(registry.is_targeted("c1").value());
  CHECK_FALSE(registry.is_targeted("a0").value());
  CHECK_FALSE(registry.is_targeted("c2").value());
  CHECK_FALSE(registry.is_targeted("missing"));
}

TEST_CASE("Target includes terminates on cycles")
{
  ns_target::Registry registry;
  registry.target("a").depends_on({"b"});
  registry.target("b").depends_on({"a"});
  CHECK(registry.target("a").includes("b"));
  CHECK_FALSE(registry.target("a").includes("c"));
}

TEST_CASE("render_tree draws the dependencies and roles")
{
  ns_target::Registry registry;
  registry.target("laptop").depends_on({"base"}).has_roles({"power"});
  registry.target("base").has_roles({"shell", "editor"});
  CHECK(ns_target::render_tree(registry.target("laptop"), false)
    == "laptop\n"
       "└───base\n");
  CHECK(ns_target::render_tree(registry.target("laptop"), true)
    == "laptop\n"
       "├───base\n"
       "│   ├╌╌╌shell\n"
       "│   └╌╌╌editor\n"
       "└╌╌╌power\n");
}

TEST_CASE("render_all lists every target")
{
  ns_target::Registry registry;
  registry.target("base").has_roles({"shell", "editor"});
  registry.target("laptop").depends_on({"base"});
  CHECK(ns_target::render_all(registry, false) == "base\nlaptop\n");
  CHECK(ns_target::render_all(registry, true) == "base\n├╌╌╌shell\n└╌╌╌editor\nlaptop\n");
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
