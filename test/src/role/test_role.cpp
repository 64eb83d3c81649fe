/**
 * @file test_role.cpp
 * @brief Unit tests for role.hpp and role_context.hpp
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "../../../src/role/role.hpp"
#include "../test.hpp"

using ns_engine::Mode;
using ns_role::RoleContext;
using Names = std::vector<std::string>;

namespace
{

/**
 * @brief Everything a driver needs, rooted at a temporary directory
 */
struct Fixture
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  ns_role::RoleRegistry roles;
  ns_target::Registry targets;
  ns_db::ns_context::Context context;
  std::shared_ptr<ns_package::PackageCache> cache;

  Fixture()
    : tmp()
    , report()
    , roles()
    , targets()
    , context(ns_test::context(tmp.path()))
    , cache(ns_package::PackageCache::from({"vim"}, {}))
  {}

  ns_role::Driver driver(Mode mode = Mode::Modify)
  {
    return ns_role::Driver(roles, targets, context, report.log(), mode, cache);
  }
};

/**
 * @brief A role that writes a line to a file of the project
 */
std::function<Value<void>(RoleContext&)> writes(std::string const& name, std::string const& line)
{
  return [name, line](RoleContext& ctx) -> Value<void>
  {
    auto file = ctx.file(ctx.context().get_root() / name);
    file->has_lines({ line });
    Pop(ctx.apply({ file }));
    return {};
  };
}

} // namespace

TEST_CASE("Driver applies the roles of a target in order")
{
  Fixture fixture;
  Names order;
  fixture.roles.add("first", [&](RoleContext& ctx) -> Value<void> { order.push_back(ctx.name()); return {}; });
  fixture.roles.add("second", [&](RoleContext& ctx) -> Value<void> { order.push_back(ctx.name()); return {}; });
  fixture.targets.target("base").has_roles({"first"});
  fixture.targets.target("laptop").depends_on({"base"}).has_roles({"second"});

  auto driver = fixture.driver();
  driver.execute(fixture.targets.target("laptop"), std::nullopt, {});
  CHECK(order == Names{"first", "second"});
  CHECK(driver.failed().empty());
}

TEST_CASE("Driver isolates a failing role")
{
  Fixture fixture;
  fixture.roles.add("broken", [](RoleContext&) -> Value<void> { return Error("E::missing variable 'editor'"); });
  fixture.roles.add("throws", [](RoleContext&) -> Value<void> { throw std::runtime_error("unexpected"); });
  fixture.roles.add("hosts", writes("hosts", "127.0.0.1 localhost"));
  fixture.targets.target("laptop").has_roles({"broken", "throws", "unknown", "hosts"});

  auto driver = fixture.driver();
  driver.execute(fixture.targets.target("laptop"), std::nullopt, {});
  CHECK(driver.failed() == Names{"broken", "throws", "unknown"});
  // The roles after the failures still ran
  CHECK(ns_test::read(fixture.tmp.path() / "hosts") == "127.0.0.1 localhost\n");
  std::string out = fixture.report.str();
  CHECK(out.find("Failed to apply role") != std::string::npos);
  CHECK(out.find("missing variable 'editor'") != std::string::npos);
  CHECK(out.find("Failed to import role 'unknown'") != std::string::npos);
}

TEST_CASE("Driver in pretend mode changes nothing")
{
  Fixture fixture;
  fixture.roles.add("hosts", writes("hosts", "127.0.0.1 localhost"));
  fixture.targets.target("laptop").has_roles({"hosts"});
  auto driver = fixture.driver(Mode::Pretend);
  driver.execute(fixture.targets.target("laptop"), std::nullopt, {});
  CHECK(driver.failed().empty());
  CHECK_FALSE(ns_fs::lexists(fixture.tmp.path() / "hosts"));
}

TEST_CASE("RoleContext runs the handlers after the role")
{
  Fixture fixture;
  fixture.roles.add("editor", [](RoleContext& ctx) -> Value<void>
  {
    auto marker = ctx.file(ctx.context().get_root() / "reloaded");
    marker->is_present();
    auto& reload = ctx.handler({ marker });
    auto config = ctx.file(ctx.context().get_root() / "vimrc");
    config->has_lines({"set number"}).on_change(reload);
    Pop(ctx.apply({ config }));
    // The handler fires after the configuration logic
    return_if(ns_fs::lexists(ctx.context().get_root() / "reloaded"), Error("E::handler ran too early"));
    return {};
  });
  fixture.targets.target("laptop").has_roles({"editor"});
  auto driver = fixture.driver();
  driver.execute(fixture.targets.target("laptop"), std::nullopt, {});
  CHECK(driver.failed().empty());
  CHECK(ns_fs::lexists(fixture.tmp.path() / "reloaded"));
}

TEST_CASE("RoleContext ensure fails on subjects that would change")
{
  Fixture fixture;
  ns_test::write(fixture.tmp.path() / "present", "");
  RoleContext ctx("checks", fixture.report.log(), Mode::Modify, fixture.context, fixture.cache, fixture.targets);

  auto present = ctx.file(fixture.tmp.path() / "present");
  present->is_present();
  CHECK(ctx.ensure({ present }));

  auto missing = ctx.file(fixture.tmp.path() / "missing");
  missing->is_present();
  auto result = ctx.ensure({ missing });
  REQUIRE_FALSE(result);
  CHECK(result.error().find("assertion failed for") != std::string::npos);
  // Checks never modify the system
  CHECK_FALSE(ns_fs::lexists(fixture.tmp.path() / "missing"));
}

TEST_CASE("RoleContext variables, resources and targets")
{
  Fixture fixture;
  fixture.context.set_vars(ns_db::json_t::parse(R"({"editor": {"name": "vim"}, "shell": "zsh"})"));
  fixture.targets.target("laptop").depends_on({"base"});
  REQUIRE(fixture.targets.select("laptop"));

  RoleContext editor("editor", fixture.report.log(), Mode::Modify, fixture.context, fixture.cache, fixture.targets);
  CHECK(editor.role_vars() == ns_db::json_t::parse(R"({"name": "vim"})"));
  CHECK(editor.vars().at("shell") == "zsh");
  CHECK(editor.resource("colors") == fixture.tmp.path() / "roles" / "editor" / "colors");
  CHECK(editor.is_targeted("base").value());
  CHECK_FALSE(editor.is_targeted("missing"));

  RoleContext shell("other", fixture.report.log(), Mode::Modify, fixture.context, fixture.cache, fixture.targets);
  CHECK(shell.role_vars() == ns_db::json_t::object());
}

TEST_CASE("RoleContext factories use the defaults of the run")
{
  Fixture fixture;
  RoleContext ctx("editor", fixture.report.log(), Mode::Pretend, fixture.context, fixture.cache, fixture.targets);
  CHECK(ctx.package({"vim"})->description() == "package vim");
  CHECK(ctx.group("wheel")->description().find("wheel") != std::string::npos);
  CHECK(ctx.service("sshd.service")->description().find("sshd.service") != std::string::npos);
  CHECK(ctx.file_tree("config")->description().find("roles/editor/config") != std::string::npos);
  CHECK(ctx.handlers() == 0);
  ctx.handler({});
  CHECK(ctx.handlers() == 1);
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
