/**
 * @file test_systemd.cpp
 * @brief Unit tests for systemd.hpp services
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <string>
#include <vector>

#include "../../../src/subjects/systemd.hpp"
#include "../test.hpp"

namespace fs = std::filesystem;

using ns_engine::Mode;
using ns_systemd::Scope;
using Args = std::vector<std::string>;

namespace
{

/**
 * @brief Privileges of an elevated run invoked by tim, with the given configuration directory
 */
ns_elevate::Privileges elevated(fs::path const& path_dir_config = "/home/tim/.config")
{
  return ns_elevate::Privileges
  {
    .elevation = ns_elevate::Elevation::ELEVATED,
    .username = "tim",
    .home_dir = "/home/tim",
    .env = {{"XDG_CONFIG_HOME", path_dir_config.string()}},
  };
}

} // namespace

TEST_CASE("ns_systemd::systemctl drops privileges for the user scope")
{
  CHECK(ns_systemd::systemctl(Scope::SYSTEM, elevated(), {"start", "sshd.service"})
    == Args{"systemctl", "start", "sshd.service"});
  CHECK(ns_systemd::systemctl(Scope::USER, elevated(), {"daemon-reload"})
    == Args{"sudo", "--preserve-env", "--user", "tim", "systemctl", "--user", "daemon-reload"});
}

TEST_CASE("SystemdService unit path per scope")
{
  ns_test::TempDir tmp;
  auto system = ns_systemd::SystemdService::create("sshd.service", Scope::SYSTEM, elevated(tmp.path()));
  CHECK(system->unit_path().value() == fs::path("/etc/systemd/system/sshd.service"));
  auto user = ns_systemd::SystemdService::create("backup.timer", Scope::USER, elevated(tmp.path()));
  CHECK(user->unit_path().value() == tmp.path() / "systemd" / "user" / "backup.timer");
}

TEST_CASE("SystemdService user unit path follows the invoking user in an elevated process")
{
  // The process environment is the one of root after sudo
  char const* home = std::getenv("HOME");
  std::string home_saved = home? home : "";
  setenv("HOME", "/root", 1);
  setenv("XDG_CONFIG_HOME", "/root/.config", 1);
  ns_elevate::Privileges privileges
  {
    .elevation = ns_elevate::Elevation::ELEVATED,
    .username = "alice",
    .home_dir = "/home/alice",
    .env = {{"HOME", "/home/alice"}},
  };
  auto service = ns_systemd::SystemdService::create("backup.service", Scope::USER, privileges);
  CHECK(service->unit_path().value() == fs::path("/home/alice/.config/systemd/user/backup.service"));
  unsetenv("XDG_CONFIG_HOME");
  setenv("HOME", home_saved.c_str(), 1);
}

TEST_CASE("SystemdService uses the home and environment of the run context")
{
  ns_test::TempDir tmp;
  auto context = ns_test::context(tmp.path());
  ns_user::Identity user = context.get_host().user;
  user.home_dir = tmp.path() / "home" / "alice";
  context.set_host(ns_db::ns_context::Host{ .os = "posix", .system = "Linux", .user = user });
  ns_env::Env env = context.get_env();
  env.erase("XDG_CONFIG_HOME");
  context.set_env(env);
  setenv("XDG_CONFIG_HOME", (tmp.path() / "process").c_str(), 1);

  // Same for a context that went through an elevated process
  auto elevated_context = ns_db::ns_context::deserialize(ns_db::ns_context::serialize(context).value());
  REQUIRE(elevated_context);
  for (auto const& ctx : { context, elevated_context.value() })
  {
    auto service = ns_systemd::SystemdService::create("backup.service", Scope::USER, ctx.privileges());
    CHECK(service->unit_path().value() == tmp.path() / "home" / "alice" / ".config" / "systemd" / "user" / "backup.service");
  }
  unsetenv("XDG_CONFIG_HOME");
}

TEST_CASE("SystemdService runs systemctl with the environment of the invoking user")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  fs::path path_bin = tmp.path() / "bin";
  fs::path path_file_out = tmp.path() / "systemctl.out";
  ns_test::write(path_bin / "systemctl"
    , std::format("#!/bin/sh\nprintf '%s|%s|%s\\n' \"$*\" \"$XDG_RUNTIME_DIR\" \"$CBN_TEST_ROOT_ONLY\" >> '{}'\n", path_file_out.string())
  );
  fs::permissions(path_bin / "systemctl", fs::perms::owner_all);
  std::string path_env = std::getenv("PATH");
  setenv("PATH", std::format("{}:{}", path_bin.string(), path_env).c_str(), 1);
  setenv("CBN_TEST_ROOT_ONLY", "root", 1);

  ns_elevate::Privileges privileges = elevated(tmp.path());
  privileges.env["XDG_RUNTIME_DIR"] = "/run/user/1000";
  auto service = ns_systemd::SystemdService::create("sshd.service", Scope::SYSTEM, privileges);
  service->is_restarted();
  REQUIRE(service->apply(report.log(), Mode::Modify));
  CHECK(ns_test::read(path_file_out) == "restart sshd.service|/run/user/1000|\n");

  setenv("PATH", path_env.c_str(), 1);
  unsetenv("CBN_TEST_ROOT_ONLY");
}

TEST_CASE("SystemdService unit file is a prerequisite with a generated handler")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  auto service = ns_systemd::SystemdService::create("backup.service", Scope::USER, elevated(tmp.path()));
  auto result = service->file([](ns_systemd::UnitFile& unit)
  {
    unit.file->has_content("[Service]\nType=oneshot\n", true);
    unit.restarts_service();
  });
  REQUIRE(result);
  REQUIRE(service->prerequisites().size() == 1);
  auto handlers = service->generated_handlers();
  REQUIRE(handlers.size() == 1);
  CHECK(handlers.front()->generated());

  // The service has no assertion of its own, only the unit file is converged
  REQUIRE(service->apply(report.log(), Mode::Modify));
  fs::path path_unit = tmp.path() / "systemd" / "user" / "backup.service";
  CHECK(ns_test::read(path_unit) == "[Service]\nType=oneshot\n");
  CHECK(report.str().find("user service file") != std::string::npos);
  CHECK(handlers.front()->triggered());

  // The reaction is only reported in pretend mode
  REQUIRE(handlers.front()->apply(report.log(), Mode::Pretend));
  CHECK(report.str().find("systemd user daemon is reloaded") != std::string::npos);
  CHECK(report.str().find("is restarted") != std::string::npos);
}

TEST_CASE("SystemdService unit file without reactions has no handler")
{
  ns_test::TempDir tmp;
  auto service = ns_systemd::SystemdService::create("backup.service", Scope::USER, elevated(tmp.path()));
  REQUIRE(service->file([](ns_systemd::UnitFile& unit)
  {
    unit.file->has_content("", true);
    unit.does_not_reload_daemon().does_not_restart_service();
  }));
  CHECK(service->generated_handlers().empty());
}

TEST_CASE("SystemdService unchanged unit file skips the generated handler silently")
{
  ns_test::TempDir tmp;
  ns_test::Report report;
  ns_test::write(tmp.path() / "systemd" / "user" / "backup.service", "[Service]\n");
  auto service = ns_systemd::SystemdService::create("backup.service", Scope::USER, elevated(tmp.path()));
  REQUIRE(service->file([](ns_systemd::UnitFile& unit){ unit.file->has_content("[Service]\n"); }));
  REQUIRE(service->apply(report.log(), Mode::Modify));
  auto handler = service->generated_handlers().front();
  CHECK_FALSE(handler->triggered());
  std::string before = report.str();
  REQUIRE(handler->apply(report.log(), Mode::Modify));
  CHECK(report.str() == before);
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
