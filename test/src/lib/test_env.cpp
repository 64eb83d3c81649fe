/**
 * @file test_env.cpp
 * @brief Unit tests for env.hpp environment utilities
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdlib>
#include <format>
#include <optional>
#include <filesystem>
#include <string>

#include "../../../src/lib/env.hpp"
#include "../test.hpp"

namespace fs = std::filesystem;

/**
 * @brief Restores a variable on scope exit
 */
class SavedVar
{
  private:
    std::string m_name;
    std::optional<std::string> m_value;
  public:
    SavedVar(std::string name)
      : m_name(std::move(name))
    {
      if (const char* value = std::getenv(m_name.c_str())) { m_value = value; }
    }
    ~SavedVar()
    {
      if (m_value) { setenv(m_name.c_str(), m_value->c_str(), 1); }
      else { unsetenv(m_name.c_str()); }
    }
};

TEST_CASE("ns_env::get_expected fails for undefined variables")
{
  unsetenv("CBN_TEST_UNDEFINED");
  CHECK_FALSE(ns_env::get_expected("CBN_TEST_UNDEFINED").has_value());
}

TEST_CASE("ns_env::exists compares the value")
{
  setenv("CBN_DEBUG_TEST", "1", 1);
  CHECK(ns_env::exists("CBN_DEBUG_TEST", "1"));
  CHECK_FALSE(ns_env::exists("CBN_DEBUG_TEST", "0"));
  unsetenv("CBN_DEBUG_TEST");
  CHECK_FALSE(ns_env::exists("CBN_DEBUG_TEST", "1"));
}

TEST_CASE("ns_env::snapshot contains the process environment")
{
  setenv("CBN_TEST_SNAPSHOT", "a=b", 1);
  auto env = ns_env::snapshot();
  REQUIRE(env.contains("CBN_TEST_SNAPSHOT"));
  CHECK(env.at("CBN_TEST_SNAPSHOT") == "a=b");
  unsetenv("CBN_TEST_SNAPSHOT");
  CHECK_FALSE(ns_env::snapshot().contains("CBN_TEST_SNAPSHOT"));
}

TEST_CASE("ns_env::xdg_config_home and xdg_data_home fall back to the home of the user")
{
  // The process HOME is not consulted, an elevated process has the one of root
  SavedVar home("HOME");
  setenv("HOME", "/root", 1);
  ns_env::Env env{{"XDG_DATA_HOME", ""}};
  CHECK(ns_env::home_dir("/home/tim").value() == fs::path("/home/tim"));
  CHECK(ns_env::xdg_config_home(env, "/home/tim").value() == fs::path("/home/tim/.config"));
  CHECK(ns_env::xdg_data_home(env, "/home/tim").value() == fs::path("/home/tim/.local/share"));
  env["XDG_CONFIG_HOME"] = "/cfg";
  env["XDG_DATA_HOME"] = "/data";
  CHECK(ns_env::xdg_config_home(env, "/home/tim").value() == fs::path("/cfg"));
  CHECK(ns_env::xdg_data_home(env, "/home/tim").value() == fs::path("/data"));
}

TEST_CASE("ns_env::home_dir fails without an absolute home")
{
  CHECK_FALSE(ns_env::home_dir("").has_value());
  CHECK_FALSE(ns_env::home_dir("home/tim").has_value());
  CHECK_FALSE(ns_env::xdg_config_home({}, "").has_value());
  // A defined XDG variable does not need the home
  CHECK(ns_env::xdg_data_home({{"XDG_DATA_HOME", "/data"}}, "").value() == fs::path("/data"));
}

TEST_CASE("ns_env::search_path finds executables")
{
  SavedVar path("PATH");
  ns_test::TempDir tmp;
  fs::path path_bin = tmp.path() / "bin";
  ns_test::write(path_bin / "cbn-tool", "#!/bin/sh\n");
  ns_test::write(path_bin / "cbn-data", "not executable");
  fs::permissions(path_bin / "cbn-tool", fs::perms::owner_all);
  fs::permissions(path_bin / "cbn-data", fs::perms::owner_read | fs::perms::owner_write);
  setenv("PATH", std::format("::{}:/nonexistent", path_bin.string()).c_str(), 1);

  CHECK(ns_env::search_path("cbn-tool").value() == path_bin / "cbn-tool");
  CHECK_FALSE(ns_env::search_path("cbn-data").has_value());
  CHECK_FALSE(ns_env::search_path("cbn-missing").has_value());
  CHECK(ns_env::search_path("/usr/bin/env").value() == fs::path("/usr/bin/env"));
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
