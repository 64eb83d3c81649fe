/**
 * @file env.hpp
 * @author Ruan Formigoni
 * @brief A library for querying environment variables and the paths derived from them
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cstdlib>
#include <filesystem>
#include <map>
#include <ranges>
#include <string>
#include <unistd.h>

#include "../std/string.hpp"
#include "../std/expected.hpp"
#include "../macro.hpp"

extern char** environ;

namespace ns_env
{

namespace
{
namespace fs = std::filesystem;
}

/**
 * @brief Environment variables by name, as recorded in the context of a run
 */
using Env = std::map<std::string,std::string>;

/**
 * @brief Get the value of an environment variable
 *
 * @param name The name of the variable
 * @return Value<std::string> The value of the variable or the respective error
 */
[[nodiscard]] inline Value<std::string> get_expected(std::string const& name)
{
  const char * var = std::getenv(name.c_str());
  return_if(var == nullptr, Error("D::Could not read variable '{}'", name));
  return std::string{var};
}

/**
 * @brief Checks if variable exists and equals value
 *
 * @param name Name of the variable
 * @param value Expected value of the variable
 * @return True if it exists and matches the expected value, or false otherwise
 */
[[nodiscard]] inline bool exists(std::string const& name, std::string_view value)
{
  const char* value_real = std::getenv(name.c_str());
  return_if(not value_real, false);
  return std::string_view{value_real} == value;
}

/**
 * @brief Snapshot of the process environment
 *
 * @return Env The variables sorted by name
 */
[[nodiscard]] inline Env snapshot()
{
  Env ret;
  for(char** i = environ; *i != nullptr; ++i)
  {
    std::string_view entry{*i};
    size_t pos = entry.find('=');
    continue_if(pos == std::string_view::npos);
    ret.emplace(entry.substr(0, pos), entry.substr(pos+1));
  }
  return ret;
}

/**
 * @brief Validates the home directory of a user
 *
 * The home is taken from the context of the run and not from HOME, which belongs to root in a
 * process elevated by sudo.
 *
 * @param path_dir_home The home directory of the user
 * @return Value<fs::path> The home directory or the respective error
 */
[[nodiscard]] inline Value<fs::path> home_dir(fs::path const& path_dir_home)
{
  return_if(not path_dir_home.is_absolute(), Error("E::Invalid home directory '{}'", path_dir_home));
  return path_dir_home;
}

/**
 * @brief Returns or computes the value of XDG_CONFIG_HOME of a user
 *
 * @param env The environment of the user
 * @param path_dir_home The home directory of the user
 * @return Value<fs::path> The path to XDG_CONFIG_HOME or the respective error
 */
[[nodiscard]] inline Value<fs::path> xdg_config_home(Env const& env, fs::path const& path_dir_home)
{
  auto it = env.find("XDG_CONFIG_HOME");
  return_if(it != env.end() and not it->second.empty(), fs::path{it->second});
  return Pop(home_dir(path_dir_home)) / ".config";
}

/**
 * @brief Returns or computes the value of XDG_DATA_HOME of a user
 *
 * @param env The environment of the user
 * @param path_dir_home The home directory of the user
 * @return Value<fs::path> The path to XDG_DATA_HOME or the respective error
 */
[[nodiscard]] inline Value<fs::path> xdg_data_home(Env const& env, fs::path const& path_dir_home)
{
  auto it = env.find("XDG_DATA_HOME");
  return_if(it != env.end() and not it->second.empty(), fs::path{it->second});
  return Pop(home_dir(path_dir_home)) / ".local" / "share";
}

/**
 * @brief Search the directories in the PATH variable for the given input file name
 *
 * @param query The file name to search for in PATH directories
 * @return Value<fs::path> The path of the found file or the respective error
 */
[[nodiscard]] inline Value<fs::path> search_path(std::string const& query)
{
  return_if(fs::path{query}.is_absolute(), fs::path{query});
  std::string env_path = Pop(ns_env::get_expected("PATH"));
  for(fs::path directory : ns_string::split(env_path, ':'))
  {
    continue_if(directory.empty());
    fs::path path_full = directory / query;
    return_if(::access(path_full.c_str(), X_OK) == 0, path_full);
  }
  return Error("D::File '{}' not found in PATH", query);
}

} // namespace ns_env

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
