/**
 * @file elevate.hpp
 * @author Ruan Formigoni
 * @brief Commands that run with more or less privileges than the program
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "env.hpp"
#include "../std/enum.hpp"
#include "../std/expected.hpp"

/**
 * @namespace ns_elevate
 * @brief Privilege elevation through sudo
 */
namespace ns_elevate
{

/**
 * @brief How privileged commands are run
 *
 * - NONE: Elevation is not allowed, privileged commands fail
 * - JUST_IN_TIME: The program runs as the user, privileged commands are prefixed with sudo
 * - ELEVATED: The program runs as root, user commands drop privileges with sudo
 */
ENUM(Elevation, JUST_IN_TIME, ELEVATED);

/**
 * @brief Creates a command that runs with root privileges
 *
 * @param elevation The elevation mode of the run
 * @param args The program followed by its arguments
 * @return Value<std::vector<std::string>> The command or the respective error
 */
[[nodiscard]] inline Value<std::vector<std::string>> elevated_command(Elevation elevation
  , std::vector<std::string> args)
{
  switch (elevation)
  {
    case Elevation::NONE:
      return Error("E::Cannot create an elevated command, because elevation is not allowed");
    case Elevation::ELEVATED:
      return args;
    case Elevation::JUST_IN_TIME:
      args.insert(args.begin(), "sudo");
      return args;
  }
  return Error("E::Unknown elevation type");
}

/**
 * @brief Creates a command that runs with the privileges of the invoking user
 *
 * @param elevation The elevation mode of the run
 * @param username The user that invoked the program
 * @param args The program followed by its arguments
 * @return std::vector<std::string> The command
 */
[[nodiscard]] inline std::vector<std::string> user_command(Elevation elevation
  , std::string const& username
  , std::vector<std::string> args)
{
  if (elevation == Elevation::ELEVATED)
  {
    args.insert(args.begin(), {"sudo", "--preserve-env", "--user", username});
  }
  return args;
}

/**
 * @brief Elevation mode and invoking user of a run, carried by subjects that run commands
 *
 * The home and the environment are the ones of the invoking user, recorded before elevating, so
 * user paths and user commands do not resolve to root.
 */
struct Privileges
{
  Elevation elevation;
  std::string username;
  std::filesystem::path home_dir;
  ns_env::Env env;

  [[nodiscard]] Value<std::vector<std::string>> elevated(std::vector<std::string> args) const
  {
    return elevated_command(elevation, std::move(args));
  }

  [[nodiscard]] std::vector<std::string> user(std::vector<std::string> args) const
  {
    return user_command(elevation, username, std::move(args));
  }
};

} // namespace ns_elevate

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
