/**
 * @file executor.hpp
 * @author Ruan Formigoni
 * @brief Executes parsed caerbannog commands
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <print>
#include <sstream>
#include <string>

#include "../config.hpp"
#include "../db/context.hpp"
#include "../lib/elevate.hpp"
#include "../lib/subprocess.hpp"
#include "../lib/user.hpp"
#include "../macro.hpp"
#include "../report/report.hpp"
#include "../role/role.hpp"
#include "../secret/password.hpp"
#include "../secret/secret.hpp"
#include "../std/filesystem.hpp"
#include "../subjects/package.hpp"
#include "../target/target.hpp"
#include "../vars/loader.hpp"
#include "interface.hpp"
#include "parser.hpp"
#include "cmd/help.hpp"

namespace ns_parser
{

namespace fs = std::filesystem;
namespace ns_context = ns_db::ns_context;

using namespace ns_parser::ns_interface;

/**
 * @brief Reads the standard input until its end
 */
[[nodiscard]] inline Value<std::string> read_stdin()
{
  std::cerr << "Reading from standard input. Ctrl-D to finish writing." << '\n';
  std::ostringstream ss;
  ss << std::cin.rdbuf();
  return_if(std::cin.bad(), Error("E::Could not read standard input"));
  return ss.str();
}

/**
 * @brief Privileges of the secrets commands, which run as the invoking user
 */
[[nodiscard]] inline Value<ns_elevate::Privileges> invoking_privileges()
{
  ns_user::Identity identity = Pop(ns_user::current());
  return ns_elevate::Privileges
  {
    .elevation = ns_elevate::Elevation::JUST_IN_TIME,
    .username = identity.username,
    .home_dir = identity.home_dir,
    .env = ns_env::snapshot(),
  };
}

/**
 * @brief Runs this program again as root through sudo
 *
 * The `--elevate` flag is dropped and the serialized context is appended to the arguments, so the
 * elevated process keeps the identity and environment of the invoking user.
 *
 * @param context The context of the run
 * @param argc Argument counter
 * @param argv Argument vector
 * @return Value<int> The exit code of the elevated process or the respective error
 */
[[nodiscard]] inline Value<int> elevate(ns_context::Context const& context, int argc, char** argv)
{
  fs::path path_bin_self = Try(fs::read_symlink("/proc/self/exe"), "E::Could not find the path of the program");
  std::vector<std::string> command{"sudo", "env", path_bin_self.string()};
  std::copy_if(argv+1, argv+argc, std::back_inserter(command), [](char const* e)
  {
    return std::string_view{e} != "--elevate";
  });
  command.push_back("--context");
  command.push_back(Pop(ns_context::serialize(context)));
  logger("D::Elevating with sudo");
  return Pop(ns_subprocess::call(command), "E::Could not run elevated process");
}

/**
 * @brief Converges the system towards a target
 *
 * @param setup The declarations of the configuration program
 * @param cmd The parsed apply command
 * @param argc Argument counter
 * @param argv Argument vector
 * @return Value<int> EXIT_FAILURE if a role failed, EXIT_SUCCESS otherwise, or the respective error
 */
[[nodiscard]] inline Value<int> apply(ns_config::Setup& setup, CmdApply const& cmd, int argc, char** argv)
{
  // Create context, a serialized context takes precedence
  ns_context::Context context;
  if (cmd.context)
  {
    context = Pop(ns_context::deserialize(*cmd.context), "E::Invalid context");
  }
  else
  {
    std::optional<std::string> target = cmd.target? cmd.target : setup.default_target();
    return_if(not target, Error("E::No target given and no default target in '{}'", setup.root() / ".target"));
    ns_elevate::Elevation elevation = cmd.elevate?
        ns_elevate::Elevation::ELEVATED
      : ns_elevate::Elevation::JUST_IN_TIME;
    context = Pop(ns_context::create(setup.root(), *target, elevation));
  }
  // Select target
  Pop(setup.targets().select(context.get_target()));
  ns_target::Target* target = Pop(setup.targets().current());
  // Re-execute as root
  if (cmd.elevate)
  {
    return elevate(context, argc, argv);
  }
  // Load variables, deepest targets first
  if (context.get_vars().empty())
  {
    std::vector<std::string> order = Pop(ns_target::resolve_names(*target));
    ns_secret::Password password = setup.password(context.privileges());
    ns_secret::KeyCache keys;
    ns_vars::Decrypt decrypt = [&](std::string const& secret) -> Value<std::string>
    {
      std::string str_password = Pop(password.get());
      return ns_secret::decrypt(secret, str_password, keys);
    };
    context.set_vars(Pop(ns_vars::load_all(context.get_root(), order, decrypt), "E::Could not load variables"));
  }
  // Show context
  if (cmd.show_context)
  {
    std::println("{}", Pop(ns_context::serialize(context, 2)));
    return EXIT_SUCCESS;
  }
  // Apply roles
  ns_report::Log log;
  ns_engine::Mode mode = cmd.dry_run? ns_engine::Mode::Pretend : ns_engine::Mode::Modify;
  ns_role::Driver driver(setup.roles()
    , setup.targets()
    , context
    , log
    , mode
    , std::make_shared<ns_package::PackageCache>()
  );
  driver.execute(*target, cmd.role_limit, cmd.skip_roles);
  return_if(not driver.failed().empty()
    , EXIT_FAILURE
    , "E::Failed roles: {}", ns_string::from_container(driver.failed(), ", ")
  );
  return EXIT_SUCCESS;
}

/**
 * @brief Prints the targets, or the dependency tree of a target
 */
[[nodiscard]] inline Value<int> show_target(ns_config::Setup& setup, CmdTarget const& cmd)
{
  if (not cmd.target)
  {
    std::print("{}", ns_target::render_all(setup.targets(), cmd.full));
    return EXIT_SUCCESS;
  }
  ns_target::Target* target = setup.targets().find(*cmd.target);
  return_if(target == nullptr, Error("E::Target '{}' does not exist", *cmd.target));
  std::println("Dependencies of {}:", target->name());
  std::println("");
  std::print("{}", ns_target::render_tree(*target, cmd.full));
  return EXIT_SUCCESS;
}

[[nodiscard]] inline Value<int> encrypt(ns_config::Setup& setup, CmdEncrypt const& cmd)
{
  ns_secret::Password password = setup.password(Pop(invoking_privileges()));
  if (cmd.path_file)
  {
    std::string plaintext = Pop(ns_fs::read_file(*cmd.path_file));
    std::string str_password = Pop(password.get());
    std::string secret = Pop(ns_secret::encrypt(plaintext, str_password));
    Pop(ns_fs::write_file(*cmd.path_file, secret));
    return EXIT_SUCCESS;
  }
  std::string plaintext;
  if (cmd.text) { plaintext = *cmd.text; }
  else { plaintext = Pop(read_stdin()); }
  std::string str_password = Pop(password.get());
  std::println("{}", Pop(ns_secret::encrypt(plaintext, str_password, not cmd.plain)));
  return EXIT_SUCCESS;
}

[[nodiscard]] inline Value<int> decrypt(ns_config::Setup& setup, CmdDecrypt const& cmd)
{
  ns_secret::Password password = setup.password(Pop(invoking_privileges()));
  if (cmd.path_file)
  {
    std::string secret = Pop(ns_fs::read_file(*cmd.path_file));
    std::string str_password = Pop(password.get());
    std::string plaintext = Pop(ns_secret::decrypt(secret, str_password));
    Pop(ns_fs::write_file(*cmd.path_file, plaintext));
    return EXIT_SUCCESS;
  }
  std::string secret;
  if (cmd.text) { secret = *cmd.text; }
  else { secret = Pop(read_stdin()); }
  std::string str_password = Pop(password.get());
  std::println("{}", Pop(ns_secret::decrypt(secret, str_password)));
  return EXIT_SUCCESS;
}

[[nodiscard]] inline Value<int> view(ns_config::Setup& setup, CmdView const& cmd)
{
  ns_secret::Password password = setup.password(Pop(invoking_privileges()));
  std::string secret = Pop(ns_fs::read_file(cmd.path_file));
  std::string str_password = Pop(password.get());
  std::println("{}", Pop(ns_secret::decrypt(secret, str_password)));
  return EXIT_SUCCESS;
}

/**
 * @brief Executes a parsed caerbannog command
 *
 * @param setup The declarations of the configuration program
 * @param argc Argument counter
 * @param argv Argument vector
 * @return Value<int> The exit code on success or the respective error
 */
[[nodiscard]] inline Value<int> execute_command(ns_config::Setup& setup, int argc, char** argv)
{
  // Parse args
  CmdType variant_cmd = Pop(ns_parser::parse(argc, argv), "C::Could not parse arguments");

  if ( auto cmd = std::get_if<CmdApply>(&variant_cmd) )
  {
    return apply(setup, *cmd, argc, argv);
  }
  else if ( auto cmd = std::get_if<CmdTarget>(&variant_cmd) )
  {
    return show_target(setup, *cmd);
  }
  else if ( auto cmd = std::get_if<CmdEncrypt>(&variant_cmd) )
  {
    return Pop(encrypt(setup, *cmd), "E::Failed to encrypt");
  }
  else if ( auto cmd = std::get_if<CmdDecrypt>(&variant_cmd) )
  {
    return Pop(decrypt(setup, *cmd), "E::Failed to decrypt");
  }
  else if ( auto cmd = std::get_if<CmdView>(&variant_cmd) )
  {
    return Pop(view(setup, *cmd), "E::Failed to view secret");
  }
  else if ( std::get_if<CmdVersion>(&variant_cmd) )
  {
    std::println("{}", CBN_VERSION);
  }
  // No command, print usage
  else if ( std::get_if<CmdNone>(&variant_cmd) )
  {
    std::cerr << ns_cmd::ns_help::help_usage() << '\n';
    return EXIT_FAILURE;
  }
  else if ( std::get_if<CmdExit>(&variant_cmd) )
  {
    return EXIT_SUCCESS;
  }
  else
  {
    return Error("C::Unknown command");
  }

  return EXIT_SUCCESS;
}

} // namespace ns_parser

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
