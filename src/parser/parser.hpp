/**
 * @file parser.hpp
 * @author Ruan Formigoni
 * @brief Parses caerbannog commands
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cstdlib>
#include <iostream>
#include <optional>
#include <ranges>
#include <set>
#include <string>
#include <utility>

#include "../macro.hpp"
#include "../std/expected.hpp"
#include "../std/string.hpp"
#include "interface.hpp"
#include "cmd/help.hpp"

/**
 * @namespace ns_parser
 * @brief Command line of a configuration program
 *
 * Parses the subcommands of a configuration program (apply, target, encrypt, decrypt, view) and
 * executes them against the declarations of its Setup.
 */
namespace ns_parser
{

/**
 * @brief Enumeration of caerbannog command types
 */
enum class CbnCommand
{
  NONE,
  APPLY,
  TARGET,
  ENCRYPT,
  DECRYPT,
  VIEW,
  VERSION,
  HELP
};

/**
 * @brief Convert string to CbnCommand enum
 *
 * @param str Command string (e.g., "apply")
 * @return Value<CbnCommand> The command enum or error
 */
[[nodiscard]] inline Value<CbnCommand> cbn_command_from_string(std::string_view str)
{
  if (str == "apply")   return CbnCommand::APPLY;
  if (str == "decrypt") return CbnCommand::DECRYPT;
  if (str == "encrypt") return CbnCommand::ENCRYPT;
  if (str == "help")    return CbnCommand::HELP;
  if (str == "target")  return CbnCommand::TARGET;
  if (str == "version") return CbnCommand::VERSION;
  if (str == "view")    return CbnCommand::VIEW;

  return Error("C::Unknown command: {}", str);
}

using namespace ns_parser::ns_interface;

/**
 * @brief Vector-based argument container with pop operations
 *
 * Wraps a vector of strings to provide convenient argument parsing
 * with formatted error messages.
 */
class VecArgs
{
  private:
    std::vector<std::string> m_data;
  public:
    /**
     * @brief Constructs a VecArgs from an iterator range
     * @param begin Beginning of the argument range
     * @param end End of the argument range
     */
    VecArgs(char** begin, char** end)
    {
      if(begin != end)
      {
        m_data = std::vector<std::string>(begin,end);
      }
    }

    /**
     * @brief Pops the front element with formatted error message
     * @tparam Format Error message format string
     * @tparam Ts Types of format arguments
     * @param ts Format arguments
     * @return Value containing the popped string or error
     */
    template<ns_string::static_string Format, typename... Ts>
    Value<std::string> pop_front(Ts&&... ts)
    {
      if(m_data.empty())
      {
        if constexpr (sizeof...(Ts) > 0)
        {
          return Error(Format, ns_string::to_string(ts)...);
        }
        else
        {
          return Error(Format.data);
        }
      }
      std::string item = m_data.front();
      m_data.erase(m_data.begin());
      return item;
    }

    std::vector<std::string> const& data()
    {
      return m_data;
    }

    size_t size()
    {
      return m_data.size();
    }

    bool empty()
    {
      return m_data.empty();
    }

    void clear()
    {
      m_data.clear();
    }
};

/**
 * @brief An option of the command line, `--name=value` or `--name value`
 */
struct Option
{
  std::string name;
  std::optional<std::string> value;
};

/**
 * @brief Splits `--name=value` into its name and value
 *
 * @param arg The argument, starting with `--`
 * @return Option The name without dashes and the inline value, if any
 */
[[nodiscard]] inline Option split_option(std::string_view arg)
{
  arg.remove_prefix(2);
  auto pos = arg.find('=');
  return_if(pos == std::string_view::npos, (Option{ std::string(arg), std::nullopt }));
  return Option{ std::string(arg.substr(0, pos)), std::string(arg.substr(pos + 1)) };
}

/**
 * @brief Splits a comma separated list of role names
 */
[[nodiscard]] inline std::set<std::string> split_roles(std::string_view list)
{
  std::set<std::string> ret;
  for(std::string const& role : ns_string::split(list, ','))
  {
    std::string name = ns_string::trim(role);
    if (not name.empty()) { ret.insert(name); }
  }
  return ret;
}

/**
 * @brief Parses caerbannog commands
 *
 * @param argc Argument counter
 * @param argv Argument vector
 * @return Value<CmdType> The parsed command or the respective error
 */
[[nodiscard]] inline Value<CmdType> parse(int argc , char** argv)
{
  if ( argc < 2 )
  {
    return CmdNone{};
  }

  VecArgs args(argv+1, argv+argc);

  // Get command string and convert to enum
  std::string cmd_str = Pop(args.pop_front<"C::Missing command">());
  CbnCommand cmd = Pop(cbn_command_from_string(cmd_str), "C::Invalid command");

  // Value of an option, inline or in the next argument
  auto f_option_value = [&](Option const& option) -> Value<std::string>
  {
    return_if(option.value, *option.value);
    return Pop(args.pop_front<"C::Missing value for option '--{}'">(option.name));
  };

  switch(cmd)
  {
    // Converge the system towards a target
    case CbnCommand::APPLY:
    {
      CmdApply cmd_apply;
      while(not args.empty())
      {
        std::string arg = Pop(args.pop_front<"C::Missing argument for apply">());
        if (not arg.starts_with("--"))
        {
          return_if(cmd_apply.target, Error("C::Trailing argument for apply: {}", arg));
          cmd_apply.target = arg;
          continue;
        }
        Option option = split_option(arg);
        if (option.name == "dry-run") { cmd_apply.dry_run = true; }
        else if (option.name == "elevate") { cmd_apply.elevate = true; }
        else if (option.name == "show-context") { cmd_apply.show_context = true; }
        else if (option.name == "context") { cmd_apply.context = Pop(f_option_value(option)); }
        else if (option.name == "role")
        {
          std::set<std::string> roles = split_roles(Pop(f_option_value(option)));
          if (not cmd_apply.role_limit) { cmd_apply.role_limit = std::set<std::string>{}; }
          cmd_apply.role_limit->insert(roles.begin(), roles.end());
        }
        else if (option.name == "skip-role")
        {
          std::set<std::string> roles = split_roles(Pop(f_option_value(option)));
          cmd_apply.skip_roles.insert(roles.begin(), roles.end());
        }
        else
        {
          return Error("C::Unknown option for apply: {}", arg);
        }
      }
      return CmdType(cmd_apply);
    }

    // List targets
    case CbnCommand::TARGET:
    {
      CmdTarget cmd_target;
      while(not args.empty())
      {
        std::string arg = Pop(args.pop_front<"C::Missing argument for target">());
        if (arg == "--full") { cmd_target.full = true; continue; }
        return_if(arg.starts_with("--"), Error("C::Unknown option for target: {}", arg));
        return_if(cmd_target.target, Error("C::Trailing argument for target: {}", arg));
        cmd_target.target = arg;
      }
      return CmdType(cmd_target);
    }

    // Encrypt and decrypt secrets
    case CbnCommand::ENCRYPT:
    case CbnCommand::DECRYPT:
    {
      std::optional<std::string> text;
      std::optional<fs::path> path_file;
      bool plain = false;
      while(not args.empty())
      {
        std::string arg = Pop(args.pop_front<"C::Missing argument for {}">(cmd_str));
        if (not arg.starts_with("--"))
        {
          return_if(text, Error("C::Trailing argument for {}: {}", cmd_str, arg));
          text = arg;
          continue;
        }
        Option option = split_option(arg);
        if (option.name == "file") { path_file = Pop(f_option_value(option)); }
        else if (option.name == "plain" and cmd == CbnCommand::ENCRYPT) { plain = true; }
        else { return Error("C::Unknown option for {}: {}", cmd_str, arg); }
      }
      return_if(text and path_file, Error("C::Text and file are mutually exclusive for {}", cmd_str));
      if (cmd == CbnCommand::ENCRYPT)
      {
        return CmdType(CmdEncrypt{ .text = text, .path_file = path_file, .plain = plain });
      }
      return CmdType(CmdDecrypt{ .text = text, .path_file = path_file });
    }

    // View an encrypted file
    case CbnCommand::VIEW:
    {
      CmdView cmd_view{ .path_file = Pop(args.pop_front<"C::Missing file for view">()) };
      return_if(not args.empty(), Error("C::Trailing arguments for view: {}", args.data()));
      return CmdType(cmd_view);
    }

    case CbnCommand::VERSION:
    {
      return_if(not args.empty(), Error("C::Trailing arguments for version: {}", args.data()));
      return CmdType(CmdVersion{});
    }

    case CbnCommand::HELP:
    {
      if (args.empty())
      {
        std::cerr << ns_cmd::ns_help::help_usage() << '\n';
        return CmdType(CmdExit{});
      }

      std::string help_topic = Pop(args.pop_front<"C::Missing argument for 'help'">());
      std::string message;

      if      (help_topic == "apply")   { message = ns_cmd::ns_help::apply_usage(); }
      else if (help_topic == "decrypt") { message = ns_cmd::ns_help::decrypt_usage(); }
      else if (help_topic == "encrypt") { message = ns_cmd::ns_help::encrypt_usage(); }
      else if (help_topic == "target")  { message = ns_cmd::ns_help::target_usage(); }
      else if (help_topic == "version") { message = ns_cmd::ns_help::version_usage(); }
      else if (help_topic == "view")    { message = ns_cmd::ns_help::view_usage(); }
      else
      {
        return Error("C::Invalid argument for help command: {}", help_topic);
      }

      std::cout << message;
      return CmdType(CmdExit{});
    }

    case CbnCommand::NONE:
    default:
      return Error("C::Unknown command");
  }
}

} // namespace ns_parser

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
