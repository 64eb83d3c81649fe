/**
 * @file help.hpp
 * @author Ruan Formigoni
 * @brief Help strings for caerbannog commands
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <string>
#include <vector>
#include <algorithm>

/**
 * @namespace ns_cmd::ns_help
 * @brief Help system and command documentation
 *
 * Provides the help text of every command of a configuration program, with usage patterns,
 * option descriptions and examples.
 */
namespace ns_cmd::ns_help
{

class HelpEntry
{
  private:
    std::string m_msg;
    std::string m_name;
  public:
    HelpEntry(std::string const& name)
      : m_msg("Caerbannog - Local configuration management\n")
      , m_name(name)
    {};
  HelpEntry& with_usage(std::string_view usage)
  {
    m_msg.append("Usage: ").append(usage).append("\n");
    return *this;
  }
  HelpEntry& with_example(std::string_view example)
  {
    m_msg.append("Example: ").append(example).append("\n");
    return *this;
  }
  HelpEntry& with_note(std::string_view note)
  {
    m_msg.append("Note: ").append(note).append("\n");
    return *this;
  }
  HelpEntry& with_description(std::string_view description)
  {
    m_msg.append(m_name).append(" : ").append(description).append("\n");
    return *this;
  }
  HelpEntry& with_args(std::vector<std::pair<std::string,std::string>> args)
  {
    std::ranges::for_each(args, [&](auto&& e)
    {
      m_msg += std::string{"  <"} + e.first + "> : " + e.second + '\n';
    });
    return *this;
  }
  std::string get()
  {
    return m_msg;
  }
};

inline std::string help_usage()
{
  return HelpEntry{"help"}
    .with_description("See usage details for specified command")
    .with_usage("help <cmd>")
    .with_args({
      { "cmd", "Name of the command to display help details" },
    })
    .with_note("Available commands: apply, target, encrypt, decrypt, view, version")
    .with_example(R"(help apply)")
    .get();
}

inline std::string apply_usage()
{
  return HelpEntry{"apply"}
    .with_description("Converge the system towards a target")
    .with_usage("apply [target] [--dry-run] [--role=<roles>] [--skip-role=<roles>] [--elevate] [--context=<json>] [--show-context]")
    .with_args({
      { "target", "Name of the target, defaults to the content of the .target file of the project" },
      { "--dry-run", "Do not modify anything, only show what would happen" },
      { "--role", "Comma separated list of roles, other roles are not applied" },
      { "--skip-role", "Comma separated list of roles that are not applied" },
      { "--elevate", "Run the program again as root through sudo" },
      { "--context", "Use a serialized context instead of querying the system" },
      { "--show-context", "Print the context of the run and exit" },
    })
    .with_example(R"(apply laptop --dry-run --role=shell,editor)")
    .get();
}

inline std::string target_usage()
{
  return HelpEntry{"target"}
    .with_description("List the targets or show the dependencies of a target")
    .with_usage("target [name] [--full]")
    .with_args({
      { "name", "Name of the target whose dependency tree is shown" },
      { "--full", "List the roles of each target as well" },
    })
    .with_example(R"(target laptop --full)")
    .get();
}

inline std::string encrypt_usage()
{
  return HelpEntry{"encrypt"}
    .with_description("Encrypt a secret, reads stdin without text or file")
    .with_usage("encrypt [text] [--file=<path>] [--plain]")
    .with_args({
      { "text", "Text to encrypt, the secret is printed to stdout" },
      { "--file", "Encrypt a file in place" },
      { "--plain", "Print the secret on a single line" },
    })
    .with_example(R"(encrypt --file vars/targets/laptop.yaml)")
    .get();
}

inline std::string decrypt_usage()
{
  return HelpEntry{"decrypt"}
    .with_description("Decrypt a secret, reads stdin without text or file")
    .with_usage("decrypt [text] [--file=<path>]")
    .with_args({
      { "text", "Secret to decrypt, the plaintext is printed to stdout" },
      { "--file", "Decrypt a file in place" },
    })
    .with_example(R"(decrypt --file vars/targets/laptop.yaml)")
    .get();
}

inline std::string view_usage()
{
  return HelpEntry{"view"}
    .with_description("Print the plaintext of an encrypted file")
    .with_usage("view <file>")
    .with_args({
      { "file", "The encrypted file" },
    })
    .get();
}

inline std::string version_usage()
{
  return HelpEntry{"version"}
    .with_description("Print the version of caerbannog")
    .with_usage("version")
    .get();
}

} // namespace ns_cmd::ns_help

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
