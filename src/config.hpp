/**
 * @file config.hpp
 * @author Ruan Formigoni
 * @brief Caerbannog configuration object
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lib/elevate.hpp"
#include "lib/log.hpp"
#include "role/role.hpp"
#include "secret/password.hpp"
#include "std/expected.hpp"
#include "std/filesystem.hpp"
#include "std/string.hpp"
#include "target/target.hpp"

// Version
#ifndef CBN_VERSION
#error "CBN_VERSION is undefined"
#endif

/**
 * @namespace ns_config
 * @brief Declarations of a configuration program
 *
 * A configuration program is a small executable compiled against caerbannog. Its main() declares
 * the targets and roles of the project on a Setup and hands the command line over to the parser.
 *
 * The project root has the following layout
 *
 * @code
 * {ROOT}/
 * ├── .target                     (default target of apply)
 * ├── vars/
 * │   ├── all.yaml                (variables of every target)
 * │   └── targets/
 * │       └── <target>.yaml       (variables of a target)
 * └── roles/
 *     └── <role>/                 (resources of a role)
 * @endcode
 */
namespace ns_config
{

namespace fs = std::filesystem;

class Setup
{
  private:
    fs::path m_root;
    ns_target::Registry m_targets;
    ns_role::RoleRegistry m_roles;
    std::optional<std::vector<std::string>> m_password_command;

  public:
    explicit Setup(fs::path root)
      : m_root(std::move(root))
      , m_targets()
      , m_roles()
      , m_password_command(std::nullopt)
    {}

    Setup(Setup const&) = delete;
    Setup& operator=(Setup const&) = delete;

    [[nodiscard]] fs::path const& root() const { return m_root; }
    [[nodiscard]] ns_target::Registry& targets() { return m_targets; }
    [[nodiscard]] ns_role::RoleRegistry& roles() { return m_roles; }

    /**
     * @brief Declares or extends a target
     */
    ns_target::Target& target(std::string const& name)
    {
      return m_targets.target(name);
    }

    /**
     * @brief Declares a role
     */
    Setup& role(std::string const& name, std::function<Value<void>(ns_role::RoleContext&)> configure)
    {
      m_roles.add(name, std::move(configure));
      return *this;
    }

    Setup& role(std::string const& name, std::unique_ptr<ns_role::Role> role)
    {
      m_roles.add(name, std::move(role));
      return *this;
    }

    /**
     * @brief Reads the password of the secrets from the output of a command
     *
     * @param cmd The command followed by its arguments, run as the invoking user
     */
    Setup& with_password_command(std::vector<std::string> cmd)
    {
      m_password_command = std::move(cmd);
      return *this;
    }

    /**
     * @brief The password source of a run, the terminal prompt unless a command was given
     */
    [[nodiscard]] ns_secret::Password password(ns_elevate::Privileges const& privileges) const
    {
      if (m_password_command)
      {
        return ns_secret::Password::command(*m_password_command, privileges);
      }
      return ns_secret::Password::prompt();
    }

    /**
     * @brief The trimmed content of {ROOT}/.target, if the file exists
     */
    [[nodiscard]] std::optional<std::string> default_target() const
    {
      fs::path path_file_target = m_root / ".target";
      return_if(not fs::is_regular_file(path_file_target), std::nullopt);
      auto content = ns_fs::read_file(path_file_target);
      return_if(not content, std::nullopt, "W::Could not read '{}'", path_file_target);
      std::string name = ns_string::trim(*content);
      return_if(name.empty(), std::nullopt);
      return name;
    }
};

} // namespace ns_config

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
