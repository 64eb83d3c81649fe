/**
 * @file interface.hpp
 * @author Ruan Formigoni
 * @brief Interfaces of caerbannog commands
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace ns_parser::ns_interface
{

namespace fs = std::filesystem;

struct CmdApply
{
  std::optional<std::string> target;
  bool dry_run = false;
  std::optional<std::set<std::string>> role_limit;
  std::set<std::string> skip_roles;
  bool elevate = false;
  std::optional<std::string> context;
  bool show_context = false;
};

struct CmdTarget
{
  std::optional<std::string> target;
  bool full = false;
};

struct CmdEncrypt
{
  std::optional<std::string> text;
  std::optional<fs::path> path_file;
  bool plain = false;
};

struct CmdDecrypt
{
  std::optional<std::string> text;
  std::optional<fs::path> path_file;
};

struct CmdView
{
  fs::path path_file;
};

struct CmdVersion
{
};

struct CmdNone
{
};

struct CmdExit
{
};

using CmdType = std::variant<CmdApply
  , CmdTarget
  , CmdEncrypt
  , CmdDecrypt
  , CmdView
  , CmdVersion
  , CmdNone
  , CmdExit
>;

} // namespace ns_parser::ns_interface

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
