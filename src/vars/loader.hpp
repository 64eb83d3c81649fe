/**
 * @file loader.hpp
 * @author Ruan Formigoni
 * @brief Variable files of a project
 *
 * Variables are read from YAML files below the vars directory of the project root:
 *
 * ```
 * vars/all.yaml                  # or vars/all.yml, or every file of vars/all/
 * vars/targets/<target>.yaml     # or vars/targets/<target>.yml, or vars/targets/<target>/
 * ```
 *
 * A file that starts with the secret marker is decrypted before it is parsed.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <charconv>
#include <cmath>
#include <filesystem>
#include <functional>
#include <limits>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "merge.hpp"
#include "../secret/secret.hpp"
#include "../std/filesystem.hpp"

namespace ns_vars
{

namespace fs = std::filesystem;

/**
 * @brief Turns the text of a secret into its plaintext
 */
using Decrypt = std::function<Value<std::string>(std::string const&)>;

// Conversion {{{

/**
 * @brief Types an untagged scalar following the YAML 1.1 core schema
 *
 * @param scalar The text of the scalar
 * @return json A null, boolean, integer, float or the text itself
 */
[[nodiscard]] inline json plain_scalar(std::string const& scalar)
{
  static std::set<std::string> const nulls{"", "~", "null", "Null", "NULL"};
  static std::set<std::string> const trues{"true", "True", "TRUE", "yes", "Yes", "YES", "on", "On", "ON", "y", "Y"};
  static std::set<std::string> const falses{"false", "False", "FALSE", "no", "No", "NO", "off", "Off", "OFF", "n", "N"};
  return_if(nulls.contains(scalar), json(nullptr));
  return_if(trues.contains(scalar), json(true));
  return_if(falses.contains(scalar), json(false));
  char const* begin = scalar.data();
  char const* end = scalar.data() + scalar.size();
  // Integers, decimal, octal with a leading zero, or hexadecimal, the sign applies to every base
  std::string_view digits = scalar;
  bool negative = digits.starts_with("-");
  if (negative or digits.starts_with("+")) { digits.remove_prefix(1); }
  int base = 10;
  if (digits.starts_with("0x")) { digits.remove_prefix(2); base = 16; }
  else if (digits.size() > 1 and digits.starts_with("0")) { digits.remove_prefix(1); base = 8; }
  if (not digits.empty() and digits.front() != '+' and digits.front() != '-')
  {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), end, value, base);
    return_if(ec == std::errc{} and ptr == end, json(negative? -value : value));
  }
  // Floats need a dot
  return_if(scalar == ".inf" or scalar == ".Inf" or scalar == "+.inf", json(std::numeric_limits<double>::infinity()));
  return_if(scalar == "-.inf" or scalar == "-.Inf", json(-std::numeric_limits<double>::infinity()));
  return_if(scalar == ".nan" or scalar == ".NaN", json(std::numeric_limits<double>::quiet_NaN()));
  if (double value; scalar.find('.') != std::string::npos)
  {
    char const* first = (scalar.starts_with("+"))? begin + 1 : begin;
    auto [ptr, ec] = std::from_chars(first, end, value);
    return_if(ec == std::errc{} and ptr == end, json(value));
  }
  return scalar;
}

/**
 * @brief Converts a YAML document to a variable value
 *
 * Quoted scalars and scalars tagged as strings stay strings.
 *
 * @param node The YAML node
 * @return Value<json> The converted node or the respective error
 */
[[nodiscard]] inline Value<json> from_yaml(YAML::Node const& node)
{
  switch (node.Type())
  {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return json(nullptr);
    case YAML::NodeType::Scalar:
    {
      std::string const& tag = node.Tag();
      return_if(tag == "!" or tag == "tag:yaml.org,2002:str", json(node.Scalar()));
      return plain_scalar(node.Scalar());
    }
    case YAML::NodeType::Sequence:
    {
      json array = json::array();
      for(auto const& item : node)
      {
        array.push_back(Pop(from_yaml(item)));
      }
      return array;
    }
    case YAML::NodeType::Map:
    {
      json object = json::object();
      for(auto const& pair : node)
      {
        return_if(not pair.first.IsScalar(), Error("E::Only scalar keys are supported in variable files"));
        object[pair.first.Scalar()] = Pop(from_yaml(pair.second));
      }
      return object;
    }
  }
  return Error("E::Unknown YAML node type");
}

/**
 * @brief Parses the text of a variable file
 *
 * An empty document is an empty tree.
 *
 * @param text The YAML text
 * @param name Name used in the error messages
 * @return Value<json> The variable tree or the respective error
 */
[[nodiscard]] inline Value<json> parse(std::string const& text, std::string const& name)
{
  YAML::Node node = Pop(Catch(YAML::Load(text)), "E::Could not parse variables of '{}'", name);
  json tree = Pop(from_yaml(node), "E::Could not convert variables of '{}'", name);
  return_if(tree.is_null(), json::object());
  return_if(not tree.is_object(), Error("E::Variables of '{}' must be a mapping, got '{}'", name, tree.type_name()));
  return tree;
}

// }}}

// Discovery {{{

/**
 * @brief Loads one variable file, decrypting it when it is a secret
 */
[[nodiscard]] inline Value<json> load_file(fs::path const& path_file, Decrypt const& decrypt)
{
  std::string content = Pop(ns_fs::read_file(path_file));
  if (ns_secret::is_secret(content))
  {
    logger("D::Decrypting variables of '{}'", path_file);
    content = Pop(decrypt(content), "E::Could not decrypt '{}'", path_file);
  }
  return parse(content, path_file.string());
}

/**
 * @brief Loads the variables of a key
 *
 * When `<dir>/<key>` is a directory, every .yaml and .yml file of it is merged in the order of the
 * file names. Otherwise `<dir>/<key>.yaml` or `<dir>/<key>.yml` is loaded. A key without files
 * has no variables.
 *
 * @param dir The directory of the category, e.g. vars/targets
 * @param key The key, e.g. the name of a target
 * @param decrypt Decrypts the files that are secrets
 * @return Value<json> The variable tree or the respective error
 */
[[nodiscard]] inline Value<json> load_vars(fs::path const& dir, std::string const& key, Decrypt const& decrypt)
{
  fs::path path_dir = dir / key;
  fs::path path_yaml = dir / (key + ".yaml");
  fs::path path_yml = dir / (key + ".yml");
  json vars = json::object();
  std::error_code ec;
  if (fs::is_directory(path_dir, ec))
  {
    for(fs::path const& entry : Pop(ns_fs::sorted_entries(path_dir)))
    {
      continue_if(not fs::is_regular_file(entry, ec));
      continue_if(entry.extension() != ".yaml" and entry.extension() != ".yml");
      json entry_vars = Pop(load_file(entry, decrypt));
      vars = Pop(unify(vars, entry_vars), "E::Could not merge variables of '{}'", entry);
    }
  }
  else if (fs::is_regular_file(path_yaml, ec))
  {
    vars = Pop(load_file(path_yaml, decrypt));
  }
  else if (fs::is_regular_file(path_yml, ec))
  {
    vars = Pop(load_file(path_yml, decrypt));
  }
  return vars;
}

/**
 * @brief Loads the variables of a run
 *
 * The variables of `vars/all` come first, then the variables of each target in the given order,
 * later variables override earlier ones.
 *
 * @param path_root The project root
 * @param targets Names of the targets, most generic first
 * @param decrypt Decrypts the files that are secrets
 * @return Value<json> The merged variables or the respective error
 */
[[nodiscard]] inline Value<json> load_all(fs::path const& path_root
  , std::vector<std::string> const& targets
  , Decrypt const& decrypt)
{
  json vars = Pop(load_vars(path_root / "vars", "all", decrypt));
  for(std::string const& target : targets)
  {
    json target_vars = Pop(load_vars(path_root / "vars" / "targets", target, decrypt));
    vars = Pop(unify(vars, target_vars), "E::Could not merge variables of target '{}'", target);
  }
  return vars;
}

// }}}

} // namespace ns_vars

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
