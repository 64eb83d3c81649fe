/**
 * @file merge.hpp
 * @author Ruan Formigoni
 * @brief Merge of variable trees
 *
 * A variable tree is a json object. The reserved key `$conflict` selects how the tree is merged
 * with another tree, at its own level only:
 *
 * ```yaml
 * packages:
 *   $conflict: replace
 *   editor: vim
 * ```
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "../std/enum.hpp"
#include "../std/expected.hpp"

/**
 * @namespace ns_vars
 * @brief Loading and merging of the variables of a run
 */
namespace ns_vars
{

using json = nlohmann::json;

/**
 * @brief Key of a variable tree that names the merge strategy of its level
 */
constexpr std::string_view CONFLICT_HINT = "$conflict";

/**
 * @brief How two variable trees are merged
 *
 * - MERGE: Union of the keys, trees present on both sides are merged recursively, otherwise the
 *   value of the overlay wins
 * - REPLACE: The keys of the overlay replace the keys of the base
 * - ERROR: The merge is refused
 */
ENUM(MergeStrategy, MERGE, REPLACE, ERROR);

/**
 * @brief Merges two variable trees
 *
 * The strategy given in the `$conflict` key of the overlay, or else of the base, overrides the
 * given strategy for this level. It is kept in the result and is not passed down to the nested
 * trees.
 *
 * @param base The variables with lower precedence
 * @param overlay The variables with higher precedence
 * @param strategy The strategy used when neither tree names one
 * @return Value<json> The merged tree or the respective error
 */
[[nodiscard]] inline Value<json> unify(json const& base, json const& overlay, MergeStrategy strategy = MergeStrategy::MERGE)
{
  return_if(not base.is_object() or not overlay.is_object()
    , Error("E::Only variable trees can be merged, got '{}' and '{}'", base.type_name(), overlay.type_name())
  );
  json unified = json::object();
  // Strategy hint of this level
  json const* hint = overlay.contains(CONFLICT_HINT)? &overlay.at(CONFLICT_HINT)
    : base.contains(CONFLICT_HINT)? &base.at(CONFLICT_HINT)
    : nullptr;
  if (hint != nullptr)
  {
    return_if(not hint->is_string(), Error("E::Merge strategy must be a string, got '{}'", hint->dump()));
    unified[CONFLICT_HINT] = hint->get<std::string>();
    strategy = Pop(MergeStrategy::from_string(hint->get<std::string>()), "E::Unknown merge strategy '{}'", hint->dump());
  }
  switch (strategy)
  {
    case MergeStrategy::ERROR:
      return Error("E::Refusing to merge conflicting dictionaries");
    case MergeStrategy::REPLACE:
      for(auto const& [key, value] : overlay.items())
      {
        continue_if(key == CONFLICT_HINT);
        unified[key] = value;
      }
      return unified;
    case MergeStrategy::MERGE:
    case MergeStrategy::NONE:
      break;
  }
  for(auto const& [key, value] : base.items())
  {
    if (not overlay.contains(key)) { unified[key] = value; }
  }
  for(auto const& [key, value] : overlay.items())
  {
    if (base.contains(key) and base.at(key).is_object() and value.is_object())
    {
      unified[key] = Pop(unify(base.at(key), value, MergeStrategy::MERGE));
    }
    else
    {
      unified[key] = value;
    }
  }
  return unified;
}

} // namespace ns_vars

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
