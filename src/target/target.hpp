/**
 * @file target.hpp
 * @author Ruan Formigoni
 * @brief Named configuration profiles and their dependencies
 *
 * Targets are declared by the configuration program before anything runs:
 *
 * @code
 * setup.target("base").has_roles({"shell", "editor"});
 * setup.target("laptop").depends_on({"base", "desktop"}).has_roles({"power"});
 * @endcode
 *
 * A target is created on its first reference, so a target may depend on a target declared after it.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../std/expected.hpp"

/**
 * @namespace ns_target
 * @brief Registry of targets, execution order and variable order
 */
namespace ns_target
{

class Registry;

class Target
{
  private:
    std::string m_name;
    Registry* m_registry;
    std::vector<std::string> m_requires;
    std::vector<std::string> m_roles;

    [[nodiscard]] bool includes(std::string const& name, std::set<std::string>& visited) const;

  public:
    Target(std::string name, Registry* registry)
      : m_name(std::move(name))
      , m_registry(registry)
      , m_requires()
      , m_roles()
    {}

    /**
     * @brief Adds targets that are executed before this target
     */
    Target& depends_on(std::vector<std::string> const& names)
    {
      std::ranges::copy(names, std::back_inserter(m_requires));
      return *this;
    }

    /**
     * @brief Adds roles applied by this target, in order
     */
    Target& has_roles(std::vector<std::string> const& roles)
    {
      std::ranges::copy(roles, std::back_inserter(m_roles));
      return *this;
    }

    [[nodiscard]] std::string const& name() const { return m_name; }
    [[nodiscard]] std::vector<std::string> const& requires_names() const { return m_requires; }
    [[nodiscard]] std::vector<std::string> const& roles() const { return m_roles; }

    /**
     * @brief The required targets, in declaration order
     */
    [[nodiscard]] std::vector<Target*> dependencies() const;

    /**
     * @brief True if name is this target or a target it requires, directly or not
     */
    [[nodiscard]] bool includes(std::string const& name) const
    {
      std::set<std::string> visited;
      return includes(name, visited);
    }

    /**
     * @brief Executes the required targets and then the roles of this target
     *
     * A target required through several paths is executed once per path.
     *
     * @param apply_role Applies a role, failures are handled by the callee
     * @param limit When set, only these roles are applied
     * @param skip Roles that are not applied
     */
    void execute(std::function<void(std::string const&)> const& apply_role
      , std::optional<std::set<std::string>> const& limit
      , std::set<std::string> const& skip) const;
};

/**
 * @brief The targets of a configuration program, in declaration order
 */
class Registry
{
  private:
    std::vector<std::unique_ptr<Target>> m_targets;
    std::optional<std::string> m_current;

  public:
    Registry() = default;
    Registry(Registry const&) = delete;
    Registry& operator=(Registry const&) = delete;

    /**
     * @brief Gets a target, creating it on first reference
     */
    Target& target(std::string const& name)
    {
      if (Target* found = find(name)) { return *found; }
      m_targets.push_back(std::make_unique<Target>(name, this));
      return *m_targets.back();
    }

    [[nodiscard]] Target* find(std::string const& name) const
    {
      auto it = std::ranges::find_if(m_targets, [&](auto const& e){ return e->name() == name; });
      return (it == m_targets.end())? nullptr : it->get();
    }

    [[nodiscard]] std::vector<Target*> all() const
    {
      std::vector<Target*> ret;
      std::ranges::transform(m_targets, std::back_inserter(ret), [](auto const& e){ return e.get(); });
      return ret;
    }

    [[nodiscard]] std::vector<std::string> names() const
    {
      std::vector<std::string> ret;
      std::ranges::transform(m_targets, std::back_inserter(ret), [](auto const& e){ return e->name(); });
      return ret;
    }

    /**
     * @brief Selects the target of the run
     */
    [[nodiscard]] Value<void> select(std::string const& name)
    {
      return_if(find(name) == nullptr, Error("E::Target '{}' does not exist", name));
      m_current = name;
      return {};
    }

    [[nodiscard]] Value<Target*> current() const
    {
      return_if(not m_current, Error("E::No target active yet"));
      return find(*m_current);
    }

    /**
     * @brief True if the current target is or requires the given target
     */
    [[nodiscard]] Value<bool> is_targeted(std::string const& name) const
    {
      return_if(find(name) == nullptr, Error("E::Target '{}' does not exist", name));
      Target* target = Pop(current());
      return target->includes(name);
    }
};

inline std::vector<Target*> Target::dependencies() const
{
  std::vector<Target*> ret;
  std::ranges::transform(m_requires, std::back_inserter(ret), [this](auto const& e){ return &m_registry->target(e); });
  return ret;
}

inline bool Target::includes(std::string const& name, std::set<std::string>& visited) const
{
  return_if(m_name == name, true);
  return_if(not visited.insert(m_name).second, false);
  return std::ranges::any_of(dependencies(), [&](Target* e){ return e->includes(name, visited); });
}

inline void Target::execute(std::function<void(std::string const&)> const& apply_role
  , std::optional<std::set<std::string>> const& limit
  , std::set<std::string> const& skip) const
{
  for(Target* required : dependencies())
  {
    logger("I::Target {} requires {}", m_name, required->name());
    required->execute(apply_role, limit, skip);
  }
  logger("I::Applying target {}", m_name);
  for(std::string const& role : m_roles)
  {
    continue_if(limit and not limit->contains(role), "D::Role {} is not in the role limit", role);
    continue_if(skip.contains(role), "D::Skipping role {}", role);
    apply_role(role);
  }
}

/**
 * @brief Order in which the variables of the targets are merged
 *
 * Every target reachable from the given one is listed once, with the minimum depth it was reached
 * at. The deepest targets come first, targets of the same depth are sorted by name, the given
 * target is last.
 *
 * @param target The selected target
 * @return Value<std::vector<Target*>> The targets in merge order, or an error if the dependencies
 * have a cycle
 */
[[nodiscard]] inline Value<std::vector<Target*>> resolve_order(Target& target)
{
  std::map<Target*,int> depths;
  std::vector<std::string> stack;
  std::function<Value<void>(Target*,int)> f_visit = [&](Target* current, int depth) -> Value<void>
  {
    return_if(std::ranges::contains(stack, current->name())
      , Error("E::Dependency cycle through target '{}'", current->name())
    );
    auto [it, inserted] = depths.emplace(current, depth);
    if (not inserted) { it->second = std::min(it->second, depth); }
    stack.push_back(current->name());
    for(Target* dependency : current->dependencies())
    {
      Pop(f_visit(dependency, depth + 1));
    }
    stack.pop_back();
    return {};
  };
  Pop(f_visit(&target, 0));
  std::vector<std::pair<Target*,int>> sorted(depths.begin(), depths.end());
  std::ranges::sort(sorted, [](auto const& a, auto const& b)
  {
    if (a.second != b.second) { return a.second > b.second; }
    return a.first->name() < b.first->name();
  });
  std::vector<Target*> ret;
  std::ranges::transform(sorted, std::back_inserter(ret), [](auto const& e){ return e.first; });
  return ret;
}

/**
 * @brief Names of the targets in the merge order of resolve_order
 */
[[nodiscard]] inline Value<std::vector<std::string>> resolve_names(Target& target)
{
  std::vector<Target*> order = Pop(resolve_order(target));
  std::vector<std::string> ret;
  std::ranges::transform(order, std::back_inserter(ret), [](Target* e){ return e->name(); });
  return ret;
}

// Rendering {{{

inline void tree_line(std::string& out
  , std::string const& item
  , std::vector<std::string> const& padding
  , bool last
  , std::string const& line)
{
  for(size_t i = 0; i + 1 < padding.size(); ++i) { out += padding[i]; }
  if (not padding.empty())
  {
    out += (last? "└" : "├") + line + line + line;
  }
  out += item + "\n";
}

inline void tree_target(std::string& out, Target& target, std::vector<std::string>& padding, bool last, bool full)
{
  tree_line(out, target.name(), padding, last, "─");
  std::vector<Target*> dependencies = target.dependencies();
  std::vector<std::string> roles = full? target.roles() : std::vector<std::string>{};
  size_t total = dependencies.size() + roles.size();
  for(size_t i = 0; i < dependencies.size(); ++i)
  {
    bool is_last = i + 1 == total;
    padding.push_back(is_last? "    " : "│   ");
    tree_target(out, *dependencies[i], padding, is_last, full);
    padding.pop_back();
  }
  for(size_t i = 0; i < roles.size(); ++i)
  {
    bool is_last = i + 1 == roles.size();
    padding.push_back(is_last? "    " : "│   ");
    tree_line(out, roles[i], padding, is_last, "╌");
    padding.pop_back();
  }
}

/**
 * @brief Renders the dependency tree of a target
 *
 * @param target The root of the tree
 * @param full Whether the roles of each target are listed
 * @return std::string The tree, one node per line
 */
[[nodiscard]] inline std::string render_tree(Target& target, bool full)
{
  std::string out;
  std::vector<std::string> padding;
  tree_target(out, target, padding, true, full);
  return out;
}

/**
 * @brief Renders every target of the registry with its roles when full is set
 */
[[nodiscard]] inline std::string render_all(Registry const& registry, bool full)
{
  std::string out;
  for(Target* target : registry.all())
  {
    out += target->name() + "\n";
    continue_if(not full);
    for(size_t i = 0; i < target->roles().size(); ++i)
    {
      out += std::string((i + 1 == target->roles().size())? "└╌╌╌" : "├╌╌╌") + target->roles()[i] + "\n";
    }
  }
  return out;
}

// }}}

} // namespace ns_target

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
