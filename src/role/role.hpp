/**
 * @file role.hpp
 * @author Ruan Formigoni
 * @brief Roles and the driver that applies them for a target
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "role_context.hpp"
#include "../lib/log.hpp"
#include "../std/expected.hpp"

namespace ns_role
{

/**
 * @brief The configuration logic of a role
 */
class Role
{
  public:
    virtual ~Role() = default;
    [[nodiscard]] virtual Value<void> configure(RoleContext& ctx) = 0;
};

/**
 * @brief A role made of a function
 */
class FunctionRole final : public Role
{
  private:
    std::function<Value<void>(RoleContext&)> m_configure;
  public:
    explicit FunctionRole(std::function<Value<void>(RoleContext&)> configure)
      : m_configure(std::move(configure))
    {}

    [[nodiscard]] Value<void> configure(RoleContext& ctx) override
    {
      return m_configure(ctx);
    }
};

/**
 * @brief Roles of a configuration program by name
 */
class RoleRegistry
{
  private:
    std::map<std::string, std::unique_ptr<Role>> m_roles;

  public:
    RoleRegistry() = default;
    RoleRegistry(RoleRegistry const&) = delete;
    RoleRegistry& operator=(RoleRegistry const&) = delete;

    RoleRegistry& add(std::string const& name, std::unique_ptr<Role> role)
    {
      m_roles[name] = std::move(role);
      return *this;
    }

    RoleRegistry& add(std::string const& name, std::function<Value<void>(RoleContext&)> configure)
    {
      return add(name, std::make_unique<FunctionRole>(std::move(configure)));
    }

    [[nodiscard]] Value<Role*> find(std::string const& name) const
    {
      auto it = m_roles.find(name);
      return_if(it == m_roles.end(), Error("E::Role '{}' is not registered", name));
      return it->second.get();
    }

    [[nodiscard]] bool contains(std::string const& name) const { return m_roles.contains(name); }
};

/**
 * @brief Applies the roles of a target, one role at a time
 *
 * A failing role does not stop the run. Its error is reported and the next role is applied.
 */
class Driver
{
  private:
    RoleRegistry const& m_roles;
    ns_target::Registry const& m_targets;
    ns_db::ns_context::Context const& m_context;
    ns_report::Log& m_log;
    ns_engine::Mode m_mode;
    std::shared_ptr<ns_package::PackageCache> m_cache;
    std::vector<std::string> m_failed;

    [[nodiscard]] Value<void> configure(Role& role, RoleContext& ctx)
    {
      // Exceptions of the configuration logic are errors of the role
      Pop(Catch(role.configure(ctx)));
      Pop(ctx.run_handlers());
      return {};
    }

  public:
    Driver(RoleRegistry const& roles
      , ns_target::Registry const& targets
      , ns_db::ns_context::Context const& context
      , ns_report::Log& log
      , ns_engine::Mode mode
      , std::shared_ptr<ns_package::PackageCache> cache)
      : m_roles(roles)
      , m_targets(targets)
      , m_context(context)
      , m_log(log)
      , m_mode(mode)
      , m_cache(std::move(cache))
      , m_failed()
    {}

    /**
     * @brief Applies a role and its handlers
     *
     * @param name The name of the role
     */
    void apply_role(std::string const& name)
    {
      auto guard = m_log.level();
      m_log.no_change("Role " + m_log.fmt_target(name));
      auto role = m_roles.find(name);
      if (not role)
      {
        m_log.error(std::format("Failed to import role '{}'", name), role.error());
        m_failed.push_back(name);
        return;
      }
      RoleContext ctx(name, m_log, m_mode, m_context, m_cache, m_targets);
      auto result = configure(**role, ctx);
      if (not result)
      {
        m_log.error("Failed to apply role", result.error());
        m_failed.push_back(name);
      }
    }

    /**
     * @brief Executes a target and every target it requires
     *
     * @param target The target of the run
     * @param limit When set, only these roles are applied
     * @param skip Roles that are not applied
     */
    void execute(ns_target::Target const& target
      , std::optional<std::set<std::string>> const& limit
      , std::set<std::string> const& skip)
    {
      target.execute([this](std::string const& name){ apply_role(name); }, limit, skip);
    }

    [[nodiscard]] std::vector<std::string> const& failed() const { return m_failed; }
};

} // namespace ns_role

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
