/**
 * @file systemd.hpp
 * @author Ruan Formigoni
 * @brief Services managed by systemd
 *
 * A service may manage its own unit file. The unit file is a prerequisite of the service and a
 * generated handler reloads the daemon, and optionally restarts the service, when it changed:
 *
 * @code
 * auto service = ctx.service("backup.service", ns_systemd::Scope::USER);
 * Pop(service->file([&](auto& unit){ unit.file->has_content(text); unit.restarts_service(); }));
 * service->is_enabled().is_started();
 * @endcode
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "file.hpp"
#include "../engine/handler.hpp"
#include "../lib/elevate.hpp"
#include "../lib/env.hpp"
#include "../lib/subprocess.hpp"
#include "../std/enum.hpp"

namespace ns_systemd
{

namespace fs = std::filesystem;

using ns_engine::Mode;
using ns_engine::Change;

ENUM(Scope, SYSTEM, USER);

/**
 * @brief Builds systemctl commands for a scope
 */
[[nodiscard]] inline std::vector<std::string> systemctl(Scope scope
  , ns_elevate::Privileges const& privileges
  , std::vector<std::string> const& args)
{
  std::vector<std::string> cmd{"systemctl"};
  if (scope == Scope::SYSTEM)
  {
    std::ranges::copy(args, std::back_inserter(cmd));
    return cmd;
  }
  cmd.push_back("--user");
  std::ranges::copy(args, std::back_inserter(cmd));
  return privileges.user(cmd);
}

/**
 * @brief Reference to a unit of a scope
 *
 * systemctl runs with the environment of the invoking user, which holds the session bus of the
 * user scope.
 */
struct Unit
{
  std::string name;
  Scope scope;
  ns_elevate::Privileges privileges;

  [[nodiscard]] std::vector<std::string> command(std::vector<std::string> const& args) const
  {
    return systemctl(scope, privileges, args);
  }

  [[nodiscard]] Value<void> run(std::vector<std::string> const& args) const
  {
    return ns_subprocess::check_call(command(args), privileges.env);
  }

  /**
   * @brief Queries a property of the unit
   *
   * @param property Name of the property, e.g. ActiveState
   * @return Value<std::string> The value of the property or the respective error
   */
  [[nodiscard]] Value<std::string> property(std::string const& property) const
  {
    int code = Pop(ns_subprocess::call(command({"status", name}), ns_subprocess::Stream::Null, privileges.env));
    return_if(code == 4, Error("E::Systemd unit '{}' does not exist in {} scope", name, scope.lower()));
    std::string value = Pop(ns_subprocess::check_output(command({"show", "--value", "--property", property, name})
      , privileges.env
    ));
    return ns_string::trim(value);
  }
};

/**
 * @brief A state toggled by a systemctl verb, e.g. started with start
 */
class IsInState : public ns_engine::Assertion
{
  private:
    Unit m_unit;
    std::string m_property;
    std::string m_state_on;
    std::string m_state_off;
    std::string m_verb;
    std::string m_change;

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      std::string state = Pop(m_unit.property(m_property));
      if (state == m_state_on)
      {
        display_passed(log);
        return {};
      }
      return_if(state != m_state_off
        , Error("E::Unknown state for service '{}': {}={}", m_unit.name, m_property, state)
      );
      Pop(register_change(Change(m_change, {}, [unit = m_unit, verb = m_verb]
      {
        return unit.run({verb, unit.name});
      }), mode));
      display(log);
      return {};
    }

    IsInState(std::string name
      , Unit unit
      , std::string property
      , std::string on
      , std::string off
      , std::string verb
      , std::string change)
      : Assertion(std::move(name))
      , m_unit(std::move(unit))
      , m_property(std::move(property))
      , m_state_on(std::move(on))
      , m_state_off(std::move(off))
      , m_verb(std::move(verb))
      , m_change(std::move(change))
    {}
};

class IsStarted final : public IsInState
{
  public:
    explicit IsStarted(Unit unit)
      : IsInState("is started", std::move(unit), "ActiveState", "active", "inactive", "start", "started")
    {}
};

class IsEnabled final : public IsInState
{
  public:
    explicit IsEnabled(Unit unit)
      : IsInState("is enabled", std::move(unit), "UnitFileState", "enabled", "disabled", "enable", "enabled")
    {}
};

/**
 * @brief Unconditional action, used by the subjects called by handlers
 */
class Performs : public ns_engine::Assertion
{
  private:
    Unit m_unit;
    std::vector<std::string> m_args;
    std::string m_change;

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      Pop(register_change(Change(m_change, {}, [unit = m_unit, args = m_args]{ return unit.run(args); }), mode));
      display(log);
      return {};
    }

    Performs(std::string name, Unit unit, std::vector<std::string> args, std::string change)
      : Assertion(std::move(name))
      , m_unit(std::move(unit))
      , m_args(std::move(args))
      , m_change(std::move(change))
    {}
};

class IsRestarted final : public Performs
{
  public:
    explicit IsRestarted(Unit const& unit)
      : Performs("is restarted", unit, {"restart", unit.name}, "restarted")
    {}
};

class IsReloaded final : public Performs
{
  public:
    explicit IsReloaded(Unit const& unit)
      : Performs(std::format("systemd {} daemon is reloaded", unit.scope.lower()), unit, {"daemon-reload"}, "reloaded")
    {}
};

/**
 * @brief Unit file of a service and what happens when it changes
 */
struct UnitFile
{
  std::shared_ptr<ns_file::File> file;
  bool reload = true;
  bool restart = false;

  UnitFile& reloads_daemon() { reload = true; return *this; }
  UnitFile& does_not_reload_daemon() { reload = false; return *this; }
  UnitFile& restarts_service() { restart = true; return *this; }
  UnitFile& does_not_restart_service() { restart = false; return *this; }
};

class SystemdService final : public ns_engine::SubjectBase<SystemdService>
{
  private:
    Unit m_unit;

  public:
    explicit SystemdService(Unit unit)
      : m_unit(std::move(unit))
    {}

    [[nodiscard]] static std::shared_ptr<SystemdService> create(std::string name
      , Scope scope
      , ns_elevate::Privileges privileges)
    {
      return std::make_shared<SystemdService>(Unit{std::move(name), scope, std::move(privileges)});
    }

    /**
     * @brief Path of the unit file, /etc/systemd/system for the system scope and
     * $XDG_CONFIG_HOME/systemd/user of the invoking user for the user scope
     */
    [[nodiscard]] Value<fs::path> unit_path() const
    {
      return_if(m_unit.scope == Scope::SYSTEM, fs::path{"/etc/systemd/system"} / m_unit.name);
      ns_elevate::Privileges const& privileges = m_unit.privileges;
      return Pop(ns_env::xdg_config_home(privileges.env, privileges.home_dir)) / "systemd" / "user" / m_unit.name;
    }

    /**
     * @brief Manages the unit file of the service
     *
     * The unit file is applied before the assertions of the service. When it changes, a generated
     * handler applies a service built for that purpose, which reloads the daemon and restarts the
     * service as configured.
     *
     * @param configure Sets the assertions of the unit file and the reactions to its changes
     * @return Value<std::shared_ptr<SystemdService>> This service or the error of finding the unit path
     */
    [[nodiscard]] Value<std::shared_ptr<SystemdService>> file(std::function<void(UnitFile&)> const& configure)
    {
      fs::path path_unit = Pop(unit_path());
      UnitFile unit{ .file = ns_file::File::create(path_unit) };
      unit.file->annotate(std::format("{} service file", m_unit.scope.lower()));
      configure(unit);
      add_prerequisite(unit.file);
      if (unit.reload or unit.restart)
      {
        auto reaction = std::make_shared<SystemdService>(m_unit);
        if (unit.reload) { reaction->is_reloaded(); }
        if (unit.restart) { reaction->is_restarted(); }
        auto handler = std::make_shared<ns_engine::Handler>(std::vector<std::shared_ptr<ns_engine::Subject>>{reaction}, true);
        handler->listen(unit.file);
        add_generated_handler(handler);
      }
      return ptr();
    }

    SystemdService& is_started()
    {
      add_assertion(std::make_unique<IsStarted>(m_unit));
      return *this;
    }

    SystemdService& is_enabled()
    {
      add_assertion(std::make_unique<IsEnabled>(m_unit));
      return *this;
    }

    SystemdService& is_restarted()
    {
      add_assertion(std::make_unique<IsRestarted>(m_unit));
      return *this;
    }

    SystemdService& is_reloaded()
    {
      add_assertion(std::make_unique<IsReloaded>(m_unit));
      return *this;
    }

    [[nodiscard]] Unit const& unit() const { return m_unit; }

    [[nodiscard]] std::string describe() const override
    {
      return "service " + m_unit.name;
    }

    [[nodiscard]] std::shared_ptr<ns_engine::Subject> clone() const override
    {
      return std::make_shared<SystemdService>(m_unit);
    }
};

} // namespace ns_systemd

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
