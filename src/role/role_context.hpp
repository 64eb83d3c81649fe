/**
 * @file role_context.hpp
 * @author Ruan Formigoni
 * @brief State of one role while it is applied
 *
 * A role receives a context that builds subjects with the defaults of the run, applies them and
 * collects its handlers:
 *
 * @code
 * Value<void> configure(ns_role::RoleContext& ctx) override
 * {
 *   auto& restart = ctx.handler({ ctx.service("sshd.service")->is_restarted().ptr() });
 *   auto config = ctx.file("/etc/ssh/sshd_config");
 *   config->is_system_file().has_content(text).on_change(restart);
 *   Pop(ctx.apply({ config }));
 *   return {};
 * }
 * @endcode
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "../db/context.hpp"
#include "../engine/handler.hpp"
#include "../engine/subject.hpp"
#include "../report/report.hpp"
#include "../subjects/file.hpp"
#include "../subjects/file_tree.hpp"
#include "../subjects/group.hpp"
#include "../subjects/package.hpp"
#include "../subjects/systemd.hpp"
#include "../target/target.hpp"
#include "../std/expected.hpp"

/**
 * @namespace ns_role
 * @brief Roles, their registry and the driver that applies them
 */
namespace ns_role
{

namespace fs = std::filesystem;

using Subjects = std::vector<std::shared_ptr<ns_engine::Subject>>;

class RoleContext
{
  private:
    std::string m_name;
    ns_report::Log& m_log;
    ns_engine::Mode m_mode;
    ns_db::ns_context::Context const& m_context;
    std::shared_ptr<ns_package::PackageCache> m_cache;
    ns_target::Registry const& m_targets;
    std::vector<std::shared_ptr<ns_engine::Handler>> m_handlers;

  public:
    RoleContext(std::string name
      , ns_report::Log& log
      , ns_engine::Mode mode
      , ns_db::ns_context::Context const& context
      , std::shared_ptr<ns_package::PackageCache> cache
      , ns_target::Registry const& targets)
      : m_name(std::move(name))
      , m_log(log)
      , m_mode(mode)
      , m_context(context)
      , m_cache(std::move(cache))
      , m_targets(targets)
      , m_handlers()
    {}

    RoleContext(RoleContext const&) = delete;
    RoleContext& operator=(RoleContext const&) = delete;

    [[nodiscard]] std::string const& name() const { return m_name; }
    [[nodiscard]] ns_engine::Mode mode() const { return m_mode; }
    [[nodiscard]] ns_report::Log& log() { return m_log; }
    [[nodiscard]] ns_db::ns_context::Context const& context() const { return m_context; }
    [[nodiscard]] ns_db::json_t const& vars() const { return m_context.get_vars(); }
    [[nodiscard]] size_t handlers() const { return m_handlers.size(); }

    /**
     * @brief Variables of the role, the entry named after the role or an empty object
     */
    [[nodiscard]] ns_db::json_t role_vars() const
    {
      ns_db::json_t const& vars = m_context.get_vars();
      return_if(not vars.is_object() or not vars.contains(m_name), ns_db::json_t::object());
      return vars.at(m_name);
    }

    /**
     * @brief True if the target of the run is or requires the given target
     */
    [[nodiscard]] Value<bool> is_targeted(std::string const& target) const
    {
      return m_targets.is_targeted(target);
    }

    /**
     * @brief Path of a resource shipped with the role, relative to roles/<role>/ of the project
     */
    [[nodiscard]] fs::path resource(fs::path const& path) const
    {
      return m_context.get_root() / "roles" / m_name / path;
    }

    // Factories {{{

    [[nodiscard]] std::shared_ptr<ns_file::File> file(fs::path path) const
    {
      auto const& user = m_context.get_host().user;
      auto subject = ns_file::File::create(std::move(path));
      subject->with_default_owner(user.username, user.groupname);
      return subject;
    }

    [[nodiscard]] std::shared_ptr<ns_file::Directory> directory(fs::path path) const
    {
      auto const& user = m_context.get_host().user;
      auto subject = ns_file::Directory::create(std::move(path));
      subject->with_default_owner(user.username, user.groupname);
      return subject;
    }

    [[nodiscard]] std::shared_ptr<ns_file::Symlink> symlink(fs::path path) const
    {
      auto const& user = m_context.get_host().user;
      auto subject = ns_file::Symlink::create(std::move(path));
      subject->with_default_owner(user.username, user.groupname);
      return subject;
    }

    /**
     * @brief A file tree whose source is a directory of the role resources
     */
    [[nodiscard]] std::shared_ptr<ns_file::FileTree> file_tree(fs::path const& source) const
    {
      auto const& user = m_context.get_host().user;
      auto subject = ns_file::FileTree::create(resource(source));
      subject->with_default_owner(user.username, user.groupname);
      return subject;
    }

    [[nodiscard]] std::shared_ptr<ns_group::Group> group(std::string name) const
    {
      return ns_group::Group::create(std::move(name), m_context.privileges());
    }

    [[nodiscard]] std::shared_ptr<ns_package::Package> package(std::vector<std::string> names) const
    {
      return ns_package::Package::create(std::move(names), m_cache, m_context.privileges());
    }

    [[nodiscard]] std::shared_ptr<ns_systemd::SystemdService> service(std::string name
      , ns_systemd::Scope scope = ns_systemd::Scope::SYSTEM) const
    {
      return ns_systemd::SystemdService::create(std::move(name), scope, m_context.privileges());
    }

    // }}}

    /**
     * @brief Applies subjects in order, in the mode of the run
     *
     * Handlers generated by the subjects are registered after the handlers of the role.
     *
     * @param subjects The subjects to converge
     * @return Value<void> Nothing on success, or the error of the first failed subject
     */
    [[nodiscard]] Value<void> apply(Subjects const& subjects)
    {
      for(auto const& subject : subjects)
      {
        Pop(subject->apply(m_log, m_mode));
        std::ranges::copy(subject->generated_handlers(), std::back_inserter(m_handlers));
      }
      return {};
    }

    /**
     * @brief Checks that subjects are already converged without modifying anything
     *
     * @param subjects The subjects to check
     * @return Value<void> Nothing when no subject would change, an error otherwise
     */
    [[nodiscard]] Value<void> ensure(Subjects const& subjects)
    {
      std::unique_ptr<ns_report::Log> log_assert = m_log.changes_are_errors();
      auto guard = log_assert->level();
      log_assert->no_change("assert that");
      for(auto const& subject : subjects)
      {
        Pop(subject->apply(*log_assert, ns_engine::Mode::Pretend));
        return_if(subject->changed(), Error("E::assertion failed for {}", subject->description()));
      }
      return {};
    }

    /**
     * @brief Registers a handler that applies the given subjects when a listened subject changed
     *
     * @param call The subjects applied when the handler fires
     * @return ns_engine::Handler& The handler, valid for the lifetime of this context
     */
    ns_engine::Handler& handler(Subjects call)
    {
      m_handlers.push_back(std::make_shared<ns_engine::Handler>(std::move(call)));
      return *m_handlers.back();
    }

    /**
     * @brief Fires the handlers in registration order
     */
    [[nodiscard]] Value<void> run_handlers()
    {
      for(auto& handler : m_handlers)
      {
        Pop(handler->apply(m_log, m_mode));
      }
      return {};
    }
};

} // namespace ns_role

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
