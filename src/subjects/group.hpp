/**
 * @file group.hpp
 * @author Ruan Formigoni
 * @brief Groups of the user database
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <memory>
#include <string>

#include "../engine/subject.hpp"
#include "../lib/elevate.hpp"
#include "../lib/subprocess.hpp"
#include "../lib/user.hpp"

namespace ns_group
{

using ns_engine::Mode;

class IsPresent final : public ns_engine::Assertion
{
  private:
    std::string m_name;
    ns_elevate::Privileges m_privileges;

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      if (not ns_user::group_exists(m_name))
      {
        Pop(register_change(ns_engine::Change("created"
          , { ns_engine::DiffLine::add(m_name) }
          , [name = m_name, privileges = m_privileges]() -> Value<void>
          {
            auto cmd = Pop(privileges.elevated({"groupadd", name}));
            return ns_subprocess::check_call(cmd);
          }
        ), mode));
      }
      display(log);
      return {};
    }

  public:
    IsPresent(std::string name, ns_elevate::Privileges privileges)
      : Assertion("is present")
      , m_name(std::move(name))
      , m_privileges(std::move(privileges))
    {}
};

/**
 * @brief A group, created with groupadd when missing
 */
class Group final : public ns_engine::SubjectBase<Group>
{
  private:
    std::string m_name;
    ns_elevate::Privileges m_privileges;

  public:
    Group(std::string name, ns_elevate::Privileges privileges)
      : m_name(std::move(name))
      , m_privileges(std::move(privileges))
    {}

    [[nodiscard]] static std::shared_ptr<Group> create(std::string name, ns_elevate::Privileges privileges)
    {
      return std::make_shared<Group>(std::move(name), std::move(privileges));
    }

    Group& is_present()
    {
      add_assertion(std::make_unique<IsPresent>(m_name, m_privileges));
      return *this;
    }

    [[nodiscard]] std::string describe() const override
    {
      return "group " + m_name;
    }

    [[nodiscard]] std::shared_ptr<ns_engine::Subject> clone() const override
    {
      return create(m_name, m_privileges);
    }
};

} // namespace ns_group

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
