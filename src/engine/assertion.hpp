/**
 * @file assertion.hpp
 * @author Ruan Formigoni
 * @brief A testable and idempotent property of a subject
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <string>
#include <vector>

#include "change.hpp"
#include "../macro.hpp"

namespace ns_engine
{

class Subject;

/**
 * @brief Base class of every assertion
 *
 * An assertion inspects the system and records a Change for every difference to the desired
 * state. The changes are executed when the mode is Mode::Modify. An assertion is satisfied when
 * evaluating it records no change.
 *
 * Derived classes implement converge(), apply() clears the changes of the previous evaluation
 * before calling it.
 */
class Assertion
{
  private:
    std::string m_name;
    std::vector<Change> m_changes;

  protected:
    /**
     * @brief Records a change, executing it first when modifying
     *
     * @param change The change found by the assertion
     * @param mode Whether the change is executed
     * @return Value<void> Nothing on success, or the error of the change action
     */
    [[nodiscard]] Value<void> register_change(Change change, Mode mode)
    {
      if (mode == Mode::Modify)
      {
        Pop(change.execute(), "E::Could not apply '{}' for '{}'", change.name(), m_name);
      }
      m_changes.push_back(std::move(change));
      return {};
    }

    /**
     * @brief Inspects the system, records and possibly performs the needed changes
     */
    [[nodiscard]] virtual Value<void> converge(ns_report::Log& log, Mode mode) = 0;

    void display(ns_report::Log& log) const
    {
      if (changed()) { display_changed(log); }
      else { display_passed(log); }
    }

    void display_failed(ns_report::Log& log) const
    {
      auto guard = log.level();
      log.assertion_fail(m_name);
      for(auto const& change : m_changes) { change.display(log); }
    }

    void display_changed(ns_report::Log& log) const
    {
      auto guard = log.level();
      log.assertion_change(m_name);
      for(auto const& change : m_changes) { change.display(log); }
    }

    void display_passed(ns_report::Log& log) const
    {
      auto guard = log.level();
      log.assertion_pass(m_name);
    }

  public:
    explicit Assertion(std::string name)
      : m_name(std::move(name))
    {}

    virtual ~Assertion() = default;

    /**
     * @brief Called before the prerequisites of the subject are applied
     *
     * This is the only place where an assertion may add prerequisites to its subject.
     *
     * @param subject The subject that owns this assertion
     */
    [[nodiscard]] virtual Value<void> prepare(Subject& subject)
    {
      std::ignore = subject;
      return {};
    }

    [[nodiscard]] Value<void> apply(ns_report::Log& log, Mode mode)
    {
      m_changes.clear();
      return converge(log, mode);
    }

    /**
     * @brief True if the last evaluation recorded a change
     */
    [[nodiscard]] virtual bool changed() const { return not m_changes.empty(); }
    [[nodiscard]] std::vector<Change> const& changes() const { return m_changes; }
    [[nodiscard]] std::string const& name() const { return m_name; }
};

} // namespace ns_engine

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
