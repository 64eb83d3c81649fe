/**
 * @file change.hpp
 * @author Ruan Formigoni
 * @brief Record of a state transition found by an assertion
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "../std/enum.hpp"
#include "../std/expected.hpp"
#include "../report/report.hpp"

namespace ns_engine
{

/**
 * @brief Whether assertions correct the drift they find or only report it
 */
enum class Mode
{
  Modify,
  Pretend,
};

ENUM(DiffType, NEUTRAL, ADD, REMOVE, HEADER);

/**
 * @brief A typed line in the details of a change
 */
struct DiffLine
{
  DiffType type;
  std::string content;

  [[nodiscard]] static DiffLine neutral(std::string_view content)
  {
    return DiffLine{DiffType::NEUTRAL, std::format("  {}", content)};
  }

  [[nodiscard]] static DiffLine add(std::string_view content)
  {
    return DiffLine{DiffType::ADD, std::format("+ {}", content)};
  }

  [[nodiscard]] static DiffLine remove(std::string_view content)
  {
    return DiffLine{DiffType::REMOVE, std::format("- {}", content)};
  }

  [[nodiscard]] static DiffLine header(std::string_view content)
  {
    return DiffLine{DiffType::HEADER, std::string{content}};
  }

  [[nodiscard]] static DiffLine detail(std::string_view content)
  {
    return DiffLine{DiffType::NEUTRAL, std::string{content}};
  }
};

/**
 * @brief Immutable record of one state transition
 *
 * The action performs the transition. It only runs when the owning assertion is modifying the
 * system, in pretend mode the change is recorded for the report and nothing else happens.
 */
class Change
{
  private:
    std::string m_name;
    std::vector<DiffLine> m_details;
    std::function<Value<void>()> m_action;

  public:
    explicit Change(std::string name
      , std::vector<DiffLine> details = {}
      , std::function<Value<void>()> action = nullptr)
      : m_name(std::move(name))
      , m_details(std::move(details))
      , m_action(std::move(action))
    {}

    [[nodiscard]] std::string const& name() const { return m_name; }
    [[nodiscard]] std::vector<DiffLine> const& details() const { return m_details; }

    /**
     * @brief Performs the transition, a change without an action succeeds trivially
     */
    [[nodiscard]] Value<void> execute() const
    {
      return_if(not m_action, {});
      return m_action();
    }

    void display(ns_report::Log& log) const
    {
      auto guard = log.level();
      log.detail(m_name);
      for(DiffLine const& line : m_details)
      {
        switch(line.type)
        {
          case DiffType::NEUTRAL: log.detail(line.content); break;
          case DiffType::ADD: log.detail_add(line.content); break;
          case DiffType::REMOVE: log.detail_remove(line.content); break;
          case DiffType::HEADER: log.detail_header(line.content); break;
          case DiffType::NONE: break;
        }
      }
    }
};

} // namespace ns_engine

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
