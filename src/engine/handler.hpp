/**
 * @file handler.hpp
 * @author Ruan Formigoni
 * @brief Deferred application of subjects triggered by changes of other subjects
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <memory>
#include <vector>

#include "subject.hpp"

namespace ns_engine
{

/**
 * @brief A set of subjects applied when a listened subject changed
 *
 * Handlers are registered in a role context and run once, in registration order, after the
 * configuration logic of the role returned. A handler fires at most once.
 *
 * @code
 * auto& restart = ctx.handler({ service });
 * ctx.file("/etc/ssh/sshd_config")->is_present().has_content(config).on_change(restart);
 * @endcode
 */
class Handler
{
  private:
    std::vector<std::shared_ptr<Subject>> m_listen;
    std::vector<std::shared_ptr<Subject>> m_call;
    bool m_generated;
    bool m_done;

    void display_summary(ns_report::Log& log) const
    {
      auto guard = log.level();
      for(auto const& subject : m_listen)
      {
        if (subject->changed()) { log.change(subject->description()); }
        else { log.no_change(subject->description()); }
      }
    }

  public:
    /**
     * @brief Construct a handler
     *
     * @param call Subjects applied when the handler fires
     * @param generated Whether the handler was created by a composite subject instead of a role,
     * generated handlers are silent when skipped
     */
    explicit Handler(std::vector<std::shared_ptr<Subject>> call, bool generated = false)
      : m_listen()
      , m_call(std::move(call))
      , m_generated(generated)
      , m_done(false)
    {}

    void listen(std::shared_ptr<Subject> subject)
    {
      m_listen.push_back(std::move(subject));
    }

    void call(std::shared_ptr<Subject> subject)
    {
      m_call.push_back(std::move(subject));
    }

    [[nodiscard]] bool generated() const { return m_generated; }
    [[nodiscard]] bool done() const { return m_done; }

    /**
     * @brief True if any listened subject changed
     */
    [[nodiscard]] bool triggered() const
    {
      return std::ranges::any_of(m_listen, [](auto const& e){ return e->changed(); });
    }

    /**
     * @brief Fires the handler if a listened subject changed
     *
     * @param log The report
     * @param mode Whether changes of the called subjects are executed
     * @return Value<void> Nothing on success, or the error of a called subject
     */
    [[nodiscard]] Value<void> apply(ns_report::Log& log, Mode mode)
    {
      return_if(m_done, {});
      m_done = true;
      if (triggered())
      {
        log.change("executing handler for:");
        {
          auto guard = log.level();
          display_summary(log);
        }
        for(auto& subject : m_call)
        {
          Pop(subject->apply(log, mode));
        }
      }
      else if (not m_generated)
      {
        log.no_change("skipped handler for:");
        display_summary(log);
      }
      return {};
    }
};

inline Subject& Subject::listen(Handler& handler)
{
  handler.listen(shared_from_this());
  return *this;
}

} // namespace ns_engine

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
