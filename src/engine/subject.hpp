/**
 * @file subject.hpp
 * @author Ruan Formigoni
 * @brief A manageable resource and the assertions made about it
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <typeinfo>
#include <vector>

#include "assertion.hpp"

namespace ns_engine
{

class Handler;

/**
 * @brief A node representing one manageable resource (a path, a package set, a service...)
 *
 * Subjects are shared, a handler keeps the subjects it listens to alive after the configuration
 * logic of a role returns. Resource types derive from Subject and create their instances through
 * a static create() that returns a std::shared_ptr.
 */
class Subject : public std::enable_shared_from_this<Subject>
{
  private:
    std::vector<std::unique_ptr<Assertion>> m_assertions;
    std::vector<std::shared_ptr<Subject>> m_prerequisites;
    std::vector<std::shared_ptr<Handler>> m_generated_handlers;
    std::optional<std::string> m_description;

  public:
    Subject() = default;
    Subject(Subject const&) = delete;
    Subject& operator=(Subject const&) = delete;
    virtual ~Subject() = default;

    /**
     * @brief Converges the subject
     *
     * Prints the description, prepares every assertion, applies the prerequisites depth-first
     * and then the assertions, both in the order they were added.
     *
     * @param log The report
     * @param mode Whether changes are executed
     * @return Value<void> Nothing on success, or the first error of a prerequisite or assertion
     */
    [[nodiscard]] Value<void> apply(ns_report::Log& log, Mode mode)
    {
      auto guard = log.level();
      log.no_change(description());
      for(auto& assertion : m_assertions)
      {
        Pop(assertion->prepare(*this));
      }
      for(size_t i = 0; i < m_prerequisites.size(); ++i)
      {
        Pop(m_prerequisites[i]->apply(log, mode));
      }
      for(auto& assertion : m_assertions)
      {
        Pop(assertion->apply(log, mode));
      }
      return {};
    }

    /**
     * @brief True if an assertion of this subject or of a prerequisite recorded a change
     */
    [[nodiscard]] bool changed() const
    {
      return std::ranges::any_of(m_assertions, [](auto const& e){ return e->changed(); })
        or std::ranges::any_of(m_prerequisites, [](auto const& e){ return e->changed(); });
    }

    /**
     * @brief Assertions of the prerequisites followed by the assertions of this subject
     */
    [[nodiscard]] std::vector<Assertion const*> assertions() const
    {
      std::vector<Assertion const*> ret;
      for(auto const& prerequisite : m_prerequisites)
      {
        std::ranges::copy(prerequisite->assertions(), std::back_inserter(ret));
      }
      std::ranges::transform(m_assertions, std::back_inserter(ret), [](auto const& e){ return e.get(); });
      return ret;
    }

    /**
     * @brief Adds an assertion, replacing a previous assertion of the same type
     */
    void add_assertion(std::unique_ptr<Assertion> assertion)
    {
      Assertion const& ref = *assertion;
      std::erase_if(m_assertions, [&](auto const& e){ return typeid(*e) == typeid(ref); });
      m_assertions.push_back(std::move(assertion));
    }

    /**
     * @brief Finds the assertion of exactly type T
     *
     * @return T* The assertion or nullptr if there is none
     */
    template<typename T>
    [[nodiscard]] T* get_assertion() const
    {
      auto it = std::ranges::find_if(m_assertions, [](auto const& e){ return typeid(*e) == typeid(T); });
      return (it == m_assertions.end())? nullptr : static_cast<T*>(it->get());
    }

    /**
     * @brief Finds the most recently added assertion that is a T or derives from it
     *
     * @return T* The assertion or nullptr if there is none
     */
    template<typename T>
    [[nodiscard]] T* get_last_assertion() const
    {
      for(auto const& assertion : m_assertions | std::views::reverse)
      {
        if (auto ptr = dynamic_cast<T*>(assertion.get())) { return ptr; }
      }
      return nullptr;
    }

    template<typename T>
    [[nodiscard]] bool has_assertion() const
    {
      return get_assertion<T>() != nullptr;
    }

    template<typename T>
    void remove_assertions()
    {
      std::erase_if(m_assertions, [](auto const& e){ return typeid(*e) == typeid(T); });
    }

    void add_prerequisite(std::shared_ptr<Subject> subject)
    {
      m_prerequisites.push_back(std::move(subject));
    }

    [[nodiscard]] std::vector<std::shared_ptr<Subject>> const& prerequisites() const
    {
      return m_prerequisites;
    }

    /**
     * @brief Registers a handler created by this subject, the role context runs it with the
     * handlers declared by the role
     */
    void add_generated_handler(std::shared_ptr<Handler> handler)
    {
      m_generated_handlers.push_back(std::move(handler));
    }

    /**
     * @brief Handlers generated by this subject and by its prerequisites
     */
    [[nodiscard]] std::vector<std::shared_ptr<Handler>> generated_handlers() const
    {
      std::vector<std::shared_ptr<Handler>> ret;
      for(auto const& prerequisite : m_prerequisites)
      {
        std::ranges::copy(prerequisite->generated_handlers(), std::back_inserter(ret));
      }
      std::ranges::copy(m_generated_handlers, std::back_inserter(ret));
      return ret;
    }

    /**
     * @brief Overrides the default description of this subject
     */
    void set_description(std::string description)
    {
      m_description = std::move(description);
    }

    [[nodiscard]] std::string description() const
    {
      return m_description.value_or(describe());
    }

    /**
     * @brief Registers this subject as a trigger of the handler
     */
    Subject& listen(Handler& handler);

    /**
     * @brief Default description of the subject
     */
    [[nodiscard]] virtual std::string describe() const = 0;

    /**
     * @brief A new subject for the same resource, without assertions
     */
    [[nodiscard]] virtual std::shared_ptr<Subject> clone() const = 0;
};

/**
 * @brief Fluent interface shared by the concrete subjects
 *
 * @tparam Derived The concrete subject type
 */
template<typename Derived>
class SubjectBase : public Subject
{
  protected:
    Derived& self() { return static_cast<Derived&>(*this); }

  public:
    Derived& annotate(std::string description)
    {
      set_description(std::move(description));
      return self();
    }

    Derived& on_change(Handler& handler)
    {
      listen(handler);
      return self();
    }

    [[nodiscard]] std::shared_ptr<Derived> ptr()
    {
      return std::static_pointer_cast<Derived>(shared_from_this());
    }
};

} // namespace ns_engine

// Defines Subject::listen
#include "handler.hpp"

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
