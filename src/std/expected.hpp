/**
 * @file expected.hpp
 * @author Ruan Formigoni
 * @brief Error handling on top of std::expected
 *
 * Every fallible operation of caerbannog returns a Value. Drift found by an assertion is not an
 * error, it is reported as a change. Errors are reserved for failed preconditions, unsupported
 * system objects, failed external commands and malformed input.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <expected>
#include <string>
#include <array>
#include <type_traits>

#include "concept.hpp"
#include "string.hpp"
#include "../lib/log.hpp"
#include "../macro.hpp"

/**
 * @brief A result or the text of the error that prevented it
 *
 * Inherits everything from std::expected and adds the logging helpers used across the engine,
 * through the discard and forward macros.
 */
template<typename T, typename E = std::string>
struct Value : std::expected<T, E>
{
  using std::expected<T, E>::expected;

private:
  constexpr static std::array<const char[6], 5> const m_prefix{"D::{}", "I::{}", "W::{}", "E::{}", "C::{}"};

  // Index of the level of fmt in m_prefix
  template<ns_string::static_string fmt>
  constexpr static int select_prefix()
  {
    constexpr std::string_view sv{fmt.data};
    return sv.starts_with("D")? 0
      : sv.starts_with("I")? 1
      : sv.starts_with("W")? 2
      : sv.starts_with("E")? 3
      : 4;
  }

public:
  /**
   * @brief Logs the error, if any, with the level of fmt and drops it
   */
  template<ns_string::static_string fmt = "Q::", typename... Args>
  void discard_impl(ns_log::Location const& loc, Args&&... args)
  {
    if (not this->has_value())
    {
      logger_loc(loc, m_prefix[select_prefix<fmt>()], this->error());
      logger_loc(loc, fmt.data, std::forward<Args>(args)...);
    }
  }

  /**
   * @brief Logs the error, if any, with the level of fmt and passes the Value on
   */
  template<ns_string::static_string fmt = "Q::", typename... Args>
  Value<T,E> forward_impl(ns_log::Location const& loc, Args&&... args)
  {
    if (not this->has_value())
    {
      logger_loc(loc, m_prefix[select_prefix<fmt>()], this->error());
      logger_loc(loc, fmt.data, std::forward<Args>(args)...);
      return std::unexpected(this->error());
    }
    return Value<T,E>(std::move(this->value()));
  }
};

// Lets Pop return an unexpected of any error type
constexpr auto __expected_fn = [](auto&& e) { return e; };

// Expands to expr only when no variadic argument follows
#define NOPT(expr, ...) NOPT_IDENTITY(__VA_OPT__(NOPT_EAT) (expr))
#define NOPT_IDENTITY(...) __VA_ARGS__
#define NOPT_EAT(...)

/**
 * @brief Unwraps a Value or returns its error from the enclosing function
 *
 * The optional message is logged with the error, the level comes from its prefix.
 *
 * @code
 * std::string content = Pop(ns_fs::read_file(path_file), "E::Could not read '{}'", path_file);
 * @endcode
 *
 * A GNU statement expression, it cannot be an operand of the conditional operator.
 */
#define Pop(expr,...)                                                         \
({                                                                            \
  auto __expected_ret = (expr);                                               \
  if (!__expected_ret)                                                        \
  {                                                                           \
    NOPT(logger("D::{}", __expected_ret.error()) __VA_OPT__(,) __VA_ARGS__);  \
    __VA_OPT__(logger(__VA_ARGS__));                                          \
    return __expected_fn(std::unexpected(std::move(__expected_ret).error())); \
  }                                                                           \
  std::move(__expected_ret).value();                                          \
})

// value.discard("W::Could not flush cache")
#define discard(fmt,...) discard_impl<fmt>(ns_log::Location() __VA_OPT__(,) __VA_ARGS__)

// return value.forward("E::Could not install packages")
#define forward(fmt,...) forward_impl<fmt>(ns_log::Location() __VA_OPT__(,) __VA_ARGS__)

/**
 * @brief Runs f and turns a thrown exception into an error
 */
template<typename Fn>
auto __except_impl(ns_log::Location const& loc, Fn&& f) -> Value<std::invoke_result_t<Fn>>
  requires (not ns_concept::IsInstanceOf<std::invoke_result_t<Fn>, Value>)
  and (not ns_concept::IsInstanceOf<std::invoke_result_t<Fn>, std::expected>)
{
  try
  {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>)
    {
      f();
      return {};
    }
    else
    {
      return f();
    }
  }
  catch (std::exception const& e)
  {
    logger_loc(loc, "E::{}::Exception was thrown", e.what());
    return std::unexpected(e.what());
  }
  catch (...)
  {
    logger_loc(loc, "E::Unknown exception was thrown");
    return std::unexpected("Unknown exception was thrown");
  }
}

/**
 * @brief Same as above for a callable that already returns a Value, e.g. the logic of a role
 */
template<typename Fn>
auto __except_impl(ns_log::Location const& loc, Fn&& f) -> std::invoke_result_t<Fn>
  requires ns_concept::IsInstanceOf<std::invoke_result_t<Fn>, Value>
{
  try
  {
    return f();
  }
  catch (std::exception const& e)
  {
    logger_loc(loc, "E::{}::Exception was thrown", e.what());
    return std::unexpected(e.what());
  }
  catch (...)
  {
    logger_loc(loc, "E::Unknown exception was thrown");
    return std::unexpected("Unknown exception was thrown");
  }
}

// Evaluates expr, an exception or an error returns from the enclosing function
#define Try(expr,...) Pop(__except_impl(::ns_log::Location(), [&]{ return (expr); }), __VA_ARGS__)

// Evaluates expr into a Value, an exception becomes its error
#define Catch(expr) (__except_impl(::ns_log::Location(), [&]{ return (expr); }))

/**
 * @brief Logs a message and makes it the error of a Value
 *
 * The level prefix is stripped from the error text.
 *
 * @code
 * return_if(sections.size() != 7, Error("E::Unknown secret format"));
 * @endcode
 */
#define Error(fmt,...)                                 \
({                                                     \
  logger(fmt __VA_OPT__(,) __VA_ARGS__);               \
  [&](auto&&... __fmt_args)                            \
  {                                                    \
    if constexpr (sizeof...(__fmt_args) > 0)           \
    {                                                  \
      return std::unexpected(                          \
          std::format(std::string_view(fmt).substr(3)  \
        , ns_string::to_string(__fmt_args)...)         \
      );                                               \
    }                                                  \
    else                                               \
    {                                                  \
      return std::unexpected(                          \
        std::format(std::string_view(fmt).substr(3))   \
      );                                               \
    }                                                  \
  }(__VA_ARGS__);                                      \
})

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
