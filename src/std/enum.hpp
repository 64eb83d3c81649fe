/**
 * @file enum.hpp
 * @author Ruan Formigoni
 * @brief Enumerations with string conversion
 *
 * The ENUM macro declares a class wrapping a plain enumeration. Every enumeration gets an
 * implicit NONE entry which is also the default value. Values convert to and from their names,
 * parsing is case-insensitive.
 *
 * @code
 * ENUM(Mode, MODIFY, PRETEND);
 * Mode mode = Mode::PRETEND;
 * std::string name = mode;                    // "PRETEND"
 * Mode parsed = Mode::from_string("modify").value();
 * @endcode
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "string.hpp"
#include "expected.hpp"
#include "../macro.hpp"

namespace ns_enum
{

/**
 * @brief Splits the stringified enumerator list of the ENUM macro
 *
 * @param str The enumerators as written in the macro, separated by commas
 * @return std::vector<std::string> The enumerator names in declaration order, NONE last
 */
[[nodiscard]] inline std::vector<std::string> names(std::string_view str)
{
  std::vector<std::string> ret;
  std::ranges::transform(ns_string::split(str, ','), std::back_inserter(ret), ns_string::trim);
  ret.push_back("NONE");
  return ret;
}

/**
 * @brief Number of entries in the stringified enumerator list, plus NONE
 */
[[nodiscard]] constexpr size_t count(std::string_view str)
{
  return std::ranges::count(str, ',') + 2;
}

} // namespace ns_enum

#define ENUM(name, ...)                                                             \
class name                                                                          \
{                                                                                   \
  public:                                                                           \
    enum enum_t { __VA_ARGS__, NONE };                                              \
    static constexpr size_t size = ns_enum::count(#__VA_ARGS__);                    \
  private:                                                                          \
    enum_t m_value;                                                                 \
    static std::vector<std::string> const& names()                                  \
    {                                                                               \
      static std::vector<std::string> const m_names = ns_enum::names(#__VA_ARGS__); \
      return m_names;                                                               \
    }                                                                               \
  public:                                                                           \
    name() : m_value(NONE) {}                                                       \
    name(enum_t value) : m_value(value) {}                                          \
    enum_t get() const { return m_value; }                                          \
    operator enum_t() const { return m_value; }                                     \
    operator std::string() const { return names().at(static_cast<size_t>(m_value)); } \
    std::string lower() const { return ns_string::to_lower(std::string(*this)); }   \
    static Value<name> from_string(std::string_view str)                            \
    {                                                                               \
      std::string upper{str};                                                       \
      std::ranges::transform(upper, upper.begin(), ::toupper);                      \
      auto it = std::ranges::find(names(), upper);                                  \
      return_if(it == names().end() or *it == "NONE"                                \
        , Error("D::Invalid value '{}' for {}", str, #name)                         \
      );                                                                            \
      return name(static_cast<enum_t>(std::distance(names().begin(), it)));         \
    }                                                                               \
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
