/**
 * @file string.hpp
 * @author Ruan Formigoni
 * @brief String helpers
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <format>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

#include "concept.hpp"

namespace ns_string
{

template<size_t N>
struct static_string
{
  char data[N];
  // Functions
  constexpr static_string(const char (&str)[N])
  {
    std::copy_n(str, N, data);
  }
  constexpr static_string() = default;
  constexpr operator const char*() const { return data; }
  constexpr operator std::string_view() const { return std::string_view(data, N - 1); }
  constexpr size_t size() const { return N - 1; }
};

/**
 * @brief Converts a type to a string
 *
 * @tparam T A string representable type
 * @param t The value to convert to a string
 * @return std::string The type string representation
 */
template<typename T>
[[nodiscard]] inline std::string to_string(T&& t) noexcept
{
  if constexpr ( ns_concept::StringConvertible<T> )
  {
    return t;
  } // if
  else if constexpr ( ns_concept::StringConstructible<T> )
  {
    return std::string{t};
  } // else if
  else if constexpr ( ns_concept::Numeric<T> )
  {
    return std::to_string(t);
  } // else if
  else if constexpr ( ns_concept::StreamInsertable<T> )
  {
    std::stringstream ss;
    ss << t;
    return ss.str();
  } // else if
  else if constexpr ( ns_concept::IterableConst<T> )
  {
    std::stringstream ss;
    ss << '[';
    std::for_each(t.cbegin(), t.cend(), [&](auto&& e){ ss << std::format("'{}',", to_string(e)); });
    ss << ']';
    return ss.str();
  } // else if
  else
  {
    static_assert(false, "Cannot convert type to string");
  }
}

/**
 * @brief Converts a container into a string if it has string convertible elements
 *
 * @tparam T A container type
 * @param t The container to convert to a string
 * @param sep The separator to use between elements of the container
 * @return std::string The result of the conversion operation
 */
template<typename T>
[[nodiscard]] std::string from_container(T&& t, std::optional<std::string_view> sep = std::nullopt) noexcept
{
  std::stringstream ret;
  for( auto it = t.begin(); it != t.end(); ++it )
  {
    ret << *it;
    if ( std::next(it) != t.end() and sep ) { ret << *sep; }
  } // if
  return ret.str();
}

/**
 * @brief Removes leading and trailing whitespace
 */
[[nodiscard]] inline std::string trim(std::string_view str) noexcept
{
  auto is_space = [](unsigned char c){ return std::isspace(c); };
  auto begin = std::ranges::find_if_not(str, is_space);
  auto end = std::ranges::find_if_not(str | std::views::reverse, is_space).base();
  return (begin < end)? std::string(begin, end) : std::string{};
}

/**
 * @brief Removes every whitespace character from the string
 */
[[nodiscard]] inline std::string remove_whitespace(std::string_view str) noexcept
{
  std::string ret;
  std::ranges::copy_if(str, std::back_inserter(ret), [](unsigned char c){ return not std::isspace(c); });
  return ret;
}

/**
 * @brief Lowercase copy of an ascii string
 */
[[nodiscard]] inline std::string to_lower(std::string_view str) noexcept
{
  std::string ret{str};
  std::ranges::transform(ret, ret.begin(), [](unsigned char c){ return std::tolower(c); });
  return ret;
}

/**
 * @brief Splits a string in lines, keeping the line terminators
 *
 * The last line has no terminator when the input does not end with one.
 */
[[nodiscard]] inline std::vector<std::string> split_lines(std::string_view str) noexcept
{
  std::vector<std::string> lines;
  size_t begin = 0;
  while (begin < str.size())
  {
    size_t end = str.find('\n', begin);
    if (end == std::string_view::npos)
    {
      lines.emplace_back(str.substr(begin));
      break;
    }
    lines.emplace_back(str.substr(begin, end - begin + 1));
    begin = end + 1;
  }
  return lines;
}

/**
 * @brief Splits a string on a delimiter, empty fields included
 */
[[nodiscard]] inline std::vector<std::string> split(std::string_view str, char delimiter) noexcept
{
  std::vector<std::string> tokens;
  size_t begin = 0;
  for (size_t end; (end = str.find(delimiter, begin)) != std::string_view::npos; begin = end + 1)
  {
    tokens.emplace_back(str.substr(begin, end - begin));
  }
  tokens.emplace_back(str.substr(begin));
  return tokens;
}

/**
 * @brief Breaks a string in chunks of at most width characters
 */
[[nodiscard]] inline std::vector<std::string> chunks(std::string_view str, size_t width) noexcept
{
  std::vector<std::string> ret;
  for (size_t i = 0; i < str.size(); i += width)
  {
    ret.emplace_back(str.substr(i, width));
  }
  return ret;
}

/**
 * @brief Checks if a byte sequence is well-formed utf-8
 */
[[nodiscard]] inline bool is_utf8(std::string_view bytes) noexcept
{
  size_t i = 0;
  while (i < bytes.size())
  {
    unsigned char c = bytes[i];
    size_t len = (c < 0x80)? 1
      : ((c >> 5) == 0x06)? 2
      : ((c >> 4) == 0x0e)? 3
      : ((c >> 3) == 0x1e)? 4
      : 0;
    if (len == 0 or i + len > bytes.size()) { return false; }
    for (size_t j = 1; j < len; ++j)
    {
      if ((static_cast<unsigned char>(bytes[i+j]) >> 6) != 0x02) { return false; }
    }
    i += len;
  }
  return true;
}

} // namespace ns_string

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
