/**
 * @file concept.hpp
 * @author Ruan Formigoni
 * @brief Concepts shared by the string helpers, the logger and the subprocess builder
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <string>
#include <type_traits>
#include <vector>
#include <optional>
#include <ranges>
#include <deque>
#include <list>
#include <set>
#include <map>
#include <ostream>

namespace ns_concept
{

// Templates {{{

template<typename T, template<typename...> typename U>
inline constexpr bool is_instance_of_v = std::false_type {};

template<template<typename...> typename U, typename... Args>
inline constexpr bool is_instance_of_v<U<Args...>,U> = std::true_type {};

/**
 * @brief True if T, without references and qualifiers, is a specialization of U
 */
template<typename T, template<typename...> typename U>
concept IsInstanceOf = is_instance_of_v<std::remove_cvref_t<T>, U>;

static_assert( IsInstanceOf<std::vector<int> const&, std::vector>);
static_assert(!IsInstanceOf<std::string, std::vector>);
static_assert( IsInstanceOf<std::optional<int>, std::optional>);

// }}}

// Ranges {{{

template<typename T>
concept Iterable = std::ranges::range<T>;

template<typename T>
concept IterableConst = requires(std::remove_cvref_t<T> const& t)
{
  { t.cbegin() } -> std::input_or_output_iterator;
  { t.cend() };
};

static_assert( IterableConst<std::vector<int>>);
static_assert( IterableConst<std::string>);
static_assert(!IterableConst<int>);

template <typename T>
concept IsVector = IsInstanceOf<T, std::vector>;

// Containers printed as a list by ns_string::to_string
template <typename T>
concept Container = IsInstanceOf<T, std::vector>
  or IsInstanceOf<T, std::deque>
  or IsInstanceOf<T, std::list>
  or IsInstanceOf<T, std::set>
  or IsInstanceOf<T, std::map>;

static_assert( Container<std::vector<std::string>>);
static_assert( Container<std::set<int>>);
static_assert(!Container<std::string>);

// }}}

// Text {{{

template<typename T>
concept StringConvertible = std::is_convertible_v<std::remove_cvref_t<T>, std::string>;

template<typename T>
concept StringConstructible = std::constructible_from<std::string, std::remove_cvref_t<T>>;

template<typename T>
concept Numeric = std::integral<std::remove_cvref_t<T>> or std::floating_point<std::remove_cvref_t<T>>;

template<typename T>
concept StreamInsertable = requires(T t, std::ostream& os)
{
  { os << t } -> std::same_as<std::ostream&>;
};

/**
 * @brief Values the logger and the subprocess builder accept as text
 */
template<typename T>
concept StringRepresentable = StringConvertible<T>
  or StringConstructible<T>
  or Numeric<T>
  or StreamInsertable<T>;

static_assert( StringConvertible<char const*>);
static_assert(!StringConvertible<int>);
static_assert( StringRepresentable<int>);
static_assert( StringRepresentable<std::string>);
static_assert(!StringRepresentable<std::vector<int>>);

// }}}

} // namespace ns_concept

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
