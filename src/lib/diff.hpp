/**
 * @file diff.hpp
 * @author Ruan Formigoni
 * @brief Line based unified diff
 *
 * The diff is a longest common subsequence of the lines that differ after removing the common
 * prefix and suffix, found with Hirschberg's algorithm in linear space. Past MAX_DIFF_WORK
 * comparisons the lines are not aligned, every old line is removed and every new line added.
 * Hunks are built like `diff -u`, with a default context of three lines.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../std/string.hpp"

/**
 * @namespace ns_diff
 * @brief Unified diff of two texts
 */
namespace ns_diff
{

enum class Op
{
  Equal,
  Remove,
  Add,
};

struct Edit
{
  Op op;
  std::string line;
};

/**
 * @brief Formats a hunk range, lines are numbered from one and an empty range points before
 * its position
 */
[[nodiscard]] inline std::string format_range(size_t start, size_t length)
{
  if (length == 1) { return std::to_string(start + 1); }
  size_t begin = (length == 0)? start : start + 1;
  return std::format("{},{}", begin, length);
}

// Comparisons above which lines are no longer aligned
constexpr size_t MAX_DIFF_WORK = size_t{1} << 26;

namespace
{

using Ids = std::vector<uint32_t>;

/**
 * @brief Length of the longest common subsequence of a[a_begin,a_end) and each prefix of
 * b[b_begin,b_end), or each suffix when walking backwards
 */
[[nodiscard]] inline Ids lcs_lengths(Ids const& a, size_t a_begin, size_t a_end
  , Ids const& b, size_t b_begin, size_t b_end
  , bool backwards)
{
  size_t m = b_end - b_begin;
  Ids prev(m + 1, 0);
  Ids curr(m + 1, 0);
  for (size_t i = 0; i < a_end - a_begin; ++i)
  {
    uint32_t x = backwards? a[a_end - 1 - i] : a[a_begin + i];
    for (size_t j = 0; j < m; ++j)
    {
      uint32_t y = backwards? b[b_end - 1 - j] : b[b_begin + j];
      curr[j+1] = (x == y)? prev[j] + 1 : std::max(prev[j+1], curr[j]);
    }
    std::swap(prev, curr);
  }
  return prev;
}

/**
 * @brief Aligns a[a_begin,a_end) with b[b_begin,b_end), appending one operation per line
 */
inline void align(Ids const& a, size_t a_begin, size_t a_end
  , Ids const& b, size_t b_begin, size_t b_end
  , std::vector<Op>& ops)
{
  if (a_begin == a_end)
  {
    ops.insert(ops.end(), b_end - b_begin, Op::Add);
    return;
  }
  if (b_begin == b_end)
  {
    ops.insert(ops.end(), a_end - a_begin, Op::Remove);
    return;
  }
  if (a_end - a_begin == 1)
  {
    auto it = std::find(b.begin() + b_begin, b.begin() + b_end, a[a_begin]);
    if (it == b.begin() + b_end)
    {
      ops.push_back(Op::Remove);
      ops.insert(ops.end(), b_end - b_begin, Op::Add);
      return;
    }
    size_t j = static_cast<size_t>(it - b.begin());
    ops.insert(ops.end(), j - b_begin, Op::Add);
    ops.push_back(Op::Equal);
    ops.insert(ops.end(), b_end - j - 1, Op::Add);
    return;
  }
  // Split b where the halves of a share the most lines
  size_t mid = a_begin + (a_end - a_begin) / 2;
  size_t m = b_end - b_begin;
  Ids forward = lcs_lengths(a, a_begin, mid, b, b_begin, b_end, false);
  Ids backward = lcs_lengths(a, mid, a_end, b, b_begin, b_end, true);
  size_t split = 0;
  for (size_t k = 1; k <= m; ++k)
  {
    if (forward[k] + backward[m-k] > forward[split] + backward[m-split]) { split = k; }
  }
  align(a, a_begin, mid, b, b_begin, b_begin + split, ops);
  align(a, mid, a_end, b, b_begin + split, b_end, ops);
}

} // namespace

/**
 * @brief Computes the edit script that transforms one list of lines into another
 *
 * Within a run of changed lines, removals come before additions.
 *
 * @param from The original lines
 * @param to The new lines
 * @return std::vector<Edit> Every line of both inputs, tagged with how it changed
 */
[[nodiscard]] inline std::vector<Edit> edits(std::vector<std::string> const& from
  , std::vector<std::string> const& to)
{
  std::vector<Edit> ret;
  // Common prefix and suffix
  size_t prefix = 0;
  while (prefix < from.size() and prefix < to.size() and from[prefix] == to[prefix]) { ++prefix; }
  size_t suffix = 0;
  while (suffix < from.size() - prefix and suffix < to.size() - prefix
    and from[from.size() - suffix - 1] == to[to.size() - suffix - 1]) { ++suffix; }
  for (size_t i = 0; i < prefix; ++i) { ret.push_back(Edit{Op::Equal, from[i]}); }
  // Align the remaining lines, compared by id
  size_t n = from.size() - prefix - suffix;
  size_t m = to.size() - prefix - suffix;
  std::vector<Op> ops;
  if (n * m > MAX_DIFF_WORK)
  {
    ops.insert(ops.end(), n, Op::Remove);
    ops.insert(ops.end(), m, Op::Add);
  }
  else
  {
    std::unordered_map<std::string_view, uint32_t> ids;
    auto f_id = [&](std::string const& line)
    {
      return ids.try_emplace(line, static_cast<uint32_t>(ids.size())).first->second;
    };
    Ids a, b;
    for (size_t i = 0; i < n; ++i) { a.push_back(f_id(from[prefix + i])); }
    for (size_t j = 0; j < m; ++j) { b.push_back(f_id(to[prefix + j])); }
    align(a, 0, n, b, 0, m, ops);
  }
  size_t i = prefix, j = prefix;
  for (Op op : ops)
  {
    switch (op)
    {
      case Op::Equal: ret.push_back(Edit{Op::Equal, from[i]}); ++i; ++j; break;
      case Op::Remove: ret.push_back(Edit{Op::Remove, from[i]}); ++i; break;
      case Op::Add: ret.push_back(Edit{Op::Add, to[j]}); ++j; break;
    }
  }
  for (auto it = ret.begin() + prefix; it != ret.end();)
  {
    auto end = std::find_if(it, ret.end(), [](Edit const& e){ return e.op == Op::Equal; });
    std::stable_partition(it, end, [](Edit const& e){ return e.op == Op::Remove; });
    it = (end == ret.end())? end : end + 1;
  }
  for (size_t k = from.size() - suffix; k < from.size(); ++k) { ret.push_back(Edit{Op::Equal, from[k]}); }
  return ret;
}

/**
 * @brief Unified diff of two texts
 *
 * Lines keep their terminators. The output starts with the `--- ` and `+++ ` file headers
 * followed by the hunks, each line prefixed with ' ', '-', '+' or '@'. Equal texts produce an
 * empty diff.
 *
 * @param from The original text
 * @param to The new text
 * @param context Number of unchanged lines shown around each change
 * @return std::vector<std::string> The lines of the diff
 */
[[nodiscard]] inline std::vector<std::string> unified(std::string_view from
  , std::string_view to
  , size_t context = 3)
{
  std::vector<Edit> script = edits(ns_string::split_lines(from), ns_string::split_lines(to));
  // Position of each edit in both texts
  std::vector<size_t> pos_from(script.size() + 1, 0);
  std::vector<size_t> pos_to(script.size() + 1, 0);
  std::vector<size_t> changes;
  for (size_t k = 0; k < script.size(); ++k)
  {
    pos_from[k+1] = pos_from[k] + (script[k].op != Op::Add);
    pos_to[k+1] = pos_to[k] + (script[k].op != Op::Remove);
    if (script[k].op != Op::Equal) { changes.push_back(k); }
  }
  std::vector<std::string> ret;
  if (changes.empty()) { return ret; }
  ret.push_back("--- \n");
  ret.push_back("+++ \n");
  for (size_t c = 0; c < changes.size();)
  {
    // Group changes separated by at most two contexts of equal lines
    size_t last = changes[c];
    size_t d = c + 1;
    while (d < changes.size() and changes[d] - last - 1 <= 2 * context) { last = changes[d++]; }
    size_t begin = (changes[c] > context)? changes[c] - context : 0;
    size_t end = std::min(script.size(), last + 1 + context);
    ret.push_back(std::format("@@ -{} +{} @@\n"
      , format_range(pos_from[begin], pos_from[end] - pos_from[begin])
      , format_range(pos_to[begin], pos_to[end] - pos_to[begin])
    ));
    for (size_t k = begin; k < end; ++k)
    {
      char tag = (script[k].op == Op::Equal)? ' ' : (script[k].op == Op::Remove)? '-' : '+';
      ret.push_back(tag + script[k].line);
    }
    c = d;
  }
  return ret;
}

} // namespace ns_diff

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
