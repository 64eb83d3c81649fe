/**
 * @file filesystem.hpp
 * @author Ruan Formigoni
 * @brief Filesystem helpers
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>
#include <ranges>
#include <string>
#include <filesystem>
#include <sys/stat.h>

#include "expected.hpp"
#include "string.hpp"

/**
 * @namespace ns_fs
 * @brief Filesystem utilities wrapping std::filesystem and the stat family
 */
namespace ns_fs
{

namespace fs = std::filesystem;

/**
 * @brief Reads the whole content of a file as raw bytes
 *
 * @param path_file Path to the file to read
 * @return Value<std::string> The bytes of the file or the respective error
 */
[[nodiscard]] inline Value<std::string> read_file(fs::path const& path_file)
{
  std::ifstream file(path_file, std::ios::in | std::ios::binary);
  return_if(not file.is_open(), Error("E::Could not open '{}' for reading", path_file));
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

/**
 * @brief Replaces the content of a file with the given bytes
 *
 * @param path_file Path to the file to write
 * @param bytes The new content
 * @return Value<void> Nothing on success, or the respective error
 */
[[nodiscard]] inline Value<void> write_file(fs::path const& path_file, std::string_view bytes)
{
  std::ofstream file(path_file, std::ios::out | std::ios::binary | std::ios::trunc);
  return_if(not file.is_open(), Error("E::Could not open '{}' for writing", path_file));
  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return_if(not file.good(), Error("E::Could not write to '{}'", path_file));
  return {};
}

/**
 * @brief Lists the entries of a directory sorted by file name
 *
 * @param path_dir Path to the directory to list
 * @return Value<std::vector<fs::path>> The sorted entries or the respective error
 */
[[nodiscard]] inline Value<std::vector<fs::path>> sorted_entries(fs::path const& path_dir)
{
  std::error_code ec;
  auto it = fs::directory_iterator(path_dir, ec);
  return_if(ec, Error("E::Could not list '{}': {}", path_dir, ec.message()));
  std::vector<fs::path> entries = std::ranges::subrange(it, fs::directory_iterator{})
    | std::views::transform([](auto&& e){ return e.path(); })
    | std::ranges::to<std::vector<fs::path>>();
  std::ranges::sort(entries, {}, [](fs::path const& e){ return e.filename(); });
  return entries;
}

/**
 * @brief Queries a path without following symbolic links
 *
 * @param path The path to query
 * @return Value<struct stat> The status of the path, or the error reported by lstat(2)
 */
[[nodiscard]] inline Value<struct stat> lstat(fs::path const& path)
{
  struct stat st{};
  return_if(::lstat(path.c_str(), &st) < 0, Error("D::Could not stat '{}': {}", path, strerror(errno)));
  return st;
}

/**
 * @brief Checks if anything exists at the path, dangling symbolic links included
 */
[[nodiscard]] inline bool lexists(fs::path const& path) noexcept
{
  struct stat st{};
  return ::lstat(path.c_str(), &st) == 0;
}

} // namespace ns_fs

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
