/**
 * @file test.hpp
 * @author Ruan Formigoni
 * @brief Test utilities for caerbannog unit tests
 *
 * Provides temporary directories and a run context of the current user, so subjects can be
 * converged without touching the system.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

#include "../../src/db/context.hpp"
#include "../../src/lib/user.hpp"
#include "../../src/report/report.hpp"
#include "../../src/std/expected.hpp"

namespace fs = std::filesystem;

/**
 * @namespace ns_test
 * @brief Test utilities for caerbannog testing
 */
namespace ns_test
{

/**
 * @brief A unique directory below the temporary directory, removed with its content on scope exit
 *
 * @code
 * ns_test::TempDir tmp;
 * fs::path path_file = tmp.path() / "hosts";
 * @endcode
 */
class TempDir
{
  private:
    fs::path m_path;
  public:
    TempDir()
    {
      std::random_device device;
      auto unique_suffix = std::format("{}_{}"
        , std::chrono::system_clock::now().time_since_epoch().count()
        , device()
      );
      m_path = fs::temp_directory_path() / ("caerbannog_test_" + unique_suffix);
      fs::create_directories(m_path);
    }
    ~TempDir()
    {
      std::error_code ec;
      fs::remove_all(m_path, ec);
    }
    TempDir(TempDir const&) = delete;
    TempDir& operator=(TempDir const&) = delete;

    [[nodiscard]] fs::path const& path() const { return m_path; }
};

/**
 * @brief Writes a file, creating its parent directories
 */
inline void write(fs::path const& path_file, std::string_view content)
{
  fs::create_directories(path_file.parent_path());
  std::ofstream file(path_file, std::ios::binary | std::ios::trunc);
  file << content;
}

/**
 * @brief Reads a whole file
 */
inline std::string read(fs::path const& path_file)
{
  std::ifstream file(path_file, std::ios::binary);
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

/**
 * @brief A context of the current user rooted at the given project directory
 *
 * Elevation is not allowed, so tests fail instead of calling sudo.
 */
inline ns_db::ns_context::Context context(fs::path const& path_dir_root, std::string const& target = "test")
{
  ns_db::ns_context::Context context;
  context.set_root(path_dir_root);
  context.set_target(target);
  context.set_elevation(ns_elevate::Elevation::NONE);
  context.set_host(ns_db::ns_context::Host
  {
    .os = "posix",
    .system = "Linux",
    .user = ns_user::current().value(),
  });
  context.set_env(ns_env::snapshot());
  return context;
}

/**
 * @brief A report written to a string, without colors
 */
class Report
{
  private:
    std::ostringstream m_stream;
    ns_report::Log m_log;
  public:
    Report()
      : m_stream()
      , m_log(m_stream, false)
    {}

    [[nodiscard]] ns_report::Log& log() { return m_log; }
    [[nodiscard]] std::string str() const { return m_stream.str(); }
};

} // namespace ns_test

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
