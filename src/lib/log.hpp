/**
 * @file log.hpp
 * @author Ruan Formigoni
 * @brief Diagnostic logging of caerbannog
 *
 * Messages carry a level prefix (D::, I::, W::, E::, C::) and the call site. Every line goes to the
 * sink file when one is set, and to stderr when the level is enabled. The change report printed
 * while converging subjects is a separate channel, see report/report.hpp.
 *
 * The logger is thread_local. External commands are spawned with fork(), a pthread_atfork
 * handler points the child logger to /dev/null so both processes never share a sink.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <pthread.h>
#include <filesystem>
#include <iostream>
#include <fstream>
#include <print>
#include <ranges>
#include <unistd.h>

#include "../std/concept.hpp"
#include "../std/string.hpp"

/**
 * @namespace ns_log
 * @brief Leveled logging to stderr and to a sink file
 */
namespace ns_log
{

enum class Level : int
{
  CRITICAL,
  ERROR,
  WARN,
  INFO,
  DEBUG,
};

namespace
{

namespace fs = std::filesystem;

class Logger
{
  private:
    std::ofstream m_sink;
    Level m_level;
    // Process that created the logger, a forked child logs its own pid instead of the call site
    pid_t m_pid;
  public:
    Logger();
    Logger(Logger const&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger const&) = delete;
    Logger& operator=(Logger&&) = delete;
    void set_level(Level level) { m_level = level; }
    [[nodiscard]] Level get_level() const { return m_level; }
    [[nodiscard]] pid_t get_pid() const { return m_pid; }
    void set_sink_file(fs::path const& path_file_sink);
    [[nodiscard]] std::ofstream& get_sink_file() { return m_sink; }
    void flush() { if (m_sink) { m_sink.flush(); } }
};

thread_local Logger logger;

// Runs in the parent before fork(), so buffered output is not written twice
static void fork_handler_parent()
{
  std::cout.flush();
  std::cerr.flush();
  ::fflush(nullptr);
}

// Runs in the child after fork(), the pid is kept to detect the fork
void fork_handler_child()
{
  logger.set_sink_file("/dev/null");
}

inline Logger::Logger()
  : m_sink("/dev/null")
  , m_level(Level::CRITICAL)
  , m_pid(getpid())
{
  static thread_local bool registered = false;
  if (not registered)
  {
    pthread_atfork(fork_handler_parent, nullptr, fork_handler_child);
    registered = true;
  }
}

inline void Logger::set_sink_file(fs::path const& path_file_sink)
{
  if (char const* var = std::getenv("CBN_DEBUG"); var and std::string_view{var} == "1")
  {
    std::println(std::cerr, "D::Logger file: {}", path_file_sink.string());
  }
  m_sink = std::ofstream(path_file_sink, std::ios::out | std::ios::trunc);
  if (not m_sink.is_open())
  {
    std::println(std::cerr, "E::Could not open file '{}'", path_file_sink.string());
  }
}

} // namespace

/**
 * @brief Sets the most verbose level printed to stderr
 */
inline void set_level(Level level)
{
  logger.set_level(level);
}

[[nodiscard]] inline Level get_level()
{
  return logger.get_level();
}

/**
 * @brief Sets the file that receives every message, whatever its level
 */
inline void set_sink_file(fs::path const& path_file_sink)
{
  logger.set_sink_file(path_file_sink);
}

/**
 * @brief Call site of a message, the file name without its directories and the line
 */
struct Location
{
  std::string_view m_str_file;
  uint32_t m_line;

  consteval Location(char const* str_file = __builtin_FILE(), uint32_t line = __builtin_LINE())
    : m_str_file(str_file)
    , m_line(line)
  {
    m_str_file = m_str_file.substr(m_str_file.find_last_of("/")+1);
  }

  constexpr auto get() const
  {
    return std::format("{}::{}", m_str_file, m_line);
  }
};

// std::make_format_args only takes lvalues
template<typename... Ts>
std::string vformat(std::string_view fmt, Ts&&... ts)
{
  return std::vformat(fmt, std::make_format_args(ts...));
}

/**
 * @brief Writes the messages of one level
 *
 * A line is `PREFIX::file::line::message`, or `PREFIX::pid::message` in a forked child. Newlines
 * of the message are dropped so every line carries a prefix.
 */
class Writer
{
  private:
    Location m_loc;
    Level m_level;
    std::string_view m_prefix;

  public:
    constexpr Writer(Location const& location, Level level, std::string_view prefix)
      : m_loc(location)
      , m_level(level)
      , m_prefix(prefix)
    {}

    template<ns_concept::StringRepresentable T, typename... Args>
    requires ( ( ns_concept::StringRepresentable<Args> or ns_concept::Iterable<Args> ) and ... )
    void operator()(T&& format, Args&&... args)
    {
      pid_t pid = getpid();
      std::string line = (pid == logger.get_pid())?
          std::format("{}::{}::", m_prefix, m_loc.get())
        : std::format("{}::{}::", m_prefix, pid);
      line += vformat(ns_string::to_string(format), ns_string::to_string(args)...)
        | std::views::filter([](char c){ return c != '\n'; })
        | std::ranges::to<std::string>();
      line += '\n';
      if (std::ofstream& sink = logger.get_sink_file(); sink.is_open())
      {
        sink << line;
      }
      if (logger.get_level() >= m_level)
      {
        std::cerr << line;
      }
      logger.flush();
    }
};

/**
 * @def logger(fmt, ...)
 * @brief Logs a message at the level of its prefix, with the call site
 *
 * The prefix is one of `D::` debug, `I::` info, `W::` warning, `E::` error, `C::` critical, or
 * `Q::` for a message that is discarded. The rest is a std::format string.
 *
 * @code
 * logger("I::Applying target {}", name);
 * logger("D::Packages to install: {}", names);
 * @endcode
 */
#define logger(fmt, ...) ::ns_log::impl_log<fmt>(::ns_log::Location{})(__VA_ARGS__)

/**
 * @def logger_loc(loc, fmt, ...)
 * @brief Same as logger, with the call site given by the caller
 */
#define logger_loc(loc, fmt, ...) ::ns_log::impl_log<fmt>(loc)(__VA_ARGS__)

template<ns_string::static_string str>
constexpr decltype(auto) impl_log(Location loc)
{
  return [=]<typename... Ts>(Ts&&... ts)
  {
    constexpr std::string_view sv = str.data;
    static_assert(sv.starts_with("D::")
      or sv.starts_with("I::")
      or sv.starts_with("W::")
      or sv.starts_with("E::")
      or sv.starts_with("C::")
      or sv.starts_with("Q::")
    );
    if constexpr (sv.starts_with("Q::")) { return; }
    else if constexpr (sv.starts_with("I::")) { Writer{loc, Level::INFO, "I"}(sv.substr(3), std::forward<Ts>(ts)...); }
    else if constexpr (sv.starts_with("W::")) { Writer{loc, Level::WARN, "W"}(sv.substr(3), std::forward<Ts>(ts)...); }
    else if constexpr (sv.starts_with("E::")) { Writer{loc, Level::ERROR, "E"}(sv.substr(3), std::forward<Ts>(ts)...); }
    else if constexpr (sv.starts_with("C::")) { Writer{loc, Level::CRITICAL, "C"}(sv.substr(3), std::forward<Ts>(ts)...); }
    else { Writer{loc, Level::DEBUG, "D"}(sv.substr(3), std::forward<Ts>(ts)...); }
  };
}

} // namespace ns_log

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
