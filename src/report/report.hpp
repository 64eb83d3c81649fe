/**
 * @file report.hpp
 * @author Ruan Formigoni
 * @brief Indented report of subjects, assertions and changes
 *
 * The report is the user facing output of a run. Each subject is printed on its own line, its
 * assertions below it with a status marker and the details of every change below the assertion:
 *
 * ```
 * [*]   /etc/hosts
 *         ✓ is file
 *         ⟳ has content
 *             content changed
 *             + 127.0.0.1 localhost
 * ```
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>

/**
 * @namespace ns_report
 * @brief Change report printed while converging subjects
 */
namespace ns_report
{

namespace ns_ansi
{

constexpr std::string_view fg_red = "\033[31m";
constexpr std::string_view fg_green = "\033[32m";
constexpr std::string_view fg_yellow = "\033[33m";
constexpr std::string_view fg_blue = "\033[34m";
constexpr std::string_view fg_cyan_bold = "\033[1;36m";
constexpr std::string_view fg_bright_black = "\033[90m";
constexpr std::string_view bg_red = "\033[41m";
constexpr std::string_view reset = "\033[0m";

} // namespace ns_ansi

class Log
{
  protected:
    std::reference_wrapper<std::ostream> m_os;
    bool m_color;
    int m_depth;

    [[nodiscard]] std::string indent() const
    {
      return std::string(static_cast<size_t>(m_depth) * 2, ' ');
    }

    [[nodiscard]] std::string paint(std::string_view color, std::string_view msg) const
    {
      return m_color? std::format("{}{}{}", color, msg, ns_ansi::reset) : std::string{msg};
    }

  public:
    /**
     * @brief RAII guard that increases the indentation of the report
     */
    class Level
    {
      private:
        Log& m_log;
      public:
        explicit Level(Log& log) : m_log(log) { ++m_log.m_depth; }
        ~Level() { --m_log.m_depth; }
        Level(Level const&) = delete;
        Level& operator=(Level const&) = delete;
    };

    /**
     * @brief Construct a report that writes to the given stream
     *
     * @param os The output stream, stderr for a run
     * @param color Whether ANSI colors are emitted
     * @param depth Initial indentation depth
     */
    explicit Log(std::ostream& os, bool color, int depth = 0)
      : m_os(os)
      , m_color(color)
      , m_depth(depth)
    {}

    /**
     * @brief Report on stderr, colored when stderr is a terminal
     */
    Log()
      : Log(std::cerr, ::isatty(STDERR_FILENO) == 1)
    {}

    virtual ~Log() = default;

    [[nodiscard]] Level level() { return Level(*this); }
    [[nodiscard]] int depth() const { return m_depth; }
    [[nodiscard]] bool color() const { return m_color; }
    [[nodiscard]] std::ostream& stream() { return m_os.get(); }

    virtual void no_change(std::string_view msg)
    {
      std::println(m_os.get(), "[{}] {}{}", paint(ns_ansi::fg_green, "*"), indent(), msg);
    }

    virtual void change(std::string_view msg)
    {
      std::println(m_os.get(), "[{}] {}{}", paint(ns_ansi::fg_yellow, "≈"), indent(), msg);
    }

    virtual void assertion_fail(std::string_view msg)
    {
      std::println(m_os.get(), "{}  {} {}", indent(), paint(ns_ansi::fg_red, "×"), msg);
    }

    virtual void assertion_change(std::string_view msg)
    {
      std::println(m_os.get(), "{}  {} {}", indent(), paint(ns_ansi::fg_yellow, "⟳"), msg);
    }

    virtual void assertion_pass(std::string_view msg)
    {
      std::println(m_os.get(), "{}  {} {}", indent(), paint(ns_ansi::fg_green, "✓"), msg);
    }

    virtual void detail(std::string_view msg)
    {
      std::println(m_os.get(), "    {}{}", indent(), msg);
    }

    virtual void detail_add(std::string_view msg)
    {
      std::println(m_os.get(), "    {}{}", indent(), paint(ns_ansi::fg_green, msg));
    }

    virtual void detail_remove(std::string_view msg)
    {
      std::println(m_os.get(), "    {}{}", indent(), paint(ns_ansi::fg_red, msg));
    }

    virtual void detail_header(std::string_view msg)
    {
      std::println(m_os.get(), "    {}{}", indent(), paint(ns_ansi::fg_bright_black, msg));
    }

    // Messages of the driver, not indented
    void info(std::string_view msg)
    {
      std::println(m_os.get(), "[{}] {}", paint(ns_ansi::fg_green, "*"), msg);
    }

    void warn(std::string_view msg)
    {
      std::println(m_os.get(), "[{}] {}", paint(ns_ansi::fg_yellow, "!"), msg);
    }

    void error(std::string_view msg, std::string_view reason)
    {
      std::println(m_os.get(), "{} {}", paint(ns_ansi::bg_red, "[×]"), msg);
      std::println(m_os.get(), "    {}", reason);
    }

    /**
     * @brief Names of targets, roles and subjects in messages of the driver
     */
    [[nodiscard]] std::string fmt_target(std::string_view name) const
    {
      return paint(ns_ansi::fg_cyan_bold, name.empty()? "''" : name);
    }

    [[nodiscard]] std::string fmt_subject(std::string_view name) const
    {
      return paint(ns_ansi::fg_blue, name.empty()? "''" : name);
    }

    [[nodiscard]] std::string fmt_code(std::string_view name) const
    {
      return paint(ns_ansi::fg_bright_black, name.empty()? "''" : name);
    }

    [[nodiscard]] std::unique_ptr<Log> changes_are_errors();
};

/**
 * @brief Report for precondition checks
 *
 * A change is a failure: it is printed with the failure marker and its details are hidden.
 */
class ChangesAreErrors final : public Log
{
  public:
    ChangesAreErrors(std::ostream& os, bool color, int depth)
      : Log(os, color, depth)
    {}

    void change(std::string_view msg) override
    {
      std::println(m_os.get(), "[{}] {}{}", paint(ns_ansi::fg_red, "≈"), indent(), msg);
    }

    void assertion_change(std::string_view msg) override
    {
      std::println(m_os.get(), "{}  {} {}", indent(), paint(ns_ansi::fg_red, "×"), msg);
    }

    void detail(std::string_view) override {}
    void detail_add(std::string_view) override {}
    void detail_remove(std::string_view) override {}
    void detail_header(std::string_view) override {}
};

inline std::unique_ptr<Log> Log::changes_are_errors()
{
  return std::make_unique<ChangesAreErrors>(m_os.get(), m_color, m_depth);
}

} // namespace ns_report

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
