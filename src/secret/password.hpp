/**
 * @file password.hpp
 * @author Ruan Formigoni
 * @brief Password of the secrets of a run
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <termios.h>
#include <unistd.h>

#include "../lib/elevate.hpp"
#include "../lib/subprocess.hpp"
#include "../std/expected.hpp"

namespace ns_secret
{

/**
 * @brief Reads a line from the terminal without echo
 *
 * @param prompt Text written to stderr before reading
 * @return Value<std::string> The line without its terminator or the respective error
 */
[[nodiscard]] inline Value<std::string> read_hidden(std::string_view prompt)
{
  std::cerr << prompt << std::flush;
  struct termios attrs_old;
  bool is_tty = ::tcgetattr(STDIN_FILENO, &attrs_old) == 0;
  if (is_tty)
  {
    struct termios attrs_new = attrs_old;
    attrs_new.c_lflag &= ~ECHO;
    return_if(::tcsetattr(STDIN_FILENO, TCSANOW, &attrs_new) != 0
      , Error("E::Could not disable echo: {}", strerror(errno))
    );
  }
  std::string line;
  bool ok = static_cast<bool>(std::getline(std::cin, line));
  if (is_tty)
  {
    ::tcsetattr(STDIN_FILENO, TCSANOW, &attrs_old);
    std::cerr << '\n';
  }
  return_if(not ok, Error("E::Could not read password"));
  return line;
}

/**
 * @brief Source of the password, read once per run
 */
class Password
{
  private:
    std::function<Value<std::string>()> m_loader;
    std::optional<std::string> m_cached;

  public:
    explicit Password(std::function<Value<std::string>()> loader)
      : m_loader(std::move(loader))
      , m_cached()
    {}

    /**
     * @brief Asks the password on the terminal
     */
    [[nodiscard]] static Password prompt()
    {
      return Password([]{ return read_hidden("Secrets password: "); });
    }

    /**
     * @brief Runs a command as the invoking user, its output is the password
     *
     * Trailing line terminators are removed from the output.
     *
     * @param cmd The command followed by its arguments, e.g. pass show caerbannog
     * @param privileges Used to drop privileges when running elevated
     */
    [[nodiscard]] static Password command(std::vector<std::string> cmd, ns_elevate::Privileges privileges)
    {
      return Password([cmd = std::move(cmd), privileges = std::move(privileges)]() -> Value<std::string>
      {
        std::string output = Pop(ns_subprocess::check_output(privileges.user(cmd)), "E::Password command failed");
        while (output.ends_with('\n') or output.ends_with('\r')) { output.pop_back(); }
        return output;
      });
    }

    /**
     * @brief A known password
     */
    [[nodiscard]] static Password value(std::string password)
    {
      return Password([password = std::move(password)]() -> Value<std::string> { return password; });
    }

    [[nodiscard]] Value<std::string> get()
    {
      if (not m_cached)
      {
        m_cached = Pop(m_loader());
      }
      return *m_cached;
    }
};

} // namespace ns_secret

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
