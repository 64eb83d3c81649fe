/**
 * @file child.hpp
 * @author Ruan Formigoni
 * @brief Handle for a spawned child process
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cstring>
#include <sys/wait.h>
#include <csignal>
#include <string>
#include <optional>
#include <utility>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "../../macro.hpp"
#include "../../std/expected.hpp"

namespace ns_subprocess
{

// Forward declaration
class Subprocess;

/**
 * @brief Handle to a spawned child process
 *
 * Returned by Subprocess::spawn(). The handle owns the threads that service the pipes of the
 * child, wait() reaps the process and joins them, so captured output is complete once wait()
 * returns. The destructor waits if wait() was never called.
 *
 * @code
 * std::ostringstream out;
 * auto child = Subprocess("/bin/ls")
 *     .with_args("-la")
 *     .with_stdio(Stream::Pipe)
 *     .with_streams(std::cin, out, std::cerr)
 *     .spawn();
 * int code = child->wait().value_or(-1);
 * @endcode
 */
class Child
{
  private:
    pid_t m_pid;
    std::string m_description;
    std::mutex m_mutex_streams;
    std::vector<std::thread> m_threads;

    friend class Subprocess;

    Child(pid_t pid, std::string description)
      : m_pid(pid)
      , m_description(std::move(description))
    {}

    static std::unique_ptr<Child> create(pid_t pid, std::string const& description)
    {
      return std::unique_ptr<Child>(new Child(pid, description));
    }

    void join()
    {
      for(auto& thread : m_threads)
      {
        if (thread.joinable()) { thread.join(); }
      }
      m_threads.clear();
    }

  public:
    ~Child()
    {
      if (m_pid > 0)
      {
        wait().discard("W::Could not reap child process");
      }
      join();
    }

    Child(Child const&) = delete;
    Child& operator=(Child const&) = delete;
    Child(Child&&) = delete;
    Child& operator=(Child&&) = delete;

    /**
     * @brief Waits for the child process to finish and returns exit code
     *
     * @return Value<int> The exit code on success, or error message on failure
     */
    [[nodiscard]] Value<int> wait()
    {
      return_if(m_pid <= 0, Error("E::Invalid pid to wait for in {}", m_description));
      int status;
      pid_t result;
      while((result = waitpid(m_pid, &status, 0)) < 0 and errno == EINTR);
      return_if(result < 0, Error("E::waitpid failed on {}: {}", m_description, strerror(errno)));
      m_pid = -1;
      join();
      return WIFEXITED(status)? Value<int>(WEXITSTATUS(status))
        : WIFSIGNALED(status)? Error("E::The process {} was terminated by a signal", m_description)
        : Error("E::The process {} exited abnormally", m_description);
    }

    /**
     * @brief Gets the PID of the child process, nullopt once it was waited for
     */
    [[nodiscard]] std::optional<pid_t> get_pid() const
    {
      return (m_pid > 0) ? std::optional<pid_t>(m_pid) : std::nullopt;
    }
};

} // namespace ns_subprocess

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
