/**
 * @file subprocess.hpp
 * @author Ruan Formigoni
 * @brief A library to spawn sub-processes in linux
 *
 * External collaborators of the engine (package and service managers, groupadd, sudo, the
 * password command) all run through this builder.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <functional>
#include <sys/wait.h>
#include <vector>
#include <string>
#include <unistd.h>
#include <fcntl.h>
#include <ranges>
#include <filesystem>
#include <sstream>
#include <utility>
#include <memory>
#include <optional>

#include "log.hpp"
#include "env.hpp"
#include "../macro.hpp"
#include "subprocess/pipe.hpp"
#include "subprocess/child.hpp"

extern char** environ;

/**
 * @namespace ns_subprocess
 * @brief Child process management and execution
 *
 * Spawns programs with configurable stdio redirection (Pipe/Null/Inherit) and argument lists.
 * Execution is synchronous from the point of view of the engine, callers wait for the child
 * before inspecting its output.
 */
namespace ns_subprocess
{

/**
 * @brief Stream redirection modes for child process stdio
 */
enum class Stream
{
  Inherit,  // Child inherits parent's stdin/stdout/stderr
  Pipe,     // Redirect to the streams given to with_streams
  Null,     // Redirect to /dev/null (silent)
};

/**
 * @brief Converts a vector of strings to a null-terminated array of C strings
 */
inline std::unique_ptr<const char*[]> to_carray(std::vector<std::string> const& vec)
{
  auto arr = std::make_unique<const char*[]>(vec.size() + 1);
  std::ranges::transform(vec, arr.get(), [](auto const& e) { return e.c_str(); });
  arr[vec.size()] = nullptr;
  return arr;
}

class Subprocess
{
  private:
    std::filesystem::path m_program;
    std::vector<std::string> m_args;
    std::vector<std::string> m_env;
    std::reference_wrapper<std::istream> m_stdin;
    std::reference_wrapper<std::ostream> m_stdout;
    std::reference_wrapper<std::ostream> m_stderr;
    Stream m_stream_mode;

    void to_dev_null();
    [[noreturn]] void exec_child();

  public:
    template<ns_concept::StringRepresentable T>
    [[nodiscard]] Subprocess(T&& t);

    template<typename... Args>
    [[maybe_unused]] [[nodiscard]] Subprocess& with_args(Args&&... args);

    [[maybe_unused]] [[nodiscard]] Subprocess& with_env(std::optional<ns_env::Env> const& env);

    [[maybe_unused]] [[nodiscard]] Subprocess& with_stdio(Stream mode);

    [[maybe_unused]] [[nodiscard]] Subprocess& with_streams(std::istream& stdin_stream
      , std::ostream& stdout_stream
      , std::ostream& stderr_stream
    );

    [[nodiscard]] std::unique_ptr<Child> spawn();
};

/**
 * @brief Construct a new Subprocess for the given program
 *
 * The program is used as argv[0], the environment of the parent is copied.
 *
 * @param t Path to the program to execute
 */
template<ns_concept::StringRepresentable T>
Subprocess::Subprocess(T&& t)
  : m_program(ns_string::to_string(t))
  , m_args()
  , m_env()
  , m_stdin(std::cin)
  , m_stdout(std::cout)
  , m_stderr(std::cerr)
  , m_stream_mode(Stream::Inherit)
{
  m_args.push_back(m_program);
  for(char** i = environ; *i != nullptr; ++i)
  {
    m_env.push_back(*i);
  }
}

/**
 * @brief Arguments for the process
 *
 * Each argument may be a string representable value or a container of strings.
 *
 * @code
 * std::vector<std::string> opts = {"--quiet", "--noconfirm"};
 * .with_args("--sync", opts, "vim")
 * @endcode
 */
template<typename... Args>
Subprocess& Subprocess::with_args(Args&&... args)
{
  auto add_arg = [this]<typename T>(T&& arg) -> void
  {
    if constexpr ( ns_concept::Container<T> )
    {
      std::ranges::transform(arg, std::back_inserter(m_args), [](auto&& e){ return ns_string::to_string(e); });
    }
    else if constexpr ( ns_concept::StringRepresentable<T> )
    {
      this->m_args.push_back(ns_string::to_string(std::forward<T>(arg)));
    }
    else
    {
      static_assert(false, "Could not determine argument type");
    }
  };
  (add_arg(std::forward<Args>(args)), ...);
  return *this;
}

/**
 * @brief Replaces the environment of the child
 *
 * Without a value the child keeps the environment of the parent.
 *
 * @code
 * Subprocess("/usr/bin/systemctl")
 *     .with_args("--user", "daemon-reload")
 *     .with_env(context.get_env())
 * @endcode
 */
inline Subprocess& Subprocess::with_env(std::optional<ns_env::Env> const& env)
{
  return_if(not env, *this);
  m_env.clear();
  std::ranges::transform(*env, std::back_inserter(m_env), [](auto const& e){ return e.first + "=" + e.second; });
  return *this;
}

/**
 * @brief Selects how the standard streams of the child are connected
 */
inline Subprocess& Subprocess::with_stdio(Stream mode)
{
  m_stream_mode = mode;
  return *this;
}

/**
 * @brief Configures stream handlers for stdin, stdout, and stderr of the child process
 *
 * Used when Stream::Pipe mode is active. Passing std::cin, std::cout or std::cerr keeps the
 * respective descriptor of the parent.
 *
 * @code
 * std::istringstream input("hello");
 * std::ostringstream output;
 * Subprocess("/bin/cat")
 *     .with_stdio(Stream::Pipe)
 *     .with_streams(input, output, std::cerr)
 *     .spawn()
 *     ->wait();
 * @endcode
 */
inline Subprocess& Subprocess::with_streams(std::istream& stdin_stream
  , std::ostream& stdout_stream
  , std::ostream& stderr_stream)
{
  this->m_stdin = stdin_stream;
  this->m_stdout = stdout_stream;
  this->m_stderr = stderr_stream;
  return *this;
}

/**
 * @brief Redirects the standard streams to /dev/null
 */
inline void Subprocess::to_dev_null()
{
  int fd = open("/dev/null", O_RDWR);
  return_if(fd < 0,,"E::Failed to open /dev/null: {}", strerror(errno));
  return_if(dup2(fd, STDIN_FILENO) < 0,,"E::Failed to redirect stdin: {}", strerror(errno));
  return_if(dup2(fd, STDOUT_FILENO) < 0,,"E::Failed to redirect stdout: {}", strerror(errno));
  return_if(dup2(fd, STDERR_FILENO) < 0,,"E::Failed to redirect stderr: {}", strerror(errno));
  close(fd);
}

/**
 * @brief Executes the child process via execve (never returns)
 */
[[noreturn]] inline void Subprocess::exec_child()
{
  auto argv_custom = to_carray(m_args);
  auto envp_custom = to_carray(m_env);
  execve(m_program.c_str(), const_cast<char**>(argv_custom.get()), const_cast<char**>(envp_custom.get()));
  logger("E::execve() failed: {}", strerror(errno));
  _exit(127);
}

/**
 * @brief Spawns (forks) the child process and begins execution
 *
 * @return std::unique_ptr<Child> The handle of the spawned process, a handle with an invalid pid
 * when the process could not be created
 */
inline std::unique_ptr<Child> Subprocess::spawn()
{
  logger("D::Spawn command: {}", m_args);
  int pipestdin[2];
  int pipestdout[2];
  int pipestderr[2];
  if ( m_stream_mode == Stream::Pipe )
  {
    return_if(pipe(pipestdin), Child::create(-1, m_program), "E::{}", strerror(errno));
    return_if(pipe(pipestdout), Child::create(-1, m_program), "E::{}", strerror(errno));
    return_if(pipe(pipestderr), Child::create(-1, m_program), "E::{}", strerror(errno));
  }

  pid_t pid = fork();
  return_if(pid < 0, Child::create(-1, m_program), "E::Failed to fork: {}", strerror(errno));

  // Parent
  if ( pid > 0 )
  {
    auto child = Child::create(pid, m_program);
    if ( m_stream_mode == Stream::Pipe )
    {
      auto f_keep = [&](std::optional<std::thread> thread)
      {
        if (thread) { child->m_threads.push_back(std::move(*thread)); }
      };
      f_keep(ns_pipe::pipes_parent(true, pipestdin, m_stdin.get(), child->m_mutex_streams));
      f_keep(ns_pipe::pipes_parent(false, pipestdout, m_stdout.get(), child->m_mutex_streams));
      f_keep(ns_pipe::pipes_parent(false, pipestderr, m_stderr.get(), child->m_mutex_streams));
    }
    return child;
  }

  // Child
  if ( m_stream_mode == Stream::Pipe )
  {
    ns_pipe::pipes_child(true, pipestdin, m_stdin.get(), STDIN_FILENO);
    ns_pipe::pipes_child(false, pipestdout, m_stdout.get(), STDOUT_FILENO);
    ns_pipe::pipes_child(false, pipestderr, m_stderr.get(), STDERR_FILENO);
  }
  else if ( m_stream_mode == Stream::Null )
  {
    this->to_dev_null();
  }
  this->exec_child();
}

/**
 * @brief Runs a command and waits for it, the program is searched in PATH
 *
 * @param args The program followed by its arguments
 * @param stdio How the standard streams of the command are connected
 * @param env The environment of the command, the one of the program without a value
 * @return Value<int> The exit code of the command or the respective error
 */
[[nodiscard]] inline Value<int> call(std::vector<std::string> const& args
  , Stream stdio = Stream::Inherit
  , std::optional<ns_env::Env> const& env = std::nullopt)
{
  return_if(args.empty(), Error("E::Empty command"));
  auto path_bin = Pop(ns_env::search_path(args.front()), "E::Could not find program '{}'", args.front());
  return Pop(Subprocess(path_bin)
    .with_args(std::vector<std::string>(args.begin() + 1, args.end()))
    .with_env(env)
    .with_stdio(stdio)
    .spawn()
    ->wait()
  );
}

/**
 * @brief Runs a command and fails if its exit code is not zero
 *
 * @param args The program followed by its arguments
 * @param env The environment of the command, the one of the program without a value
 * @return Value<void> Nothing on success, or the respective error
 */
[[nodiscard]] inline Value<void> check_call(std::vector<std::string> const& args
  , std::optional<ns_env::Env> const& env = std::nullopt)
{
  int code = Pop(call(args, Stream::Inherit, env));
  return_if(code != 0, Error("E::Command {} failed with exit code {}", args, code));
  return {};
}

/**
 * @brief Runs a command and returns what it wrote to stdout
 *
 * Stderr is inherited, so prompts of the command reach the terminal.
 *
 * @param args The program followed by its arguments
 * @param env The environment of the command, the one of the program without a value
 * @return Value<std::string> The standard output of the command or the respective error
 */
[[nodiscard]] inline Value<std::string> check_output(std::vector<std::string> const& args
  , std::optional<ns_env::Env> const& env = std::nullopt)
{
  return_if(args.empty(), Error("E::Empty command"));
  auto path_bin = Pop(ns_env::search_path(args.front()), "E::Could not find program '{}'", args.front());
  std::ostringstream output;
  int code = Pop(Subprocess(path_bin)
    .with_args(std::vector<std::string>(args.begin() + 1, args.end()))
    .with_env(env)
    .with_stdio(Stream::Pipe)
    .with_streams(std::cin, output, std::cerr)
    .spawn()
    ->wait()
  );
  return_if(code != 0, Error("E::Command {} failed with exit code {}", args, code));
  return output.str();
}

} // namespace ns_subprocess

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
