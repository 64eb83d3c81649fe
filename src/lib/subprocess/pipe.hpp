/**
 * @file pipe.hpp
 * @author Ruan Formigoni
 * @brief Pipe handling utilities for subprocess
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <iterator>
#include <mutex>
#include <ostream>
#include <pthread.h>
#include <string>
#include <thread>
#include <unistd.h>

#include "../../macro.hpp"

namespace ns_subprocess
{

namespace ns_pipe
{

/**
 * @brief Write the whole input stream to a pipe file descriptor, then close it
 *
 * SIGPIPE is blocked on the calling thread, a child that exits without reading its input makes
 * write(2) fail with EPIPE instead of terminating the process.
 *
 * @param pipe_fd File descriptor of the pipe write end
 * @param stream Input stream to read from
 */
inline void write_pipe(int pipe_fd, std::istream& stream)
{
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGPIPE);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  std::string data(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>{});
  for(size_t offset = 0; offset < data.size();)
  {
    ssize_t written = ::write(pipe_fd, data.data() + offset, data.size() - offset);
    break_if(written < 0 and errno != EINTR);
    offset += (written > 0)? static_cast<size_t>(written) : 0;
  }
  close(pipe_fd);
}

/**
 * @brief Read from a pipe file descriptor and write to an output stream
 *
 * Data is forwarded unchanged, the stream is guarded by a mutex shared with the other reader so
 * stdout and stderr can target the same stream.
 *
 * @param pipe_fd File descriptor of the pipe read end
 * @param stream Output stream to write to
 * @param mutex Guards the output stream
 */
inline void read_pipe(int pipe_fd, std::ostream& stream, std::mutex& mutex)
{
  char buffer[4096];
  for(ssize_t count; (count = ::read(pipe_fd, buffer, sizeof(buffer))) != 0;)
  {
    continue_if(count < 0 and errno == EINTR);
    break_if(count < 0);
    std::lock_guard lock(mutex);
    stream.write(buffer, count);
  }
  close(pipe_fd);
}

/**
 * @brief Check if a stream is a standard stream (std::cin, std::cout, or std::cerr)
 *
 * @tparam Stream The stream type (std::istream or std::ostream)
 * @param stream The stream reference to check
 * @return true if the stream is std::cin, std::cout, or std::cerr
 */
template<typename Stream>
bool is_standard_stream(Stream& stream)
{
  if constexpr (std::is_same_v<Stream, std::istream>)
  {
    return (&stream == &std::cin);
  }
  else
  {
    return (&stream == &std::cout) or (&stream == &std::cerr);
  }
}

/**
 * @brief Setup pipe for child process (unified for stdin/stdout/stderr)
 *
 * Standard streams are not redirected, the child keeps the terminal.
 *
 * @param is_istream True for input streams (stdin), false for output streams (stdout/stderr)
 * @param pipe Pipe array [read_end, write_end]
 * @param stream The stream reference to check
 * @param fileno The file descriptor to redirect to
 */
template<typename Stream>
void pipes_child(bool is_istream, int pipe[2], Stream& stream, int fileno)
{
  int idx_child  = is_istream ? 0 : 1;
  int idx_parent = is_istream ? 1 : 0;
  close(pipe[idx_parent]);
  if (is_standard_stream(stream))
  {
    close(pipe[idx_child]);
    return;
  }
  return_if(dup2(pipe[idx_child], fileno) == -1,,"E::dup2(pipe[{}], {}): {}", idx_child, fileno, strerror(errno));
  close(pipe[idx_child]);
}

/**
 * @brief Setup pipe for parent process (unified for stdin/stdout/stderr)
 *
 * @param is_istream True for input streams (stdin), false for output streams (stdout/stderr)
 * @param pipe Pipe array [read_end, write_end]
 * @param stream The stream to feed from or to fill
 * @param mutex Guards output streams
 * @return std::optional<std::thread> The thread servicing the pipe, if one is needed
 */
template<typename Stream>
std::optional<std::thread> pipes_parent(bool is_istream, int pipe[2], Stream& stream, std::mutex& mutex)
{
  int idx_parent = is_istream ? 1 : 0;
  int idx_child  = is_istream ? 0 : 1;
  close(pipe[idx_child]);
  if (is_standard_stream(stream))
  {
    close(pipe[idx_parent]);
    return std::nullopt;
  }
  if constexpr (std::is_same_v<Stream, std::istream>)
  {
    return std::thread(write_pipe, pipe[idx_parent], std::ref(stream));
  }
  else
  {
    return std::thread(read_pipe, pipe[idx_parent], std::ref(stream), std::ref(mutex));
  }
}

} // namespace ns_pipe

} // namespace ns_subprocess

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
