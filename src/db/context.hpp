/**
 * @file context.hpp
 * @author Ruan Formigoni
 * @brief The context of a run, shared with the roles and with an elevated process
 *
 * The context is serialized to json for `apply --show-context` and passed to the program
 * re-executed by sudo with `--context`, so the elevated process keeps the identity and
 * environment of the invoking user.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <map>
#include <string>
#include <sys/utsname.h>

#include "db.hpp"
#include "../lib/elevate.hpp"
#include "../lib/env.hpp"
#include "../lib/user.hpp"
#include "../std/expected.hpp"

namespace ns_db::ns_context
{

namespace fs = std::filesystem;

/**
 * @brief Facts of the machine and of the invoking user
 */
struct Host
{
  std::string os;
  std::string system;
  ns_user::Identity user;
};

class Context
{
  private:
    fs::path m_root;
    std::string m_target;
    ns_elevate::Elevation m_elevation;
    Host m_host;
    ns_env::Env m_env;
    json_t m_vars;
  public:
    Context();
    [[nodiscard]] fs::path const& get_root() const { return m_root; }
    [[nodiscard]] std::string const& get_target() const { return m_target; }
    [[nodiscard]] ns_elevate::Elevation get_elevation() const { return m_elevation; }
    [[nodiscard]] Host const& get_host() const { return m_host; }
    [[nodiscard]] ns_env::Env const& get_env() const { return m_env; }
    [[nodiscard]] json_t const& get_vars() const { return m_vars; }
    void set_root(fs::path const& path_dir_root) { m_root = path_dir_root; }
    void set_target(std::string_view target) { m_target = target; }
    void set_elevation(ns_elevate::Elevation elevation) { m_elevation = elevation; }
    void set_host(Host const& host) { m_host = host; }
    void set_env(ns_env::Env const& env) { m_env = env; }
    void set_vars(json_t const& vars) { m_vars = vars; }
    /**
     * @brief Elevation, user name, home and environment used by the subjects to run commands
     */
    [[nodiscard]] ns_elevate::Privileges privileges() const
    {
      return ns_elevate::Privileges
      {
        .elevation = m_elevation,
        .username = m_host.user.username,
        .home_dir = m_host.user.home_dir,
        .env = m_env,
      };
    }
};

inline Context::Context()
  : m_root()
  , m_target()
  , m_elevation(ns_elevate::Elevation::NONE)
  , m_host()
  , m_env()
  , m_vars(json_t::object())
{}

/**
 * @brief Queries the facts of the machine and of the real user of the process
 *
 * @return Value<Host> The facts or the respective error
 */
[[nodiscard]] inline Value<Host> detect_host()
{
  struct utsname info;
  return_if(::uname(&info) != 0, Error("E::Could not query system name: {}", strerror(errno)));
  return Host
  {
    .os = "posix",
    .system = info.sysname,
    .user = Pop(ns_user::current()),
  };
}

/**
 * @brief Creates the context of a run from the running process
 *
 * The variables are not loaded here, they depend on the selected target.
 *
 * @param path_dir_root The project root
 * @param target The selected target
 * @param elevation The elevation mode of the run
 * @return Value<Context> The context or the respective error
 */
[[nodiscard]] inline Value<Context> create(fs::path const& path_dir_root
  , std::string_view target
  , ns_elevate::Elevation elevation)
{
  Context context;
  context.set_root(path_dir_root);
  context.set_target(target);
  context.set_elevation(elevation);
  context.set_host(Pop(detect_host()));
  context.set_env(ns_env::snapshot());
  return context;
}

/**
 * @brief Deserializes a json string into a `Context` class
 *
 * @param str_raw_json The json string which to deserialize
 * @return The `Context` class or the respective error
 */
[[nodiscard]] inline Value<Context> deserialize(std::string_view str_raw_json) noexcept
{
  Context context;
  auto db = Pop(ns_db::from_string(str_raw_json));
  context.set_root(Pop(db("root").template value<std::string>()));
  context.set_target(Pop(db("target").template value<std::string>()));
  // Elevation, 'none' is the implicit entry of the enumeration
  std::string elevation = Pop(db("elevation").template value<std::string>());
  if (elevation != "none")
  {
    context.set_elevation(Pop(ns_elevate::Elevation::from_string(elevation), "E::Invalid elevation '{}'", elevation));
  }
  // Host
  Host host;
  auto db_host = Pop(db("host").template value<Db>());
  host.os = Pop(db_host("os").template value<std::string>());
  host.system = Pop(db_host("system").template value<std::string>());
  auto db_user = Pop(db_host("user").template value<Db>());
  host.user.username = Pop(db_user("username").template value<std::string>());
  host.user.groupname = Pop(db_user("groupname").template value<std::string>());
  host.user.uid = Pop(db_user("uid").template value<uid_t>());
  host.user.gid = Pop(db_user("gid").template value<gid_t>());
  host.user.home_dir = Pop(db_user("home_dir").template value<std::string>());
  context.set_host(host);
  // Environment
  ns_env::Env env;
  auto db_env = Pop(db("env").template value<Db>());
  for(std::string const& key : db_env.keys())
  {
    env[key] = Pop(db_env(key).template value<std::string>());
  }
  context.set_env(env);
  // Variables
  if (db.contains("vars"))
  {
    context.set_vars(Pop(db("vars").template value<json_t>()));
  }
  return context;
}

/**
 * @brief Serializes a `Context` class into a json string
 *
 * @param context The `Context` object to serialize
 * @param indent Indentation of the output, -1 for a single line
 * @return The serialized json data
 */
[[nodiscard]] inline Value<std::string> serialize(Context const& context, int indent = -1) noexcept
{
  Host const& host = context.get_host();
  auto db = ns_db::Db();
  db("root") = context.get_root().string();
  db("target") = context.get_target();
  db("elevation") = context.get_elevation().lower();
  db("host")("os") = host.os;
  db("host")("system") = host.system;
  db("host")("user")("username") = host.user.username;
  db("host")("user")("groupname") = host.user.groupname;
  db("host")("user")("uid") = host.user.uid;
  db("host")("user")("gid") = host.user.gid;
  db("host")("user")("home_dir") = host.user.home_dir.string();
  db("env") = context.get_env();
  db("vars") = context.get_vars();
  return db.dump(indent);
}

} // namespace ns_db::ns_context

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
