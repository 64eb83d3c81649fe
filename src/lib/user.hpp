/**
 * @file user.hpp
 * @author Ruan Formigoni
 * @brief Lookups in the user and group databases
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <grp.h>
#include <pwd.h>
#include <unistd.h>
#include <filesystem>
#include <string>

#include "../std/expected.hpp"

/**
 * @namespace ns_user
 * @brief Name and id resolution of users and groups
 */
namespace ns_user
{

namespace fs = std::filesystem;

/**
 * @brief The user that runs the program
 */
struct Identity
{
  std::string username;
  std::string groupname;
  uid_t uid;
  gid_t gid;
  fs::path home_dir;
};

[[nodiscard]] inline Value<uid_t> uid(std::string const& name)
{
  struct passwd* pw = ::getpwnam(name.c_str());
  return_if(not pw, Error("E::Unknown user '{}'", name));
  return pw->pw_uid;
}

[[nodiscard]] inline Value<gid_t> gid(std::string const& name)
{
  struct group* gr = ::getgrnam(name.c_str());
  return_if(not gr, Error("E::Unknown group '{}'", name));
  return gr->gr_gid;
}

/**
 * @brief Name of the user with the given id, the id itself when it has no entry
 */
[[nodiscard]] inline std::string user_name(uid_t id)
{
  struct passwd* pw = ::getpwuid(id);
  return pw? std::string{pw->pw_name} : std::to_string(id);
}

/**
 * @brief Name of the group with the given id, the id itself when it has no entry
 */
[[nodiscard]] inline std::string group_name(gid_t id)
{
  struct group* gr = ::getgrgid(id);
  return gr? std::string{gr->gr_name} : std::to_string(id);
}

[[nodiscard]] inline bool group_exists(std::string const& name)
{
  return ::getgrnam(name.c_str()) != nullptr;
}

/**
 * @brief Queries the identity of the real user of the process
 *
 * @return Value<Identity> The user and its primary group, or the respective error
 */
[[nodiscard]] inline Value<Identity> current()
{
  struct passwd* pw = ::getpwuid(::getuid());
  return_if(not pw, Error("E::Failed to get current user info"));
  return Identity
  {
    .username = pw->pw_name,
    .groupname = group_name(pw->pw_gid),
    .uid = pw->pw_uid,
    .gid = pw->pw_gid,
    .home_dir = pw->pw_dir,
  };
}

} // namespace ns_user

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
