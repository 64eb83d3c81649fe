/**
 * @file boot.cpp
 * @author Ruan Formigoni
 * @brief An example caerbannog configuration program
 *
 * The project root of the program is the working directory, e.g.:
 *
 * @code
 * caerbannog-example target --full
 * caerbannog-example apply workstation --dry-run
 * @endcode
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#include <filesystem>
#include <format>
#include <string>
#include <vector>

#include "../std/expected.hpp"
#include "../lib/env.hpp"
#include "../lib/log.hpp"
#include "../parser/executor.hpp"
#include "../role/role.hpp"
#include "../config.hpp"

namespace fs = std::filesystem;

/**
 * @brief Shell profile of the user, the aliases come from the variables
 *
 * @code
 * shell:
 *   aliases:
 *     ll: ls -l
 * @endcode
 */
class ShellRole final : public ns_role::Role
{
  public:
    [[nodiscard]] Value<void> configure(ns_role::RoleContext& ctx) override
    {
      fs::path path_dir_home = ctx.context().get_host().user.home_dir;
      ns_db::json_t vars = ctx.role_vars();
      std::vector<std::string> lines{"# Managed by caerbannog"};
      if (vars.contains("aliases") and vars.at("aliases").is_object())
      {
        for(auto const& [name, command] : vars.at("aliases").items())
        {
          continue_if(not command.is_string(), "W::Alias '{}' is not a string", name);
          lines.push_back(std::format("alias {}='{}'", name, command.get<std::string>()));
        }
      }
      auto directory = ctx.directory(path_dir_home / ".config" / "caerbannog-example");
      directory->is_present();
      auto profile = ctx.file(path_dir_home / ".config" / "caerbannog-example" / "profile");
      profile->has_lines(lines).has_mode(0644);
      Pop(ctx.apply({ directory, profile }));
      return {};
    }
};

/**
 * @brief Editor configuration copied from roles/editor/ of the project
 */
Value<void> editor(ns_role::RoleContext& ctx)
{
  fs::path path_dir_home = ctx.context().get_host().user.home_dir;
  auto config = ctx.file_tree("config");
  Pop(config->replicates_children_to({ path_dir_home / ".config" / "caerbannog-example" / "editor" }));
  config->has_file_mode(0644).has_directory_mode(0755);
  Pop(ctx.apply({ config }));
  return {};
}

/**
 * @brief A user service restarted when its unit file changes
 */
Value<void> service(ns_role::RoleContext& ctx)
{
  Pop(ctx.ensure({ ctx.directory(ctx.context().get_host().user.home_dir)->is_present().ptr() }));
  auto timer = ctx.service("caerbannog-example.service", ns_systemd::Scope::USER);
  Pop(timer->file([](ns_systemd::UnitFile& unit)
  {
    unit.file->has_lines({
      "[Unit]",
      "Description=caerbannog example",
      "",
      "[Service]",
      "Type=oneshot",
      "ExecStart=/usr/bin/true",
    }, true, true);
    unit.restarts_service();
  }));
  Pop(ctx.apply({ timer }));
  return {};
}

/**
 * @brief Boots the configuration program
 *
 * @param argc Argument count
 * @param argv Argument vector
 * @return The exit code of the command
 */
[[nodiscard]] Value<int> boot(int argc, char** argv)
{
  ns_config::Setup setup(Try(fs::current_path(), "E::Could not read the working directory"));
  // Roles
  setup.role("shell", std::make_unique<ShellRole>());
  setup.role("editor", editor);
  setup.role("service", service);
  // Targets
  setup.target("base").has_roles({"shell"});
  setup.target("workstation").depends_on({"base", "desktop"}).has_roles({"editor"});
  setup.target("desktop").depends_on({"base"}).has_roles({"service"});
  // Password of the secrets
  if (auto command = ns_env::get_expected("CBN_PASSWORD_COMMAND"))
  {
    setup.with_password_command(ns_string::split(*command, ' '));
  }
  return Pop(ns_parser::execute_command(setup, argc, argv));
}

/**
 * @brief Set the logger level
 *
 * @param argc Argument count
 * @param argv Argument vector
 */
void set_logger_level(int argc, char** argv)
{
  // Force debug mode
  if(ns_env::exists("CBN_DEBUG", "1"))
  {
    ns_log::set_level(ns_log::Level::DEBUG);
    return;
  }
  // The change report is the output of apply
  if(argc >= 2 and std::string_view{argv[1]} == "apply")
  {
    ns_log::set_level(ns_log::Level::WARN);
    return;
  }
  // Otherwise, info mode is the default
  ns_log::set_level(ns_log::Level::INFO);
}

/**
 * @brief Entry point of the configuration program
 *
 * @param argc Argument count
 * @param argv Argument vector
 * @return int Exit code (0 for success, non-zero for failure)
 */
int main(int argc, char** argv)
{
  auto __expected_fn = [](auto&&){ return 125; };
  // Configure logger
  set_logger_level(argc, argv);
  if (auto path_file_log = ns_env::get_expected("CBN_LOG_FILE"))
  {
    ns_log::set_sink_file(*path_file_log);
  }
  // Run the command
  return Pop(boot(argc, argv), "C::The program exited with an error");
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
