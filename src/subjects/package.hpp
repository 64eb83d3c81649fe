/**
 * @file package.hpp
 * @author Ruan Formigoni
 * @brief Packages installed with pacman
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../engine/subject.hpp"
#include "../lib/elevate.hpp"
#include "../lib/subprocess.hpp"
#include "../std/string.hpp"

namespace ns_package
{

using ns_engine::Mode;

/**
 * @brief Installed packages and package groups, queried once per run
 */
class PackageCache
{
  private:
    struct Installed
    {
      std::set<std::string> packages;
      std::map<std::string,std::set<std::string>> groups;
    };
    std::optional<Installed> m_installed;

  public:
    PackageCache() = default;

    /**
     * @brief Creates a cache with known content, nothing is queried
     */
    [[nodiscard]] static std::shared_ptr<PackageCache> from(std::set<std::string> packages
      , std::map<std::string,std::set<std::string>> groups)
    {
      auto cache = std::make_shared<PackageCache>();
      cache->m_installed = Installed{ std::move(packages), std::move(groups) };
      return cache;
    }

    /**
     * @brief Queries pacman on first use
     *
     * @return Value<std::set<std::string>> Names of the installed packages and groups, or the
     * error of the query
     */
    [[nodiscard]] Value<std::set<std::string>> present()
    {
      if (not m_installed)
      {
        Installed installed;
        std::string packages = Pop(ns_subprocess::check_output({"pacman", "--query", "--quiet"}));
        std::string groups = Pop(ns_subprocess::check_output({"pacman", "--query", "--groups"}));
        for(std::string const& line : ns_string::split_lines(packages))
        {
          std::string name = ns_string::trim(line);
          if (not name.empty()) { installed.packages.insert(name); }
        }
        for(std::string const& line : ns_string::split_lines(groups))
        {
          auto fields = ns_string::split(ns_string::trim(line), ' ');
          continue_if(fields.size() != 2, "W::Unexpected line in pacman output: {}", line);
          installed.groups[fields[0]].insert(fields[1]);
        }
        m_installed = std::move(installed);
      }
      std::set<std::string> ret = m_installed->packages;
      std::ranges::transform(m_installed->groups, std::inserter(ret, ret.end()), [](auto const& e){ return e.first; });
      return ret;
    }

    /**
     * @brief Records the packages installed during the run
     */
    void mark_installed(std::set<std::string> const& names)
    {
      if (m_installed) { m_installed->packages.insert(names.begin(), names.end()); }
    }
};

class IsInstalled final : public ns_engine::Assertion
{
  private:
    std::set<std::string> m_names;
    std::shared_ptr<PackageCache> m_cache;
    ns_elevate::Privileges m_privileges;

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      std::set<std::string> present = Pop(m_cache->present());
      std::set<std::string> missing;
      std::ranges::set_difference(m_names, present, std::inserter(missing, missing.end()));
      if (not missing.empty())
      {
        std::vector<ns_engine::DiffLine> details;
        std::ranges::transform(missing, std::back_inserter(details), [](auto const& e){ return ns_engine::DiffLine::add(e); });
        Pop(register_change(ns_engine::Change("installed", std::move(details)
          , [missing, cache = m_cache, privileges = m_privileges]() -> Value<void>
          {
            std::vector<std::string> args{"pacman", "--sync", "--noconfirm"};
            std::ranges::copy(missing, std::back_inserter(args));
            auto cmd = Pop(privileges.elevated(args));
            Pop(ns_subprocess::check_call(cmd), "E::Installation failed");
            cache->mark_installed(missing);
            return {};
          }
        ), mode));
      }
      display(log);
      return {};
    }

  public:
    IsInstalled(std::set<std::string> names, std::shared_ptr<PackageCache> cache, ns_elevate::Privileges privileges)
      : Assertion((names.size() > 1)? "are installed" : "is installed")
      , m_names(std::move(names))
      , m_cache(std::move(cache))
      , m_privileges(std::move(privileges))
    {}
};

/**
 * @brief One or more pacman packages or package groups
 */
class Package final : public ns_engine::SubjectBase<Package>
{
  private:
    std::vector<std::string> m_names;
    std::shared_ptr<PackageCache> m_cache;
    ns_elevate::Privileges m_privileges;

  public:
    Package(std::vector<std::string> names, std::shared_ptr<PackageCache> cache, ns_elevate::Privileges privileges)
      : m_names(std::move(names))
      , m_cache(std::move(cache))
      , m_privileges(std::move(privileges))
    {}

    [[nodiscard]] static std::shared_ptr<Package> create(std::vector<std::string> names
      , std::shared_ptr<PackageCache> cache
      , ns_elevate::Privileges privileges)
    {
      return std::make_shared<Package>(std::move(names), std::move(cache), std::move(privileges));
    }

    Package& is_installed()
    {
      add_assertion(std::make_unique<IsInstalled>(std::set<std::string>(m_names.begin(), m_names.end())
        , m_cache
        , m_privileges
      ));
      return *this;
    }

    [[nodiscard]] std::string describe() const override
    {
      return std::format("{} {}", (m_names.size() > 1)? "packages" : "package", ns_string::from_container(m_names, ", "));
    }

    [[nodiscard]] std::shared_ptr<ns_engine::Subject> clone() const override
    {
      return create(m_names, m_cache, m_privileges);
    }
};

} // namespace ns_package

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
