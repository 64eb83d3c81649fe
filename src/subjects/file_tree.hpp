/**
 * @file file_tree.hpp
 * @author Ruan Formigoni
 * @brief Replication of a directory tree of a role to other locations
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "file.hpp"

namespace ns_file
{

using Owner = std::optional<std::pair<std::string,std::string>>;

/**
 * @brief Normal form of a path without a trailing separator
 */
[[nodiscard]] inline fs::path normal(fs::path const& path)
{
  fs::path ret = path.lexically_normal();
  if (not ret.has_filename() and ret != ret.root_path()) { ret = ret.parent_path(); }
  return ret;
}

/**
 * @brief Visits a directory tree top-down with entries sorted by name
 *
 * @param path_dir The root of the tree
 * @param f Called with each directory and its entries that are not directories, returns false to
 * skip the subdirectories
 * @return Value<void> Nothing on success, or the error of listing a directory
 */
template<typename F>
[[nodiscard]] Value<void> walk(fs::path const& path_dir, F&& f)
{
  std::vector<fs::path> entries = Pop(ns_fs::sorted_entries(path_dir));
  std::vector<fs::path> dirs;
  std::vector<fs::path> files;
  for(fs::path const& entry : entries)
  {
    if (kind(entry) == Kind::Directory) { dirs.push_back(entry); }
    else { files.push_back(entry); }
  }
  return_if(not f(path_dir, files), {});
  for(fs::path const& dir : dirs)
  {
    Pop(walk(dir, f));
  }
  return {};
}

/**
 * @brief The subjects that replicate a source tree to one destination
 */
struct Replication
{
  std::string name;
  std::vector<std::shared_ptr<ns_engine::Subject>> subjects;
  std::vector<std::shared_ptr<File>> files;
  std::vector<std::shared_ptr<Directory>> directories;

  /**
   * @brief Generates the subjects of a replication
   *
   * One Directory is generated for every directory of the source and one File for every other
   * entry. With exclusive replication the destination is walked as well and every entry without a
   * counterpart in the source gets an absence assertion.
   *
   * @param path_source Absolute path of the source directory
   * @param path_destination Absolute path of the destination
   * @param exclusive Whether entries of the destination missing from the source are removed
   * @param children_only Whether the children of the source are replicated instead of the source
   * @param owner Default ownership of the generated entries
   * @return Value<Replication> The replication or the respective error
   */
  [[nodiscard]] static Value<Replication> create(fs::path const& path_source
    , fs::path const& path_destination
    , bool exclusive
    , bool children_only
    , Owner const& owner)
  {
    return_if(kind(path_source) != Kind::Directory
      , Error("E::Source path '{}' does not exist or is not a directory", path_source)
    );
    return_if(not path_destination.is_absolute()
      , Error("E::Destination path '{}' is not absolute", path_destination)
    );
    Replication ret;
    ret.name = std::format("replicates {} to {}", children_only? "children" : "self", path_destination.string());
    fs::path path_base = normal(path_source).parent_path();
    std::vector<fs::path> expected_dirs;
    std::vector<fs::path> expected_files;
    std::vector<std::pair<std::shared_ptr<File>,fs::path>> sources;
    if (not children_only) { expected_dirs.push_back(normal(path_destination)); }
    // Subjects that replicate the source
    auto f_replicate = [&](fs::path const& path_dir, std::vector<fs::path> const& files)
    {
      fs::path rel = path_dir.lexically_relative(path_base);
      if (children_only)
      {
        // Drop the name of the source directory
        fs::path stripped;
        for (auto it = std::next(rel.begin()); it != rel.end(); ++it) { stripped /= *it; }
        rel = stripped;
      }
      fs::path dst_dir = normal(path_destination / rel);
      expected_dirs.push_back(dst_dir);
      auto directory = Directory::create(dst_dir);
      if (owner) { directory->with_default_owner(owner->first, owner->second); }
      directory->is_present();
      ret.directories.push_back(directory);
      ret.subjects.push_back(directory);
      for(fs::path const& path_file : files)
      {
        auto file = File::create(dst_dir / path_file.filename());
        if (owner) { file->with_default_owner(owner->first, owner->second); }
        sources.emplace_back(file, path_file);
        ret.files.push_back(file);
        ret.subjects.push_back(file);
        expected_files.push_back(file->path());
      }
      return true;
    };
    Pop(walk(path_source, f_replicate));
    // The walk callback cannot propagate errors, read the contents afterwards
    for(auto const& [file, path_file] : sources)
    {
      Pop(file->has_content_from(path_file));
    }
    return_if(not exclusive or kind(path_destination) != Kind::Directory, ret);
    // Subjects that remove what is not in the source
    auto f_prune = [&](fs::path const& path_dir, std::vector<fs::path> const& files)
    {
      fs::path dir = normal(path_dir);
      if (std::ranges::find(expected_dirs, dir) == expected_dirs.end())
      {
        auto directory = Directory::create(dir);
        directory->is_absent();
        ret.subjects.push_back(directory);
        return false;
      }
      for(fs::path const& path_file : files)
      {
        continue_if(std::ranges::find(expected_files, normal(path_file)) != expected_files.end());
        auto file = File::create(path_file);
        file->is_absent();
        ret.subjects.push_back(file);
      }
      return true;
    };
    Pop(walk(path_destination, f_prune));
    return ret;
  }
};

/**
 * @brief Replication of a source tree to several destinations
 */
class IsReplicatedTo final : public Assertion
{
  private:
    std::vector<Replication> m_replications;
    size_t m_begin_last;

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      for(Replication& replication : m_replications)
      {
        auto guard = log.level();
        log.detail(replication.name);
        for(auto& subject : replication.subjects)
        {
          Pop(subject->apply(log, mode));
        }
      }
      return {};
    }

  public:
    IsReplicatedTo()
      : Assertion("is replicated")
      , m_replications()
      , m_begin_last(0)
    {}

    /**
     * @brief Adds the replications of one call, they become the last replications
     */
    void add(std::vector<Replication> replications)
    {
      m_begin_last = m_replications.size();
      std::ranges::move(replications, std::back_inserter(m_replications));
    }

    /**
     * @brief The replications added by the last call to add()
     */
    [[nodiscard]] std::span<Replication const> last() const
    {
      return std::span<Replication const>(m_replications).subspan(m_begin_last);
    }

    [[nodiscard]] bool changed() const override
    {
      return std::ranges::any_of(m_replications, [](Replication const& replication)
      {
        return std::ranges::any_of(replication.subjects, [](auto const& e){ return e->changed(); });
      });
    }
};

/**
 * @brief A directory of a role replicated to other locations
 *
 * @code
 * auto tree = Pop(ctx.file_tree("config")->replicates_children_to({home / ".config"}));
 * tree->has_file_mode(0600).has_directory_mode(0700);
 * @endcode
 */
class FileTree final : public ns_engine::SubjectBase<FileTree>
{
  private:
    fs::path m_source;
    Owner m_default_owner;

    [[nodiscard]] Value<std::shared_ptr<FileTree>> replicate(std::vector<fs::path> const& destinations
      , bool exclusive
      , bool children_only)
    {
      std::vector<Replication> replications;
      for(fs::path const& destination : destinations)
      {
        replications.push_back(Pop(Replication::create(m_source, destination, exclusive, children_only, m_default_owner)));
      }
      if (not has_assertion<IsReplicatedTo>()) { add_assertion(std::make_unique<IsReplicatedTo>()); }
      get_assertion<IsReplicatedTo>()->add(std::move(replications));
      return ptr();
    }

  public:
    explicit FileTree(fs::path source)
      : m_source(std::move(source))
      , m_default_owner(std::nullopt)
    {}

    [[nodiscard]] static std::shared_ptr<FileTree> create(fs::path source)
    {
      return std::make_shared<FileTree>(std::move(source));
    }

    FileTree& with_default_owner(std::string user, std::string group)
    {
      m_default_owner = std::make_pair(std::move(user), std::move(group));
      return *this;
    }

    /**
     * @brief Replicates the source directory into each destination
     */
    [[nodiscard]] Value<std::shared_ptr<FileTree>> replicates_self_to(std::vector<fs::path> const& destinations
      , bool exclusive = false)
    {
      return replicate(destinations, exclusive, false);
    }

    /**
     * @brief Replicates the entries of the source directory into each destination
     */
    [[nodiscard]] Value<std::shared_ptr<FileTree>> replicates_children_to(std::vector<fs::path> const& destinations
      , bool exclusive = false)
    {
      return replicate(destinations, exclusive, true);
    }

    /**
     * @brief Mode of the files generated by the last replication
     */
    FileTree& has_file_mode(mode_t mode)
    {
      if (auto assertion = get_last_assertion<IsReplicatedTo>())
      {
        for(Replication const& replication : assertion->last())
        {
          std::ranges::for_each(replication.files, [&](auto const& e){ e->has_mode(mode); });
        }
      }
      return *this;
    }

    /**
     * @brief Mode of the directories generated by the last replication
     */
    FileTree& has_directory_mode(mode_t mode)
    {
      if (auto assertion = get_last_assertion<IsReplicatedTo>())
      {
        for(Replication const& replication : assertion->last())
        {
          std::ranges::for_each(replication.directories, [&](auto const& e){ e->has_mode(mode); });
        }
      }
      return *this;
    }

    [[nodiscard]] fs::path const& source() const { return m_source; }

    [[nodiscard]] std::string describe() const override
    {
      return "file tree " + m_source.string();
    }

    [[nodiscard]] std::shared_ptr<ns_engine::Subject> clone() const override
    {
      return create(m_source);
    }
};

} // namespace ns_file

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
