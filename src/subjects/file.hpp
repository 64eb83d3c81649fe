/**
 * @file file.hpp
 * @author Ruan Formigoni
 * @brief Files, directories and symbolic links
 *
 * Entries are inspected with lstat(2), a symbolic link is an entry of its own and is never
 * followed. Paths occupied by anything other than a regular file, a directory or a symbolic link
 * (sockets, fifos, devices) cannot be reconciled and are reported as errors.
 *
 * @code
 * auto file = ns_file::File::create("/etc/motd");
 * file->has_content("Welcome\n", true).has_mode(0644);
 * Pop(file->apply(log, ns_engine::Mode::Modify));
 * @endcode
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "../engine/subject.hpp"
#include "../lib/diff.hpp"
#include "../lib/user.hpp"
#include "../std/filesystem.hpp"
#include "../std/string.hpp"

/**
 * @namespace ns_file
 * @brief Filesystem subjects, the assertions made about them and the changes they perform
 */
namespace ns_file
{

namespace fs = std::filesystem;

using ns_engine::Assertion;
using ns_engine::Change;
using ns_engine::DiffLine;
using ns_engine::Mode;

// Longest content diff shown in full
constexpr size_t MAX_DIFF_SIZE = 250;

enum class Kind
{
  None,
  File,
  Directory,
  Symlink,
  Other,
};

/**
 * @brief Finds what occupies a path, without following symbolic links
 */
[[nodiscard]] inline Kind kind(fs::path const& path)
{
  auto st = ns_fs::lstat(path);
  if (not st) { return Kind::None; }
  if (S_ISREG(st->st_mode)) { return Kind::File; }
  if (S_ISDIR(st->st_mode)) { return Kind::Directory; }
  if (S_ISLNK(st->st_mode)) { return Kind::Symlink; }
  return Kind::Other;
}

/**
 * @brief Converts a file mode into a directory mode, every read bit grants the respective
 * execute bit
 */
[[nodiscard]] constexpr mode_t to_dir_mode(mode_t mode)
{
  return mode | ((mode & 0444) >> 2);
}

[[nodiscard]] inline std::string fmt_mode(mode_t mode)
{
  return std::format("{:03o}", mode);
}

// Changes {{{

namespace ns_change
{

[[nodiscard]] inline Change file_created(fs::path const& path)
{
  return Change("file created", {}, [path]() -> Value<void>
  {
    return ns_fs::write_file(path, "");
  });
}

[[nodiscard]] inline Change directory_created(fs::path const& path)
{
  return Change("directory created", {}, [path]() -> Value<void>
  {
    std::error_code ec;
    fs::create_directory(path, ec);
    return_if(ec, Error("E::Could not create directory '{}': {}", path, ec.message()));
    return {};
  });
}

[[nodiscard]] inline Change symlink_created(fs::path const& path, fs::path const& target)
{
  return Change("symlink created", {}, [path, target]() -> Value<void>
  {
    std::error_code ec;
    fs::create_symlink(target, path, ec);
    return_if(ec, Error("E::Could not create symlink '{}' to '{}': {}", path, target, ec.message()));
    return {};
  });
}

[[nodiscard]] inline Change symlink_changed(fs::path const& path, fs::path const& old_target, fs::path const& target)
{
  return Change("symlink changed"
    , { DiffLine::remove(old_target.string()), DiffLine::add(target.string()) }
    , [path, target]() -> Value<void>
    {
      std::error_code ec;
      fs::remove(path, ec);
      return_if(ec, Error("E::Could not remove symlink '{}': {}", path, ec.message()));
      fs::create_symlink(target, path, ec);
      return_if(ec, Error("E::Could not create symlink '{}' to '{}': {}", path, target, ec.message()));
      return {};
    }
  );
}

[[nodiscard]] inline Change removed(std::string name, fs::path const& path, bool recursive)
{
  return Change(std::move(name), {}, [path, recursive]() -> Value<void>
  {
    std::error_code ec;
    if (recursive) { fs::remove_all(path, ec); }
    else { fs::remove(path, ec); }
    return_if(ec, Error("E::Could not remove '{}': {}", path, ec.message()));
    return {};
  });
}

[[nodiscard]] inline Change file_removed(fs::path const& path)
{
  return removed("file removed", path, false);
}

[[nodiscard]] inline Change directory_removed(fs::path const& path)
{
  return removed("directory removed", path, true);
}

[[nodiscard]] inline Change symlink_removed(fs::path const& path)
{
  return removed("symlink removed", path, false);
}

[[nodiscard]] inline Change user_changed(fs::path const& path, std::string const& old_user, std::string const& user)
{
  return Change("user changed"
    , { DiffLine::remove(old_user), DiffLine::add(user) }
    , [path, user]() -> Value<void>
    {
      uid_t id = Pop(ns_user::uid(user));
      return_if(::lchown(path.c_str(), id, static_cast<gid_t>(-1)) < 0
        , Error("E::Could not change user of '{}' to '{}': {}", path, user, strerror(errno))
      );
      return {};
    }
  );
}

[[nodiscard]] inline Change group_changed(fs::path const& path, std::string const& old_group, std::string const& group)
{
  return Change("group changed"
    , { DiffLine::remove(old_group), DiffLine::add(group) }
    , [path, group]() -> Value<void>
    {
      gid_t id = Pop(ns_user::gid(group));
      return_if(::lchown(path.c_str(), static_cast<uid_t>(-1), id) < 0
        , Error("E::Could not change group of '{}' to '{}': {}", path, group, strerror(errno))
      );
      return {};
    }
  );
}

[[nodiscard]] inline Change mode_changed(fs::path const& path, mode_t old_mode, mode_t mode)
{
  return Change("mode changed"
    , { DiffLine::remove(fmt_mode(old_mode)), DiffLine::add(fmt_mode(mode)) }
    , [path, mode]() -> Value<void>
    {
      return_if(::chmod(path.c_str(), mode) < 0
        , Error("E::Could not change mode of '{}' to '{}': {}", path, fmt_mode(mode), strerror(errno))
      );
      return {};
    }
  );
}

/**
 * @brief Formats the lines of a unified diff as change details
 */
[[nodiscard]] inline std::vector<DiffLine> format_diff(std::vector<std::string> const& diff)
{
  std::vector<DiffLine> ret;
  for(std::string const& line : diff)
  {
    continue_if(line.empty());
    std::string stripped = ns_string::trim(line);
    continue_if(stripped == "---" or stripped == "+++");
    // Mark lines without a terminator
    std::string trimmed = line;
    while (trimmed.ends_with('\n') or trimmed.ends_with('\r')) { trimmed.pop_back(); }
    if (trimmed == line) { trimmed += "^m"; }
    if (line.starts_with('@')) { ret.push_back(DiffLine::header(trimmed)); continue; }
    std::string content = trimmed.substr(1);
    switch (line.front())
    {
      case '-': ret.push_back(DiffLine::remove(content)); break;
      case '+': ret.push_back(DiffLine::add(content)); break;
      case ' ': ret.push_back(DiffLine::neutral(content)); break;
      default: break;
    }
  }
  return ret;
}

/**
 * @brief Details of a content change, a summary when the diff is too long to be shown
 */
[[nodiscard]] inline std::vector<DiffLine> content_details(std::string_view from, std::string_view to)
{
  std::vector<std::string> diff = ns_diff::unified(from, to);
  std::vector<DiffLine> lines;
  if (diff.size() > MAX_DIFF_SIZE)
  {
    auto f_count = [&](char tag)
    {
      return std::ranges::count_if(diff, [&](std::string const& line)
      {
        std::string stripped = ns_string::trim(line);
        return stripped != "---" and stripped != "+++" and line.starts_with(tag);
      });
    };
    lines.push_back(DiffLine::neutral("Diff too long to be shown. Summary:"));
    lines.push_back(DiffLine::add(std::format("{} lines", f_count('+'))));
    lines.push_back(DiffLine::remove(std::format("{} lines", f_count('-'))));
    lines.push_back(DiffLine::neutral("Sample:"));
    std::ranges::copy(format_diff(std::vector<std::string>(diff.begin(), diff.begin() + 10)), std::back_inserter(lines));
    lines.push_back(DiffLine::detail("8< -------------------------------"));
    std::ranges::copy(format_diff(std::vector<std::string>(diff.end() - 10, diff.end())), std::back_inserter(lines));
  }
  else
  {
    lines = format_diff(diff);
  }
  if (lines.empty()) { lines.push_back(DiffLine::detail("<only whitespace changes>")); }
  return lines;
}

[[nodiscard]] inline Change content_changed(fs::path const& path, std::string_view from, std::string content)
{
  auto details = content_details(from, content);
  return Change("content changed", std::move(details), [path, content = std::move(content)]() -> Value<void>
  {
    return ns_fs::write_file(path, content);
  });
}

[[nodiscard]] inline Change content_changed_summary(fs::path const& path, size_t old_size, std::string content)
{
  auto delta = static_cast<long long>(content.size()) - static_cast<long long>(old_size);
  std::string summary = (delta > 0)? std::format("+{}", delta) : std::to_string(delta);
  return Change("content changed", { DiffLine::detail(summary) }, [path, content = std::move(content)]() -> Value<void>
  {
    return ns_fs::write_file(path, content);
  });
}

} // namespace ns_change

// }}}

// Assertions {{{

/**
 * @brief Ownership of an entry, a missing user or group is left as is
 */
class HasOwner : public Assertion
{
  private:
    fs::path m_path;
    std::optional<std::string> m_user;
    std::optional<std::string> m_group;

    [[nodiscard]] static std::string describe(std::optional<std::string> const& user
      , std::optional<std::string> const& group)
    {
      std::vector<std::string> ownership;
      if (user) { ownership.push_back("user=" + *user); }
      if (group) { ownership.push_back("group=" + *group); }
      return "has owner: " + ns_string::from_container(ownership, " ");
    }

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      auto st = ns_fs::lstat(m_path);
      if (not st)
      {
        return_if(mode == Mode::Modify, Error("E::Cannot query owner of missing '{}'", m_path));
        display_failed(log);
        return {};
      }
      std::string old_user = ns_user::user_name(st->st_uid);
      std::string old_group = ns_user::group_name(st->st_gid);
      if (m_user and *m_user != old_user)
      {
        Pop(register_change(ns_change::user_changed(m_path, old_user, *m_user), mode));
      }
      if (m_group and *m_group != old_group)
      {
        Pop(register_change(ns_change::group_changed(m_path, old_group, *m_group), mode));
      }
      display(log);
      return {};
    }

  public:
    HasOwner(fs::path path, std::optional<std::string> user, std::optional<std::string> group)
      : Assertion(describe(user, group))
      , m_path(std::move(path))
      , m_user(std::move(user))
      , m_group(std::move(group))
    {}

    [[nodiscard]] std::optional<std::string> const& user() const { return m_user; }
    [[nodiscard]] std::optional<std::string> const& group() const { return m_group; }
};

/**
 * @brief Permission bits of an entry
 */
class HasMode : public Assertion
{
  private:
    fs::path m_path;
    mode_t m_mode;

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      auto st = ns_fs::lstat(m_path);
      if (not st)
      {
        return_if(mode == Mode::Modify, Error("E::Cannot query mode of missing '{}'", m_path));
        display_failed(log);
        return {};
      }
      mode_t current = st->st_mode & 0777;
      if (current != m_mode)
      {
        Pop(register_change(ns_change::mode_changed(m_path, current, m_mode), mode));
      }
      display(log);
      return {};
    }

  public:
    HasMode(fs::path path, mode_t mode)
      : Assertion("has mode: " + fmt_mode(mode))
      , m_path(std::move(path))
      , m_mode(mode)
    {}

    [[nodiscard]] mode_t mode() const { return m_mode; }
};

/**
 * @brief Base of the presence assertions, synthesizes the missing parent directory
 *
 * The parent subject is created once, in prepare(), and carries the ownership of the entry and
 * the mode given by parent_mode() when the entry asserts them.
 */
class IsPresent : public Assertion
{
  private:
    bool m_create_parents;
    std::shared_ptr<ns_engine::Subject> m_parent;

  protected:
    fs::path m_path;

    /**
     * @brief Mode of a synthesized parent directory given the mode asserted on the entry
     */
    [[nodiscard]] virtual std::optional<mode_t> parent_mode(mode_t mode) const
    {
      std::ignore = mode;
      return std::nullopt;
    }

    /**
     * @brief Removes an entry of another kind, registering the respective change
     */
    [[nodiscard]] Value<void> remove_other(Kind actual, Mode mode)
    {
      switch (actual)
      {
        case Kind::File: Pop(register_change(ns_change::file_removed(m_path), mode)); break;
        case Kind::Directory: Pop(register_change(ns_change::directory_removed(m_path), mode)); break;
        case Kind::Symlink: Pop(register_change(ns_change::symlink_removed(m_path), mode)); break;
        case Kind::Other: return Error("E::'{}' is not a file, directory or symlink", m_path);
        case Kind::None: break;
      }
      return {};
    }

  public:
    IsPresent(std::string name, fs::path path, bool create_parents)
      : Assertion(std::move(name))
      , m_create_parents(create_parents)
      , m_parent(nullptr)
      , m_path(std::move(path))
    {}

    [[nodiscard]] Value<void> prepare(ns_engine::Subject& subject) override;

    [[nodiscard]] bool create_parents() const { return m_create_parents; }
};

class IsFile final : public IsPresent
{
  protected:
    [[nodiscard]] std::optional<mode_t> parent_mode(mode_t mode) const override
    {
      return to_dir_mode(mode);
    }

    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      Kind actual = kind(m_path);
      if (actual == Kind::File)
      {
        display_passed(log);
        return {};
      }
      Pop(remove_other(actual, mode));
      Pop(register_change(ns_change::file_created(m_path), mode));
      display_changed(log);
      return {};
    }

  public:
    IsFile(fs::path path, bool create_parents)
      : IsPresent("is file", std::move(path), create_parents)
    {}
};

class IsDirectory final : public IsPresent
{
  protected:
    [[nodiscard]] std::optional<mode_t> parent_mode(mode_t mode) const override
    {
      return mode;
    }

    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      Kind actual = kind(m_path);
      if (actual == Kind::Directory)
      {
        display_passed(log);
        return {};
      }
      Pop(remove_other(actual, mode));
      Pop(register_change(ns_change::directory_created(m_path), mode));
      display_changed(log);
      return {};
    }

  public:
    IsDirectory(fs::path path, bool create_parents)
      : IsPresent("is directory", std::move(path), create_parents)
    {}
};

class IsSymlink final : public IsPresent
{
  private:
    fs::path m_target;

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      Kind actual = kind(m_path);
      if (actual == Kind::Symlink)
      {
        std::error_code ec;
        fs::path old_target = fs::read_symlink(m_path, ec);
        return_if(ec, Error("E::Could not read symlink '{}': {}", m_path, ec.message()));
        if (old_target == m_target)
        {
          display_passed(log);
          return {};
        }
        Pop(register_change(ns_change::symlink_changed(m_path, old_target, m_target), mode));
        display_changed(log);
        return {};
      }
      Pop(remove_other(actual, mode));
      Pop(register_change(ns_change::symlink_created(m_path, m_target), mode));
      display_changed(log);
      return {};
    }

  public:
    IsSymlink(fs::path path, fs::path target, bool create_parents)
      : IsPresent(std::format("is symlink to {}", target.string()), std::move(path), create_parents)
      , m_target(std::move(target))
    {}
};

class IsAbsent final : public Assertion
{
  private:
    fs::path m_path;

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      switch (kind(m_path))
      {
        case Kind::File: Pop(register_change(ns_change::file_removed(m_path), mode)); break;
        case Kind::Directory: Pop(register_change(ns_change::directory_removed(m_path), mode)); break;
        case Kind::Symlink: Pop(register_change(ns_change::symlink_removed(m_path), mode)); break;
        case Kind::Other: return Error("E::'{}' is not a file, directory or symlink", m_path);
        case Kind::None: break;
      }
      display(log);
      return {};
    }

  public:
    explicit IsAbsent(fs::path path)
      : Assertion("is absent")
      , m_path(std::move(path))
    {}
};

/**
 * @brief Text content of a file, drift is reported as a unified diff
 */
class HasContent final : public Assertion
{
  private:
    fs::path m_path;
    std::string m_content;

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      bool is_file = kind(m_path) == Kind::File;
      std::string existing;
      if (is_file) { existing = Pop(ns_fs::read_file(m_path)); }
      if (not is_file or existing != m_content)
      {
        Pop(register_change(ns_change::content_changed(m_path, existing, m_content), mode));
      }
      display(log);
      return {};
    }

  public:
    HasContent(fs::path path, std::string content)
      : Assertion("has content")
      , m_path(std::move(path))
      , m_content(std::move(content))
    {}
};

/**
 * @brief Binary content of a file, drift is reported as the size difference
 */
class HasBinaryContent final : public Assertion
{
  private:
    fs::path m_path;
    std::string m_content;

  protected:
    [[nodiscard]] Value<void> converge(ns_report::Log& log, Mode mode) override
    {
      bool is_file = kind(m_path) == Kind::File;
      std::string existing;
      if (is_file) { existing = Pop(ns_fs::read_file(m_path)); }
      if (not is_file or existing != m_content)
      {
        Pop(register_change(ns_change::content_changed_summary(m_path, existing.size(), m_content), mode));
      }
      display(log);
      return {};
    }

  public:
    HasBinaryContent(fs::path path, std::string content)
      : Assertion("has content")
      , m_path(std::move(path))
      , m_content(std::move(content))
    {}
};

// }}}

// Subjects {{{

/**
 * @brief Operations shared by files, directories and symbolic links
 *
 * @tparam Derived The concrete entry type
 */
template<typename Derived>
class FsEntry : public ns_engine::SubjectBase<Derived>
{
  protected:
    fs::path m_path;
    std::optional<std::pair<std::string,std::string>> m_default_owner;

    template<typename T, typename... Args>
    Derived& add_presence(Args&&... args)
    {
      this->add_assertion(std::make_unique<T>(m_path, std::forward<Args>(args)...));
      if (m_default_owner and not this->template has_assertion<HasOwner>())
      {
        has_owner(m_default_owner->first, m_default_owner->second);
      }
      return this->self();
    }

  public:
    explicit FsEntry(fs::path path)
      : m_path(std::move(path))
      , m_default_owner(std::nullopt)
    {}

    [[nodiscard]] fs::path const& path() const { return m_path; }

    /**
     * @brief Ownership asserted with the first presence assertion when none was given
     */
    Derived& with_default_owner(std::string user, std::string group)
    {
      m_default_owner = std::make_pair(std::move(user), std::move(group));
      return this->self();
    }

    Derived& is_absent()
    {
      this->add_assertion(std::make_unique<IsAbsent>(m_path));
      return this->self();
    }

    Derived& has_owner(std::optional<std::string> user, std::optional<std::string> group = std::nullopt)
    {
      this->add_assertion(std::make_unique<HasOwner>(m_path, std::move(user), std::move(group)));
      return this->self();
    }

    Derived& has_mode(mode_t mode)
    {
      this->add_assertion(std::make_unique<HasMode>(m_path, mode));
      return this->self();
    }

    Derived& is_system_file()
    {
      return has_owner("root", "root");
    }

    [[nodiscard]] std::string describe() const override
    {
      return "path " + m_path.string();
    }
};

class Directory final : public FsEntry<Directory>
{
  public:
    explicit Directory(fs::path path) : FsEntry(std::move(path)) {}

    [[nodiscard]] static std::shared_ptr<Directory> create(fs::path path)
    {
      return std::make_shared<Directory>(std::move(path));
    }

    /**
     * @brief Asserts that the directory exists
     *
     * @param create_parents Whether missing parent directories are created as well
     */
    Directory& is_present(bool create_parents = true)
    {
      return add_presence<IsDirectory>(create_parents);
    }

    [[nodiscard]] std::shared_ptr<ns_engine::Subject> clone() const override
    {
      return create(m_path);
    }
};

class File final : public FsEntry<File>
{
  public:
    explicit File(fs::path path) : FsEntry(std::move(path)) {}

    [[nodiscard]] static std::shared_ptr<File> create(fs::path path)
    {
      return std::make_shared<File>(std::move(path));
    }

    /**
     * @brief Asserts that the file exists
     *
     * @param create_parents Whether missing parent directories are created as well
     */
    File& is_present(bool create_parents = true)
    {
      return add_presence<IsFile>(create_parents);
    }

    File& has_content(std::string content, bool create_parents = false)
    {
      if (not has_assertion<IsFile>()) { is_present(create_parents); }
      add_assertion(std::make_unique<HasContent>(m_path, std::move(content)));
      return *this;
    }

    File& has_binary_content(std::string bytes, bool create_parents = false)
    {
      if (not has_assertion<IsFile>()) { is_present(create_parents); }
      add_assertion(std::make_unique<HasBinaryContent>(m_path, std::move(bytes)));
      return *this;
    }

    /**
     * @brief Content made of the given lines joined by newlines
     */
    File& has_lines(std::vector<std::string> const& lines, bool final_newline = true, bool create_parents = false)
    {
      std::string content = ns_string::from_container(lines, "\n");
      if (final_newline) { content += '\n'; }
      return has_content(std::move(content), create_parents);
    }

    /**
     * @brief Content copied from another file, compared as text when it is valid utf-8
     *
     * @param path_source The file with the desired content
     * @param create_parents Whether missing parent directories are created as well
     * @return Value<std::shared_ptr<File>> This file, or the error of reading the source
     */
    [[nodiscard]] Value<std::shared_ptr<File>> has_content_from(fs::path const& path_source, bool create_parents = false)
    {
      std::string content = Pop(ns_fs::read_file(path_source), "E::Could not read content of '{}'", m_path);
      if (ns_string::is_utf8(content)) { has_content(std::move(content), create_parents); }
      else { has_binary_content(std::move(content), create_parents); }
      return ptr();
    }

    [[nodiscard]] std::shared_ptr<ns_engine::Subject> clone() const override
    {
      return create(m_path);
    }
};

class Symlink final : public FsEntry<Symlink>
{
  public:
    explicit Symlink(fs::path path) : FsEntry(std::move(path)) {}

    [[nodiscard]] static std::shared_ptr<Symlink> create(fs::path path)
    {
      return std::make_shared<Symlink>(std::move(path));
    }

    Symlink& has_target(fs::path target, bool create_parents = false)
    {
      return add_presence<IsSymlink>(std::move(target), create_parents);
    }

    // Permission bits of symbolic links are not used on Linux
    Symlink& has_mode(mode_t) = delete;

    [[nodiscard]] std::shared_ptr<ns_engine::Subject> clone() const override
    {
      return create(m_path);
    }
};

// }}}

inline Value<void> IsPresent::prepare(ns_engine::Subject& subject)
{
  return_if(not m_create_parents or m_parent != nullptr, {});
  fs::path path_parent = m_path.parent_path();
  return_if(path_parent.empty() or ns_fs::lexists(path_parent), {});
  auto parent = Directory::create(path_parent);
  parent->is_present(true).annotate("parent directory " + path_parent.string());
  if (auto has_mode = subject.get_assertion<HasMode>())
  {
    if (auto mode = parent_mode(has_mode->mode())) { parent->has_mode(*mode); }
  }
  if (auto has_owner = subject.get_assertion<HasOwner>())
  {
    parent->has_owner(has_owner->user(), has_owner->group());
  }
  subject.add_prerequisite(parent);
  m_parent = parent;
  return {};
}

} // namespace ns_file

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
