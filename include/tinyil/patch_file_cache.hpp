#pragma once

#include <tsl/robin_map.h>
#include <tsl/robin_set.h>

#include <tinyil/error.hpp>

#include <string_view>
#include <filesystem>
#include <string>

namespace tinyil
{

/// Lazily indexed patch sections, keyed by `file:patch`.
///
/// Patch files hold named sections:
///
///     == FNV_HASH
///     // comment lines and blank lines are dropped
///     ldarg.1
///     ...
///
/// Each distinct `file` prefix triggers at most one recursive scan of the search
/// directory. A prefix whose scan hit a duplicate section keeps failing with
/// `duplicate_patch` for the rest of the cache lifetime. Not synchronized, guard it externally if shared between threads.
class patch_file_cache
{
public:
  static constexpr std::string_view default_extension = ".ilpatch";

  explicit patch_file_cache(std::filesystem::path search_directory,
                            std::string extension = std::string(default_extension));

  const std::string& find_patch(std::string_view qualified_name);

  const std::filesystem::path& search_directory() const
  { return directory; }

  std::size_t scan_count() const
  { return scans; }
private:
  struct patch_section
  {
    std::string text;
    std::filesystem::path origin;
  };
  using patch_map = tsl::robin_map<std::string, patch_section>;

  void scan(std::string_view file);
  void parse_file(const std::filesystem::path& path, std::string_view file, patch_map& found);
  void add_patch(patch_map& found, std::string key, std::string text, const std::filesystem::path& path);
private:
  std::filesystem::path directory;
  std::string extension;

  tsl::robin_map<std::string, std::string> patches;
  tsl::robin_set<std::string> scanned;
  tsl::robin_map<std::string, compile_error> failed;
  std::size_t scans { 0 };
};

}
