#include <tinyil/patch_file_cache.hpp>
#include <tinyil/resolver.hpp>
#include <tinyil/error.hpp>

#include <fstream>

namespace fs = std::filesystem;

namespace tinyil
{

namespace
{

constexpr std::string_view section_marker = "==";
constexpr std::string_view comment_marker = "//";

std::string_view trim_front(std::string_view str)
{
  while(!str.empty() && (str.front() == ' ' || str.front() == '\t'))
    str.remove_prefix(1);
  return str;
}

}

patch_file_cache::patch_file_cache(fs::path search_directory, std::string extension)
  : directory(std::move(search_directory)), extension(std::move(extension))
{  }

const std::string& patch_file_cache::find_patch(std::string_view qualified_name)
{
  auto colon = qualified_name.find(':');
  if(colon == std::string_view::npos || colon == 0 || colon + 1 == qualified_name.size())
    fail(error_kind::syntax, "Malformed patch name '{}', expected 'file:patch'", qualified_name);

  const std::string key(qualified_name);
  if(auto it = patches.find(key); it != patches.end())
    return it->second;

  auto file = qualified_name.substr(0, colon);
  if(auto it = failed.find(std::string(file)); it != failed.end())
    throw it->second;

  if(scanned.find(std::string(file)) == scanned.end())
  {
    scan(file);

    if(auto it = patches.find(key); it != patches.end())
      return it->second;
  }

  fail(error_kind::patch_not_found, "Unable to find patch '{}' in file '{}{}' under '{}'",
       qualified_name.substr(colon + 1), file, extension, directory.string());
}

void patch_file_cache::scan(std::string_view file)
{
  scanned.insert(std::string(file));
  ++scans;

  std::error_code ec;
  fs::recursive_directory_iterator it(directory, ec);
  if(ec)
    return;

  // sections only become visible once every file of the prefix parsed cleanly
  patch_map found;
  try
  {
    for(; it != fs::recursive_directory_iterator(); it.increment(ec))
    {
      if(ec)
        break;

      const auto& path = it->path();
      if(!it->is_regular_file(ec) || path.extension() != extension || path.stem() != fs::path(file))
        continue;

      parse_file(path, file, found);
    }
  }
  catch(const compile_error& err)
  {
    failed.emplace(std::string(file), err);
    throw;
  }

  for(auto& p : found)
    patches.emplace(p.first, p.second.text);
}

void patch_file_cache::parse_file(const fs::path& path, std::string_view file, patch_map& found)
{
  std::ifstream is(path);
  if(!is)
    fail(error_kind::patch_not_found, "Unable to open patch file '{}'", path.string());

  std::string section;
  std::string text;
  bool in_section = false;

  std::string line;
  while(std::getline(is, line))
  {
    if(!line.empty() && line.back() == '\r')
      line.pop_back();

    auto content = trim_front(line);
    if(content.substr(0, section_marker.size()) == section_marker)
    {
      if(in_section)
        add_patch(found, fmt::format("{}:{}", file, section), std::move(text), path);

      section = std::string(trim(content.substr(section_marker.size())));
      text.clear();
      in_section = true;
      continue;
    }

    if(!in_section || trim(content).empty() || content.substr(0, comment_marker.size()) == comment_marker)
      continue;

    if(!text.empty())
      text += '\n';
    text += content;
  }

  if(in_section)
    add_patch(found, fmt::format("{}:{}", file, section), std::move(text), path);
}

void patch_file_cache::add_patch(patch_map& found, std::string key, std::string text, const fs::path& path)
{
  if(auto it = found.find(key); it != found.end())
    fail(error_kind::duplicate_patch, "Patch '{}' is defined more than once, in '{}' and again in '{}'",
         key, it->second.origin.string(), path.string());

  found.emplace(std::move(key), patch_section { std::move(text), path });
}

}
