#include <tinyil/patch_file_cache.hpp>
#include <tinyil/diagnostic_db.hpp>
#include <tinyil/diagnostic.hpp>
#include <tinyil/module_io.hpp>
#include <tinyil/compiler.hpp>
#include <tinyil/handlers.hpp>
#include <tinyil/encoder.hpp>
#include <tinyil/error.hpp>

#include <fmt/format.h>

#include <tsl/robin_map.h>

#include <filesystem>
#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <map>

namespace fs = std::filesystem;

namespace tinyil
{

namespace
{

struct description
{
  std::string path;
  nlohmann::json json;
  bool loaded { false };
  bool visiting { false };
};

template<typename F>
void for_each_compiled_method(const module& mod, F&& f)
{
  for(auto& def : mod.types)
  {
    for(auto& m : def->methods)
    {
      if(!m->body.empty())
        f(*m);
    }
  }
}

std::string describe(const compile_error& err)
{
  if(err.statement().empty())
    return err.message();
  return fmt::format("{} in \"{}\"", err.message(), err.statement());
}

std::string kind_name(error_kind kind)
{ return nlohmann::json(kind).get<std::string>(); }

}

void emit_listing(std::FILE* out, const module& mod)
{
  for_each_compiled_method(mod, [out](const method_def& m)
  {
    fmt::print(out, ".method {}\n", m.full_name());

    if(!m.body.locals.empty())
    {
      std::string locals;
      for(std::size_t i = 0; i < m.body.locals.size(); ++i)
        locals += fmt::format("{}{} V_{}", i == 0 ? "" : ", ", type_notation(m.body.locals[i].type, &m), i);
      fmt::print(out, "  .locals {}({})\n", m.body.init_locals ? "init " : "", locals);
    }

    for(std::size_t i = 0; i < m.body.size(); ++i)
      fmt::print(out, "  {}\n", format_instruction(m.body, i));
    fmt::print(out, "\n");
  });
}

void emit_bytecode(std::FILE* out, const module& mod)
{
  metadata_tokens tokens(mod);
  for_each_compiled_method(mod, [out, &tokens](const method_def& m)
  {
    std::vector<unsigned char> bytes;
    try
    {
      bytes = encode(m.body, m, tokens);
    }
    catch(compile_error& err)
    {
      err.at(m.full_name(), std::string(), 0);
      throw;
    }

    fmt::print(out, "{}\n  ", m.full_name());
    for(std::size_t i = 0; i < bytes.size(); ++i)
      fmt::print(out, "{:02X}{}", bytes[i], (i + 1) % 16 == 0 && i + 1 != bytes.size() ? "\n  " : " ");
    fmt::print(out, "\n");
  });
}

void emit_module(std::FILE* out, const module& mod)
{
  fmt::print(out, "{}\n", write_module(mod).dump(2));
}

static const std::map<emit_classes, std::function<void(std::FILE*, const module&)>> emitter =
{
  { emit_classes::listing, emit_listing },
  { emit_classes::bytecode, emit_bytecode },
  { emit_classes::module, emit_module },
};

void compiler::load_modules()
{
  std::vector<description> descriptions;
  auto read = [&descriptions](const fs::path& path)
  {
    try
    {
      descriptions.push_back(description { path.string(), parse_description(path) });
    }
    catch(const compile_error& err)
    {
      const auto p = path.string();
      diagnostic <<= diagnostic_db::load::module_failed(source_range { p, 0, 0, 0, 0 }, err.message());
    }
  };

  for(auto dir : config.reference_dirs)
  {
    std::error_code ec;
    std::vector<fs::path> files;
    for(fs::directory_iterator it(fs::path(dir), ec), end; !ec && it != end; it.increment(ec))
    {
      if(it->path().extension() == ".json")
        files.push_back(it->path());
    }
    if(files.empty())
      diagnostic <<= diagnostic_db::load::empty_reference_dir(source_range { dir, 0, 0, 0, 0 }, dir);

    std::sort(files.begin(), files.end());
    for(auto& f : files)
      read(f);
  }
  const std::size_t first_file = descriptions.size();
  for(auto f : config.files)
    read(fs::path(f));

  tsl::robin_map<std::string, std::size_t> by_name;
  for(std::size_t i = 0; i < descriptions.size(); ++i)
    by_name.emplace(descriptions[i].json.value("name", std::string()), i);

  // a module is read after the modules it references
  std::function<void(description&)> load = [&](description& d)
  {
    if(d.loaded || d.visiting)
      return;
    d.visiting = true;

    if(auto refs = d.json.find("references"); refs != d.json.end() && refs->is_array())
    {
      for(auto& r : *refs)
      {
        if(!r.is_string())
          continue;
        if(auto it = by_name.find(r.get<std::string>()); it != by_name.end())
          load(descriptions[it->second]);
      }
    }

    d.loaded = true;
    try
    {
      read_module(d.json, registry);
    }
    catch(const compile_error& err)
    {
      diagnostic <<= diagnostic_db::load::module_failed(source_range { d.path, 0, 0, 0, 0 },
                                                        fmt::format("[{}] {}", kind_name(err.kind()), err.message()));
    }
  };
  for(auto& d : descriptions)
    load(d);

  target_name.clear();
  if(first_file < descriptions.size())
    target_name = descriptions[first_file].json.value("name", std::string());
}

std::size_t compiler::rewrite(module& target)
{
  patch_file_cache cache(fs::path(config.patch_dir), config.patch_extension);

  std::size_t failed = 0;
  const auto rewritten = traverse_methods_and_modify(target, cache, [&failed](const method_def& method, const compile_error& err)
  {
    ++failed;

    const std::string where = err.method().empty() ? method.full_name() : err.method();
    diagnostic <<= diagnostic_db::compile::method_failed(source_range { where, 0, err.row(), 0, err.row() },
                                                         kind_name(err.kind()), describe(err));
  });

  const source_range mod_range { target.name, 0, 0, 0, 0 };
  if(failed != 0)
  {
    diagnostic <<= diagnostic_db::compile::module_not_written(mod_range, target.name, failed);
    return 0;
  }
  if(rewritten == 0)
    diagnostic <<= diagnostic_db::compile::module_unmodified(mod_range, target.name);
  else
    diagnostic <<= diagnostic_db::compile::methods_compiled(mod_range, rewritten, target.name);
  return rewritten;
}

void compiler::emit(const module& target)
{
  auto em = emitter.find(config.emit_class);
  if(em == emitter.end())
    return;

  std::unique_ptr<std::FILE, decltype(&std::fclose)> file(nullptr, &std::fclose);
  std::FILE* out = stdout;
  if(config.output_file != "-")
  {
    file.reset(std::fopen(config.output_file.c_str(), "w"));
    if(!file)
    {
      diagnostic <<= diagnostic_db::emit::cannot_open_output(source_range { "emit", 0, 0, 0, 0 }, config.output_file);
      return;
    }
    out = file.get();
  }

  try
  {
    em->second(out, target);
  }
  catch(const compile_error& err)
  {
    diagnostic <<= diagnostic_db::emit::encoding_failed(source_range { err.method(), 0, 0, 0, 0 },
                                                        kind_name(err.kind()), err.message());
  }
}

void compiler::go()
{
  load_modules();
  if(diagnostic.error_code() != 0 || target_name.empty())
    return;

  module* target = registry.resolve(target_name);
  if(target == nullptr)
    return;

  if(rewrite(*target) == 0)
    return;

  emit(*target);
}

}
