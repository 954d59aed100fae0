#include <tinyil/handlers.hpp>
#include <tinyil/assembler.hpp>

#include <optional>
#include <string>

namespace tinyil
{

namespace
{

// removes the attribute and hands back its single string argument
std::optional<std::string> take_attribute(method_def& method, std::string_view name)
{
  auto it = find_custom_attribute(method.attributes, name);
  if(it == method.attributes.end())
    return std::nullopt;

  if(it->args.empty())
    fail(error_kind::syntax, "{} on '{}' is missing its argument", name, method.full_name());

  std::string arg = std::move(it->args.front());
  method.attributes.erase(it);
  return arg;
}

}

bool intrinsic_il::process(method_def& method)
{
  auto text = take_attribute(method, attribute_name);
  if(!text)
    return false;

  assembler::assemble(method, *text);
  return true;
}

bool external_il::process(method_def& method, patch_file_cache& cache)
{
  auto name = take_attribute(method, attribute_name);
  if(!name)
    return false;

  try
  {
    assembler::assemble(method, cache.find_patch(*name));
  }
  catch(compile_error& err)
  {
    err.at(method.full_name(), *name, 0);
    throw;
  }
  return true;
}

bool compile_method(method_def& method, patch_file_cache& cache)
{
  if(intrinsic_il::process(method))
    return true;
  return external_il::process(method, cache);
}

std::size_t traverse_methods_and_modify(module& mod, patch_file_cache& cache, const method_error_handler& on_error)
{
  std::size_t modified = 0;
  for(auto& type : mod.types)
  {
    for(auto& method : type->methods)
    {
      try
      {
        if(compile_method(*method, cache))
          ++modified;
      }
      catch(const compile_error& err)
      {
        on_error(*method, err);
      }
    }
  }
  return modified;
}

}
