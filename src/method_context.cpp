#include <tinyil/method_context.hpp>
#include <tinyil/error.hpp>

#include <algorithm>
#include <cctype>

namespace tinyil
{

bool iequals(std::string_view lhs, std::string_view rhs)
{
  return lhs.size() == rhs.size()
      && std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                    [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

method_context::method_context(method_def& definition)
  : definition(definition), body(definition.body)
{
  var_names.reserve(8);
  labels.reserve(8);
  branches.reserve(8);
  modules.push_back(&definition.owner());
}

void method_context::prepare_overwrite()
{
  body.clear();

  var_names.clear();
  labels.clear();
  branches.clear();
  constants.clear();
}

void method_context::define_variable(std::string_view name, type_ptr type)
{
  if(name.empty())
    fail(error_kind::syntax, "Local variable name must not be empty");

  if(std::find(var_names.begin(), var_names.end(), name) != var_names.end())
    fail(error_kind::duplicate_definition, "Local variable with name '{}' already defined for method '{}'",
         name, definition.full_name());

  body.locals.push_back(local_def { std::move(type) });
  var_names.emplace_back(name);
}

void method_context::define_label(std::string_view name)
{
  if(name.empty())
    fail(error_kind::syntax, "Label name must not be empty");

  if(find_label(name) != nullptr)
    fail(error_kind::duplicate_definition, "Label with name '{}' already defined in method '{}'",
         name, definition.full_name());

  labels.push_back(label_definition { std::string(name), body.size() });
}

void method_context::define_constant(std::string_view name, std::string_view value)
{
  if(name.empty())
    fail(error_kind::syntax, "Constant name must not be empty");

  std::string prefixed = constant_prefix + std::string(name);
  if(find_constant(prefixed) != nullptr)
    fail(error_kind::duplicate_definition, "Constant with name '{}' already defined in method '{}'",
         name, definition.full_name());

  constants.push_back(constant_definition { std::move(prefixed), std::string(value) });
}

void method_context::import_module(std::string_view assembly_name)
{
  if(assembly_name.empty())
    fail(error_kind::syntax, "#asmref must have an assembly name");

  auto& root = own_module();
  module* found = root.resolver ? root.resolver->resolve(assembly_name) : nullptr;
  if(found == nullptr)
    fail(error_kind::unresolved_symbol, "Could not resolve assembly '{}'", assembly_name);

  if(std::find(modules.begin(), modules.end(), found) == modules.end())
    modules.push_back(found);
  if(found != &root)
    root.add_module_reference(found->name);
}

std::size_t method_context::emit(instruction instr)
{ return body.append(std::move(instr)); }

std::size_t method_context::emit_placeholder(std::string_view label, op_code op)
{
  auto idx = body.append(instruction(op_code::NOP));
  branches.push_back(late_branch { std::string(label), op, idx });
  return idx;
}

const constant_definition* method_context::find_constant(std::string_view prefixed_name) const
{
  for(auto& c : constants)
  {
    if(iequals(c.name, prefixed_name))
      return &c;
  }
  return nullptr;
}

const label_definition* method_context::find_label(std::string_view name) const
{
  for(auto& l : labels)
  {
    if(iequals(l.label, name))
      return &l;
  }
  return nullptr;
}

}
