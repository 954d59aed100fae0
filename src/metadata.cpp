#include <tinyil/metadata.hpp>

#include <algorithm>

namespace tinyil
{

attribute_list::iterator find_custom_attribute(attribute_list& attrs, std::string_view name)
{
  // `TinyIL.IntrinsicILAttribute` is found as `IntrinsicILAttribute` too
  return std::find_if(attrs.begin(), attrs.end(), [name](const custom_attribute& attr)
  {
    std::string_view type_name = attr.type_name;
    if(auto dot = type_name.rfind('.'); dot != std::string_view::npos && type_name.substr(dot + 1) == name)
      return true;
    return type_name == name;
  });
}

const generic_param* find_generic(const generic_param_list& params, std::string_view name)
{
  for(auto& p : params)
  {
    if(p->name == name)
      return p.get();
  }
  return nullptr;
}

std::string field_def::full_name() const
{
  std::string str = type->full_name();
  str += " ";
  if(declaring_type)
    str += declaring_type->full_name() + "::";
  str += name;
  return str;
}

param_def& method_def::add_parameter(std::string name, type_ptr type)
{
  auto index = parameters.size();
  parameters.push_back(std::make_unique<param_def>(param_def { std::move(name), std::move(type), index }));
  return *parameters.back();
}

module& method_def::owner() const
{ return *declaring_type->owner; }

std::string method_def::full_name() const
{
  std::string str = return_type ? return_type->full_name() : "System.Void";
  str += " ";
  if(declaring_type)
    str += declaring_type->full_name() + "::";
  str += name;
  str += "(";
  for(auto it = parameters.begin(); it != parameters.end(); ++it)
  {
    if(it != parameters.begin())
      str += ",";
    str += (*it)->type->full_name();
  }
  str += ")";
  return str;
}

field_def& type_def::add_field(std::string name, type_ptr type, bool is_static)
{
  auto field = std::make_unique<field_def>();
  field->name = std::move(name);
  field->type = std::move(type);
  field->is_static = is_static;
  field->declaring_type = this;

  fields.push_back(std::move(field));
  return *fields.back();
}

method_def& type_def::add_method(std::string name, type_ptr return_type, bool has_this)
{
  auto method = std::make_unique<method_def>();
  method->name = std::move(name);
  method->return_type = std::move(return_type);
  method->has_this = has_this;
  method->declaring_type = this;

  methods.push_back(std::move(method));
  return *methods.back();
}

generic_param& type_def::add_generic_parameter(std::string name)
{
  auto pos = generic_parameters.size();
  generic_parameters.push_back(std::make_unique<generic_param>(generic_param { std::move(name), pos }));
  return *generic_parameters.back();
}

const type_def* type_def::base_definition() const
{
  if(!base_type || base_type->kind != type_kind::defined)
    return nullptr;
  return base_type->def;
}

std::string type_def::full_name() const
{
  if(declaring_type)
    return declaring_type->full_name() + "/" + name;
  if(ns.empty())
    return name;
  return ns + "." + name;
}

type_def& module::add_type(std::string ns, std::string name, type_def* enclosing)
{
  auto def = std::make_unique<type_def>();
  def->ns = std::move(ns);
  def->name = std::move(name);
  def->declaring_type = enclosing;
  def->owner = this;

  auto* ref = def.get();
  types.push_back(std::move(def));

  if(enclosing)
    enclosing->nested_types.push_back(ref);
  type_index[ref->full_name()] = ref;

  return *ref;
}

type_def* module::find_type(std::string_view full_name) const
{
  if(auto it = type_index.find(std::string(full_name)); it != type_index.end())
    return it->second;
  return nullptr;
}

void module::record(std::string full_name)
{
  if(std::find(imported_references.begin(), imported_references.end(), full_name) == imported_references.end())
    imported_references.push_back(std::move(full_name));
}

type_ptr module::import_reference(type_ptr type)
{
  const type_sig* inner = type.get();
  while(inner && inner->element)
    inner = inner->element.get();

  if(inner && inner->kind == type_kind::defined && !owns(*inner->def))
    record(inner->def->full_name());

  return type;
}

const method_def* module::import_reference(const method_def* method)
{
  if(method->declaring_type && !owns(*method->declaring_type))
  {
    import_reference(make_defined(*method->declaring_type));
    record(method->full_name());
  }
  return method;
}

const field_def* module::import_reference(const field_def* field)
{
  if(field->declaring_type && !owns(*field->declaring_type))
  {
    import_reference(make_defined(*field->declaring_type));
    record(field->full_name());
  }
  return field;
}

void module::add_module_reference(std::string_view assembly_name)
{
  if(std::find(module_references.begin(), module_references.end(), assembly_name) == module_references.end())
    module_references.emplace_back(assembly_name);
}

module& module_registry::create(std::string name)
{
  modules.push_back(std::make_unique<module>(std::move(name), this));
  return *modules.back();
}

module* module_registry::resolve(std::string_view assembly_name)
{
  for(auto& m : modules)
  {
    if(m->name == assembly_name)
      return m.get();
  }
  return nullptr;
}

}
