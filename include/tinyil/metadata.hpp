#pragma once

#include <tinyil/instruction.hpp>
#include <tinyil/types.hpp>

#include <tsl/robin_map.h>

#include <string_view>
#include <memory>
#include <string>
#include <vector>

namespace tinyil
{

struct module;
struct type_def;
struct method_def;

struct custom_attribute
{
  std::string type_name;
  std::vector<std::string> args;
};

using attribute_list = std::vector<custom_attribute>;

attribute_list::iterator find_custom_attribute(attribute_list& attrs, std::string_view name);

struct generic_param
{
  std::string name;
  std::size_t position;
};

using generic_param_list = std::vector<std::unique_ptr<generic_param>>;

const generic_param* find_generic(const generic_param_list& params, std::string_view name);

struct field_def
{
  using cRef = const field_def*;

  std::string name;
  type_ptr type;
  bool is_static { false };

  const type_def* declaring_type { nullptr };

  std::string full_name() const;
};

struct param_def
{
  using cRef = const param_def*;

  std::string name;
  type_ptr type;
  std::size_t index;
};

struct method_def
{
  using Ref = method_def*;
  using cRef = const method_def*;

  std::string name;
  type_ptr return_type;
  std::vector<std::unique_ptr<param_def>> parameters;
  bool has_this { false };

  generic_param_list generic_parameters;
  type_def* declaring_type { nullptr };

  attribute_list attributes;
  method_body body;

  param_def& add_parameter(std::string name, type_ptr type);

  module& owner() const;

  // `System.Void Ns.Type::Name(System.Int32,System.Char*)`
  std::string full_name() const;
};

struct type_def
{
  using Ref = type_def*;
  using cRef = const type_def*;

  std::string ns;
  std::string name;

  type_def* declaring_type { nullptr };
  type_ptr base_type;
  module* owner { nullptr };

  generic_param_list generic_parameters;
  std::vector<std::unique_ptr<field_def>> fields;
  std::vector<std::unique_ptr<method_def>> methods;
  std::vector<type_def*> nested_types;

  attribute_list attributes;

  field_def& add_field(std::string name, type_ptr type, bool is_static);
  method_def& add_method(std::string name, type_ptr return_type, bool has_this);
  generic_param& add_generic_parameter(std::string name);

  // resolved definition of the base type, nullptr for roots and non-defined bases
  const type_def* base_definition() const;

  // `Ns.Outer/Inner`
  std::string full_name() const;
};

struct module_resolver
{
  virtual ~module_resolver() = default;

  virtual module* resolve(std::string_view assembly_name) = 0;
};

struct module
{
  explicit module(std::string name, module_resolver* resolver = nullptr)
    : name(std::move(name)), resolver(resolver)
  {  }

  module(const module&) = delete;
  module& operator=(const module&) = delete;

  type_def& add_type(std::string ns, std::string name, type_def* enclosing = nullptr);

  type_def* find_type(std::string_view full_name) const;

  // records a durable reference so the module can still name the member once written
  type_ptr import_reference(type_ptr type);
  const method_def* import_reference(const method_def* method);
  const field_def* import_reference(const field_def* field);

  void add_module_reference(std::string_view assembly_name);

  bool owns(const type_def& def) const
  { return def.owner == this; }

  std::string name;
  module_resolver* resolver;

  std::vector<std::unique_ptr<type_def>> types;
  std::vector<std::string> module_references;
  std::vector<std::string> imported_references;
private:
  void record(std::string full_name);

  tsl::robin_map<std::string, type_def*> type_index;
};

/// Owns a set of modules and resolves them by assembly name.
struct module_registry : module_resolver
{
  module& create(std::string name);

  module* resolve(std::string_view assembly_name) override;

  std::vector<std::unique_ptr<module>> modules;
};

}
