#pragma once

#include <tinyil/metadata.hpp>

#include <string_view>
#include <string>
#include <vector>

namespace tinyil
{

struct label_definition
{
  std::string label;
  std::size_t index;
};

// a branch whose target is patched in once every label is known
struct late_branch
{
  std::string label;
  op_code op;
  std::size_t placeholder;
};

struct constant_definition
{
  std::string name;
  std::string value;
};

/// Per method compilation state. Never reused across methods.
struct method_context
{
  // names of constants are stored with this prefix, which is also how they are referenced
  static constexpr char constant_prefix = '#';

  explicit method_context(method_def& definition);

  method_context(const method_context&) = delete;
  method_context& operator=(const method_context&) = delete;

  void prepare_overwrite();

  void define_variable(std::string_view name, type_ptr type);
  void define_label(std::string_view name);
  void define_constant(std::string_view name, std::string_view value);
  void import_module(std::string_view assembly_name);

  std::size_t emit(instruction instr);
  std::size_t emit_placeholder(std::string_view label, op_code op);

  const constant_definition* find_constant(std::string_view prefixed_name) const;
  const label_definition* find_label(std::string_view name) const;

  module& own_module() const
  { return definition.owner(); }

  method_def& definition;
  method_body& body;

  std::vector<std::string> var_names;
  std::vector<label_definition> labels;
  std::vector<late_branch> branches;
  std::vector<constant_definition> constants;
  std::vector<module*> modules;
};

bool iequals(std::string_view lhs, std::string_view rhs);

}
