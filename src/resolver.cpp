#include <tinyil/resolver.hpp>
#include <tinyil/error.hpp>

#include <tsl/robin_map.h>

#include <algorithm>
#include <charconv>
#include <cctype>

using namespace std::literals::string_view_literals;

namespace tinyil
{

namespace
{

const auto primitive_map = tsl::robin_map<std::string_view, primitive_type>({
  { "void"sv,        primitive_type::void_ },
  { "bool"sv,        primitive_type::boolean },
  { "char"sv,        primitive_type::char_ },
  { "int8"sv,        primitive_type::int8 },
  { "uint8"sv,       primitive_type::uint8 },
  { "int16"sv,       primitive_type::int16 },
  { "uint16"sv,      primitive_type::uint16 },
  { "int32"sv,       primitive_type::int32 },
  { "uint32"sv,      primitive_type::uint32 },
  { "int64"sv,       primitive_type::int64 },
  { "uint64"sv,      primitive_type::uint64 },
  { "float32"sv,     primitive_type::float32 },
  { "float"sv,       primitive_type::float32 },
  { "float64"sv,     primitive_type::float64 },
  { "double"sv,      primitive_type::float64 },
  { "native int"sv,  primitive_type::native_int },
  { "native uint"sv, primitive_type::native_uint },
  { "string"sv,      primitive_type::string },
  { "object"sv,      primitive_type::object },
});

bool ends_with(std::string_view str, std::string_view suffix)
{ return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix; }

const type_def& require_definition(const type_ptr& type, std::string_view type_name)
{
  if(!type || type->kind != type_kind::defined)
    fail(error_kind::unresolved_symbol, "No type definition found with the name '{}'", type_name);
  return *type->def;
}

type_ptr find_generic_type(const method_context& ctx, std::string_view name)
{
  if(auto* p = find_generic(ctx.definition.generic_parameters, name))
    return make_generic(*p);

  for(const type_def* decl = ctx.definition.declaring_type; decl != nullptr; decl = decl->declaring_type)
  {
    if(auto* p = find_generic(decl->generic_parameters, name))
      return make_generic(*p);
  }

  fail(error_kind::unresolved_symbol, "Unable to locate generic type with name '{}'", name);
}

type_ptr expand_type_macro(method_context& ctx, std::string_view macro)
{
  if(iequals(macro, "declaringType"))
  {
    if(ctx.definition.declaring_type == nullptr)
      fail(error_kind::unresolved_symbol, "Method '{}' has no declaring type", ctx.definition.name);
    return make_defined(*ctx.definition.declaring_type);
  }

  auto space = macro.find(' ');
  if(space == std::string_view::npos)
    fail(error_kind::syntax, "Malformed type macro '[{}]'", macro);

  auto access = trim(macro.substr(0, space));
  auto name = trim(macro.substr(space + 1));

  if(iequals(access, "param") || iequals(access, "arg"))
    return find_param(ctx, name)->type;
  if(iequals(access, "var"))
    return ctx.body.locals[find_variable(ctx, name).index].type;

  fail(error_kind::syntax, "Unknown type macro '{}' in '[{}]'", access, macro);
}

std::pair<std::string_view, std::string_view> split_member(std::string_view full, std::string_view what)
{
  auto scope = full.find("::");
  if(scope == std::string_view::npos)
    fail(error_kind::syntax, "Malformed {} name '{}'", what, full);

  return { trim(full.substr(0, scope)), trim(full.substr(scope + 2)) };
}

}

std::string_view trim(std::string_view str)
{
  while(!str.empty() && std::isspace(static_cast<unsigned char>(str.front())))
    str.remove_prefix(1);
  while(!str.empty() && std::isspace(static_cast<unsigned char>(str.back())))
    str.remove_suffix(1);
  return str;
}

std::string to_lower(std::string_view str)
{
  std::string low(str);
  std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c) { return std::tolower(c); });
  return low;
}

std::optional<primitive_type> find_primitive(std::string_view name)
{
  if(auto it = primitive_map.find(to_lower(name)); it != primitive_map.end())
    return it->second;
  return std::nullopt;
}

type_modifiers strip_type_modifiers(std::string_view type_name)
{
  type_modifiers mods;
  auto name = trim(type_name);

  if(name.size() > " pinned"sv.size() && ends_with(name, " pinned"sv))
  {
    mods.pinned = true;
    name = trim(name.substr(0, name.size() - " pinned"sv.size()));
  }

  while(!name.empty() && name.back() == '*')
  {
    ++mods.pointer_depth;
    name = trim(name.substr(0, name.size() - 1));
  }

  if(name.empty())
    fail(error_kind::syntax, "Type name must not be empty, instead got '{}'", type_name);

  mods.element = name;
  return mods;
}

type_ptr apply_type_modifiers(type_ptr element, const type_modifiers& modifiers)
{
  for(std::size_t i = 0; i < modifiers.pointer_depth; ++i)
    element = make_pointer(std::move(element));
  if(modifiers.pinned)
    element = make_pinned(std::move(element));
  return element;
}

type_ptr find_type(method_context& ctx, std::string_view type_name)
{
  const auto mods = strip_type_modifiers(type_name);
  const auto name = mods.element;

  type_ptr type;
  if(auto prim = find_primitive(name))
  {
    type = make_primitive(*prim);
  }
  else if(name.substr(0, 2) == "!!")
  {
    type = find_generic_type(ctx, name.substr(2));
  }
  else if(name.size() >= 2 && name.front() == '[' && name.back() == ']')
  {
    type = expand_type_macro(ctx, trim(name.substr(1, name.size() - 2)));
  }
  else
  {
    for(auto* mod : ctx.modules)
    {
      if(auto* def = mod->find_type(name))
      {
        type = make_defined(*def);
        break;
      }
    }
  }

  if(!type)
    fail(error_kind::unresolved_symbol, "Unable to locate type with name '{}'", name);

  return ctx.own_module().import_reference(apply_type_modifiers(std::move(type), mods));
}

std::vector<type_ptr> parse_type_list(method_context& ctx, std::string_view type_list)
{
  std::vector<type_ptr> types;
  type_list = trim(type_list);
  if(type_list.empty())
    return types;

  std::size_t beg = 0;
  while(true)
  {
    auto comma = type_list.find(',', beg);
    types.push_back(find_type(ctx, type_list.substr(beg, comma == std::string_view::npos ? comma : comma - beg)));
    if(comma == std::string_view::npos)
      break;
    beg = comma + 1;
  }
  return types;
}

const param_def* find_param(const method_context& ctx, std::string_view param_name)
{
  if(param_name.empty())
    fail(error_kind::syntax, "Parameter name must not be empty");

  for(auto& p : ctx.definition.parameters)
  {
    if(p->name == param_name)
      return p.get();
  }

  fail(error_kind::unresolved_symbol, "No parameter with name '{}' found in method '{}'",
       param_name, ctx.definition.full_name());
}

local_ref find_variable(const method_context& ctx, std::string_view var_name)
{
  if(var_name.empty())
    fail(error_kind::syntax, "Local variable name must not be empty");

  std::size_t index = 0;
  auto [end, ec] = std::from_chars(var_name.data(), var_name.data() + var_name.size(), index);
  if(ec == std::errc() && end == var_name.data() + var_name.size())
  {
    if(index >= ctx.body.locals.size())
      fail(error_kind::unresolved_symbol, "No local variable with index {} found in method '{}'",
           index, ctx.definition.full_name());
    return local_ref { index };
  }

  auto it = std::find(ctx.var_names.begin(), ctx.var_names.end(), var_name);
  if(it == ctx.var_names.end())
    fail(error_kind::unresolved_symbol, "No local variable with name '{}' found in method '{}'",
         var_name, ctx.definition.full_name());

  return local_ref { static_cast<std::size_t>(it - ctx.var_names.begin()) };
}

const method_def* find_method(method_context& ctx, std::string_view method_name)
{
  auto [type_name, scoped] = split_member(method_name, "method");

  auto open = scoped.find('(');
  auto close = scoped.rfind(')');
  if(open == std::string_view::npos || close == std::string_view::npos || close < open)
    fail(error_kind::syntax, "Malformed method name '{}'", method_name);

  auto parameter_types = parse_type_list(ctx, scoped.substr(open + 1, close - open - 1));
  auto name = trim(scoped.substr(0, open));

  auto type = find_type(ctx, type_name);
  const type_def& def = require_definition(type, type_name);

  for(const type_def* current = &def; current != nullptr; current = current->base_definition())
  {
    for(auto& method : current->methods)
    {
      if(method->name != name || method->parameters.size() != parameter_types.size())
        continue;

      bool parameters_match = true;
      for(std::size_t i = 0; i < parameter_types.size() && parameters_match; ++i)
        parameters_match = same_type(method->parameters[i]->type, parameter_types[i]);

      if(parameters_match)
      {
        ctx.own_module().import_reference(method->return_type);
        return ctx.own_module().import_reference(method.get());
      }
    }
  }

  fail(error_kind::unresolved_symbol, "No method with name '{}' found on type '{}'", name, def.full_name());
}

const field_def* find_field(method_context& ctx, std::string_view field_name, bool is_static)
{
  auto [type_name, name] = split_member(field_name, "field");

  auto type = find_type(ctx, type_name);
  const type_def& def = require_definition(type, type_name);

  for(const type_def* current = &def; current != nullptr; current = current->base_definition())
  {
    for(auto& field : current->fields)
    {
      if(field->name == name)
      {
        ctx.own_module().import_reference(field->type);
        return ctx.own_module().import_reference(field.get());
      }
    }
  }

  fail(error_kind::unresolved_symbol, "No {} field with name '{}' found on type '{}'",
       is_static ? "static" : "instance", name, def.full_name());
}

call_site parse_call_site(method_context& ctx, std::string_view descriptor)
{
  auto open = descriptor.find('(');
  auto close = descriptor.rfind(')');
  if(open == std::string_view::npos || close == std::string_view::npos || close < open)
    fail(error_kind::syntax, "Malformed call site '{}'", descriptor);

  call_site site;
  auto head = trim(descriptor.substr(0, open));

  auto keyword = [&head](std::string_view kw)
  {
    if(head.size() > kw.size() && iequals(head.substr(0, kw.size()), kw)
        && std::isspace(static_cast<unsigned char>(head[kw.size()])))
    {
      head = trim(head.substr(kw.size()));
      return true;
    }
    return false;
  };

  for(bool more = true; more; )
  {
    more = false;
    if(keyword("instance"))
    { site.has_this = true; more = true; }
    else if(keyword("explicit"))
    { site.explicit_this = true; more = true; }
    else if(keyword("default"))
    { site.conv = calling_convention::default_; more = true; }
    else if(keyword("vararg"))
    { site.conv = calling_convention::vararg; more = true; }
    else if(keyword("unmanaged"))
    {
      if(keyword("cdecl"))
        site.conv = calling_convention::c;
      else if(keyword("stdcall"))
        site.conv = calling_convention::std_call;
      else if(keyword("thiscall"))
        site.conv = calling_convention::this_call;
      else if(keyword("fastcall"))
        site.conv = calling_convention::fast_call;
      else
        fail(error_kind::syntax, "Unknown unmanaged calling convention in call site '{}'", descriptor);
      more = true;
    }
  }

  site.return_type = find_type(ctx, head);
  site.parameters = parse_type_list(ctx, descriptor.substr(open + 1, close - open - 1));
  return site;
}

operand find_token(method_context& ctx, std::string_view token)
{
  if(token.find("::") != std::string_view::npos)
  {
    if(token.find('(') != std::string_view::npos)
      return find_method(ctx, token);
    return find_field(ctx, token, false);
  }
  return find_type(ctx, token);
}

std::string parse_user_string(std::string_view str)
{
  if(str.size() >= 2 && str.front() == '"' && str.back() == '"')
    str = str.substr(1, str.size() - 2);
  return std::string(str);
}

std::string_view resolve_constant(const method_context& ctx, std::string_view prefixed_name)
{
  if(auto* c = ctx.find_constant(prefixed_name))
    return c->value;

  fail(error_kind::unresolved_symbol, "No constant with name '{}' found in method '{}'",
       prefixed_name.substr(1), ctx.definition.full_name());
}

}
