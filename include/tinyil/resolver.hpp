#pragma once

#include <tinyil/method_context.hpp>

#include <string_view>
#include <optional>
#include <string>
#include <vector>

namespace tinyil
{

/// Type names:
///   primitives      int32, uint8, float64, native int, string, object, ...
///   pointers        int32*, char**     (each `*` is one level)
///   pinned          char* pinned
///   generics        !!T                (method first, then enclosing types)
///   macros          [declaringType], [param NAME], [arg NAME], [var NAME|INDEX]
///   anything else   qualified name searched in every imported module in order
type_ptr find_type(method_context& ctx, std::string_view type_name);

// `char** pinned` is the element `char` behind two pointer levels, pinned
struct type_modifiers
{
  std::string_view element;
  std::size_t pointer_depth { 0 };
  bool pinned { false };
};

type_modifiers strip_type_modifiers(std::string_view type_name);
type_ptr apply_type_modifiers(type_ptr element, const type_modifiers& modifiers);

// case insensitive lookup in the fixed primitive name table
std::optional<primitive_type> find_primitive(std::string_view name);

std::vector<type_ptr> parse_type_list(method_context& ctx, std::string_view type_list);

const param_def* find_param(const method_context& ctx, std::string_view param_name);

local_ref find_variable(const method_context& ctx, std::string_view var_name);

// `Type::Name(P1, P2)`
const method_def* find_method(method_context& ctx, std::string_view method_name);

// `Type::name`
const field_def* find_field(method_context& ctx, std::string_view field_name, bool is_static);

// `[callconv] RET(P1, P2)`
call_site parse_call_site(method_context& ctx, std::string_view descriptor);

// operand of `ldtoken`: a method, a field or a type
operand find_token(method_context& ctx, std::string_view token);

std::string parse_user_string(std::string_view str);

std::string_view resolve_constant(const method_context& ctx, std::string_view prefixed_name);

std::string_view trim(std::string_view str);
std::string to_lower(std::string_view str);

}
