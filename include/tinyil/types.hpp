#pragma once

#include <string_view>
#include <cstdint>
#include <memory>
#include <string>

namespace tinyil
{

struct type_def;
struct generic_param;

enum class primitive_type : std::uint8_t
{
  void_,
  boolean,
  char_,
  int8,
  uint8,
  int16,
  uint16,
  int32,
  uint32,
  int64,
  uint64,
  float32,
  float64,
  native_int,
  native_uint,
  string,
  object
};

enum class type_kind : std::uint8_t
{
  primitive,
  defined,
  generic_parameter,
  pointer,
  pinned
};

struct type_sig;

// signatures are immutable and shared, compare them with same_type()
using type_ptr = std::shared_ptr<const type_sig>;

struct type_sig
{
  type_kind kind;

  primitive_type prim { primitive_type::void_ };
  const type_def* def { nullptr };
  const generic_param* generic { nullptr };
  type_ptr element;

  std::string full_name() const;
};

type_ptr make_primitive(primitive_type prim);
type_ptr make_defined(const type_def& def);
type_ptr make_generic(const generic_param& param);
type_ptr make_pointer(type_ptr element);
type_ptr make_pinned(type_ptr element);

std::string_view primitive_full_name(primitive_type prim);

// assembly spelling, `int32`, `native int`, ...
std::string_view primitive_name(primitive_type prim);

bool same_type(const type_ptr& lhs, const type_ptr& rhs);

}
