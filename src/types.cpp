#include <tinyil/types.hpp>
#include <tinyil/metadata.hpp>

#include <array>

namespace tinyil
{

std::string_view primitive_full_name(primitive_type prim)
{
  switch(prim)
  {
  case primitive_type::void_:       return "System.Void";
  case primitive_type::boolean:     return "System.Boolean";
  case primitive_type::char_:       return "System.Char";
  case primitive_type::int8:        return "System.SByte";
  case primitive_type::uint8:       return "System.Byte";
  case primitive_type::int16:       return "System.Int16";
  case primitive_type::uint16:      return "System.UInt16";
  case primitive_type::int32:       return "System.Int32";
  case primitive_type::uint32:      return "System.UInt32";
  case primitive_type::int64:       return "System.Int64";
  case primitive_type::uint64:      return "System.UInt64";
  case primitive_type::float32:     return "System.Single";
  case primitive_type::float64:     return "System.Double";
  case primitive_type::native_int:  return "System.IntPtr";
  case primitive_type::native_uint: return "System.UIntPtr";
  case primitive_type::string:      return "System.String";
  case primitive_type::object:      return "System.Object";
  }
  return "System.Void";
}

std::string_view primitive_name(primitive_type prim)
{
  switch(prim)
  {
  case primitive_type::void_:       return "void";
  case primitive_type::boolean:     return "bool";
  case primitive_type::char_:       return "char";
  case primitive_type::int8:        return "int8";
  case primitive_type::uint8:       return "uint8";
  case primitive_type::int16:       return "int16";
  case primitive_type::uint16:      return "uint16";
  case primitive_type::int32:       return "int32";
  case primitive_type::uint32:      return "uint32";
  case primitive_type::int64:       return "int64";
  case primitive_type::uint64:      return "uint64";
  case primitive_type::float32:     return "float32";
  case primitive_type::float64:     return "float64";
  case primitive_type::native_int:  return "native int";
  case primitive_type::native_uint: return "native uint";
  case primitive_type::string:      return "string";
  case primitive_type::object:      return "object";
  }
  return "void";
}

std::string type_sig::full_name() const
{
  switch(kind)
  {
  case type_kind::primitive:
    return std::string(primitive_full_name(prim));

  case type_kind::defined:
    return def->full_name();

  case type_kind::generic_parameter:
    return generic->name;

  case type_kind::pointer:
    return element->full_name() + "*";

  case type_kind::pinned:
    return element->full_name() + " pinned";
  }
  return {};
}

type_ptr make_primitive(primitive_type prim)
{
  // one shared instance per primitive
  static const auto table = []()
  {
    std::array<type_ptr, static_cast<std::size_t>(primitive_type::object) + 1> t;
    for(std::size_t i = 0; i < t.size(); ++i)
    {
      type_sig sig { type_kind::primitive };
      sig.prim = static_cast<primitive_type>(i);
      t[i] = std::make_shared<const type_sig>(sig);
    }
    return t;
  }();
  return table[static_cast<std::size_t>(prim)];
}

type_ptr make_defined(const type_def& def)
{
  type_sig sig { type_kind::defined };
  sig.def = &def;
  return std::make_shared<const type_sig>(std::move(sig));
}

type_ptr make_generic(const generic_param& param)
{
  type_sig sig { type_kind::generic_parameter };
  sig.generic = &param;
  return std::make_shared<const type_sig>(std::move(sig));
}

type_ptr make_pointer(type_ptr element)
{
  type_sig sig { type_kind::pointer };
  sig.element = std::move(element);
  return std::make_shared<const type_sig>(std::move(sig));
}

type_ptr make_pinned(type_ptr element)
{
  type_sig sig { type_kind::pinned };
  sig.element = std::move(element);
  return std::make_shared<const type_sig>(std::move(sig));
}

bool same_type(const type_ptr& lhs, const type_ptr& rhs)
{
  if(lhs == rhs)
    return true;
  if(!lhs || !rhs || lhs->kind != rhs->kind)
    return false;

  switch(lhs->kind)
  {
  case type_kind::primitive:
    return lhs->prim == rhs->prim;

  case type_kind::defined:
    return lhs->def == rhs->def || lhs->def->full_name() == rhs->def->full_name();

  case type_kind::generic_parameter:
    return lhs->generic == rhs->generic
        || (lhs->generic->position == rhs->generic->position && lhs->generic->name == rhs->generic->name);

  case type_kind::pointer:
  case type_kind::pinned:
    return same_type(lhs->element, rhs->element);
  }
  return false;
}

}
