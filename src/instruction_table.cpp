#include <tinyil/instruction_table.hpp>
#include <tinyil/resolver.hpp>
#include <tinyil/error.hpp>

#include <type_traits>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>

using namespace std::literals::string_view_literals;

namespace tinyil
{

template<typename T>
T parse_integer(std::string_view text)
{
  using U = std::make_unsigned_t<T>;

  auto str = trim(text);
  bool negative = false;
  if(!str.empty() && (str.front() == '-' || str.front() == '+'))
  {
    negative = str.front() == '-';
    str.remove_prefix(1);
  }

  int base = 10;
  if(str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X'))
  {
    base = 16;
    str.remove_prefix(2);
  }

  std::uint64_t magnitude = 0;
  auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), magnitude, base);
  if(str.empty() || ec != std::errc() || end != str.data() + str.size())
    fail(error_kind::syntax, "'{}' is not a valid integer literal", text);

  // positive literals may use the full unsigned range and wrap, like `ldc.i4 0x811C9DC5`
  constexpr std::uint64_t positive_limit = std::numeric_limits<U>::max();
  constexpr std::uint64_t negative_limit = static_cast<std::uint64_t>(std::numeric_limits<T>::max()) + 1;

  if(negative)
  {
    if(magnitude > negative_limit)
      fail(error_kind::syntax, "Integer literal '{}' out of range", text);
    return static_cast<T>(static_cast<U>(~magnitude + 1));
  }

  if(magnitude > positive_limit)
    fail(error_kind::syntax, "Integer literal '{}' out of range", text);
  return static_cast<T>(static_cast<U>(magnitude));
}

template std::int8_t parse_integer<std::int8_t>(std::string_view);
template std::uint8_t parse_integer<std::uint8_t>(std::string_view);
template std::int32_t parse_integer<std::int32_t>(std::string_view);
template std::int64_t parse_integer<std::int64_t>(std::string_view);

namespace
{

template<typename F>
F parse_floating(std::string_view text, F(*conv)(const char*, char**))
{
  std::string str(trim(text));
  char* end = nullptr;
  F value = conv(str.c_str(), &end);
  if(str.empty() || end != str.c_str() + str.size())
    fail(error_kind::syntax, "'{}' is not a valid floating point literal", text);
  return value;
}

bool is_static_field_op(op_code op)
{ return op == op_code::LDSFLD || op == op_code::LDSFLDA || op == op_code::STSFLD; }

instruction_generator generator_for(op_code op, operand_kind kind)
{
  switch(kind)
  {
  case operand_kind::type:
    return [op](std::string_view a, method_context& ctx) { return instruction(op, find_type(ctx, a)); };

  case operand_kind::method:
    return [op](std::string_view a, method_context& ctx) { return instruction(op, find_method(ctx, a)); };

  case operand_kind::field:
    return [op](std::string_view a, method_context& ctx) { return instruction(op, find_field(ctx, a, is_static_field_op(op))); };

  case operand_kind::short_arg:
  case operand_kind::arg:
    return [op](std::string_view a, method_context& ctx) { return instruction(op, find_param(ctx, a)); };

  case operand_kind::short_local:
  case operand_kind::local:
    return [op](std::string_view a, method_context& ctx) { return instruction(op, find_variable(ctx, a)); };

  case operand_kind::int8:
    return [op](std::string_view a, method_context&) { return instruction(op, parse_integer<std::int8_t>(a)); };

  case operand_kind::uint8:
    return [op](std::string_view a, method_context&)
    {
      auto alignment = parse_integer<std::uint8_t>(a);
      if(alignment != 1 && alignment != 2 && alignment != 4)
        fail(error_kind::syntax, "Alignment must be 1, 2 or 4, instead got '{}'", a);
      return instruction(op, alignment);
    };

  case operand_kind::int32:
    return [op](std::string_view a, method_context&) { return instruction(op, parse_integer<std::int32_t>(a)); };

  case operand_kind::int64:
    return [op](std::string_view a, method_context&) { return instruction(op, parse_integer<std::int64_t>(a)); };

  case operand_kind::float32:
    return [op](std::string_view a, method_context&) { return instruction(op, parse_float32(a)); };

  case operand_kind::float64:
    return [op](std::string_view a, method_context&) { return instruction(op, parse_float64(a)); };

  case operand_kind::string:
    return [op](std::string_view a, method_context&) { return instruction(op, parse_user_string(a)); };

  case operand_kind::token:
    return [op](std::string_view a, method_context& ctx) { return instruction(op, find_token(ctx, a)); };

  case operand_kind::signature:
    return [op](std::string_view a, method_context& ctx) { return instruction(op, parse_call_site(ctx, a)); };

  default:
    return nullptr;
  }
}

operand_command unaligned_shorthand(std::uint8_t alignment)
{
  return operand_command {
    [alignment](std::string_view, method_context&) { return instruction(op_code::UNALIGNED, alignment); },
    false
  };
}

}

float parse_float32(std::string_view text)
{ return parse_floating<float>(text, &std::strtof); }

double parse_float64(std::string_view text)
{ return parse_floating<double>(text, &std::strtod); }

instruction_table::instruction_table()
{
  for(std::size_t i = 0; i < static_cast<std::size_t>(op_code::UNKNOWN); ++i)
  {
    const auto op = static_cast<op_code>(i);
    const auto& inf = info(op);

    switch(inf.operand)
    {
    case operand_kind::none:
      no_operand_commands.emplace(inf.mnemonic, op);
      break;

    case operand_kind::short_branch:
    case operand_kind::branch:
    case operand_kind::switch_:
      branch_commands.emplace(inf.mnemonic, op);
      break;

    default:
      operand_commands.emplace(inf.mnemonic, operand_command { generator_for(op, inf.operand) });
      break;
    }
  }

  operand_commands.emplace("unaligned.1"sv, unaligned_shorthand(1));
  operand_commands.emplace("unaligned.2"sv, unaligned_shorthand(2));
  operand_commands.emplace("unaligned.4"sv, unaligned_shorthand(4));
}

const instruction_table& instruction_table::get()
{
  static const instruction_table table;
  return table;
}

std::optional<op_code> instruction_table::find_no_operand(std::string_view mnemonic) const
{
  if(auto it = no_operand_commands.find(mnemonic); it != no_operand_commands.end())
    return it->second;
  return std::nullopt;
}

std::optional<op_code> instruction_table::find_branch(std::string_view mnemonic) const
{
  if(auto it = branch_commands.find(mnemonic); it != branch_commands.end())
    return it->second;
  return std::nullopt;
}

const operand_command* instruction_table::find_operand_command(std::string_view mnemonic) const
{
  if(auto it = operand_commands.find(mnemonic); it != operand_commands.end())
    return &it->second;
  return nullptr;
}

}
