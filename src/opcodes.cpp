#include <tinyil/opcodes.hpp>

#include <iterator>

namespace tinyil
{

namespace
{

constexpr opcode_info opcode_table[] = {
#define TINYIL_OPCODE_INFO(name, mnemonic, value, flow, operand) \
  { mnemonic, value, flow_control::flow, operand_kind::operand },
  TINYIL_OPCODES(TINYIL_OPCODE_INFO)
#undef TINYIL_OPCODE_INFO
};

constexpr opcode_info unknown_opcode { "<unknown>", 0xFFFF, flow_control::next, operand_kind::none };

static_assert(std::size(opcode_table) == static_cast<std::size_t>(op_code::UNKNOWN),
              "opcode table out of sync with op_code");

}

const opcode_info& info(op_code op)
{
  const auto idx = static_cast<std::size_t>(op);
  if(idx >= std::size(opcode_table))
    return unknown_opcode;
  return opcode_table[idx];
}

std::size_t operand_size(operand_kind kind)
{
  switch(kind)
  {
  case operand_kind::none:
    return 0;

  case operand_kind::short_branch:
  case operand_kind::int8:
  case operand_kind::uint8:
  case operand_kind::short_arg:
  case operand_kind::short_local:
    return 1;

  case operand_kind::arg:
  case operand_kind::local:
    return 2;

  case operand_kind::int64:
  case operand_kind::float64:
    return 8;

  // switch is variable length, the encoder adds the targets
  case operand_kind::switch_:
  case operand_kind::branch:
  case operand_kind::int32:
  case operand_kind::float32:
  case operand_kind::string:
  case operand_kind::type:
  case operand_kind::method:
  case operand_kind::field:
  case operand_kind::token:
  case operand_kind::signature:
    return 4;
  }
  return 0;
}

}
