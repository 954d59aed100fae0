#pragma once

#include <tinyil/opcodes.hpp>
#include <tinyil/types.hpp>

#include <cstdint>
#include <variant>
#include <string>
#include <vector>

namespace tinyil
{

struct method_def;
struct field_def;
struct param_def;

struct local_def
{
  type_ptr type;
};

struct local_ref
{
  std::size_t index;
};

// targets are instruction indices into the owning body
struct branch_target
{
  std::size_t index;
};

using switch_targets = std::vector<branch_target>;

enum class calling_convention : std::uint8_t
{
  default_,
  vararg,
  c,
  std_call,
  this_call,
  fast_call
};

struct call_site
{
  calling_convention conv { calling_convention::default_ };
  bool has_this { false };
  bool explicit_this { false };

  type_ptr return_type;
  std::vector<type_ptr> parameters;

  std::string full_name() const;
};

using operand = std::variant<std::monostate,
                             std::int8_t,
                             std::uint8_t,
                             std::int32_t,
                             std::int64_t,
                             float,
                             double,
                             std::string,
                             type_ptr,
                             const method_def*,
                             const field_def*,
                             const param_def*,
                             local_ref,
                             branch_target,
                             switch_targets,
                             call_site>;

struct instruction
{
  instruction(op_code op = op_code::NOP) : op(op), arg()
  {  }

  instruction(op_code op, operand arg) : op(op), arg(std::move(arg))
  {  }

  op_code opcode() const
  { return op; }

  flow_control flow() const
  { return info(op).flow; }

  op_code op;
  operand arg;
};

struct method_body
{
  void clear()
  { instructions.clear(); locals.clear(); }

  std::size_t size() const
  { return instructions.size(); }

  bool empty() const
  { return instructions.empty(); }

  std::size_t append(instruction instr)
  {
    instructions.push_back(std::move(instr));
    return instructions.size() - 1;
  }

  void replace(std::size_t index, instruction instr)
  { instructions.at(index) = std::move(instr); }

  std::vector<instruction> instructions;
  std::vector<local_def> locals;

  bool init_locals { true };
};

/// Renders `IL_0003: ldloc hash` style listing lines.
std::string format_instruction(const method_body& body, std::size_t index);
std::string format_operand(const method_body& body, const operand& arg);

}
