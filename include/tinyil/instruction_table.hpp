#pragma once

#include <tinyil/method_context.hpp>
#include <tinyil/instruction.hpp>

#include <tsl/robin_map.h>

#include <string_view>
#include <functional>
#include <optional>

namespace tinyil
{

using instruction_generator = std::function<instruction(std::string_view operand, method_context& ctx)>;

struct operand_command
{
  instruction_generator generate;
  bool requires_operand { true };
};

/// Mnemonic dispatch. Built once from the opcode list and read-only afterwards,
/// keys are expected in lower case.
struct instruction_table
{
  static const instruction_table& get();

  std::optional<op_code> find_no_operand(std::string_view mnemonic) const;
  std::optional<op_code> find_branch(std::string_view mnemonic) const;
  const operand_command* find_operand_command(std::string_view mnemonic) const;
private:
  instruction_table();
private:
  tsl::robin_map<std::string_view, op_code> no_operand_commands;
  tsl::robin_map<std::string_view, op_code> branch_commands;
  tsl::robin_map<std::string_view, operand_command> operand_commands;
};

template<typename T>
T parse_integer(std::string_view text);

float parse_float32(std::string_view text);
double parse_float64(std::string_view text);

}
