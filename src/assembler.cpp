#include <tinyil/assembler.hpp>
#include <tinyil/instruction_table.hpp>
#include <tinyil/resolver.hpp>
#include <tinyil/error.hpp>

using namespace std::literals::string_view_literals;

namespace tinyil
{

namespace
{

std::pair<std::string_view, std::string_view> split_directive(std::string_view directive, std::string_view operand)
{
  auto space = operand.find_first_of(" \t");
  if(space == std::string_view::npos)
    fail(error_kind::syntax, "{} expects a name and a value, instead got '{}'", directive, operand);

  return { operand.substr(0, space), trim(operand.substr(space + 1)) };
}

}

assembler::assembler(method_def& method)
  : ctx(method)
{  }

void assembler::assemble(method_def& method, std::string_view source)
{
  assembler assm(method);

  try
  {
    assm.phase_one(source);
    assm.phase_two();
  }
  catch(compile_error& err)
  {
    // a failed method forfeits its body
    assm.ctx.prepare_overwrite();
    err.at(method.full_name(), {}, 0);
    throw;
  }
}

void assembler::phase_one(std::string_view source)
{
  ctx.prepare_overwrite();

  for(auto& stmt : read_statements(source))
  {
    try
    {
      process_statement(stmt);
    }
    catch(compile_error& err)
    {
      err.at(ctx.definition.full_name(), std::string(stmt.text), stmt.row);
      throw;
    }
  }
}

void assembler::phase_two()
{
  resolve_branching();
  validate_return();
}

void assembler::process_statement(const statement& stmt)
{
  if(is_label_definition(stmt.mnemonic))
  {
    ctx.define_label(stmt.mnemonic.substr(0, stmt.mnemonic.size() - 1));

    // `LABEL: ret` labels the instruction that follows on the same statement
    if(!stmt.operand.empty())
      process_statement(split_statement(stmt.operand, stmt.row));
    return;
  }

  const auto mnemonic = to_lower(stmt.mnemonic);

  if(mnemonic == "#var"sv)
  {
    auto [name, type] = split_directive("#var"sv, stmt.operand);
    ctx.define_variable(name, find_type(ctx, type));
    return;
  }
  if(mnemonic == "#asmref"sv)
  {
    ctx.import_module(stmt.operand);
    return;
  }
  if(mnemonic == "#const"sv)
  {
    auto [name, value] = split_directive("#const"sv, stmt.operand);
    ctx.define_constant(name, value);
    return;
  }
  if(mnemonic.front() == method_context::constant_prefix)
    fail(error_kind::syntax, "Unknown directive '{}'", stmt.mnemonic);

  if(!stmt.operand.empty() && stmt.operand.front() == method_context::constant_prefix)
  {
    const std::string substituted(resolve_constant(ctx, stmt.operand));
    process_instruction(mnemonic, substituted);
  }
  else
    process_instruction(mnemonic, stmt.operand);
}

void assembler::process_instruction(std::string_view mnemonic, std::string_view operand)
{
  const auto& table = instruction_table::get();

  if(auto op = table.find_no_operand(mnemonic))
  {
    if(!operand.empty())
      fail(error_kind::syntax, "Opcode '{}' does not take an operand, instead got '{}'", mnemonic, operand);

    ctx.emit(instruction(*op));
    return;
  }

  if(auto op = table.find_branch(mnemonic))
  {
    if(operand.empty())
      fail(error_kind::syntax, "Branch opcode '{}' requires a label", mnemonic);

    ctx.emit_placeholder(operand, *op);
    return;
  }

  if(auto* command = table.find_operand_command(mnemonic))
  {
    if(command->requires_operand && operand.empty())
      fail(error_kind::syntax, "Opcode '{}' requires an operand", mnemonic);
    if(!command->requires_operand && !operand.empty())
      fail(error_kind::syntax, "Opcode '{}' does not take an operand, instead got '{}'", mnemonic, operand);

    ctx.emit(command->generate(operand, ctx));
    return;
  }

  fail(error_kind::syntax, "Unknown opcode '{}'", mnemonic);
}

branch_target assembler::resolve_label(std::string_view label)
{
  if(auto* def = ctx.find_label(trim(label)))
  {
    targets_end |= def->index == ctx.body.size();
    return branch_target { def->index };
  }

  fail(error_kind::unresolved_label, "Unable to resolve label '{}' in method '{}'",
       trim(label), ctx.definition.full_name());
}

void assembler::resolve_branching()
{
  for(auto& branch : ctx.branches)
  {
    if(branch.op != op_code::SWITCH)
    {
      ctx.body.replace(branch.placeholder, instruction(branch.op, resolve_label(branch.label)));
      continue;
    }

    // jump table, order and duplicates are significant
    switch_targets targets;
    std::string_view labels = branch.label;
    std::size_t beg = 0;
    while(true)
    {
      auto comma = labels.find(',', beg);
      targets.push_back(resolve_label(labels.substr(beg, comma == std::string_view::npos ? comma : comma - beg)));
      if(comma == std::string_view::npos)
        break;
      beg = comma + 1;
    }
    ctx.body.replace(branch.placeholder, instruction(branch.op, std::move(targets)));
  }
}

void assembler::validate_return()
{
  auto& body = ctx.body;
  if(body.empty())
  {
    ctx.emit(instruction(op_code::NOP));
    ctx.emit(instruction(op_code::RET));
    return;
  }

  // a branch to a label behind the last instruction still needs something to land on
  const auto flow = body.instructions.back().flow();
  if(targets_end || (flow != flow_control::return_ && flow != flow_control::throw_))
    ctx.emit(instruction(op_code::RET));
}

}
