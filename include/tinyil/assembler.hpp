#pragma once

#include <tinyil/method_context.hpp>
#include <tinyil/line_parser.hpp>

#include <string_view>

namespace tinyil
{

/// Rewrites the body of a method from assembly text.
///
/// Phase one parses every statement and emits instructions, branches are emitted as
/// placeholders. Phase two patches the placeholders once all labels are known and makes
/// sure the body ends in a terminator. Any failure throws `compile_error` annotated with
/// the method and the offending statement, the body is left empty in that case.
struct assembler
{
  static void assemble(method_def& method, std::string_view source);
private:
  explicit assembler(method_def& method);

  void phase_one(std::string_view source);
  void phase_two();

  void process_statement(const statement& stmt);
  void process_instruction(std::string_view mnemonic, std::string_view operand);

  void resolve_branching();
  void validate_return();

  branch_target resolve_label(std::string_view label);
private:
  method_context ctx;
  bool targets_end { false };
};

}
