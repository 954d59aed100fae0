#pragma once

#include <tinyil/metadata.hpp>

#include <cstdint>
#include <vector>

namespace tinyil
{

/// Evaluation stack entry. Integers are kept sign extended in `i`.
struct value
{
  enum class type : std::uint8_t
  {
    int32,
    int64,
    native_int,
    floating
  };

  type kind { type::int32 };
  std::int64_t i { 0 };
  double f { 0.0 };

  static value int32(std::int32_t v)
  { return value { type::int32, v, 0.0 }; }

  static value int64(std::int64_t v)
  { return value { type::int64, v, 0.0 }; }

  static value native(std::intptr_t v)
  { return value { type::native_int, static_cast<std::int64_t>(v), 0.0 }; }

  static value floating(double v)
  { return value { type::floating, 0, v }; }

  std::int32_t as_int32() const
  { return static_cast<std::int32_t>(i); }

  std::uint32_t as_uint32() const
  { return static_cast<std::uint32_t>(i); }

  bool truthy() const
  { return kind == type::floating ? f != 0.0 : i != 0; }
};

/// Runs compiled method bodies directly from their instruction list.
///
/// Covers loads, stores, constants, arithmetic, comparisons, conversions, indirect
/// access through native addresses and every branch. Calls, objects and exception
/// handling are out of its reach and raise execution_error, as do stack underflow,
/// division by zero and running past the step limit.
struct vm
{
public:
  static constexpr std::size_t default_step_limit = 1'000'000;
public:
  explicit vm(std::size_t step_limit = default_step_limit);

  // `this` is passed as first argument for instance methods, the result of a void method is int32 0
  value run(const method_def& method, std::vector<value> arguments);

  void run_next_instr();

  std::size_t program_counter() const;
  std::size_t steps() const;
  const std::vector<value>& stack() const;
private:
  value pop();
  void push(value v);

  std::size_t argument_slot(const instruction& instr) const;
  std::size_t local_slot(const instruction& instr) const;

  void branch(const instruction& instr);
  void binary(op_code op);
  void compare_and_branch(op_code op, const instruction& instr);
  void convert(op_code op);
  void load_indirect(op_code op);
  void store_indirect(op_code op);
private:
  const method_def* method { nullptr };

  std::vector<value> args;
  std::vector<value> locals;
  std::vector<value> eval_stack;

  std::size_t pc { 0 };
  std::size_t step_count { 0 };
  std::size_t step_limit;

  bool returned { false };
  value result;
};

}
