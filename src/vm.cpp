#include <tinyil/vm.hpp>
#include <tinyil/error.hpp>

#include <fmt/format.h>

#include <cstring>
#include <limits>
#include <cmath>

namespace tinyil
{

namespace
{

enum class comparison : std::uint8_t
{
  eq,
  ne,
  gt,
  ge,
  lt,
  le
};

[[noreturn]] void fault(const std::string& message)
{ throw execution_error(message); }

value::type kind_of(const type_ptr& type)
{
  if(!type)
    return value::type::int32;

  switch(type->kind)
  {
  case type_kind::primitive:
    switch(type->prim)
    {
    case primitive_type::int64:
    case primitive_type::uint64:
      return value::type::int64;
    case primitive_type::float32:
    case primitive_type::float64:
      return value::type::floating;
    case primitive_type::native_int:
    case primitive_type::native_uint:
    case primitive_type::string:
    case primitive_type::object:
      return value::type::native_int;
    default:
      return value::type::int32;
    }

  case type_kind::pinned:
    return kind_of(type->element);

  default:
    return value::type::native_int;
  }
}

value zero_of(const type_ptr& type)
{
  switch(kind_of(type))
  {
  case value::type::int64:      return value::int64(0);
  case value::type::native_int: return value::native(0);
  case value::type::floating:   return value::floating(0.0);
  default:                      return value::int32(0);
  }
}

// binary numeric operations, int32 and native int mix into native int
value::type result_kind(op_code op, const value& a, const value& b)
{
  if(a.kind == b.kind)
    return a.kind;

  if((a.kind == value::type::native_int && b.kind == value::type::int32)
      || (a.kind == value::type::int32 && b.kind == value::type::native_int))
    return value::type::native_int;

  fault(fmt::format("Operand types of '{}' do not match", mnemonic(op)));
}

value make(value::type kind, std::uint64_t bits)
{
  switch(kind)
  {
  case value::type::int32:
    return value::int32(static_cast<std::int32_t>(static_cast<std::uint32_t>(bits)));
  case value::type::native_int:
    return value::native(static_cast<std::intptr_t>(bits));
  default:
    return value::int64(static_cast<std::int64_t>(bits));
  }
}

std::uint64_t unsigned_bits(value::type kind, const value& v)
{
  if(kind == value::type::int32)
    return static_cast<std::uint32_t>(v.i);
  return static_cast<std::uint64_t>(v.i);
}

bool compare(op_code op, comparison cmp, bool is_unsigned, const value& a, const value& b)
{
  if(a.kind == value::type::floating || b.kind == value::type::floating)
  {
    if(a.kind != b.kind)
      fault(fmt::format("Operand types of '{}' do not match", mnemonic(op)));

    // `.un` forms are true for unordered operands
    if(std::isnan(a.f) || std::isnan(b.f))
      return is_unsigned;

    switch(cmp)
    {
    case comparison::eq: return a.f == b.f;
    case comparison::ne: return a.f != b.f;
    case comparison::gt: return a.f > b.f;
    case comparison::ge: return a.f >= b.f;
    case comparison::lt: return a.f < b.f;
    case comparison::le: return a.f <= b.f;
    }
    return false;
  }

  const auto kind = result_kind(op, a, b);
  if(is_unsigned)
  {
    const auto x = unsigned_bits(kind, a);
    const auto y = unsigned_bits(kind, b);
    switch(cmp)
    {
    case comparison::eq: return x == y;
    case comparison::ne: return x != y;
    case comparison::gt: return x > y;
    case comparison::ge: return x >= y;
    case comparison::lt: return x < y;
    case comparison::le: return x <= y;
    }
    return false;
  }

  switch(cmp)
  {
  case comparison::eq: return a.i == b.i;
  case comparison::ne: return a.i != b.i;
  case comparison::gt: return a.i > b.i;
  case comparison::ge: return a.i >= b.i;
  case comparison::lt: return a.i < b.i;
  case comparison::le: return a.i <= b.i;
  }
  return false;
}

std::pair<comparison, bool> comparison_of(op_code op)
{
  switch(op)
  {
  case op_code::BEQ:    case op_code::BEQ_S:    case op_code::CEQ:    return { comparison::eq, false };
  case op_code::BNE_UN: case op_code::BNE_UN_S:                       return { comparison::ne, true };
  case op_code::BGT:    case op_code::BGT_S:    case op_code::CGT:    return { comparison::gt, false };
  case op_code::BGT_UN: case op_code::BGT_UN_S: case op_code::CGT_UN: return { comparison::gt, true };
  case op_code::BGE:    case op_code::BGE_S:                          return { comparison::ge, false };
  case op_code::BGE_UN: case op_code::BGE_UN_S:                       return { comparison::ge, true };
  case op_code::BLT:    case op_code::BLT_S:    case op_code::CLT:    return { comparison::lt, false };
  case op_code::BLT_UN: case op_code::BLT_UN_S: case op_code::CLT_UN: return { comparison::lt, true };
  case op_code::BLE:    case op_code::BLE_S:                          return { comparison::le, false };
  case op_code::BLE_UN: case op_code::BLE_UN_S:                       return { comparison::le, true };
  default:
    fault(fmt::format("'{}' is not a comparison", mnemonic(op)));
  }
}

std::int64_t signed_integer(const value& v)
{
  if(v.kind == value::type::floating)
    return static_cast<std::int64_t>(v.f);
  return v.i;
}

// int32 sources are zero extended, wider ones keep their bits
std::uint64_t unsigned_integer(const value& v)
{
  if(v.kind == value::type::floating)
    return static_cast<std::uint64_t>(v.f);
  return unsigned_bits(v.kind, v);
}

template<typename T>
const T& operand_of(const instruction& instr)
{
  if(auto* v = std::get_if<T>(&instr.arg))
    return *v;
  fault(fmt::format("Bad operand for '{}'", mnemonic(instr.op)));
}

template<typename T>
T read_address(const value& address)
{
  if(address.kind != value::type::native_int)
    fault("Indirect access needs a native address");
  if(address.i == 0)
    fault("Indirect access through a null address");

  T v;
  std::memcpy(&v, reinterpret_cast<const void*>(static_cast<std::intptr_t>(address.i)), sizeof(T));
  return v;
}

template<typename T>
void write_address(const value& address, T v)
{
  if(address.kind != value::type::native_int)
    fault("Indirect access needs a native address");
  if(address.i == 0)
    fault("Indirect access through a null address");

  std::memcpy(reinterpret_cast<void*>(static_cast<std::intptr_t>(address.i)), &v, sizeof(T));
}

}

vm::vm(std::size_t step_limit)
  : step_limit(step_limit)
{  }

std::size_t vm::program_counter() const
{ return pc; }

std::size_t vm::steps() const
{ return step_count; }

const std::vector<value>& vm::stack() const
{ return eval_stack; }

value vm::run(const method_def& method, std::vector<value> arguments)
{
  const std::size_t expected = method.parameters.size() + (method.has_this ? 1 : 0);
  if(arguments.size() != expected)
    fault(fmt::format("'{}' expects {} arguments, got {}", method.full_name(), expected, arguments.size()));

  this->method = &method;
  args = std::move(arguments);

  locals.clear();
  for(auto& l : method.body.locals)
    locals.push_back(zero_of(l.type));

  eval_stack.clear();
  pc = 0;
  step_count = 0;
  returned = false;
  result = value::int32(0);

  // core loop of our vm
  while(!returned)
  {
    if(pc >= method.body.size())
      fault(fmt::format("Execution ran past the end of '{}'", method.full_name()));
    if(++step_count > step_limit)
      fault(fmt::format("Step limit of {} exceeded in '{}'", step_limit, method.full_name()));

    run_next_instr();
  }
  return result;
}

value vm::pop()
{
  if(eval_stack.empty())
    fault(fmt::format("Evaluation stack underflow at IL_{:04x}", pc));

  value v = eval_stack.back();
  eval_stack.pop_back();
  return v;
}

void vm::push(value v)
{ eval_stack.push_back(v); }

std::size_t vm::argument_slot(const instruction& instr) const
{
  auto* const* param = std::get_if<const param_def*>(&instr.arg);
  if(param == nullptr)
    fault(fmt::format("Bad operand for '{}'", mnemonic(instr.op)));
  return (*param)->index + (method->has_this ? 1 : 0);
}

std::size_t vm::local_slot(const instruction& instr) const
{
  auto* local = std::get_if<local_ref>(&instr.arg);
  if(local == nullptr || local->index >= locals.size())
    fault(fmt::format("Bad operand for '{}'", mnemonic(instr.op)));
  return local->index;
}

void vm::branch(const instruction& instr)
{
  auto* target = std::get_if<branch_target>(&instr.arg);
  if(target == nullptr)
    fault(fmt::format("Bad operand for '{}'", mnemonic(instr.op)));
  pc = target->index;
}

void vm::compare_and_branch(op_code op, const instruction& instr)
{
  const value b = pop();
  const value a = pop();
  auto [cmp, is_unsigned] = comparison_of(op);

  if(compare(op, cmp, is_unsigned, a, b))
    branch(instr);
}

void vm::binary(op_code op)
{
  const value b = pop();
  const value a = pop();

  // shifts keep the type of the shifted value
  if(op == op_code::SHL || op == op_code::SHR || op == op_code::SHR_UN)
  {
    if(a.kind == value::type::floating || b.kind == value::type::floating)
      fault(fmt::format("'{}' needs integer operands", mnemonic(op)));

    const unsigned width = a.kind == value::type::int32 ? 32 : 64;
    const auto amount = static_cast<unsigned>(b.i) & (width - 1);

    if(op == op_code::SHL)
      push(make(a.kind, unsigned_bits(a.kind, a) << amount));
    else if(op == op_code::SHR)
      push(make(a.kind, static_cast<std::uint64_t>(a.i >> amount)));
    else
      push(make(a.kind, unsigned_bits(a.kind, a) >> amount));
    return;
  }

  const auto kind = result_kind(op, a, b);
  if(kind == value::type::floating)
  {
    switch(op)
    {
    case op_code::ADD: push(value::floating(a.f + b.f)); return;
    case op_code::SUB: push(value::floating(a.f - b.f)); return;
    case op_code::MUL: push(value::floating(a.f * b.f)); return;
    case op_code::DIV: push(value::floating(a.f / b.f)); return;
    case op_code::REM: push(value::floating(std::fmod(a.f, b.f))); return;
    default:
      fault(fmt::format("'{}' needs integer operands", mnemonic(op)));
    }
  }

  const auto x = unsigned_bits(kind, a);
  const auto y = unsigned_bits(kind, b);
  switch(op)
  {
  case op_code::ADD: push(make(kind, x + y)); return;
  case op_code::SUB: push(make(kind, x - y)); return;
  case op_code::MUL: push(make(kind, x * y)); return;
  case op_code::AND: push(make(kind, x & y)); return;
  case op_code::OR:  push(make(kind, x | y)); return;
  case op_code::XOR: push(make(kind, x ^ y)); return;

  case op_code::DIV:
  case op_code::REM:
    {
      if(b.i == 0)
        fault("Division by zero");

      const std::int64_t min = kind == value::type::int32 ? std::numeric_limits<std::int32_t>::min()
                                                          : std::numeric_limits<std::int64_t>::min();
      if(a.i == min && b.i == -1)
        fault(fmt::format("Arithmetic overflow in '{}'", mnemonic(op)));

      push(make(kind, static_cast<std::uint64_t>(op == op_code::DIV ? a.i / b.i : a.i % b.i)));
    } return;

  case op_code::DIV_UN:
  case op_code::REM_UN:
    if(y == 0)
      fault("Division by zero");
    push(make(kind, op == op_code::DIV_UN ? x / y : x % y));
    return;

  default:
    fault(fmt::format("Unsupported opcode '{}'", mnemonic(op)));
  }
}

void vm::convert(op_code op)
{
  const value v = pop();
  const auto s = signed_integer(v);
  const auto u = unsigned_integer(v);

  switch(op)
  {
  case op_code::CONV_I1: push(value::int32(static_cast<std::int8_t>(s))); break;
  case op_code::CONV_U1: push(value::int32(static_cast<std::uint8_t>(u))); break;
  case op_code::CONV_I2: push(value::int32(static_cast<std::int16_t>(s))); break;
  case op_code::CONV_U2: push(value::int32(static_cast<std::uint16_t>(u))); break;
  case op_code::CONV_I4: push(value::int32(static_cast<std::int32_t>(s))); break;
  case op_code::CONV_U4: push(value::int32(static_cast<std::int32_t>(static_cast<std::uint32_t>(u)))); break;
  case op_code::CONV_I8: push(value::int64(s)); break;
  case op_code::CONV_U8: push(value::int64(static_cast<std::int64_t>(u))); break;
  case op_code::CONV_I:  push(value::native(static_cast<std::intptr_t>(s))); break;
  case op_code::CONV_U:  push(value::native(static_cast<std::intptr_t>(u))); break;

  case op_code::CONV_R4:
    push(value::floating(static_cast<float>(v.kind == value::type::floating ? v.f : static_cast<double>(s))));
    break;
  case op_code::CONV_R8:
    push(value::floating(v.kind == value::type::floating ? v.f : static_cast<double>(s)));
    break;
  case op_code::CONV_R_UN:
    push(value::floating(v.kind == value::type::floating ? v.f : static_cast<double>(u)));
    break;

  default:
    fault(fmt::format("Unsupported opcode '{}'", mnemonic(op)));
  }
}

void vm::load_indirect(op_code op)
{
  const value address = pop();
  switch(op)
  {
  case op_code::LDIND_I1: push(value::int32(read_address<std::int8_t>(address))); break;
  case op_code::LDIND_U1: push(value::int32(read_address<std::uint8_t>(address))); break;
  case op_code::LDIND_I2: push(value::int32(read_address<std::int16_t>(address))); break;
  case op_code::LDIND_U2: push(value::int32(read_address<std::uint16_t>(address))); break;
  case op_code::LDIND_I4: push(value::int32(read_address<std::int32_t>(address))); break;
  case op_code::LDIND_U4: push(value::int32(static_cast<std::int32_t>(read_address<std::uint32_t>(address)))); break;
  case op_code::LDIND_I8: push(value::int64(read_address<std::int64_t>(address))); break;
  case op_code::LDIND_I:  push(value::native(read_address<std::intptr_t>(address))); break;
  case op_code::LDIND_R4: push(value::floating(read_address<float>(address))); break;
  case op_code::LDIND_R8: push(value::floating(read_address<double>(address))); break;
  default:
    fault(fmt::format("Unsupported opcode '{}'", mnemonic(op)));
  }
}

void vm::store_indirect(op_code op)
{
  const value v = pop();
  const value address = pop();
  switch(op)
  {
  case op_code::STIND_I1: write_address(address, static_cast<std::int8_t>(v.i)); break;
  case op_code::STIND_I2: write_address(address, static_cast<std::int16_t>(v.i)); break;
  case op_code::STIND_I4: write_address(address, static_cast<std::int32_t>(v.i)); break;
  case op_code::STIND_I8: write_address(address, static_cast<std::int64_t>(v.i)); break;
  case op_code::STIND_I:  write_address(address, static_cast<std::intptr_t>(v.i)); break;
  case op_code::STIND_R4: write_address(address, static_cast<float>(v.f)); break;
  case op_code::STIND_R8: write_address(address, v.f); break;
  default:
    fault(fmt::format("Unsupported opcode '{}'", mnemonic(op)));
  }
}

void vm::run_next_instr()
{
  if(method == nullptr || pc >= method->body.size())
    return;

  const auto& instr = method->body.instructions[pc++];
  const auto op = instr.op;
  switch(op)
  {
  default:
    fault(fmt::format("Unsupported opcode '{}' at IL_{:04x}", mnemonic(op), pc - 1));

  case op_code::NOP:
    break;

  case op_code::LDARG_0: case op_code::LDARG_1: case op_code::LDARG_2: case op_code::LDARG_3:
    {
      const auto slot = static_cast<std::size_t>(op) - static_cast<std::size_t>(op_code::LDARG_0);
      if(slot >= args.size())
        fault(fmt::format("No argument {} in '{}'", slot, method->full_name()));
      push(args[slot]);
    } break;

  case op_code::LDARG_S:
  case op_code::LDARG:
    push(args.at(argument_slot(instr)));
    break;

  case op_code::STARG_S:
  case op_code::STARG:
    args.at(argument_slot(instr)) = pop();
    break;

  case op_code::LDLOC_0: case op_code::LDLOC_1: case op_code::LDLOC_2: case op_code::LDLOC_3:
    {
      const auto slot = static_cast<std::size_t>(op) - static_cast<std::size_t>(op_code::LDLOC_0);
      if(slot >= locals.size())
        fault(fmt::format("No local {} in '{}'", slot, method->full_name()));
      push(locals[slot]);
    } break;

  case op_code::STLOC_0: case op_code::STLOC_1: case op_code::STLOC_2: case op_code::STLOC_3:
    {
      const auto slot = static_cast<std::size_t>(op) - static_cast<std::size_t>(op_code::STLOC_0);
      if(slot >= locals.size())
        fault(fmt::format("No local {} in '{}'", slot, method->full_name()));
      locals[slot] = pop();
    } break;

  case op_code::LDLOC_S:
  case op_code::LDLOC:
    push(locals[local_slot(instr)]);
    break;

  case op_code::STLOC_S:
  case op_code::STLOC:
    locals[local_slot(instr)] = pop();
    break;

  case op_code::LDC_I4_M1: case op_code::LDC_I4_0: case op_code::LDC_I4_1: case op_code::LDC_I4_2:
  case op_code::LDC_I4_3:  case op_code::LDC_I4_4: case op_code::LDC_I4_5: case op_code::LDC_I4_6:
  case op_code::LDC_I4_7:  case op_code::LDC_I4_8:
    push(value::int32(static_cast<int>(op) - static_cast<int>(op_code::LDC_I4_0)));
    break;

  case op_code::LDC_I4_S:
    push(value::int32(operand_of<std::int8_t>(instr)));
    break;

  case op_code::LDC_I4:
    push(value::int32(operand_of<std::int32_t>(instr)));
    break;

  case op_code::LDC_I8:
    push(value::int64(operand_of<std::int64_t>(instr)));
    break;

  case op_code::LDC_R4:
    push(value::floating(operand_of<float>(instr)));
    break;

  case op_code::LDC_R8:
    push(value::floating(operand_of<double>(instr)));
    break;

  case op_code::DUP:
    {
      const value v = pop();
      push(v);
      push(v);
    } break;

  case op_code::POP:
    pop();
    break;

  case op_code::RET:
    if(method->return_type && !(method->return_type->kind == type_kind::primitive
                                && method->return_type->prim == primitive_type::void_))
      result = pop();
    if(!eval_stack.empty())
      fault(fmt::format("Evaluation stack not empty on return from '{}'", method->full_name()));
    returned = true;
    break;

  case op_code::BR:
  case op_code::BR_S:
    branch(instr);
    break;

  case op_code::BRTRUE:
  case op_code::BRTRUE_S:
    if(pop().truthy())
      branch(instr);
    break;

  case op_code::BRFALSE:
  case op_code::BRFALSE_S:
    if(!pop().truthy())
      branch(instr);
    break;

  case op_code::BEQ:    case op_code::BEQ_S:
  case op_code::BNE_UN: case op_code::BNE_UN_S:
  case op_code::BGT:    case op_code::BGT_S:
  case op_code::BGT_UN: case op_code::BGT_UN_S:
  case op_code::BGE:    case op_code::BGE_S:
  case op_code::BGE_UN: case op_code::BGE_UN_S:
  case op_code::BLT:    case op_code::BLT_S:
  case op_code::BLT_UN: case op_code::BLT_UN_S:
  case op_code::BLE:    case op_code::BLE_S:
  case op_code::BLE_UN: case op_code::BLE_UN_S:
    compare_and_branch(op, instr);
    break;

  case op_code::SWITCH:
    {
      auto* targets = std::get_if<switch_targets>(&instr.arg);
      if(targets == nullptr)
        fault("Bad operand for 'switch'");

      const auto index = pop().as_uint32();
      if(index < targets->size())
        pc = (*targets)[index].index;
    } break;

  case op_code::CEQ:
  case op_code::CGT:
  case op_code::CGT_UN:
  case op_code::CLT:
  case op_code::CLT_UN:
    {
      const value b = pop();
      const value a = pop();
      auto [cmp, is_unsigned] = comparison_of(op);
      push(value::int32(compare(op, cmp, is_unsigned, a, b) ? 1 : 0));
    } break;

  case op_code::ADD: case op_code::SUB: case op_code::MUL: case op_code::DIV: case op_code::DIV_UN:
  case op_code::REM: case op_code::REM_UN: case op_code::AND: case op_code::OR: case op_code::XOR:
  case op_code::SHL: case op_code::SHR: case op_code::SHR_UN:
    binary(op);
    break;

  case op_code::NEG:
    {
      const value v = pop();
      if(v.kind == value::type::floating)
        push(value::floating(-v.f));
      else
        push(make(v.kind, ~unsigned_bits(v.kind, v) + 1));
    } break;

  case op_code::NOT:
    {
      const value v = pop();
      if(v.kind == value::type::floating)
        fault("'not' needs an integer operand");
      push(make(v.kind, ~unsigned_bits(v.kind, v)));
    } break;

  case op_code::CONV_I1: case op_code::CONV_U1: case op_code::CONV_I2: case op_code::CONV_U2:
  case op_code::CONV_I4: case op_code::CONV_U4: case op_code::CONV_I8: case op_code::CONV_U8:
  case op_code::CONV_I:  case op_code::CONV_U:  case op_code::CONV_R4: case op_code::CONV_R8:
  case op_code::CONV_R_UN:
    convert(op);
    break;

  case op_code::LDIND_I1: case op_code::LDIND_U1: case op_code::LDIND_I2: case op_code::LDIND_U2:
  case op_code::LDIND_I4: case op_code::LDIND_U4: case op_code::LDIND_I8: case op_code::LDIND_I:
  case op_code::LDIND_R4: case op_code::LDIND_R8:
    load_indirect(op);
    break;

  case op_code::STIND_I1: case op_code::STIND_I2: case op_code::STIND_I4: case op_code::STIND_I8:
  case op_code::STIND_I:  case op_code::STIND_R4: case op_code::STIND_R8:
    store_indirect(op);
    break;
  }
}

}
