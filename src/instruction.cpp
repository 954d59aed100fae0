#include <tinyil/instruction.hpp>
#include <tinyil/metadata.hpp>

#include <fmt/format.h>

namespace tinyil
{

namespace
{

std::string_view convention_prefix(calling_convention conv)
{
  switch(conv)
  {
  case calling_convention::default_:  return "";
  case calling_convention::vararg:    return "vararg ";
  case calling_convention::c:         return "unmanaged cdecl ";
  case calling_convention::std_call:  return "unmanaged stdcall ";
  case calling_convention::this_call: return "unmanaged thiscall ";
  case calling_convention::fast_call: return "unmanaged fastcall ";
  }
  return "";
}

std::string label_name(branch_target target)
{ return fmt::format("IL_{:04x}", target.index); }

struct operand_printer
{
  const method_body& body;

  std::string operator()(std::monostate) const
  { return {}; }

  std::string operator()(std::int8_t v) const
  { return fmt::format("{}", static_cast<int>(v)); }

  std::string operator()(std::uint8_t v) const
  { return fmt::format("{}", static_cast<unsigned>(v)); }

  std::string operator()(std::int32_t v) const
  { return fmt::format("{}", v); }

  std::string operator()(std::int64_t v) const
  { return fmt::format("{}", v); }

  std::string operator()(float v) const
  { return fmt::format("{}", v); }

  std::string operator()(double v) const
  { return fmt::format("{}", v); }

  std::string operator()(const std::string& str) const
  { return fmt::format("\"{}\"", str); }

  std::string operator()(const type_ptr& type) const
  { return type ? type->full_name() : "<null>"; }

  std::string operator()(const method_def* method) const
  { return method->full_name(); }

  std::string operator()(const field_def* field) const
  { return field->full_name(); }

  std::string operator()(const param_def* param) const
  { return param->name; }

  std::string operator()(local_ref local) const
  {
    if(local.index < body.locals.size())
      return fmt::format("V_{} ({})", local.index, body.locals[local.index].type->full_name());
    return fmt::format("V_{}", local.index);
  }

  std::string operator()(branch_target target) const
  { return label_name(target); }

  std::string operator()(const switch_targets& targets) const
  {
    std::string str = "(";
    for(auto it = targets.begin(); it != targets.end(); ++it)
    {
      if(it != targets.begin())
        str += ", ";
      str += label_name(*it);
    }
    return str + ")";
  }

  std::string operator()(const call_site& site) const
  { return site.full_name(); }
};

}

std::string call_site::full_name() const
{
  std::string str;
  if(has_this)
    str += "instance ";
  if(explicit_this)
    str += "explicit ";
  str += convention_prefix(conv);
  str += return_type ? return_type->full_name() : "System.Void";
  str += "(";
  for(auto it = parameters.begin(); it != parameters.end(); ++it)
  {
    if(it != parameters.begin())
      str += ",";
    str += (*it)->full_name();
  }
  return str + ")";
}

std::string format_operand(const method_body& body, const operand& arg)
{ return std::visit(operand_printer { body }, arg); }

std::string format_instruction(const method_body& body, std::size_t index)
{
  const auto& instr = body.instructions.at(index);
  auto arg = format_operand(body, instr.arg);

  if(arg.empty())
    return fmt::format("IL_{:04x}: {}", index, mnemonic(instr.op));
  return fmt::format("IL_{:04x}: {} {}", index, mnemonic(instr.op), arg);
}

}
