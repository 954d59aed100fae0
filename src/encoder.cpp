#include <tinyil/encoder.hpp>
#include <tinyil/error.hpp>

#include <cstring>

namespace tinyil
{

namespace
{

void put(std::vector<unsigned char>& code, std::uint64_t value, std::size_t bytes)
{
  for(std::size_t i = 0; i < bytes; ++i)
    code.push_back(static_cast<unsigned char>((value >> (8 * i)) & 0xFF));
}

template<typename T>
const T& operand_as(const instruction& instr)
{
  if(auto* v = std::get_if<T>(&instr.arg))
    return *v;
  fail(error_kind::encoding, "Operand of '{}' does not match its encoding", mnemonic(instr.op));
}

std::size_t utf16_length(const std::string& str)
{
  std::size_t units = 0;
  for(unsigned char c : str)
  {
    if((c & 0xC0) == 0x80)
      continue;
    // four byte sequences become surrogate pairs
    units += c >= 0xF0 ? 2 : 1;
  }
  return units;
}

}

metadata_tokens::metadata_tokens(const module& mod)
  : mod(mod)
{
  std::uint32_t methods = 0;
  std::uint32_t fields = 0;
  for(std::size_t i = 0; i < mod.types.size(); ++i)
  {
    const auto& type = mod.types[i];
    definitions[type.get()] = make_token(token_table::type_def, static_cast<std::uint32_t>(i + 1));

    for(auto& m : type->methods)
      definitions[m.get()] = make_token(token_table::method_def, ++methods);
    for(auto& f : type->fields)
      definitions[f.get()] = make_token(token_table::field_def, ++fields);
  }
}

std::uint32_t metadata_tokens::reference(tsl::robin_map<std::string, std::uint32_t>& table, token_table kind, std::string key)
{
  if(auto it = table.find(key); it != table.end())
    return it->second;

  auto token = make_token(kind, static_cast<std::uint32_t>(table.size() + 1));
  table.emplace(std::move(key), token);
  return token;
}

std::uint32_t metadata_tokens::type_token(const type_ptr& type)
{
  if(!type)
    fail(error_kind::encoding, "Missing type operand");

  switch(type->kind)
  {
  case type_kind::defined:
    if(mod.owns(*type->def))
      return definitions.at(type->def);
    return reference(type_refs, token_table::type_ref, type->full_name());

  case type_kind::primitive:
    return reference(type_refs, token_table::type_ref, type->full_name());

  default:
    return reference(type_specs, token_table::type_spec, type->full_name());
  }
}

std::uint32_t metadata_tokens::method_token(const method_def* method)
{
  if(method->declaring_type && mod.owns(*method->declaring_type))
    return definitions.at(method);
  return reference(member_refs, token_table::member_ref, method->full_name());
}

std::uint32_t metadata_tokens::field_token(const field_def* field)
{
  if(field->declaring_type && mod.owns(*field->declaring_type))
    return definitions.at(field);
  return reference(member_refs, token_table::member_ref, field->full_name());
}

std::uint32_t metadata_tokens::string_token(const std::string& str)
{
  if(auto it = strings.find(str); it != strings.end())
    return it->second;

  auto token = make_token(token_table::user_string, string_heap_size);
  strings.emplace(str, token);

  // blob: compressed length, UTF-16 code units, trailing flag byte
  const std::size_t bytes = utf16_length(str) * 2 + 1;
  const std::size_t prefix = bytes < 0x80 ? 1 : (bytes < 0x4000 ? 2 : 4);
  string_heap_size += static_cast<std::uint32_t>(prefix + bytes);

  return token;
}

std::uint32_t metadata_tokens::signature_token(const call_site& site)
{ return reference(signatures, token_table::signature, site.full_name()); }

std::vector<std::size_t> instruction_offsets(const method_body& body)
{
  std::vector<std::size_t> offsets;
  offsets.reserve(body.size() + 1);

  std::size_t offset = 0;
  for(auto& instr : body.instructions)
  {
    offsets.push_back(offset);

    const auto& inf = info(instr.op);
    offset += inf.size() + operand_size(inf.operand);
    if(auto* targets = std::get_if<switch_targets>(&instr.arg))
      offset += 4 * targets->size();
  }
  offsets.push_back(offset);
  return offsets;
}

std::vector<unsigned char> encode(const method_body& body, const method_def& method, metadata_tokens& tokens)
{
  const auto offsets = instruction_offsets(body);

  std::vector<unsigned char> code;
  code.reserve(offsets.back());

  const std::size_t this_slot = method.has_this ? 1 : 0;

  auto displacement = [&offsets](std::size_t next, branch_target target) -> std::int64_t
  {
    if(target.index >= offsets.size())
      fail(error_kind::encoding, "Branch target {} is outside of the method body", target.index);
    return static_cast<std::int64_t>(offsets[target.index]) - static_cast<std::int64_t>(next);
  };

  for(std::size_t i = 0; i < body.size(); ++i)
  {
    const auto& instr = body.instructions[i];
    const auto& inf = info(instr.op);
    const std::size_t next = offsets[i + 1];

    if(inf.is_two_byte())
      code.push_back(0xFE);
    code.push_back(static_cast<unsigned char>(inf.value & 0xFF));

    switch(inf.operand)
    {
    case operand_kind::none:
      break;

    case operand_kind::short_branch:
      {
        auto disp = displacement(next, operand_as<branch_target>(instr));
        if(disp < -128 || disp > 127)
          fail(error_kind::encoding, "Branch '{}' at IL_{:04x} is too far for a short displacement ({} bytes)",
               inf.mnemonic, offsets[i], disp);
        put(code, static_cast<std::uint64_t>(disp), 1);
      } break;

    case operand_kind::branch:
      put(code, static_cast<std::uint64_t>(displacement(next, operand_as<branch_target>(instr))), 4);
      break;

    case operand_kind::switch_:
      {
        const auto& targets = operand_as<switch_targets>(instr);
        put(code, targets.size(), 4);
        for(auto& target : targets)
          put(code, static_cast<std::uint64_t>(displacement(next, target)), 4);
      } break;

    case operand_kind::int8:
      put(code, static_cast<std::uint8_t>(operand_as<std::int8_t>(instr)), 1);
      break;

    case operand_kind::uint8:
      put(code, operand_as<std::uint8_t>(instr), 1);
      break;

    case operand_kind::int32:
      put(code, static_cast<std::uint32_t>(operand_as<std::int32_t>(instr)), 4);
      break;

    case operand_kind::int64:
      put(code, static_cast<std::uint64_t>(operand_as<std::int64_t>(instr)), 8);
      break;

    case operand_kind::float32:
      {
        std::uint32_t bits;
        const float value = operand_as<float>(instr);
        std::memcpy(&bits, &value, sizeof(bits));
        put(code, bits, 4);
      } break;

    case operand_kind::float64:
      {
        std::uint64_t bits;
        const double value = operand_as<double>(instr);
        std::memcpy(&bits, &value, sizeof(bits));
        put(code, bits, 8);
      } break;

    case operand_kind::string:
      put(code, tokens.string_token(operand_as<std::string>(instr)), 4);
      break;

    case operand_kind::type:
      put(code, tokens.type_token(operand_as<type_ptr>(instr)), 4);
      break;

    case operand_kind::method:
      put(code, tokens.method_token(operand_as<const method_def*>(instr)), 4);
      break;

    case operand_kind::field:
      put(code, tokens.field_token(operand_as<const field_def*>(instr)), 4);
      break;

    case operand_kind::token:
      if(auto* m = std::get_if<const method_def*>(&instr.arg))
        put(code, tokens.method_token(*m), 4);
      else if(auto* f = std::get_if<const field_def*>(&instr.arg))
        put(code, tokens.field_token(*f), 4);
      else
        put(code, tokens.type_token(operand_as<type_ptr>(instr)), 4);
      break;

    case operand_kind::signature:
      put(code, tokens.signature_token(operand_as<call_site>(instr)), 4);
      break;

    case operand_kind::short_arg:
    case operand_kind::arg:
      {
        const auto number = operand_as<const param_def*>(instr)->index + this_slot;
        if(inf.operand == operand_kind::short_arg && number > 0xFF)
          fail(error_kind::encoding, "Argument {} does not fit '{}'", number, inf.mnemonic);
        put(code, number, operand_size(inf.operand));
      } break;

    case operand_kind::short_local:
    case operand_kind::local:
      {
        const auto index = operand_as<local_ref>(instr).index;
        if(inf.operand == operand_kind::short_local && index > 0xFF)
          fail(error_kind::encoding, "Local {} does not fit '{}'", index, inf.mnemonic);
        put(code, index, operand_size(inf.operand));
      } break;
    }
  }
  return code;
}

}
