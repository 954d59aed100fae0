#pragma once

#include <tinyil/metadata.hpp>

#include <tsl/robin_map.h>

#include <cstdint>
#include <string>
#include <vector>

namespace tinyil
{

enum class token_table : std::uint8_t
{
  type_ref    = 0x01,
  type_def    = 0x02,
  field_def   = 0x04,
  method_def  = 0x06,
  member_ref  = 0x0A,
  signature   = 0x11,
  type_spec   = 0x1B,
  user_string = 0x70
};

constexpr std::uint32_t make_token(token_table table, std::uint32_t row)
{ return (static_cast<std::uint32_t>(table) << 24) | (row & 0x00FFFFFF); }

constexpr token_table table_of(std::uint32_t token)
{ return static_cast<token_table>(token >> 24); }

/// Metadata tokens of one module. Definitions are numbered in declaration order,
/// references, specs, signatures and strings in order of first use.
class metadata_tokens
{
public:
  explicit metadata_tokens(const module& mod);

  std::uint32_t type_token(const type_ptr& type);
  std::uint32_t method_token(const method_def* method);
  std::uint32_t field_token(const field_def* field);
  std::uint32_t string_token(const std::string& str);
  std::uint32_t signature_token(const call_site& site);
private:
  std::uint32_t reference(tsl::robin_map<std::string, std::uint32_t>& table, token_table kind, std::string key);
private:
  const module& mod;

  tsl::robin_map<const void*, std::uint32_t> definitions;

  tsl::robin_map<std::string, std::uint32_t> type_refs;
  tsl::robin_map<std::string, std::uint32_t> type_specs;
  tsl::robin_map<std::string, std::uint32_t> member_refs;
  tsl::robin_map<std::string, std::uint32_t> signatures;
  tsl::robin_map<std::string, std::uint32_t> strings;

  // #US heap offsets start at 1, 0 is the empty blob
  std::uint32_t string_heap_size { 1 };
};

/// Little endian CIL code stream of `body`. Branch displacements are relative to the
/// end of the branching instruction, argument numbers count the implicit `this`.
/// Throws compile_error(encoding) for operands that don't fit their encoding.
std::vector<unsigned char> encode(const method_body& body, const method_def& method, metadata_tokens& tokens);

// offset of every instruction plus the total size as last element
std::vector<std::size_t> instruction_offsets(const method_body& body);

}
