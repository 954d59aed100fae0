#pragma once

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <cstdint>
#include <string>

namespace tinyil
{

enum class error_kind : std::uint8_t
{
  syntax,
  duplicate_definition,
  unresolved_symbol,
  unresolved_label,
  patch_not_found,
  duplicate_patch,
  unsupported,
  encoding
};

NLOHMANN_JSON_SERIALIZE_ENUM( error_kind, {
  { error_kind::syntax, "syntax" },
  { error_kind::duplicate_definition, "duplicate-definition" },
  { error_kind::unresolved_symbol, "unresolved-symbol" },
  { error_kind::unresolved_label, "unresolved-label" },
  { error_kind::patch_not_found, "patch-not-found" },
  { error_kind::duplicate_patch, "duplicate-patch" },
  { error_kind::unsupported, "unsupported" },
  { error_kind::encoding, "encoding" },
})

class compile_error : public std::runtime_error
{
public:
  compile_error(error_kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind), message_(message)
  {  }

  error_kind kind() const
  { return kind_; }

  const std::string& message() const
  { return message_; }

  const std::string& method() const
  { return method_; }

  const std::string& statement() const
  { return statement_; }

  std::size_t row() const
  { return row_; }

  // only the innermost statement is kept, outer layers don't overwrite it
  compile_error& at(const std::string& method, const std::string& statement, std::size_t row)
  {
    if(method_.empty())
      method_ = method;
    if(statement_.empty())
    {
      statement_ = statement;
      row_ = row;
    }
    return *this;
  }
private:
  error_kind kind_;
  std::string message_;

  std::string method_;
  std::string statement_;
  std::size_t row_ { 0 };
};

template<typename... Args>
[[noreturn]] void fail(error_kind kind, fmt::format_string<Args...> fmt_str, Args&&... args)
{ throw compile_error(kind, fmt::format(fmt_str, std::forward<Args>(args)...)); }

class execution_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

}
