#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdint>
#include <ostream>
#include <string>

namespace tinyil
{

/// For assembly, `module` names the method (or the external patch) and rows count statements.
struct source_range
{
  std::string_view module;

  std::size_t column_beg;
  std::size_t row_beg;

  std::size_t column_end;
  std::size_t row_end;

  source_range() = default;

  source_range(std::string_view module, std::size_t column_beg, std::size_t row_beg,
                                        std::size_t column_end, std::size_t row_end);

  std::string to_string() const;

  friend std::ostream& operator<<(std::ostream& os, const source_range& src_range);
};

void to_json(nlohmann::json& j, const source_range& s);
void from_json(const nlohmann::json& j, source_range& s);

}
