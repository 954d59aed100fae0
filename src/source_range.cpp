#include <tinyil/source_range.hpp>

namespace tinyil
{

source_range::source_range(std::string_view module, std::size_t column_beg, std::size_t row_beg,
                                                    std::size_t column_end, std::size_t row_end)
  : module(module), column_beg(column_beg), row_beg(row_beg), column_end(column_end), row_end(row_end)
{  }

std::string source_range::to_string() const
{
  return std::string(module) + ":"
    + std::to_string(row_beg) + ":"
    + std::to_string(column_beg);
}

std::ostream& operator<<(std::ostream& os, const source_range& src_range)
{
  return os << src_range.to_string();
}

void to_json(nlohmann::json& j, const source_range& s)
{
  j = nlohmann::json{
    { "module", s.module },
    { "col_beg", s.column_beg },
    { "row_beg", s.row_beg },
    { "col_end", s.column_end },
    { "row_end", s.row_end },
  };
}

// the module view refers into `j`, which has to outlive the range
void from_json(const nlohmann::json& j, source_range& s)
{
  s = source_range { j.at("module").get_ref<const std::string&>(),
                     j.at("col_beg").get<std::size_t>(),
                     j.at("row_beg").get<std::size_t>(),
                     j.at("col_end").get<std::size_t>(),
                     j.at("row_end").get<std::size_t>()
  };
}

}
