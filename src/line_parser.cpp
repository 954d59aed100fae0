#include <tinyil/line_parser.hpp>
#include <tinyil/resolver.hpp>

namespace tinyil
{

namespace
{

constexpr std::string_view separators = ";\r\n";
constexpr std::string_view comment_marker = "//";

std::string_view strip_comment(std::string_view str)
{
  if(auto pos = str.find(comment_marker); pos != std::string_view::npos)
    str = str.substr(0, pos);
  return trim(str);
}

}

statement split_statement(std::string_view text, std::size_t row)
{
  text = trim(text);

  statement stmt { text, text, {}, row };
  if(auto space = text.find_first_of(" \t"); space != std::string_view::npos)
  {
    stmt.mnemonic = text.substr(0, space);
    stmt.operand = trim(text.substr(space + 1));
  }
  return stmt;
}

bool is_label_definition(std::string_view mnemonic)
{ return mnemonic.size() > 1 && mnemonic.back() == ':'; }

std::vector<statement> read_statements(std::string_view source)
{
  std::vector<statement> statements;

  std::size_t row = 0;
  std::size_t beg = 0;
  while(beg <= source.size())
  {
    auto end = source.find_first_of(separators, beg);
    if(end == std::string_view::npos)
      end = source.size();

    auto text = strip_comment(trim(source.substr(beg, end - beg)));
    if(!text.empty())
      statements.push_back(split_statement(text, ++row));

    beg = end + 1;
  }
  return statements;
}

}
