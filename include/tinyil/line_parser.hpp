#pragma once

#include <string_view>
#include <vector>

namespace tinyil
{

struct statement
{
  std::string_view text;      // trimmed, comment stripped
  std::string_view mnemonic;
  std::string_view operand;   // trimmed, may be empty
  std::size_t row;            // 1-based statement number within the block
};

/// Splits an assembly block into statements. `;`, `\r` and `\n` all separate statements,
/// `//` starts a comment running to the end of its statement. The returned views point
/// into `source`.
std::vector<statement> read_statements(std::string_view source);

// splits `text` at the first space or tab into mnemonic and operand
statement split_statement(std::string_view text, std::size_t row = 0);

bool is_label_definition(std::string_view mnemonic);

}
