#pragma once

#include <string_view>
#include <functional>
#include <optional>
#include <cstdio>
#include <string>
#include <vector>
#include <any>
#include <map>

namespace tinyil::arguments
{

void parse(int argc, const char** argv, std::FILE* out);

namespace detail
{

  using option_parser = std::function<std::any(const std::vector<std::string_view>&)>;

  struct CmdOption
  {
    static constexpr std::size_t many = static_cast<std::size_t>(-1);

    std::vector<std::string_view> opt;
    std::string_view description;

    std::any default_value;
    std::string_view default_value_str;

    option_parser parser;

    bool has_equals { false };

    // number of arguments the option takes, flags take none
    std::size_t argc { many };
  };
  struct CmdOptions
  {
  private:
    struct CmdOptionsAdder
    {
      CmdOptionsAdder& operator()(std::string_view opts, std::string_view description,
                                  std::any default_value, std::string_view default_value_str,
                                  const option_parser& f, std::size_t argc = CmdOption::many);

      CmdOptions* ot;
    };
    friend struct CmdParse;
  public:
    CmdOptions(std::string_view name, std::string_view description)
      : name(name), description(description)
    {  }

    CmdOptionsAdder add_options();

    std::map<std::string, std::any> parse(int argc, const char** argv);

    void print_help(std::FILE* f) const;
  private:
    std::string_view name;
    std::string_view description;

    std::vector<CmdOption> data;
  };

}

}
