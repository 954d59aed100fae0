#include <tinyil/arguments_parser.hpp>
#include <tinyil/diagnostic_db.hpp>
#include <tinyil/diagnostic.hpp>
#include <tinyil/config.hpp>

#include <fmt/format.h>

#include <filesystem>

using namespace std::string_view_literals;

namespace tinyil
{

void print_emit_classes(std::FILE* f)
{
  fmt::print(f, "emit classes: ");

  for(auto it = std::begin(emit_classes_list); it != std::end(emit_classes_list); ++it)
  {
    if(std::next(it) == std::end(emit_classes_list))
      fmt::print(f, "{}\n", nlohmann::json(*it).get<std::string>());
    else
      fmt::print(f, "{}, ", nlohmann::json(*it).get<std::string>());
  }
}

namespace arguments
{

namespace
{
const source_range args_range { "args", 0, 0, 0, 0 };

std::vector<std::string_view> as_list(const std::vector<std::string_view>& x)
{ return x; }
}

void parse(int argc, const char** argv, std::FILE* out)
{
  detail::CmdOptions options("tinyil", "Assembles TinyIL method bodies into CIL.");
  options.add_options()
    ("h,?,-help", "Prints this text.", std::make_any<bool>(false), "false", [](auto){ return std::make_any<bool>(true); }, 0)
    (",f,-files", "Module descriptions to load, the first one is rewritten.", std::make_any<std::vector<std::string_view>>(), "none",
      [](auto x){ return as_list(x); })
    ("r,-references", "Directories whose module descriptions (*.json) are loaded as references.",
      std::make_any<std::vector<std::string_view>>(), "none",
      [](auto x)
      {
        for(auto dir : x)
        {
          std::error_code ec;
          if(!std::filesystem::is_directory(std::filesystem::path(dir), ec))
            diagnostic <<= diagnostic_db::args::not_a_directory(args_range, dir);
        }
        return as_list(x);
      })
    ("p,-patches", "Directory searched for external patch files.", std::make_any<std::string>("."), ".",
      [](auto x){ return std::string(x.front()); }, 1)
    ("-patch-ext=", "Extension of external patch files.", std::make_any<std::string>(".ilpatch"), ".ilpatch",
      [](auto x)
      {
        std::string ext(x.front());
        if(!ext.empty() && ext.front() != '.')
          ext.insert(ext.begin(), '.');
        return ext;
      })
    ("-emit=", "Choose what to emit. Set to \"help\" to get a list.", std::make_any<emit_classes>(emit_classes::listing), "listing",
      [](auto x)
      {
        auto& v = x.front();

        if(v.empty()) return emit_classes::help;

        nlohmann::json easy_conversion = v;
        if(easy_conversion.get<emit_classes>() != emit_classes::undef)
          return easy_conversion.get<emit_classes>();

        diagnostic <<= diagnostic_db::args::emit_not_present(args_range, v);
        return emit_classes::help;
      })
    ("o,-output", "Output file to write to, \"-\" for stdout." , std::make_any<std::string>("-"), "-",
     [](auto x)
     { return std::string(x.front()); }, 1)
    ;

  auto map = options.parse(argc, argv);

  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
  }
  config.files = std::any_cast<std::vector<std::string_view>>(map["f"]);
  config.reference_dirs = std::any_cast<std::vector<std::string_view>>(map["r"]);
  config.patch_dir = std::any_cast<std::string>(map["p"]);
  config.patch_extension = std::any_cast<std::string>(map["-patch-ext="]);
  config.emit_class = std::any_cast<emit_classes>(map["-emit="]);
  if(config.emit_class == emit_classes::help)
  {
    print_emit_classes(out);
    config.print_help = true;
  }
  config.output_file = std::any_cast<std::string>(map["o"]);

  if(!config.print_help && config.files.empty())
    diagnostic <<= diagnostic_db::args::no_files(args_range);
}

namespace detail
{

CmdOptions::CmdOptionsAdder& CmdOptions::CmdOptionsAdder::operator()(std::string_view opt_list, std::string_view description,
    std::any default_value, std::string_view default_value_str, const option_parser& f, std::size_t argc)
{
  bool has_equals = false;
  std::vector<std::string_view> opts;
  auto it = opt_list.find(',');
  while(it != std::string_view::npos)
  {
    std::string_view opt = opt_list.substr(0, it);
    opt_list.remove_prefix(it + 1); // + 1 to remove comma

    opts.emplace_back(opt);
    it = opt_list.find(',');
  }
  if(!opt_list.empty())
  {
    if(opt_list.back() == '=')
    {
      opt_list.remove_suffix(1); // <- get rid of equals
      has_equals = true;
    }
    opts.emplace_back(opt_list);
  }

  ot->data.push_back(CmdOption { opts, description, default_value, default_value_str, f, has_equals,
                                 has_equals ? 1 : argc });
  return *this;
}

CmdOptions::CmdOptionsAdder CmdOptions::add_options()
{ return { this }; }


struct CmdParse
{
  CmdParse(const std::vector<std::string_view>& args, std::map<std::string, std::any>& map, CmdOptions& cmdopts)
    : args(&args), map(&map), cmdopts(&cmdopts)
  {
    reset_cur_opt();
  }

  operator std::map<std::string, std::any>&()
  { return parse(); }
private:
  void reset_cur_opt()
  {
    cur_opt = std::nullopt;
    opt_args.clear();

    for(auto& v : this->cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(f == "") // if we have an implicit argument, make this the initial current option
          cur_opt = v;
      }
    }
  }

  std::map<std::string, std::any>& parse()
  {
    for(auto it = args->begin(); it != args->end(); ++it)
    {
      auto& str = *it;
      if(!str.empty() && str[0] == '-')
        parse_option(str);
      else
        parse_arg(str, it + 1 == args->end() ? ""sv : *(it + 1));
    }

    return *map;
  }

  void commit()
  {
    std::any a = cur_opt->parser(opt_args);
    for(auto& o : cur_opt->opt)
      (*map)[static_cast<std::string>(o) + (cur_opt->has_equals ? "=" : "")] = a;
  }

  void parse_arg(const std::string_view& str, const std::string_view& next)
  {
    if(!cur_opt.has_value())
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(args_range, str);
      return;
    }
    opt_args.push_back(str);

    // parse option arguments only if we hit the end or another option,
    //    or once the option has all arguments it takes
    const bool saturated = opt_args.size() == cur_opt->argc;
    if(saturated || next.empty() || next[0] == '-')
    {
      commit();

      if(saturated)
        reset_cur_opt();
    }
  }

  void parse_option(const std::string_view& str)
  {
    cur_opt = std::nullopt;
    opt_args.clear();
    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(!f.empty() && str.find(f) == 1 && str.size() - 1 == f.size()) // first char of str is `-`, after that it should match
          cur_opt = v;
      }
    }
    if(!cur_opt.has_value())
      diagnostic <<= diagnostic_db::args::unknown_arg(args_range, str);
    else if(cur_opt->argc == 0)
    {
      commit();
      reset_cur_opt();
    }
  }

private:
  const std::vector<std::string_view>* args;
  std::map<std::string, std::any>* map; // <- not a string_view, since we need to append '=' sometimes

  CmdOptions* cmdopts;

  std::vector<std::string_view> opt_args;
  std::optional<CmdOption> cur_opt;
};

std::map<std::string, std::any> CmdOptions::parse(int argc, const char** argv)
{
  std::map<std::string, std::any> map;
  for(auto& v : data)
  {
    for(auto f : v.opt)
    {
      map[static_cast<std::string>(f) + (v.has_equals ? "=" : "")] = v.default_value;
    }
  }
  if(argc - 1 <= 0)
    return map;

  std::vector<std::string_view> args;
  args.reserve(argc - 1);

  for(int i = 1; i < argc; ++i)
  {
    // We want to split options at equals
    std::string_view v = argv[i];
    if(auto it = v.find('='); !v.empty() && v.front() == '-' && it != std::string_view::npos)
    {
      // grab the option
      args.push_back(v.substr(0, it));

      // grab its argument
      args.push_back(v.substr(it + 1));
    }
    else
      args.push_back(v);
  }

  CmdParse parser(args, map, *this);
  return static_cast<std::map<std::string, std::any>&>(parser);
}

void CmdOptions::print_help(std::FILE* f) const
{
  fmt::print(f, "{}  -  {}\n", name, description);

  for(auto& v : data)
  {
    std::string args;
    for(auto o : v.opt)
    {
      if(o.empty())
        continue;
      if(!args.empty())
        args += " or ";
      args += '-';
      args += o;
      if(v.has_equals)
        args += '=';
    }
    fmt::print(f, "{}    {} [default={}]\n", args, v.description, v.default_value_str);
  }
}

}

}

}
