#include <tinyil/diagnostic.hpp>

#include <fmt/color.h>

#include <cassert>

namespace tinyil
{

namespace mk_diag
{

namespace
{
nlohmann::json make(diag_level level, const source_range& range,
                    std::uint_fast16_t tic, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = level;

  j["tic"] = tic;
  j["message"] = message;

  return j;
}
}

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t tic, const std::string_view& message)
{ return make(diag_level::warn, range, tic, message); }

nlohmann::json error(const source_range& range,
                     std::uint_fast16_t tic, const std::string_view& message)
{ return make(diag_level::error, range, tic, message); }

nlohmann::json info(const source_range& range,
                    std::uint_fast16_t tic, const std::string_view& message)
{ return make(diag_level::info, range, tic, message); }

}

diagnostics_manager::~diagnostics_manager()
{ assert((printed || data.empty()) && "Messages have been printed."); }

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  std::lock_guard<std::mutex> guard(mut);

  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  auto& range = msg["range"];
  detail::position pos { range["module"].get<std::string>(),
                         range["row_beg"].get<std::size_t>(),
                         range["col_beg"].get<std::size_t>() };

  auto it = data.find(pos);
  if(it == data.end())
  {
    order.push_back(pos);
    data[std::move(pos)].push_back(msg);
  }
  else
    it.value().push_back(msg);

  return *this;
}

std::size_t diagnostics_manager::count(diag_level level) const
{
  std::lock_guard<std::mutex> guard(mut);

  std::size_t n = 0;
  for(auto& w : data)
    for(auto& v : w.second)
      n += v["level"].get<diag_level>() == level;
  return n;
}

void diagnostics_manager::print(std::FILE* file)
{
  if(printed)
    return;
  std::lock_guard<std::mutex> guard(mut);
  for(auto& pos : order)
  {
    for(auto& v : data.at(pos))
    {
      fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}: ",
          v["range"].get<source_range>().to_string());

      auto lv = v["level"].get<diag_level>();

      switch(lv)
      {
      default:
      case diag_level::error:
        {
          fmt::print(file, fg(fmt::color::cornsilk), "(TI-{}) ", v["tic"].get<std::uint_fast16_t>());
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::red), "error: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;

      case diag_level::info:
        {
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::gray), "info: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;

      case diag_level::warn:
        {
          fmt::print(file, fg(fmt::color::cornsilk), "(TI-{}) ", v["tic"].get<std::uint_fast16_t>());
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;
      }
      fmt::print(file, fg(fmt::color::white), "\n");
    }
  }
  printed = true;
}

int diagnostics_manager::error_code() const
{
  return err;
}

}
