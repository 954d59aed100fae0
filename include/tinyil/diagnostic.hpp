#pragma once

#include <tinyil/source_range.hpp>

#include <nlohmann/json.hpp>
#include <tsl/robin_map.h>

#include <fmt/format.h>

#include <string_view>
#include <functional>
#include <cstdio>
#include <string>
#include <vector>
#include <mutex>

namespace tinyil
{

enum class diag_level : unsigned char
{
  error = 1,
  info  = 1 << 1,
  warn  = 1 << 2,
};

NLOHMANN_JSON_SERIALIZE_ENUM( diag_level, {
  { diag_level::error, "error" },
  { diag_level::info, "info" },
  { diag_level::warn, "warn" },
})

namespace mk_diag
{
nlohmann::json error(const source_range& range,
                     std::uint_fast16_t tic, const std::string_view& message);

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t tic, const std::string_view& message);

nlohmann::json info(const source_range& range,
                    std::uint_fast16_t tic, const std::string_view& message);
}

namespace detail
{
  struct position
  {
    std::string module;
    std::size_t row;
    std::size_t col;

    bool operator==(const position& other) const
    { return row == other.row && col == other.col && module == other.module; }
  };

  struct position_hash
  {
    std::size_t operator()(const position& p) const
    {
      return std::hash<std::string>()(p.module)
        ^ ((std::hash<std::size_t>()(p.row) ^ (std::hash<std::size_t>()(p.col) << 1)) >> 1);
    }
  };
}

struct diagnostics_manager
{
private:
  diagnostics_manager()  {  }
public:
  ~diagnostics_manager();

  static diagnostics_manager& make()
  {
    static diagnostics_manager diag;
    return diag;
  }

  diagnostics_manager& operator<<=(const nlohmann::json& msg);

  bool empty() const { return data.empty(); }
  std::size_t count(diag_level level) const;

  void print(std::FILE* file);
  int error_code() const;

  inline void reset() { err = 0; data.clear(); order.clear(); }
private:
  tsl::robin_map<detail::position, std::vector<nlohmann::json>, detail::position_hash> data;
  std::vector<detail::position> order;

  int err { 0 };
  mutable std::mutex mut;

#ifndef TINYIL_TESTING
  bool printed { false };
#else
  bool printed { true  };
#endif
};

inline diagnostics_manager& diagnostic = diagnostics_manager::make();

}
