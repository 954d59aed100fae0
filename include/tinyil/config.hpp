#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdio>
#include <string>
#include <vector>

namespace tinyil
{

enum class emit_classes
{
  undef,
  help,
  listing,
  module,
  bytecode,
};

NLOHMANN_JSON_SERIALIZE_ENUM( emit_classes, {
  { emit_classes::undef, "undef" },
  { emit_classes::help, "help" },
  { emit_classes::listing, "listing" },
  { emit_classes::module, "module" },
  { emit_classes::bytecode, "bytecode" },
})

const static auto emit_classes_list = {
  emit_classes::help,
  emit_classes::listing,
  emit_classes::module,
  emit_classes::bytecode,
};

void print_emit_classes(std::FILE* f);

struct config_t
{
  bool print_help { false };

  emit_classes emit_class { emit_classes::listing };

  std::vector<std::string_view> files;
  std::vector<std::string_view> reference_dirs;

  std::string patch_dir { "." };
  std::string patch_extension { ".ilpatch" };

  // "-" writes to stdout
  std::string output_file { "-" };
};

inline config_t config;

}
