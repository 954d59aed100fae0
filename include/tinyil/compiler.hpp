#pragma once

#include <tinyil/config.hpp>
#include <tinyil/metadata.hpp>

#include <cstdio>

namespace tinyil
{

/// Loads the configured modules, compiles the marked methods of the first
/// one and emits the result. Every failure ends up in `diagnostic`.
struct compiler
{
  void go();

  void load_modules();
  std::size_t rewrite(module& target);
  void emit(const module& target);

  module_registry registry;

  // module of the first file given with -f
  std::string target_name;
};

void emit_listing(std::FILE* out, const module& mod);
void emit_bytecode(std::FILE* out, const module& mod);
void emit_module(std::FILE* out, const module& mod);

}
