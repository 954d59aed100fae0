#pragma once

#include <tinyil/diagnostic.hpp>

#include <fmt/format.h>

namespace tinyil::diagnostic_db
{

#define db_entry(lv, name, txt) static const auto name = [](const source_range& range) \
{ return mk_diag::lv(range, __COUNTER__, txt); }

#define db_entry_arg(lv, name, txt) static const auto name = [](const source_range& range, auto t) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t)); }

#define db_entry_arg2(lv, name, txt) static const auto name = [](const source_range& range, auto t1, auto t2) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t1, t2)); }

namespace args
{

db_entry_arg(error, unknown_arg, "Unknown command line argument \"{}\".");
db_entry_arg(error, emit_not_present, "Selected emit class \"{}\" is unknown!");
db_entry(error, no_files, "No module description given, pass one with -f.");
db_entry_arg(error, not_a_directory, "\"{}\" is not a directory.");

}

namespace load
{

db_entry_arg(error, module_failed, "Unable to load module: {}");
db_entry_arg(warn, empty_reference_dir, "Reference directory \"{}\" holds no module descriptions.");

}

namespace compile
{

db_entry_arg2(error, method_failed, "[{}] {}");
db_entry_arg(info, module_unmodified, "Module \"{}\" has no methods to rewrite, nothing is written.");
db_entry_arg2(info, methods_compiled, "Rewrote {} methods of module \"{}\".");
db_entry_arg2(error, module_not_written, "Module \"{}\" is not written, {} methods failed to compile.");

}

namespace emit
{

db_entry_arg(error, cannot_open_output, "Unable to open \"{}\" for writing.");
db_entry_arg2(error, encoding_failed, "[{}] {}");

}

#undef db_entry
#undef db_entry_arg
#undef db_entry_arg2

}
