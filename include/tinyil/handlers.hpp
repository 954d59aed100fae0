#pragma once

#include <tinyil/patch_file_cache.hpp>
#include <tinyil/metadata.hpp>
#include <tinyil/error.hpp>

#include <string_view>
#include <functional>

namespace tinyil
{

namespace intrinsic_il
{
constexpr std::string_view attribute_name = "IntrinsicILAttribute";

// assembles the attribute's instruction text into `method`, false if not marked
bool process(method_def& method);
}

namespace external_il
{
constexpr std::string_view attribute_name = "ExternalILAttribute";

// like intrinsic_il::process, but the attribute names a `file:patch` section
bool process(method_def& method, patch_file_cache& cache);
}

bool compile_method(method_def& method, patch_file_cache& cache);

using method_error_handler = std::function<void(const method_def& method, const compile_error& err)>;

/// Compiles every marked method of every type in `mod`, nested types included.
/// A failing method is handed to `on_error` and the traversal moves on, so one broken
/// body does not hide errors in its siblings. Returns the number of rewritten methods.
std::size_t traverse_methods_and_modify(module& mod, patch_file_cache& cache, const method_error_handler& on_error);

}
