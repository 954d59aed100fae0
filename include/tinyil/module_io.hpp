#pragma once

#include <tinyil/metadata.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace tinyil
{

/// Module descriptions:
///
///     { "name": "Game", "references": [ "UnityEngine" ],
///       "types": [ { "namespace": "", "name": "Script", "base": "UnityEngine.MonoBehaviour",
///                    "generic_parameters": [], "fields": [ { "name": "x", "type": "int32", "static": false } ],
///                    "methods": [ { "name": "Hash", "static": true, "return": "uint32",
///                                   "parameters": [ { "name": "ptr", "type": "char*" } ],
///                                   "generic_parameters": [],
///                                   "attributes": [ { "type": "IntrinsicILAttribute", "args": [ "ldc.i4.0" ] } ] } ],
///                    "nested": [ ... ] } ] }
///
/// Type strings use the assembler's notation, `!!T` names a method generic parameter and
/// `!T` one of the enclosing types. References must already be in `registry`.
/// Malformed descriptions throw compile_error(syntax), unknown types compile_error(unresolved_symbol).
module& read_module(const nlohmann::json& description, module_registry& registry);

nlohmann::json parse_description(const std::filesystem::path& path);
module& load_module(const std::filesystem::path& path, module_registry& registry);

// adds `locals`, `listing` and hex `bytecode` to every method with a body
nlohmann::json write_module(const module& mod);

std::string type_notation(const type_ptr& type, const method_def* method = nullptr);

}
