#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <tinyil/patch_file_cache.hpp>
#include <tinyil/module_io.hpp>
#include <tinyil/handlers.hpp>
#include <tinyil/error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <vector>

using namespace tinyil;
using json = nlohmann::json;

namespace
{

const json engine_description = json::parse(R"({
  "name": "UnityEngine",
  "types": [ { "namespace": "UnityEngine", "name": "MonoBehaviour",
               "methods": [ { "name": "Log", "static": true, "parameters": [ { "name": "message", "type": "string" } ] } ] } ]
})");

const json game_description = json::parse(R"({
  "name": "Game",
  "references": [ "UnityEngine" ],
  "types": [ {
    "namespace": "",
    "name": "Script",
    "base": "UnityEngine.MonoBehaviour",
    "fields": [ { "name": "counter", "type": "int32" }, { "name": "buffer", "type": "char* pinned", "static": true } ],
    "methods": [
      { "name": "Answer", "static": true, "return": "int32",
        "attributes": [ { "type": "TinyIL.IntrinsicILAttribute", "args": [ "#var tmp int32; ldc.i4.s 42; stloc tmp; ldloc tmp" ] } ] },
      { "name": "Greet", "static": true,
        "attributes": [ { "type": "IntrinsicILAttribute", "args": [ "#asmref UnityEngine; ldstr \"hi\"; call UnityEngine.MonoBehaviour::Log(string)" ] } ] },
      { "name": "Broken", "static": true,
        "attributes": [ { "type": "IntrinsicILAttribute", "args": [ "nop; frobnicate" ] } ] },
      { "name": "Missing", "static": true,
        "attributes": [ { "type": "ExternalILAttribute", "args": [ "nowhere:Nothing" ] } ] },
      { "name": "Plain", "static": false, "return": "void", "parameters": [ { "name": "x", "type": "int32*" } ] }
    ],
    "nested": [ {
      "name": "Slot",
      "generic_parameters": [ "T" ],
      "fields": [ { "name": "value", "type": "!T" } ],
      "methods": [ { "name": "Convert", "generic_parameters": [ "U" ], "return": "!!U",
                     "parameters": [ { "name": "input", "type": "!T" } ] } ]
    } ]
  } ]
})");

}

TEST_CASE( "Module descriptions are read", "[module_io]" ) {
  module_registry registry;
  read_module(engine_description, registry);
  auto& game = read_module(game_description, registry);

  REQUIRE(game.name == "Game");
  REQUIRE(game.module_references == std::vector<std::string>{ "UnityEngine" });

  auto* script = game.find_type("Script");
  REQUIRE(script != nullptr);
  REQUIRE(script->base_type->full_name() == "UnityEngine.MonoBehaviour");
  REQUIRE(script->methods.size() == 5);
  REQUIRE(!script->methods[0]->has_this);
  REQUIRE(script->methods[4]->has_this);
  REQUIRE((script->methods[4]->parameters[0]->type->kind == type_kind::pointer));
  REQUIRE((script->fields[1]->type->kind == type_kind::pinned));
  REQUIRE(script->fields[1]->is_static);

  auto* slot = game.find_type("Script/Slot");
  REQUIRE(slot != nullptr);
  REQUIRE(slot->declaring_type == script);
  REQUIRE(slot->fields[0]->type->generic == slot->generic_parameters[0].get());

  auto& convert = *slot->methods[0];
  REQUIRE(convert.return_type->generic == convert.generic_parameters[0].get());
  REQUIRE(type_notation(convert.return_type, &convert) == "!!U");
  REQUIRE(type_notation(convert.parameters[0]->type, &convert) == "!T");
}

TEST_CASE( "Module description errors", "[module_io]" ) {
  module_registry registry;

  auto kind_of_failure = [&registry](const json& description)
  {
    try
    {
      read_module(description, registry);
    }
    catch(const compile_error& err)
    {
      return err.kind();
    }
    FAIL("module description should have been rejected");
    return error_kind::syntax;
  };

  SECTION( "references have to be loaded first" ) {
    REQUIRE((kind_of_failure(game_description) == error_kind::unresolved_symbol));
  }

  SECTION( "modules are loaded once" ) {
    read_module(engine_description, registry);
    REQUIRE((kind_of_failure(engine_description) == error_kind::duplicate_definition));
  }

  SECTION( "malformed" ) {
    REQUIRE((kind_of_failure(json::parse(R"({ "types": [] })")) == error_kind::syntax));
    REQUIRE((kind_of_failure(json::parse(R"({ "name": "X", "types": [ { "namespace": "" } ] })")) == error_kind::syntax));
  }

  SECTION( "missing file" ) {
    REQUIRE_THROWS_AS(load_module("/nonexistent/tinyil/module.json", registry), compile_error);
  }
}

TEST_CASE( "Marked methods are rewritten", "[handlers]" ) {
  module_registry registry;
  read_module(engine_description, registry);
  auto& game = read_module(game_description, registry);
  auto& script = *game.find_type("Script");

  patch_file_cache cache(std::filesystem::temp_directory_path() / "tinyil-no-patches-here");

  std::vector<std::pair<std::string, compile_error>> failures;
  const auto rewritten = traverse_methods_and_modify(game, cache, [&failures](const method_def& method, const compile_error& err)
  {
    failures.emplace_back(method.name, err);
  });

  REQUIRE(rewritten == 2);
  REQUIRE(failures.size() == 2);

  REQUIRE(failures[0].first == "Broken");
  REQUIRE((failures[0].second.kind() == error_kind::syntax));
  REQUIRE(failures[0].second.row() == 2);
  REQUIRE(failures[0].second.statement() == "frobnicate");

  REQUIRE(failures[1].first == "Missing");
  REQUIRE((failures[1].second.kind() == error_kind::patch_not_found));
  REQUIRE(failures[1].second.statement() == "nowhere:Nothing");

  SECTION( "attributes are consumed" ) {
    for(auto& m : script.methods)
      REQUIRE(m->attributes.empty());
  }

  SECTION( "failed methods are left without body" ) {
    REQUIRE(script.methods[2]->body.empty());
    REQUIRE(script.methods[3]->body.empty());
    REQUIRE(script.methods[4]->body.empty());
  }

  SECTION( "imports are recorded" ) {
    REQUIRE((game.imported_references == std::vector<std::string>{ "UnityEngine.MonoBehaviour",
                                                                   "System.Void UnityEngine.MonoBehaviour::Log(System.String)" }));
  }

  SECTION( "written back" ) {
    auto out = write_module(game);

    auto& answer = out["types"][0]["methods"][0];
    REQUIRE(answer["name"] == "Answer");
    REQUIRE(answer["locals"] == json::array({ "int32" }));
    REQUIRE(answer["listing"] == json::array({ "IL_0000: ldc.i4.s 42",
                                               "IL_0001: stloc V_0 (System.Int32)",
                                               "IL_0002: ldloc V_0 (System.Int32)",
                                               "IL_0003: ret" }));
    REQUIRE(answer["bytecode"] == "1F2AFE0E0000FE0C00002A");

    auto& plain = out["types"][0]["methods"][4];
    REQUIRE(plain.count("listing") == 0);
    REQUIRE(plain["parameters"][0]["type"] == "int32*");

    REQUIRE(out["types"][0]["nested"][0]["name"] == "Slot");
    REQUIRE(out["types"][0]["fields"][1]["type"] == "char* pinned");
  }

  SECTION( "written modules read back" ) {
    module_registry other;
    read_module(engine_description, other);
    auto& copy = read_module(write_module(game), other);

    REQUIRE(copy.find_type("Script/Slot") != nullptr);
    REQUIRE(copy.find_type("Script")->methods.size() == 5);
  }
}
