#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <tinyil/assembler.hpp>
#include <tinyil/encoder.hpp>
#include <tinyil/error.hpp>

#include <string>
#include <vector>

using namespace tinyil;

namespace
{

using bytes = std::vector<unsigned char>;

struct game_module
{
  game_module()
  {
    auto& mod = registry.create("Game");
    script = &mod.add_type("", "Script");
    script->add_field("counter", make_primitive(primitive_type::int32), false);

    helper = &script->add_method("Helper", make_primitive(primitive_type::int32), false);
    helper->add_parameter("x", make_primitive(primitive_type::int32));

    method = &script->add_method("Run", make_primitive(primitive_type::int32), true);
    method->add_parameter("value", make_primitive(primitive_type::int32));

    auto& engine = registry.create("UnityEngine");
    auto& vec = engine.add_type("UnityEngine", "Vector3");
    vec.add_field("x", make_primitive(primitive_type::float32), false);
  }

  bytes compile(method_def& m, std::string_view src)
  {
    assembler::assemble(m, src);
    metadata_tokens tokens(*registry.resolve("Game"));
    return encode(m.body, m, tokens);
  }

  module_registry registry;
  type_def* script;
  method_def* helper;
  method_def* method;
};

}

TEST_CASE( "Code stream", "[encoder]" ) {
  game_module g;

  SECTION( "short branch" ) {
    REQUIRE((g.compile(*g.helper, "br.s SKIP; nop; SKIP: ret") == bytes{ 0x2B, 0x01, 0x00, 0x2A }));
  }

  SECTION( "backward long branch" ) {
    REQUIRE((g.compile(*g.helper, "TOP: nop; br TOP") == bytes{ 0x00, 0x38, 0xFA, 0xFF, 0xFF, 0xFF, 0x2A }));
  }

  SECTION( "little endian immediates" ) {
    REQUIRE((g.compile(*g.helper, "ldc.i4 0x811C9DC5; ret") == bytes{ 0x20, 0xC5, 0x9D, 0x1C, 0x81, 0x2A }));
    REQUIRE((g.compile(*g.helper, "ldc.i4.s -2; ret") == bytes{ 0x1F, 0xFE, 0x2A }));
    REQUIRE((g.compile(*g.helper, "ldc.r4 1.0; ret") == bytes{ 0x22, 0x00, 0x00, 0x80, 0x3F, 0x2A }));
  }

  SECTION( "two byte opcodes" ) {
    REQUIRE((g.compile(*g.helper, "#var hash uint32; ldloc hash; ret") == bytes{ 0xFE, 0x0C, 0x00, 0x00, 0x2A }));
    REQUIRE((g.compile(*g.helper, "ldarg.0; ldc.i4.1; ceq; ret") == bytes{ 0x02, 0x17, 0xFE, 0x01, 0x2A }));
  }

  SECTION( "switch" ) {
    REQUIRE((g.compile(*g.helper, "ldarg.0; switch A,B; A: nop; B: ret")
             == bytes{ 0x02, 0x45, 0x02, 0x00, 0x00, 0x00,
                       0x00, 0x00, 0x00, 0x00,
                       0x01, 0x00, 0x00, 0x00,
                       0x00, 0x2A }));
  }

  SECTION( "arguments count this" ) {
    REQUIRE((g.compile(*g.helper, "ldarg.s x; ret") == bytes{ 0x0E, 0x00, 0x2A }));
    REQUIRE((g.compile(*g.method, "ldarg.s value; ret") == bytes{ 0x0E, 0x01, 0x2A }));
  }

  SECTION( "short branch out of range" ) {
    std::string src = "br.s FAR";
    for(int i = 0; i < 130; ++i)
      src += "; nop";
    src += "; FAR: ret";

    try
    {
      g.compile(*g.helper, src);
      FAIL("displacement of 130 should not fit");
    }
    catch(const compile_error& err)
    {
      REQUIRE((err.kind() == error_kind::encoding));
    }

    src.replace(0, 4, "br");
    REQUIRE(g.compile(*g.helper, src).size() == 5 + 130 + 1);
  }
}

TEST_CASE( "Offsets", "[encoder]" ) {
  game_module g;
  assembler::assemble(*g.helper, "ldarg.0; switch A,B,A; A: ldc.i4 7; B: ret");

  const auto offsets = instruction_offsets(g.helper->body);
  REQUIRE((offsets == std::vector<std::size_t>{ 0, 1, 18, 23, 24 }));
}

TEST_CASE( "Metadata tokens", "[encoder]" ) {
  game_module g;
  auto& game = *g.registry.resolve("Game");
  auto& engine = *g.registry.resolve("UnityEngine");

  metadata_tokens tokens(game);

  SECTION( "definitions" ) {
    REQUIRE(tokens.type_token(make_defined(*g.script)) == 0x02000001);
    REQUIRE(tokens.method_token(g.helper) == 0x06000001);
    REQUIRE(tokens.method_token(g.method) == 0x06000002);
    REQUIRE(tokens.field_token(g.script->fields[0].get()) == 0x04000001);
  }

  SECTION( "references are numbered on first use" ) {
    auto vec = make_defined(*engine.find_type("UnityEngine.Vector3"));
    REQUIRE(tokens.type_token(make_primitive(primitive_type::int32)) == 0x01000001);
    REQUIRE(tokens.type_token(vec) == 0x01000002);
    REQUIRE(tokens.type_token(make_primitive(primitive_type::int32)) == 0x01000001);

    REQUIRE(tokens.type_token(make_pointer(vec)) == 0x1B000001);
    REQUIRE(tokens.field_token(engine.find_type("UnityEngine.Vector3")->fields[0].get()) == 0x0A000001);
    REQUIRE((table_of(tokens.type_token(make_pinned(make_pointer(vec)))) == token_table::type_spec));
  }

  SECTION( "user strings" ) {
    REQUIRE(tokens.string_token("Hi") == 0x70000001);
    REQUIRE(tokens.string_token("Bye") == 0x70000007);
    REQUIRE(tokens.string_token("Hi") == 0x70000001);
  }

  SECTION( "operands of the code stream" ) {
    auto code = g.compile(*g.method, "ldarg.0; ldfld Script::counter; call Script::Helper(int32); ldstr \"Hi\"; pop; ret");
    REQUIRE((code == bytes{ 0x02,
                            0x7B, 0x01, 0x00, 0x00, 0x04,
                            0x28, 0x01, 0x00, 0x00, 0x06,
                            0x72, 0x01, 0x00, 0x00, 0x70,
                            0x26, 0x2A }));
  }
}
