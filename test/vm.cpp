#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <tinyil/patch_file_cache.hpp>
#include <tinyil/assembler.hpp>
#include <tinyil/handlers.hpp>
#include <tinyil/error.hpp>
#include <tinyil/vm.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <limits>
#include <string>

using namespace tinyil;
namespace fs = std::filesystem;

namespace
{

constexpr std::string_view fnv_patch =
  "== FNV_HASH\n"
  "// 32 bit FNV-1a over UTF-16 code units\n"
  "#const BASIS 0x811C9DC5\n"
  "#const PRIME 16777619\n"
  "#var hash uint32\n"
  "\n"
  "    ldarg.1\n"
  "    brtrue.s LOOP_INIT\n"
  "    ldc.i4.0\n"
  "    ret\n"
  "LOOP_INIT:\n"
  "    ldc.i4 #BASIS\n"
  "    stloc hash\n"
  "LOOP:\n"
  "    ldloc hash\n"
  "    ldarg.0\n"
  "    ldind.u2\n"
  "    xor\n"
  "    ldc.i4 #PRIME\n"
  "    mul\n"
  "    stloc hash\n"
  "    ldarg.0\n"
  "    ldc.i4.2\n"
  "    add\n"
  "    starg.s ptr\n"
  "    ldarg.1\n"
  "    ldc.i4.1\n"
  "    sub\n"
  "    dup\n"
  "    starg.s len\n"
  "    brtrue.s LOOP\n"
  "    ldloc hash\n"
  "    ret\n";

std::uint32_t reference_fnv1a(const std::u16string& text)
{
  std::uint32_t h = 2166136261u;
  for(char16_t unit : text)
    h = (h ^ static_cast<std::uint32_t>(unit)) * 16777619u;
  return h;
}

struct script_module
{
  script_module()
  {
    auto& mod = registry.create("Game");
    script = &mod.add_type("", "Script");
  }

  method_def& add_static(std::string name, primitive_type ret)
  { return script->add_method(std::move(name), make_primitive(ret), false); }

  module_registry registry;
  type_def* script;
};

value run(const method_def& m, std::vector<value> args)
{
  vm virt_mach;
  return virt_mach.run(m, std::move(args));
}

}

TEST_CASE( "FNV-1a round trip", "[vm]" ) {
  const std::u16string aqualab = u"Aqualab";
  REQUIRE(aqualab.size() == 7);

  std::random_device rd;
  const auto dir = fs::temp_directory_path() / ("tinyil-vm-" + std::to_string(rd()));
  fs::create_directories(dir);
  {
    std::ofstream os(dir / "hashing.ilpatch", std::ios::binary);
    os << fnv_patch;
  }

  script_module g;
  auto& hash = g.add_static("FnvHash32", primitive_type::uint32);
  hash.add_parameter("ptr", make_pointer(make_primitive(primitive_type::char_)));
  hash.add_parameter("len", make_primitive(primitive_type::int32));
  hash.attributes.push_back(custom_attribute { "TinyIL.ExternalILAttribute", { "hashing:FNV_HASH" } });

  patch_file_cache cache(dir);
  REQUIRE(compile_method(hash, cache));
  REQUIRE(hash.attributes.empty());

  std::error_code ec;
  fs::remove_all(dir, ec);

  SECTION( "Aqualab" ) {
    auto result = run(hash, { value::native(reinterpret_cast<std::intptr_t>(aqualab.data())), value::int32(7) });

    REQUIRE(result.as_uint32() == reference_fnv1a(aqualab));
  }

  SECTION( "empty input hashes to zero" ) {
    auto result = run(hash, { value::native(reinterpret_cast<std::intptr_t>(aqualab.data())), value::int32(0) });

    REQUIRE(result.as_uint32() == 0);
  }

  SECTION( "other strings" ) {
    for(const std::u16string text : { u"a", u"TinyIL", u"äöü" })
    {
      auto result = run(hash, { value::native(reinterpret_cast<std::intptr_t>(text.data())),
                                value::int32(static_cast<std::int32_t>(text.size())) });

      REQUIRE(result.as_uint32() == reference_fnv1a(text));
    }
  }
}

TEST_CASE( "vm", "[vm]" ) {
  script_module g;

  SECTION( "arithmetic" ) {
    auto& m = g.add_static("Calc", primitive_type::int32);
    m.add_parameter("x", make_primitive(primitive_type::int32));
    assembler::assemble(m, "ldarg.0; ldc.i4.3; mul; ldc.i4.s -4; add; ldc.i4.2; div; ret");

    REQUIRE(run(m, { value::int32(6) }).as_int32() == 7);
    REQUIRE(run(m, { value::int32(-2) }).as_int32() == -5);
  }

  SECTION( "int32 arithmetic wraps" ) {
    auto& m = g.add_static("Wrap", primitive_type::int32);
    assembler::assemble(m, "ldc.i4 0x7FFFFFFF; ldc.i4.1; add; ret");

    REQUIRE(run(m, {}).as_int32() == std::numeric_limits<std::int32_t>::min());
  }

  SECTION( "loops and locals" ) {
    auto& m = g.add_static("Sum", primitive_type::int32);
    m.add_parameter("n", make_primitive(primitive_type::int32));
    assembler::assemble(m, R"(
      #var acc int32
      ldc.i4.0; stloc acc
      LOOP: ldarg.0; brfalse.s DONE
      ldloc acc; ldarg.0; add; stloc acc
      ldarg.0; ldc.i4.1; sub; starg.s n
      br.s LOOP
      DONE: ldloc acc; ret)");

    REQUIRE(run(m, { value::int32(10) }).as_int32() == 55);
    REQUIRE(run(m, { value::int32(0) }).as_int32() == 0);
  }

  SECTION( "switch" ) {
    auto& m = g.add_static("Pick", primitive_type::int32);
    m.add_parameter("i", make_primitive(primitive_type::int32));
    assembler::assemble(m, "ldarg.0; switch A,B,A; ldc.i4.m1; ret; A: ldc.i4 10; ret; B: ldc.i4 20; ret");

    REQUIRE(run(m, { value::int32(0) }).as_int32() == 10);
    REQUIRE(run(m, { value::int32(1) }).as_int32() == 20);
    REQUIRE(run(m, { value::int32(2) }).as_int32() == 10);
    REQUIRE(run(m, { value::int32(3) }).as_int32() == -1);
  }

  SECTION( "unsigned comparison" ) {
    auto& m = g.add_static("Above", primitive_type::boolean);
    m.add_parameter("x", make_primitive(primitive_type::int32));
    assembler::assemble(m, "ldarg.0; ldc.i4 100; cgt.un; ret");

    REQUIRE(run(m, { value::int32(-1) }).as_int32() == 1);
    REQUIRE(run(m, { value::int32(5) }).as_int32() == 0);
  }

  SECTION( "conversions" ) {
    auto& m = g.add_static("Narrow", primitive_type::int32);
    assembler::assemble(m, "ldc.i4 0x1FF; conv.i1; ret");

    REQUIRE(run(m, {}).as_int32() == -1);
  }

  SECTION( "indirect stores" ) {
    auto& m = g.add_static("Poke", primitive_type::void_);
    m.add_parameter("ptr", make_pointer(make_primitive(primitive_type::int32)));
    assembler::assemble(m, "ldarg.0; ldc.i4 1234; stind.i4");

    std::int32_t target = 0;
    run(m, { value::native(reinterpret_cast<std::intptr_t>(&target)) });
    REQUIRE(target == 1234);
  }

  SECTION( "step through" ) {
    auto& m = g.add_static("Three", primitive_type::int32);
    assembler::assemble(m, "ldc.i4.1; ldc.i4.2; add; ret");

    vm virt_mach;
    virt_mach.run(m, {});
    REQUIRE(virt_mach.steps() == 4);
    REQUIRE(virt_mach.program_counter() == 4);
    REQUIRE(virt_mach.stack().empty());
  }
}

TEST_CASE( "vm faults", "[vm]" ) {
  script_module g;

  SECTION( "argument count" ) {
    auto& m = g.add_static("One", primitive_type::int32);
    m.add_parameter("x", make_primitive(primitive_type::int32));
    assembler::assemble(m, "ldarg.0; ret");

    REQUIRE_THROWS_AS(run(m, {}), execution_error);
  }

  SECTION( "step limit" ) {
    auto& m = g.add_static("Forever", primitive_type::void_);
    assembler::assemble(m, "SPIN: br.s SPIN");

    vm virt_mach(100);
    REQUIRE_THROWS_AS(virt_mach.run(m, {}), execution_error);
    REQUIRE(virt_mach.steps() == 101);
  }

  SECTION( "division by zero" ) {
    auto& m = g.add_static("Div", primitive_type::int32);
    assembler::assemble(m, "ldc.i4.1; ldc.i4.0; div; ret");

    REQUIRE_THROWS_AS(run(m, {}), execution_error);
  }

  SECTION( "calls are out of reach" ) {
    auto& callee = g.add_static("Callee", primitive_type::void_);
    assembler::assemble(callee, "ret");
    auto& m = g.add_static("Caller", primitive_type::void_);
    assembler::assemble(m, "call Script::Callee(); ret");

    REQUIRE_THROWS_AS(run(m, {}), execution_error);
  }

  SECTION( "stack underflow" ) {
    auto& m = g.add_static("Pop", primitive_type::void_);
    assembler::assemble(m, "pop; ret");

    REQUIRE_THROWS_AS(run(m, {}), execution_error);
  }
}
