#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <tinyil/arguments_parser.hpp>
#include <tinyil/diagnostic.hpp>
#include <tinyil/compiler.hpp>
#include <tinyil/config.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <random>
#include <string>

using namespace tinyil;
namespace fs = std::filesystem;

namespace
{

void reset()
{
  config = config_t{};
  diagnostic.reset();
}

template<std::size_t N>
void parse(const char* (&argv)[N], std::FILE* out = stdout)
{ arguments::parse(static_cast<int>(N), argv, out); }

std::string read_all(const fs::path& path)
{
  std::ifstream is(path);
  std::stringstream ss;
  ss << is.rdbuf();
  return ss.str();
}

struct workspace
{
  workspace()
  {
    std::random_device rd;
    root = fs::temp_directory_path() / ("tinyil-driver-" + std::to_string(rd()));
    fs::create_directories(root / "refs");
    fs::create_directories(root / "patches");

    write(root / "refs" / "engine.json", R"({
      "name": "UnityEngine",
      "types": [ { "namespace": "UnityEngine", "name": "MonoBehaviour" } ] })");
    write(root / "patches" / "math.ilpatch", "== ANSWER\nldc.i4.s 42\nret\n");

    game = (root / "game.json").string();
    output = (root / "out.txt").string();
    patches = (root / "patches").string();
    refs = (root / "refs").string();
  }
  ~workspace()
  {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  void write(const fs::path& path, const std::string& content) const
  {
    std::ofstream os(path, std::ios::binary);
    os << content;
  }

  void write_game(const std::string& methods) const
  {
    write(game, R"({ "name": "Game", "references": [ "UnityEngine" ],
      "types": [ { "namespace": "", "name": "Script", "base": "UnityEngine.MonoBehaviour",
                   "methods": [ )" + methods + " ] } ] }");
  }

  void configure()
  {
    config.files = { game };
    config.reference_dirs = { refs };
    config.patch_dir = patches;
    config.output_file = output;
  }

  fs::path root;
  std::string game;
  std::string output;
  std::string patches;
  std::string refs;
};

}

TEST_CASE( "Command line arguments", "[arguments]" ) {
  reset();

  SECTION( "every option" ) {
    const char* argv[] = { "tinyil", "-f", "game.json", "lib.json", "--emit=bytecode",
                           "-p", "patches", "--patch-ext=txt", "-o", "out.txt" };
    parse(argv);

    REQUIRE(diagnostic.error_code() == 0);
    REQUIRE(config.files.size() == 2);
    REQUIRE(config.files[0] == "game.json");
    REQUIRE(config.files[1] == "lib.json");
    REQUIRE((config.emit_class == emit_classes::bytecode));
    REQUIRE(config.patch_dir == "patches");
    REQUIRE(config.patch_extension == ".txt");
    REQUIRE(config.output_file == "out.txt");
    REQUIRE(!config.print_help);
  }

  SECTION( "defaults" ) {
    const char* argv[] = { "tinyil", "game.json" };
    parse(argv);

    REQUIRE(diagnostic.error_code() == 0);
    REQUIRE(config.files.size() == 1);
    REQUIRE((config.emit_class == emit_classes::listing));
    REQUIRE(config.patch_dir == ".");
    REQUIRE(config.patch_extension == ".ilpatch");
    REQUIRE(config.output_file == "-");
  }

  SECTION( "unknown argument" ) {
    const char* argv[] = { "tinyil", "-f", "game.json", "-x" };
    parse(argv);

    REQUIRE(diagnostic.error_code() == 1);
    REQUIRE(diagnostic.count(diag_level::error) == 1);
  }

  SECTION( "unknown emit class" ) {
    std::FILE* out = std::tmpfile();
    REQUIRE(out != nullptr);

    const char* argv[] = { "tinyil", "-f", "game.json", "--emit=pe" };
    parse(argv, out);

    REQUIRE(diagnostic.error_code() == 1);
    REQUIRE(config.print_help);

    std::rewind(out);
    char buffer[256] = {};
    REQUIRE(std::fgets(buffer, sizeof(buffer), out) != nullptr);
    REQUIRE(std::string(buffer) == "emit classes: help, listing, module, bytecode\n");
    std::fclose(out);
  }

  SECTION( "help" ) {
    std::FILE* out = std::tmpfile();
    REQUIRE(out != nullptr);

    const char* argv[] = { "tinyil", "-h" };
    parse(argv, out);

    REQUIRE(diagnostic.error_code() == 0);
    REQUIRE(config.print_help);

    std::rewind(out);
    char buffer[256] = {};
    REQUIRE(std::fgets(buffer, sizeof(buffer), out) != nullptr);
    REQUIRE_THAT(std::string(buffer), Catch::StartsWith("tinyil"));
    std::fclose(out);
  }

  SECTION( "no files" ) {
    const char* argv[] = { "tinyil", "--emit=module" };
    parse(argv);

    REQUIRE(diagnostic.error_code() == 1);
    REQUIRE(config.files.empty());
  }
}

TEST_CASE( "Compiler", "[compiler]" ) {
  reset();
  workspace ws;
  ws.configure();

  SECTION( "listing" ) {
    ws.write_game(R"({ "name": "Answer", "static": true, "return": "int32",
                       "attributes": [ { "type": "IntrinsicILAttribute", "args": [ "ldc.i4.s 42" ] } ] },
                     { "name": "Patched", "static": true, "return": "int32",
                       "attributes": [ { "type": "ExternalILAttribute", "args": [ "math:ANSWER" ] } ] },
                     { "name": "Untouched", "static": true })");

    compiler comp;
    comp.go();

    REQUIRE(diagnostic.error_code() == 0);
    REQUIRE(diagnostic.count(diag_level::info) == 1);
    REQUIRE(comp.target_name == "Game");

    const auto text = read_all(ws.output);
    REQUIRE_THAT(text, Catch::Contains(".method System.Int32 Script::Answer()\n"
                                       "  IL_0000: ldc.i4.s 42\n"
                                       "  IL_0001: ret\n"));
    REQUIRE_THAT(text, Catch::Contains("Script::Patched()"));
    REQUIRE(text.find("Untouched") == std::string::npos);
  }

  SECTION( "bytecode" ) {
    ws.write_game(R"({ "name": "Answer", "static": true, "return": "int32",
                       "attributes": [ { "type": "IntrinsicILAttribute", "args": [ "ldc.i4.s 42; ret" ] } ] })");
    config.emit_class = emit_classes::bytecode;

    compiler comp;
    comp.go();

    REQUIRE(diagnostic.error_code() == 0);
    REQUIRE(read_all(ws.output) == "System.Int32 Script::Answer()\n  1F 2A 2A \n");
  }

  SECTION( "references are loaded first" ) {
    ws.write_game(R"({ "name": "Answer", "static": true,
                       "attributes": [ { "type": "IntrinsicILAttribute", "args": [ "nop" ] } ] })");
    const std::string engine = (ws.root / "refs" / "engine.json").string();
    config.reference_dirs.clear();
    config.files = { ws.game, engine };

    compiler comp;
    comp.go();

    REQUIRE(diagnostic.error_code() == 0);
    REQUIRE(comp.registry.modules.size() == 2);
    REQUIRE(comp.registry.modules[0]->name == "UnityEngine");
    REQUIRE(comp.target_name == "Game");
    REQUIRE(fs::exists(ws.output));
  }

  SECTION( "failed methods keep the module from being written" ) {
    ws.write_game(R"({ "name": "Answer", "static": true,
                       "attributes": [ { "type": "IntrinsicILAttribute", "args": [ "nop" ] } ] },
                     { "name": "Broken", "static": true,
                       "attributes": [ { "type": "IntrinsicILAttribute", "args": [ "nop; br NOWHERE" ] } ] },
                     { "name": "Lost", "static": true,
                       "attributes": [ { "type": "ExternalILAttribute", "args": [ "math:QUESTION" ] } ] })");

    compiler comp;
    comp.go();

    REQUIRE(diagnostic.error_code() == 1);
    REQUIRE(diagnostic.count(diag_level::error) == 3);
    REQUIRE(!fs::exists(ws.output));
  }

  SECTION( "nothing to rewrite" ) {
    ws.write_game(R"({ "name": "Plain", "static": true })");

    compiler comp;
    comp.go();

    REQUIRE(diagnostic.error_code() == 0);
    REQUIRE(diagnostic.count(diag_level::info) == 1);
    REQUIRE(!fs::exists(ws.output));
  }

  SECTION( "missing reference" ) {
    ws.write_game(R"({ "name": "Plain", "static": true })");
    config.reference_dirs.clear();

    compiler comp;
    comp.go();

    REQUIRE(diagnostic.error_code() == 1);
    REQUIRE(!fs::exists(ws.output));
  }

  SECTION( "unreadable description" ) {
    ws.write(ws.game, "{ \"name\": ");

    compiler comp;
    comp.go();

    REQUIRE(diagnostic.error_code() == 1);
    REQUIRE(comp.registry.modules.size() == 1);
  }
}
