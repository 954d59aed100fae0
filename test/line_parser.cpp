#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <tinyil/line_parser.hpp>
#include <tinyil/resolver.hpp>

#include <string>

using namespace tinyil;

TEST_CASE( "Statements are split and trimmed", "[line_parser]" ) {

  SECTION( "separators" ) {
    auto stmts = read_statements("ldarg.0;ldarg.1\nadd\r\n  ret  ");

    REQUIRE(stmts.size() == 4);
    REQUIRE(stmts[0].text == "ldarg.0");
    REQUIRE(stmts[1].text == "ldarg.1");
    REQUIRE(stmts[2].text == "add");
    REQUIRE(stmts[3].text == "ret");
  }

  SECTION( "rows count non empty statements" ) {
    auto stmts = read_statements("\n\nnop;;\n  ; // comment only\nret");

    REQUIRE(stmts.size() == 2);
    REQUIRE(stmts[0].row == 1);
    REQUIRE(stmts[1].row == 2);
  }

  SECTION( "comments end at the statement" ) {
    auto stmts = read_statements("ldc.i4 5 // five; ret // done");

    REQUIRE(stmts.size() == 2);
    REQUIRE(stmts[0].text == "ldc.i4 5");
    REQUIRE(stmts[0].operand == "5");
    REQUIRE(stmts[1].text == "ret");
  }

  SECTION( "empty source" ) {
    REQUIRE(read_statements("").empty());
    REQUIRE(read_statements(" \t\r\n;").empty());
  }
}

TEST_CASE( "Mnemonic and operand", "[line_parser]" ) {

  SECTION( "first space splits" ) {
    auto stmt = split_statement("call   int32 Script::Helper(int32)", 7);

    REQUIRE(stmt.mnemonic == "call");
    REQUIRE(stmt.operand == "int32 Script::Helper(int32)");
    REQUIRE(stmt.row == 7);
  }

  SECTION( "tabs split as well" ) {
    auto stmt = split_statement("ldloc\thash");

    REQUIRE(stmt.mnemonic == "ldloc");
    REQUIRE(stmt.operand == "hash");
  }

  SECTION( "no operand" ) {
    auto stmt = split_statement("ret");

    REQUIRE(stmt.mnemonic == "ret");
    REQUIRE(stmt.operand.empty());
  }

  SECTION( "labels" ) {
    REQUIRE(is_label_definition("LOOP:"));
    REQUIRE(!is_label_definition(":"));
    REQUIRE(!is_label_definition("ldc.i4"));

    auto stmt = split_statement("LOOP: ldloc hash");
    REQUIRE(is_label_definition(stmt.mnemonic));
    REQUIRE(stmt.operand == "ldloc hash");
  }
}

TEST_CASE( "Text helpers", "[line_parser]" ) {
  REQUIRE(trim("  \tnop \r") == "nop");
  REQUIRE(trim("   ").empty());
  REQUIRE(to_lower("LdC.I4.S") == "ldc.i4.s");
}
