#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <tinyil/patch_file_cache.hpp>
#include <tinyil/error.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

using namespace tinyil;
namespace fs = std::filesystem;

namespace
{

struct scratch_dir
{
  scratch_dir()
  {
    std::random_device rd;
    path = fs::temp_directory_path() / ("tinyil-test-" + std::to_string(rd()));
    fs::create_directories(path);
  }
  ~scratch_dir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  void write(const fs::path& relative, const std::string& content) const
  {
    fs::create_directories((path / relative).parent_path());
    std::ofstream os(path / relative, std::ios::binary);
    os << content;
  }

  fs::path path;
};

error_kind kind_of_failure(patch_file_cache& cache, std::string_view name)
{
  try
  {
    cache.find_patch(name);
  }
  catch(const compile_error& err)
  {
    return err.kind();
  }
  FAIL("find_patch(" << name << ") did not fail");
  return error_kind::syntax;
}

}

TEST_CASE( "Patch sections are looked up by file and name", "[patch_file_cache]" ) {
  scratch_dir dir;
  dir.write("hashing.ilpatch",
            "// leading comment, not part of any section\n"
            "== FNV_HASH\n"
            "  // seed\n"
            "  ldc.i4 0x811C9DC5\n"
            "\n"
            "\tstloc hash\r\n"
            "== other\n"
            "ret\n");

  patch_file_cache cache(dir.path);

  SECTION( "body of the requested section" ) {
    REQUIRE(cache.find_patch("hashing:FNV_HASH") == "ldc.i4 0x811C9DC5\nstloc hash");
    REQUIRE(cache.find_patch("hashing:other") == "ret");
  }

  SECTION( "one scan per file" ) {
    REQUIRE(cache.scan_count() == 0);
    auto first = cache.find_patch("hashing:FNV_HASH");
    REQUIRE(cache.scan_count() == 1);

    fs::remove(dir.path / "hashing.ilpatch");

    REQUIRE(cache.find_patch("hashing:FNV_HASH") == first);
    REQUIRE(cache.find_patch("hashing:other") == "ret");
    REQUIRE(cache.scan_count() == 1);
  }

  SECTION( "missing patch" ) {
    REQUIRE((kind_of_failure(cache, "hashing:MISSING") == error_kind::patch_not_found));
    REQUIRE((kind_of_failure(cache, "nofile:FNV_HASH") == error_kind::patch_not_found));
    REQUIRE((kind_of_failure(cache, "nofile:FNV_HASH") == error_kind::patch_not_found));
    REQUIRE(cache.scan_count() == 2);
  }

  SECTION( "malformed names" ) {
    REQUIRE((kind_of_failure(cache, "FNV_HASH") == error_kind::syntax));
    REQUIRE((kind_of_failure(cache, ":FNV_HASH") == error_kind::syntax));
    REQUIRE((kind_of_failure(cache, "hashing:") == error_kind::syntax));
  }

  SECTION( "error names what was searched" ) {
    try
    {
      cache.find_patch("hashing:MISSING");
      FAIL("MISSING should not be found");
    }
    catch(const compile_error& err)
    {
      REQUIRE_THAT(err.message(), Catch::Contains("MISSING") && Catch::Contains("hashing.ilpatch")
                                  && Catch::Contains(dir.path.string()));
    }
  }
}

TEST_CASE( "Patch files are found recursively", "[patch_file_cache]" ) {
  scratch_dir dir;
  dir.write("scripts/deep/movement.ilpatch", "== Jump\nldc.r4 9.81\nret\n");
  dir.write("scripts/movement.txt", "== Walk\nret\n");

  patch_file_cache cache(dir.path);
  REQUIRE(cache.find_patch("movement:Jump") == "ldc.r4 9.81\nret");
  REQUIRE((kind_of_failure(cache, "movement:Walk") == error_kind::patch_not_found));

  SECTION( "custom extension" ) {
    patch_file_cache txt(dir.path, ".txt");
    REQUIRE(txt.find_patch("movement:Walk") == "ret");
  }
}

TEST_CASE( "Duplicate patches", "[patch_file_cache]" ) {
  scratch_dir dir;

  SECTION( "within one file" ) {
    dir.write("fx.ilpatch", "== Blink\nnop\n== Blink\nret\n");

    patch_file_cache cache(dir.path);
    REQUIRE((kind_of_failure(cache, "fx:Blink") == error_kind::duplicate_patch));
  }

  SECTION( "across files" ) {
    dir.write("a/fx.ilpatch", "== Blink\nnop\n");
    dir.write("b/fx.ilpatch", "== Fade\nnop\n== Blink\nret\n");

    patch_file_cache cache(dir.path);
    REQUIRE((kind_of_failure(cache, "fx:Fade") == error_kind::duplicate_patch));
  }

  SECTION( "keep failing for the whole cache lifetime" ) {
    dir.write("a/fx.ilpatch", "== Blink\nnop\n");
    dir.write("b/fx.ilpatch", "== Blink\nret\n");
    dir.write("other.ilpatch", "== Blink\nret\n");

    patch_file_cache cache(dir.path);
    REQUIRE((kind_of_failure(cache, "fx:Blink") == error_kind::duplicate_patch));
    REQUIRE((kind_of_failure(cache, "fx:Blink") == error_kind::duplicate_patch));
    REQUIRE((kind_of_failure(cache, "fx:Fade") == error_kind::duplicate_patch));
    REQUIRE(cache.scan_count() == 1);

    REQUIRE(cache.find_patch("other:Blink") == "ret");
  }
}
