#include <tinyil/arguments_parser.hpp>
#include <tinyil/diagnostic.hpp>
#include <tinyil/compiler.hpp>
#include <tinyil/config.hpp>

#include <cstdio>

using namespace tinyil;

int main(int argc, const char** argv)
{
  arguments::parse(argc, argv, stdout);

  if(diagnostic.error_code() != 0)
    goto end;
  if(config.print_help)
    goto end;

  { // <- needed for goto
  compiler comp;
  comp.go();
  }

end:
  diagnostic.print(stderr);
  return diagnostic.error_code();
}
