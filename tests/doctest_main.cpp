#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <vrmi/core/logger.hpp>

int main(int argc, char **argv) {
  vrmi::core::Logger::init();

  doctest::Context context;
  context.applyCommandLine(argc, argv);

  int res = context.run();

  vrmi::core::Logger::shutdown();

  return res;
}
