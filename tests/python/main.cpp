#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <cstdio>
#include <string>

#include "quill/python/runtime.hpp"
#include "quill/quill.h"

int main(int argc, char ** argv) {
  std::string error;
  if (quill::python::initialize(quill::python::options{}, &error) != QUILL_OK) {
    std::fprintf(stderr, "python initialize failed: %s\n", error.c_str());
    return 1;
  }

  doctest::Context context;
  context.applyCommandLine(argc, argv);
  const int rc = context.run();

  quill::python::finalize();
  return rc;
}
