// file      : tests/main.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
