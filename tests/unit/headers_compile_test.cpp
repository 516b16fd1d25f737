// Each public header first, so it must stand on its own includes.
#include <execerr/coded_error.hpp>
#include <execerr/sink.hpp>
#include <execerr/execerr.hpp>
#include <execerr/c/execerr.h>
#include <catch2/catch_all.hpp>

TEST_CASE("headers compile and basic types exist", "[headers]") {
  execerr::first_error latch{execerr::core::trace_options{}};
  REQUIRE_FALSE(latch.has_error());
  REQUIRE(execerr::describe(execerr::error_kind::generic) == "Generic error");
}
