#include <catch2/catch_all.hpp>
#include <execerr/c/execerr.h>

#include <string>

TEST_CASE("C API kind descriptions are total", "[c_api]") {
  REQUIRE(std::string(execerr_kind_description(4)) == "Insufficient gas");
  REQUIRE(std::string(execerr_kind_description(0)) == "Generic error");
  REQUIRE(std::string(execerr_kind_description(36)) == "Unknown error");
  REQUIRE(std::string(execerr_kind_description(0xFFFFFFFFu)) == "Unknown error");
}

TEST_CASE("C API latch lifecycle", "[c_api][latch]") {
  execerr_latch_t* latch = nullptr;
  REQUIRE(execerr_latch_create(&latch) == EXECERR_OK);
  REQUIRE(latch != nullptr);

  int has = -1;
  uint32_t kind = 0;
  const char* msg = nullptr;
  REQUIRE(execerr_latch_get(latch, &has, &kind, &msg) == EXECERR_OK);
  REQUIRE(has == 0);

  REQUIRE(execerr_latch_push(latch, 4, nullptr) == EXECERR_OK);
  REQUIRE(execerr_latch_push(latch, 4, "") == EXECERR_OK);
  REQUIRE(execerr_latch_has_error(latch, &has) == EXECERR_OK);
  REQUIRE(has == 0);

  REQUIRE(execerr_latch_push(latch, 4, "gas exhausted") == EXECERR_OK);
  REQUIRE(execerr_latch_push(latch, 9, "stack overflow") == EXECERR_OK);
  REQUIRE(execerr_latch_get(latch, &has, &kind, &msg) == EXECERR_OK);
  REQUIRE(has == 1);
  REQUIRE(kind == 4u);
  REQUIRE(std::string(msg) == "gas exhausted");

  REQUIRE(execerr_latch_reset(latch) == EXECERR_OK);
  REQUIRE(execerr_latch_has_error(latch, &has) == EXECERR_OK);
  REQUIRE(has == 0);

  REQUIRE(execerr_latch_push(latch, 9, "stack overflow") == EXECERR_OK);
  REQUIRE(execerr_latch_get(latch, &has, &kind, &msg) == EXECERR_OK);
  REQUIRE(kind == 9u);

  execerr_latch_destroy(latch);
}

TEST_CASE("C API rejects null handles", "[c_api]") {
  int has = 0;
  REQUIRE(execerr_latch_create(nullptr) == EXECERR_E_INVALID_PARAM);
  REQUIRE(execerr_latch_push(nullptr, 0, "x") == EXECERR_E_INVALID_PARAM);
  REQUIRE(execerr_latch_has_error(nullptr, &has) == EXECERR_E_INVALID_PARAM);
  REQUIRE(execerr_latch_reset(nullptr) == EXECERR_E_INVALID_PARAM);
  REQUIRE(std::string(execerr_get_last_error()).empty());
  execerr_latch_destroy(nullptr);
}
