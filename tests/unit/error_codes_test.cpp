#include <execerr/error.hpp>
#include <catch2/catch_all.hpp>

#include <set>
#include <string>

TEST_CASE("error kinds stable subset", "[errors]") {
  using execerr::error_kind;
  REQUIRE(static_cast<unsigned>(error_kind::generic) == 0u);
  REQUIRE(static_cast<unsigned>(error_kind::unknown_address) == 1u);
  REQUIRE(static_cast<unsigned>(error_kind::insufficient_gas) == 4u);
  REQUIRE(static_cast<unsigned>(error_kind::call_stack_overflow) == 9u);
  REQUIRE(static_cast<unsigned>(error_kind::execution_aborted) == 15u);
  REQUIRE(static_cast<unsigned>(error_kind::execution_reverted) == 16u);
  REQUIRE(static_cast<unsigned>(error_kind::permission_denied) == 17u);
  REQUIRE(static_cast<unsigned>(error_kind::already_voted) == 35u);
  REQUIRE(execerr::error_kind_count == 36u);
}

TEST_CASE("every declared kind has its own description", "[errors]") {
  using namespace execerr;
  std::set<std::string> seen;
  for (std::uint32_t v = 0; v < error_kind_count; ++v) {
    const auto kind = static_cast<error_kind>(v);
    REQUIRE(is_declared(kind));
    const auto d = describe(kind);
    REQUIRE_FALSE(d.empty());
    REQUIRE(d != unknown_error_description);
    seen.insert(std::string(d));
  }
  REQUIRE(seen.size() == error_kind_count);
}

TEST_CASE("out-of-range kinds describe as unknown", "[errors]") {
  using namespace execerr;
  for (std::uint32_t v : {error_kind_count, error_kind_count + 1, 1000u, 0xFFFFFFFFu}) {
    const auto kind = static_cast<error_kind>(v);
    REQUIRE_FALSE(is_declared(kind));
    REQUIRE(describe(kind) == "Unknown error");
  }
}

TEST_CASE("canonical descriptions", "[errors]") {
  using namespace execerr;
  REQUIRE(describe(error_kind::generic) == "Generic error");
  REQUIRE(describe(error_kind::insufficient_gas) == "Insufficient gas");
  REQUIRE(describe(error_kind::native_contract_code_copy) == "Tried to copy native contract code");
  REQUIRE(describe(error_kind::invalid_sequence) == "Invalid sequence number");
  REQUIRE(describe(error_kind::already_voted) == "Vote already registered for this address");
}

TEST_CASE("to_string decorates with the numeric kind", "[errors]") {
  using namespace execerr;
  REQUIRE(to_string(error_kind::insufficient_gas) == "Error 4: Insufficient gas");
  REQUIRE(to_string(static_cast<error_kind>(99)) == "Error 99: Unknown error");
  REQUIRE(to_uint32(error_kind::integer_overflow) == 30u);
}

TEST_CASE("error kinds convert to std::error_code", "[errors][error_code]") {
  using namespace execerr;
  std::error_code ec = error_kind::permission_denied;
  REQUIRE(ec.category() == error_category());
  REQUIRE(std::string(ec.category().name()) == "execerr");
  REQUIRE(ec.value() == 17);
  REQUIRE(ec.message() == "Permission denied");

  const std::error_code generic = make_error_code(error_kind::generic);
  REQUIRE(generic.value() == 0);
  REQUIRE(generic.category() == error_category());
}
