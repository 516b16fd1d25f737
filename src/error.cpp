#include "execerr/error.hpp"

#include <array>

namespace execerr {

namespace {

// Indexed by numeric kind; order must follow the enum exactly.
constexpr std::array<std::string_view, error_kind_count> kDescriptions = {
  "Generic error",
  "Unknown address",
  "Insufficient balance",
  "Invalid jump dest",
  "Insufficient gas",
  "Memory out of bounds",
  "Code out of bounds",
  "Input out of bounds",
  "Return data out of bounds",
  "Call stack overflow",
  "Call stack underflow",
  "Data stack overflow",
  "Data stack underflow",
  "Invalid contract",
  "Tried to copy native contract code",
  "Execution aborted",
  "Execution reverted",
  "Permission denied",
  "Native function error",
  "Event publish error",
  "Invalid string",
  "Event mapping error",
  "Invalid address",
  "Duplicate address",
  "Insufficient funds",
  "Overpayment",
  "Zero payment error",
  "Invalid sequence number",
  "Address is reserved for SNative or internal use",
  "Callee attempted to illegally modify state",
  "Integer overflow",
  "Proposal is invalid",
  "Proposal is expired since sequence number does not match",
  "Proposal has already been executed",
  "Account has no input permission",
  "Vote already registered for this address",
};

static_assert(to_uint32(error_kind::already_voted) + 1 == error_kind_count,
              "error_kind_count out of sync with error_kind");

class execerr_category final : public std::error_category {
public:
  auto name() const noexcept -> const char* override { return "execerr"; }

  auto message(int value) const -> std::string override {
    return std::string(describe(static_cast<error_kind>(value)));
  }
};

} // namespace

auto describe(error_kind kind) noexcept -> std::string_view {
  if (!is_declared(kind)) return unknown_error_description;
  return kDescriptions[to_uint32(kind)];
}

auto to_string(error_kind kind) -> std::string {
  std::string out = "Error ";
  out += std::to_string(to_uint32(kind));
  out += ": ";
  out += describe(kind);
  return out;
}

auto error_category() noexcept -> const std::error_category& {
  static const execerr_category category;
  return category;
}

auto make_error_code(error_kind kind) noexcept -> std::error_code {
  return {static_cast<int>(to_uint32(kind)), error_category()};
}

} // namespace execerr
