#pragma once

/**
 * \file error.hpp
 * \brief Execution error taxonomy: stable kinds and their canonical descriptions.
 *
 * Design:
 * - Numeric identity of every shipped kind is stable; new kinds are appended.
 * - describe() is total: values outside the declared range map to "Unknown error".
 * - Kinds plug into std::error_code through error_category().
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace execerr {

/** \brief Stable execution failure kinds. Append only. */
enum class error_kind : std::uint32_t {
  generic = 0,
  unknown_address,
  insufficient_balance,
  invalid_jump_dest,
  insufficient_gas,
  memory_out_of_bounds,
  code_out_of_bounds,
  input_out_of_bounds,
  return_data_out_of_bounds,
  call_stack_overflow,
  call_stack_underflow,
  data_stack_overflow,
  data_stack_underflow,
  invalid_contract,
  native_contract_code_copy,
  execution_aborted,
  execution_reverted,
  permission_denied,
  native_function,
  event_publish,
  invalid_string,
  event_mapping,
  invalid_address,
  duplicate_address,
  insufficient_funds,
  overpayment,
  zero_payment,
  invalid_sequence,
  reserved_address,
  illegal_write,
  integer_overflow,
  invalid_proposal,
  expired_proposal,
  proposal_executed,
  no_input_permission,
  already_voted,
};

/** Number of declared kinds; the last declared kind is error_kind_count - 1. */
inline constexpr std::uint32_t error_kind_count = 36;

/** Description returned for any value outside the declared range. */
inline constexpr std::string_view unknown_error_description = "Unknown error";

constexpr auto to_uint32(error_kind kind) noexcept -> std::uint32_t {
  return static_cast<std::uint32_t>(kind);
}

constexpr auto is_declared(error_kind kind) noexcept -> bool {
  return to_uint32(kind) < error_kind_count;
}

/** \brief Canonical description of a kind; total over all 32-bit values. */
auto describe(error_kind kind) noexcept -> std::string_view;

/** \brief Debug form "Error <n>: <description>". */
auto to_string(error_kind kind) -> std::string;

/** \brief Category named "execerr"; message(v) is describe(error_kind{v}). */
auto error_category() noexcept -> const std::error_category&;

auto make_error_code(error_kind kind) noexcept -> std::error_code;

} // namespace execerr

template <>
struct std::is_error_code_enum<execerr::error_kind> : std::true_type {};
