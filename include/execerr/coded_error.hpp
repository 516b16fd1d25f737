#pragma once

/**
 * \file coded_error.hpp
 * \brief Coded execution error value, its absent state, and the constructors/combinators.
 *
 * Absent state: maybe_error (std::optional<coded_error>) disengaged. Every
 * combinator below handles it explicitly; none of them throws for it.
 * Value-returning engine code uses result<T> (std::expected<T, coded_error>).
 * Thread-safety: coded_error is immutable; all functions are stateless.
 */

#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "execerr/error.hpp"
#include "execerr/platform/compiler.hpp"

namespace execerr {

/**
 * \brief Capability of any failure value that knows its error_kind.
 *
 * Engine exception types may derive from it next to std::exception; as_coded()
 * then keeps their kind instead of falling back to error_kind::generic.
 */
class has_error_kind {
public:
  virtual ~has_error_kind() = default;
  virtual auto kind() const noexcept -> error_kind = 0;
};

class coded_error;

/** \brief A failure that may be absent. Disengaged means "no failure". */
using maybe_error = std::optional<coded_error>;

template <typename T>
using result = std::expected<T, coded_error>;

/** \brief Build an error; an empty message yields the absent state. */
auto make_error(error_kind kind, std::string message) -> maybe_error;

/**
 * \brief Immutable (kind, message) pair.
 *
 * what() is exactly the message. debug_string() decorates it with the numeric
 * kind for logs. Instances only come from make_error() and friends, so a
 * present coded_error never carries an empty message.
 */
class coded_error : public std::exception, public has_error_kind {
public:
  auto kind() const noexcept -> error_kind override { return kind_; }
  auto message() const noexcept -> const std::string& { return message_; }
  auto what() const noexcept -> const char* override { return message_.c_str(); }

  /** "Error <n>: <message>" */
  auto debug_string() const -> std::string;

  friend auto operator==(const coded_error& a, const coded_error& b) noexcept -> bool {
    return a.kind_ == b.kind_ && a.message_ == b.message_;
  }

private:
  coded_error(error_kind kind, std::string message)
      : kind_(kind), message_(std::move(message)) {}

  friend auto make_error(error_kind kind, std::string message) -> maybe_error;

  error_kind kind_;
  std::string message_;
};

/** \brief make_error() with a printf-style message. */
EXECERR_PRINTF_FORMAT(2, 3)
auto make_errorf(error_kind kind, const char* format, ...) -> maybe_error;

/** \brief make_errorf() with error_kind::generic. */
EXECERR_PRINTF_FORMAT(1, 2)
auto errorf(const char* format, ...) -> maybe_error;

/**
 * \brief Error side of a result<T>.
 *
 * An empty message is replaced by describe(kind): a failed result always
 * carries a present error.
 */
auto fail(error_kind kind, std::string message) -> std::unexpected<coded_error>;

// ----------------------------------------------------------------------------
// Coercion: the single point where heterogeneous failure values are unified.
// ----------------------------------------------------------------------------

inline auto as_coded(const maybe_error& e) -> maybe_error { return e; }

inline auto as_coded(const coded_error& e) -> maybe_error { return e; }

/**
 * coded_error is copied exactly. Other has_error_kind exceptions and
 * std::system_error in the execerr category keep their kind. Everything else
 * becomes error_kind::generic. The message is what(); an empty what() coerces
 * to the absent state.
 */
auto as_coded(const std::exception& e) -> maybe_error;

/** Null is absent. Payloads not derived from std::exception become generic "unknown exception". */
auto as_coded(const std::exception_ptr& e) -> maybe_error;

/**
 * The execerr category keeps its kind (value 0 is error_kind::generic, not
 * absent). Other categories: zero is absent, anything else is generic.
 */
auto as_coded(const std::error_code& ec) -> maybe_error;

/** A result holding a value is absent. */
template <typename T>
auto as_coded(const result<T>& r) -> maybe_error {
  if (r.has_value()) return std::nullopt;
  return r.error();
}

namespace detail {
auto wrap_coded(const maybe_error& inner, std::string_view context) -> maybe_error;
} // namespace detail

/**
 * \brief Prefix a failure with context, keeping its kind.
 *
 * Present: message becomes "<context>: <message>". Absent stays absent.
 */
template <typename Source>
auto wrap(const Source& source, std::string_view context) -> maybe_error {
  return detail::wrap_coded(as_coded(source), context);
}

/** \brief Both absent, or both present with the same kind and message. */
inline auto equal(const maybe_error& a, const maybe_error& b) noexcept -> bool {
  if (!a || !b) return !a && !b;
  return *a == *b;
}

inline auto equal(const maybe_error& a, const std::exception& b) -> bool {
  return equal(a, as_coded(b));
}

/** \brief User-facing diagnostic: the message, or "" when absent. */
inline auto diagnostic(const maybe_error& e) -> std::string {
  return e ? e->message() : std::string{};
}

/** \brief Log form: debug_string(), or "no error" when absent. */
auto debug_string(const maybe_error& e) -> std::string;

/** \brief Re-enter exception propagation: throws the held error, no-op when absent. */
EXECERR_COLD inline void raise_if(const maybe_error& e) {
  if (e) throw *e;
}

} // namespace execerr
