#pragma once

/** \file sink.hpp
 *  \brief Failure provider/sink capabilities and the first-error latch.
 *
 * Thread-safety: none. A first_error belongs to one sequential execution trace;
 * parallel branches each get their own instance and the engine merges them.
 */

#include <cstdint>
#include <exception>
#include <system_error>

#include "execerr/coded_error.hpp"
#include "execerr/core/trace.hpp"

namespace execerr {

/** \brief Anything whose failure state can be queried after it ran. */
class error_provider {
public:
  virtual ~error_provider() = default;

  /** The failure that occurred, or absent if none did. */
  [[nodiscard]] virtual auto error() const -> maybe_error = 0;
};

/**
 * \brief Anything that accumulates failures raised by sub-operations.
 *
 * Implementations override the maybe_error overload; the others coerce through
 * as_coded() and forward to it. Derived classes re-expose them with
 * `using error_sink::push_error;`.
 */
class error_sink {
public:
  virtual ~error_sink() = default;

  virtual void push_error(const maybe_error& e) = 0;

  void push_error(const coded_error& e) { push_error(maybe_error(e)); }
  void push_error(const std::exception& e) { push_error(as_coded(e)); }
  void push_error(const std::exception_ptr& e) { push_error(as_coded(e)); }
  void push_error(const std::error_code& ec) { push_error(as_coded(ec)); }

  template <typename T>
  void push_error(const result<T>& r) { push_error(as_coded(r)); }
};

/**
 * \brief Keeps only the first present failure pushed to it.
 *
 * States: empty, latched. push_error() in the empty state latches any present
 * failure and ignores absent ones; in the latched state it never overwrites.
 * reset() returns to empty so the instance can serve the next traced run.
 */
class first_error final : public error_sink, public error_provider {
public:
  /** Trace options from EXECERR_TRACE. */
  first_error();
  explicit first_error(core::trace_options trace);

  using error_sink::push_error;
  void push_error(const maybe_error& e) override;

  [[nodiscard]] auto error() const -> maybe_error override { return recorded_; }
  [[nodiscard]] auto has_error() const noexcept -> bool { return recorded_.has_value(); }
  [[nodiscard]] auto recorded() const noexcept -> const maybe_error& { return recorded_; }

  /** Present failures ignored since the last reset. */
  [[nodiscard]] auto dropped_count() const noexcept -> std::uint64_t { return dropped_; }

  void reset() noexcept;

private:
  maybe_error recorded_;
  std::uint64_t dropped_{0};
  core::trace_options trace_;
};

/**
 * \brief Scope of one traced run: resets the latch on entry.
 *
 * The latch is left as-is on exit so the caller can inspect it.
 */
class trace_scope {
public:
  explicit trace_scope(first_error& latch) noexcept : latch_(latch) { latch_.reset(); }

  trace_scope(const trace_scope&) = delete;
  trace_scope& operator=(const trace_scope&) = delete;

  [[nodiscard]] auto sink() noexcept -> error_sink& { return latch_; }
  [[nodiscard]] auto provider() const noexcept -> const error_provider& { return latch_; }

private:
  first_error& latch_;
};

} // namespace execerr
