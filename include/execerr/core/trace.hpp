#pragma once

/** \file trace.hpp
 *  \brief Env-gated diagnostic lines for error aggregation.
 *
 * Lines are tagged "[execerr][<phase>] <text>" and written to trace_options::out.
 * Level 0: silent. Level 1: latched errors. Level 2+: dropped errors as well.
 */

#include <iosfwd>
#include <string_view>

namespace execerr::core {

inline constexpr const char* kTraceEnvVar = "EXECERR_TRACE";

struct trace_options {
  int level{0};                 /**< 0 = off, 1 = latches, 2 = latches + drops */
  std::ostream* out{nullptr};   /**< nullptr means std::cerr */

  [[nodiscard]] auto enabled(int at_level) const noexcept -> bool {
    return level >= at_level;
  }
};

/** \brief Options from EXECERR_TRACE; output goes to std::cerr. */
auto trace_options_from_env() noexcept -> trace_options;

/** \brief Emit one tagged line if opts.level >= at_level. */
void trace_line(const trace_options& opts, int at_level,
                std::string_view phase, std::string_view text);

} // namespace execerr::core
