#include "execerr/core/trace.hpp"

#include <iostream>

#include "execerr/core/platform_utils.hpp"

namespace execerr::core {

auto trace_options_from_env() noexcept -> trace_options {
  trace_options opts;
  opts.level = env_level(kTraceEnvVar);
  return opts;
}

void trace_line(const trace_options& opts, int at_level,
                std::string_view phase, std::string_view text) {
  if (!opts.enabled(at_level)) return;
  std::ostream& os = opts.out ? *opts.out : std::cerr;
  os << "[execerr][" << phase << "] " << text << std::endl;
}

} // namespace execerr::core
