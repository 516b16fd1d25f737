#include "execerr/sink.hpp"

namespace execerr {

first_error::first_error() : trace_(core::trace_options_from_env()) {}

first_error::first_error(core::trace_options trace) : trace_(trace) {}

void first_error::push_error(const maybe_error& e) {
  if (!e) return;
  if (recorded_) {
    ++dropped_;
    if (trace_.enabled(2)) {
      core::trace_line(trace_, 2, "first_error", "dropped " + e->debug_string());
    }
    return;
  }
  recorded_ = e;
  if (trace_.enabled(1)) {
    core::trace_line(trace_, 1, "first_error", "latched " + e->debug_string());
  }
}

void first_error::reset() noexcept {
  recorded_.reset();
  dropped_ = 0;
}

} // namespace execerr
