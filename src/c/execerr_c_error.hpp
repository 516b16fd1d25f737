#pragma once
#include <exception>
#include <string>
#include <string_view>

namespace execerr_c {
  // Thread-local error buffer behind execerr_get_last_error()
  extern thread_local std::string g_last_error;

  inline void set_error(std::string_view s) noexcept {
    try {
      g_last_error.assign(s.data(), s.size());
    } catch (const std::exception&) {
      g_last_error.clear();
    }
  }
  inline void clear_error() noexcept {
    g_last_error.clear();
  }
} // namespace execerr_c
