#include "execerr/coded_error.hpp"

#include <cstdarg>
#include <cstdio>
#include <vector>

namespace execerr {

namespace {

auto vformat(const char* format, std::va_list args) -> std::string {
  if (format == nullptr) return {};
  std::va_list probe;
  va_copy(probe, args);
  const int needed = std::vsnprintf(nullptr, 0, format, probe);
  va_end(probe);
  if (needed <= 0) return {};
  std::vector<char> buf(static_cast<std::size_t>(needed) + 1);
  std::vsnprintf(buf.data(), buf.size(), format, args);
  return std::string(buf.data(), static_cast<std::size_t>(needed));
}

// what() of a user-defined exception may be null; treat it as empty.
auto what_of(const std::exception& e) -> std::string {
  const char* w = e.what();
  return w ? std::string(w) : std::string{};
}

} // namespace

auto make_error(error_kind kind, std::string message) -> maybe_error {
  if (message.empty()) return std::nullopt;
  return coded_error(kind, std::move(message));
}

auto coded_error::debug_string() const -> std::string {
  std::string out = "Error ";
  out += std::to_string(to_uint32(kind_));
  out += ": ";
  out += message_;
  return out;
}

auto make_errorf(error_kind kind, const char* format, ...) -> maybe_error {
  std::va_list args;
  va_start(args, format);
  std::string message = vformat(format, args);
  va_end(args);
  return make_error(kind, std::move(message));
}

auto errorf(const char* format, ...) -> maybe_error {
  std::va_list args;
  va_start(args, format);
  std::string message = vformat(format, args);
  va_end(args);
  return make_error(error_kind::generic, std::move(message));
}

auto fail(error_kind kind, std::string message) -> std::unexpected<coded_error> {
  if (message.empty()) message = std::string(describe(kind));
  return std::unexpected<coded_error>(*make_error(kind, std::move(message)));
}

auto as_coded(const std::exception& e) -> maybe_error {
  if (const auto* coded = dynamic_cast<const coded_error*>(&e)) {
    return *coded;
  }
  if (const auto* kinded = dynamic_cast<const has_error_kind*>(&e)) {
    return make_error(kinded->kind(), what_of(e));
  }
  if (const auto* sys = dynamic_cast<const std::system_error*>(&e)) {
    if (sys->code().category() == error_category()) {
      return make_error(static_cast<error_kind>(sys->code().value()), what_of(e));
    }
  }
  return make_error(error_kind::generic, what_of(e));
}

auto as_coded(const std::exception_ptr& e) -> maybe_error {
  if (!e) return std::nullopt;
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return as_coded(ex);
  } catch (...) {
    return make_error(error_kind::generic, "unknown exception");
  }
}

auto as_coded(const std::error_code& ec) -> maybe_error {
  // Value 0 is error_kind::generic in our category, so test the category first.
  if (ec.category() == error_category()) {
    const auto kind = static_cast<error_kind>(ec.value());
    return make_error(kind, std::string(describe(kind)));
  }
  if (!ec) return std::nullopt;
  return make_error(error_kind::generic, ec.message());
}

auto debug_string(const maybe_error& e) -> std::string {
  return e ? e->debug_string() : std::string("no error");
}

namespace detail {

auto wrap_coded(const maybe_error& inner, std::string_view context) -> maybe_error {
  if (!inner) return std::nullopt;
  std::string message(context);
  message += ": ";
  message += inner->message();
  return make_error(inner->kind(), std::move(message));
}

} // namespace detail

} // namespace execerr
