#include "execerr/c/execerr.h"

#include <new>
#include <string>

#include "execerr/sink.hpp"

struct execerr_latch_t {
  execerr::first_error latch;
};

#include "execerr_c_error.hpp"

thread_local std::string execerr_c::g_last_error;
using execerr_c::set_error;
using execerr_c::clear_error;

extern "C" {

EXECERR_C_API const char* execerr_get_last_error(void) {
  return execerr_c::g_last_error.c_str();
}

EXECERR_C_API const char* execerr_kind_description(uint32_t kind) {
  // describe() views point into static storage, all NUL-terminated literals.
  return execerr::describe(static_cast<execerr::error_kind>(kind)).data();
}

EXECERR_C_API execerr_status_t execerr_latch_create(execerr_latch_t** out) {
  if (!out) return EXECERR_E_INVALID_PARAM;
  clear_error();
  *out = new (std::nothrow) execerr_latch_t{};
  if (!*out) {
    set_error("out of memory creating latch");
    return EXECERR_E_INTERNAL;
  }
  return EXECERR_OK;
}

EXECERR_C_API void execerr_latch_destroy(execerr_latch_t* latch) {
  delete latch;
}

EXECERR_C_API execerr_status_t execerr_latch_push(execerr_latch_t* latch,
                                                  uint32_t kind,
                                                  const char* message) {
  if (!latch) return EXECERR_E_INVALID_PARAM;
  clear_error();
  if (!message) return EXECERR_OK;
  try {
    latch->latch.push_error(execerr::make_error(static_cast<execerr::error_kind>(kind), message));
    return EXECERR_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return EXECERR_E_INTERNAL;
  }
}

EXECERR_C_API execerr_status_t execerr_latch_has_error(const execerr_latch_t* latch,
                                                       int* out_has_error) {
  if (!latch || !out_has_error) return EXECERR_E_INVALID_PARAM;
  clear_error();
  *out_has_error = latch->latch.has_error() ? 1 : 0;
  return EXECERR_OK;
}

EXECERR_C_API execerr_status_t execerr_latch_get(const execerr_latch_t* latch,
                                                 int* out_has_error,
                                                 uint32_t* out_kind,
                                                 const char** out_message) {
  if (!latch || !out_has_error || !out_kind || !out_message) return EXECERR_E_INVALID_PARAM;
  clear_error();
  const auto& recorded = latch->latch.recorded();
  if (!recorded) {
    *out_has_error = 0;
    return EXECERR_OK;
  }
  *out_has_error = 1;
  *out_kind = execerr::to_uint32(recorded->kind());
  *out_message = recorded->message().c_str();
  return EXECERR_OK;
}

EXECERR_C_API execerr_status_t execerr_latch_reset(execerr_latch_t* latch) {
  if (!latch) return EXECERR_E_INVALID_PARAM;
  clear_error();
  latch->latch.reset();
  return EXECERR_OK;
}

} // extern "C"
