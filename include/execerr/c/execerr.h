#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Symbol visibility
#if defined(_WIN32)
  #if defined(EXECERR_C_API_EXPORTS)
    #define EXECERR_C_API __declspec(dllexport)
  #else
    #define EXECERR_C_API __declspec(dllimport)
  #endif
#else
  #define EXECERR_C_API __attribute__((visibility("default")))
#endif

#include <stddef.h>
#include <stdint.h>

// Opaque handles
typedef struct execerr_latch_t execerr_latch_t;

typedef enum execerr_status_e {
  EXECERR_OK = 0,
  EXECERR_E_INVALID_PARAM = 1,
  EXECERR_E_INTERNAL = 2
} execerr_status_t;

// Thread-local last error string for the calling thread ("" if none)
EXECERR_C_API const char* execerr_get_last_error(void);

// Canonical description of a numeric error kind. Total: unknown values map to
// "Unknown error". The returned string has static storage duration.
EXECERR_C_API const char* execerr_kind_description(uint32_t kind);

// -------------------------
// First-error latch
// -------------------------

EXECERR_C_API execerr_status_t execerr_latch_create(execerr_latch_t** out);
EXECERR_C_API void execerr_latch_destroy(execerr_latch_t* latch);

// Push a failure. A NULL or empty message is the absent failure and is ignored.
// Once a failure is latched, further pushes are ignored until reset.
EXECERR_C_API execerr_status_t execerr_latch_push(execerr_latch_t* latch,
                                                  uint32_t kind,
                                                  const char* message);

EXECERR_C_API execerr_status_t execerr_latch_has_error(const execerr_latch_t* latch,
                                                       int* out_has_error);

// Read the latched failure. Sets *out_has_error to 0 when the latch is empty,
// in which case *out_kind and *out_message are left untouched.
// *out_message stays valid until the next push/reset/destroy on this latch.
EXECERR_C_API execerr_status_t execerr_latch_get(const execerr_latch_t* latch,
                                                 int* out_has_error,
                                                 uint32_t* out_kind,
                                                 const char** out_message);

EXECERR_C_API execerr_status_t execerr_latch_reset(execerr_latch_t* latch);

#ifdef __cplusplus
} // extern "C"
#endif
