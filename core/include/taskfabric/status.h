/**
 * @file status.h
 * @brief TaskFabric status codes
 *
 * Every fallible operation in the core returns a tf_status. Results
 * travel through out-parameters; an optional std::string* carries the
 * human-readable reason where one exists (peer message, handler error).
 *
 * Pure C, safe to include from any translation unit.
 */

#ifndef TASKFABRIC_STATUS_H
#define TASKFABRIC_STATUS_H

#include <stddef.h>
#include <stdint.h>

/* ------------------------------------------------------------------ */
/*  1. Export / Visibility Macros                                      */
/* ------------------------------------------------------------------ */

#if defined(_WIN32) || defined(__CYGWIN__)
  #ifdef TF_BUILDING_DLL
    #define TF_API __declspec(dllexport)
  #else
    #define TF_API __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define TF_API __attribute__((visibility("default")))
#else
  #define TF_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ------------------------------------------------------------------ */
/*  2. Status Codes                                                    */
/* ------------------------------------------------------------------ */

typedef enum tf_status {
    TF_OK                         = 0,
    TF_ERROR_INVALID_ARG          = 1,

    /** Peer closed mid-frame or the transport was reset. */
    TF_ERROR_CONNECTION_CLOSED    = 2,

    /** OTP mismatch, malformed handshake, or admission refused. */
    TF_ERROR_AUTH_FAILED          = 3,

    /** Ciphertext is not valid under the current key. */
    TF_ERROR_DECRYPTION           = 4,

    /** Explicit target worker absent or inactive. */
    TF_ERROR_WORKER_NOT_FOUND     = 5,

    /** No idle active worker at dispatch time. */
    TF_ERROR_NO_AVAILABLE_WORKER  = 6,

    /** No task_result arrived before the deadline. */
    TF_ERROR_TASK_TIMEOUT         = 7,

    /** Worker reported success:false. */
    TF_ERROR_TASK_EXECUTION       = 8,

    /** Oversized frame, malformed tree, missing message field. */
    TF_ERROR_PROTOCOL             = 9,

    /** Well-formed frame whose `type` is not in the catalogue. */
    TF_ERROR_UNKNOWN_MESSAGE      = 10,

    /** File or key-file access failed. */
    TF_ERROR_IO                   = 11,

    TF_ERROR_INTERNAL             = 255
} tf_status;

TF_API const char* tf_status_str(tf_status st);

#ifdef __cplusplus
}
#endif

#endif /* TASKFABRIC_STATUS_H */
