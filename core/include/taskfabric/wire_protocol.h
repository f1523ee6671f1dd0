/**
 * @file wire_protocol.h
 * @brief TaskFabric Wire Protocol — Dispatcher/Worker Framing
 *
 * Defines the framing format for every message crossing the network
 * boundary between the dispatcher and its workers.
 *
 * Frame layout:
 *   [uint32 length N, big-endian] [N bytes of ciphertext]
 *
 * Ciphertext layout (AES-256-GCM):
 *   [version u8] [nonce 12] [encrypted plaintext] [tag 16]
 *
 * Plaintext is compact UTF-8 JSON. Raw byte leaves travel as
 *   {"__binary__": "<base64>"}
 * File-transfer chunks are the one exception: their plaintext is the raw
 * chunk, not a tree.
 *
 * Pure C, no C++ dependencies.
 */

#ifndef TASKFABRIC_WIRE_PROTOCOL_H
#define TASKFABRIC_WIRE_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ------------------------------------------------------------------ */
/*  1. Framing Constants                                               */
/* ------------------------------------------------------------------ */

/** Length prefix size in bytes. */
#define TF_FRAME_PREFIX_BYTES   4u

/** Largest ciphertext a receiver accepts in one frame (64 MiB). */
#define TF_MAX_FRAME_BYTES      ((uint32_t)(64u * 1024u * 1024u))

/* ------------------------------------------------------------------ */
/*  2. Cipher Constants                                                */
/* ------------------------------------------------------------------ */

/** Ciphertext format version — increment on breaking changes. */
#define TF_CIPHER_VERSION       ((uint8_t)0x01)

#define TF_KEY_BYTES            32u
#define TF_NONCE_BYTES          12u
#define TF_TAG_BYTES            16u
#define TF_SALT_BYTES           16u
#define TF_PBKDF2_ITERATIONS    100000u

/** version + nonce + tag: smallest well-formed ciphertext. */
#define TF_CIPHER_OVERHEAD      (1u + TF_NONCE_BYTES + TF_TAG_BYTES)

/* ------------------------------------------------------------------ */
/*  3. Tree Encoding                                                   */
/* ------------------------------------------------------------------ */

/** Reserved single key that marks a base64 byte-array leaf. */
#define TF_BINARY_TAG           "__binary__"

/* ------------------------------------------------------------------ */
/*  4. Message Discriminators (`type` field)                           */
/* ------------------------------------------------------------------ */

#define TF_MSG_AUTH                 "auth"
#define TF_MSG_AUTH_RESPONSE        "auth_response"
#define TF_MSG_HEARTBEAT            "heartbeat"
#define TF_MSG_HEARTBEAT_RESPONSE   "heartbeat_response"
#define TF_MSG_EXECUTE_TASK         "execute_task"
#define TF_MSG_TASK_RESULT          "task_result"
#define TF_MSG_DISCONNECT           "disconnect"
#define TF_MSG_FILE_TRANSFER_START  "file_transfer_start"
#define TF_MSG_FILE_TRANSFER_END    "file_transfer_end"

/* ------------------------------------------------------------------ */
/*  5. Defaults                                                        */
/*     Injected through Config; the core never reads these directly.   */
/* ------------------------------------------------------------------ */

#define TF_DEFAULT_HOST_PORT            8888
#define TF_DEFAULT_WORKER_PORT          8889
#define TF_DEFAULT_OTP_LENGTH           8
#define TF_DEFAULT_CHUNK_SIZE           8192
#define TF_DEFAULT_MAX_FILE_SIZE        ((uint64_t)100 * 1024 * 1024)
#define TF_DEFAULT_CONNECTION_TIMEOUT_MS 30000
#define TF_DEFAULT_TASK_TIMEOUT_MS      300000
#define TF_DEFAULT_HEARTBEAT_MS         10000
#define TF_DEFAULT_MAX_WORKERS          10

/* ------------------------------------------------------------------ */
/*  6. Length Prefix Helpers                                          */
/*     Byte-wise so they are correct on any host byte order.           */
/* ------------------------------------------------------------------ */

static inline void tf_store_be32(uint8_t* dst, uint32_t v) {
    dst[0] = (uint8_t)(v >> 24);
    dst[1] = (uint8_t)(v >> 16);
    dst[2] = (uint8_t)(v >> 8);
    dst[3] = (uint8_t)(v);
}

static inline uint32_t tf_load_be32(const uint8_t* src) {
    return ((uint32_t)src[0] << 24) | ((uint32_t)src[1] << 16) |
           ((uint32_t)src[2] << 8)  |  (uint32_t)src[3];
}

#ifdef __cplusplus
}
#endif

#endif /* TASKFABRIC_WIRE_PROTOCOL_H */
