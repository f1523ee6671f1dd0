/**
 * @file cipher.hpp
 * @brief TaskFabric — channel cipher, key derivation, one-time passwords
 *
 * AES-256-GCM through the GnuTLS crypto API. Each encrypt() call draws a
 * fresh 96-bit nonce, so identical plaintexts never produce identical
 * ciphertexts. Output layout:
 *
 *   [TF_CIPHER_VERSION] [nonce 12] [ciphertext] [tag 16]
 *
 * The version byte is authenticated as associated data.
 */

#ifndef TASKFABRIC_CIPHER_HPP
#define TASKFABRIC_CIPHER_HPP

#include "taskfabric/status.h"
#include "taskfabric/wire_protocol.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace taskfabric { namespace cipher {

using Key = std::array<uint8_t, TF_KEY_BYTES>;

/** Fresh random key (GNUTLS_RND_KEY quality). */
tf_status generate_key(Key* out);

/**
 * PBKDF2-HMAC-SHA256, TF_PBKDF2_ITERATIONS rounds, 32-byte output.
 * An empty *salt is filled with TF_SALT_BYTES random bytes so the caller
 * can persist it next to the key.
 */
tf_status derive_key(const std::string& password,
                     std::vector<uint8_t>* salt,
                     Key* out);

tf_status encrypt(const Key& key, const uint8_t* plaintext, size_t len,
                  std::vector<uint8_t>* out);

/** TF_ERROR_DECRYPTION for a wrong key, altered data or a short input. */
tf_status decrypt(const Key& key, const uint8_t* ciphertext, size_t len,
                  std::vector<uint8_t>* out);

/** Cryptographically random bytes (GNUTLS_RND_NONCE quality). */
tf_status random_bytes(void* buf, size_t len);

/** Uniform over [A-Z0-9], cryptographically random. */
tf_status generate_otp(size_t length, std::string* out);

/** Lowercase hex, 64 characters. */
std::string key_to_hex(const Key& key);

/** Accepts exactly 64 hex digits (either case). */
bool key_from_hex(const std::string& hex, Key* out);

}} // namespace taskfabric::cipher

#endif // TASKFABRIC_CIPHER_HPP
