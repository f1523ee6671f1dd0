/**
 * @file cipher.cpp
 * @brief AES-256-GCM channel cipher, PBKDF2 key derivation, OTPs (GnuTLS)
 */

#include "taskfabric/cipher.hpp"
#include "taskfabric/metrics.h"

#include <gnutls/gnutls.h>
#include <gnutls/crypto.h>

#include <cstring>

namespace taskfabric { namespace cipher {

namespace {

/** Owns a gnutls_aead_cipher_hd_t for the duration of one call. */
class AeadHandle {
public:
    explicit AeadHandle(const Key& key) {
        gnutls_datum_t k;
        k.data = const_cast<unsigned char*>(key.data());
        k.size = static_cast<unsigned int>(key.size());
        rc_ = gnutls_aead_cipher_init(&hd_, GNUTLS_CIPHER_AES_256_GCM, &k);
    }
    ~AeadHandle() {
        if (rc_ == 0) gnutls_aead_cipher_deinit(hd_);
    }
    AeadHandle(const AeadHandle&) = delete;
    AeadHandle& operator=(const AeadHandle&) = delete;

    bool ok() const { return rc_ == 0; }
    int  rc() const { return rc_; }
    gnutls_aead_cipher_hd_t get() const { return hd_; }

private:
    gnutls_aead_cipher_hd_t hd_ = nullptr;
    int                     rc_ = -1;
};

const uint8_t kVersion = TF_CIPHER_VERSION;

} // namespace

tf_status generate_key(Key* out) {
    if (!out) return TF_ERROR_INVALID_ARG;
    int rc = gnutls_rnd(GNUTLS_RND_KEY, out->data(), out->size());
    if (rc < 0) {
        tf_log(TF_LOG_ERROR, "cipher", "gnutls_rnd failed: %s", gnutls_strerror(rc));
        return TF_ERROR_INTERNAL;
    }
    return TF_OK;
}

tf_status derive_key(const std::string& password,
                     std::vector<uint8_t>* salt,
                     Key* out) {
    if (!salt || !out) return TF_ERROR_INVALID_ARG;

    if (salt->empty()) {
        salt->resize(TF_SALT_BYTES);
        int rc = gnutls_rnd(GNUTLS_RND_NONCE, salt->data(), salt->size());
        if (rc < 0) {
            tf_log(TF_LOG_ERROR, "cipher", "gnutls_rnd failed: %s", gnutls_strerror(rc));
            return TF_ERROR_INTERNAL;
        }
    }

    gnutls_datum_t pw;
    pw.data = reinterpret_cast<unsigned char*>(const_cast<char*>(password.data()));
    pw.size = static_cast<unsigned int>(password.size());
    gnutls_datum_t s;
    s.data = salt->data();
    s.size = static_cast<unsigned int>(salt->size());

    int rc = gnutls_pbkdf2(GNUTLS_MAC_SHA256, &pw, &s, TF_PBKDF2_ITERATIONS,
                           out->data(), out->size());
    if (rc < 0) {
        tf_log(TF_LOG_ERROR, "cipher", "gnutls_pbkdf2 failed: %s", gnutls_strerror(rc));
        return TF_ERROR_INTERNAL;
    }
    return TF_OK;
}

tf_status encrypt(const Key& key, const uint8_t* plaintext, size_t len,
                  std::vector<uint8_t>* out) {
    if (!out || (!plaintext && len > 0)) return TF_ERROR_INVALID_ARG;

    AeadHandle aead(key);
    if (!aead.ok()) {
        tf_log(TF_LOG_ERROR, "cipher", "aead init failed: %s", gnutls_strerror(aead.rc()));
        return TF_ERROR_INTERNAL;
    }

    out->resize(1 + TF_NONCE_BYTES + len + TF_TAG_BYTES);
    uint8_t* p = out->data();
    p[0] = kVersion;
    uint8_t* nonce = p + 1;
    int rc = gnutls_rnd(GNUTLS_RND_NONCE, nonce, TF_NONCE_BYTES);
    if (rc < 0) {
        out->clear();
        return TF_ERROR_INTERNAL;
    }

    /* gnutls rejects a null plaintext pointer even for len == 0. */
    static const uint8_t kEmpty = 0;
    size_t ct_len = len + TF_TAG_BYTES;
    rc = gnutls_aead_cipher_encrypt(aead.get(),
                                    nonce, TF_NONCE_BYTES,
                                    &kVersion, 1,
                                    TF_TAG_BYTES,
                                    len ? plaintext : &kEmpty, len,
                                    nonce + TF_NONCE_BYTES, &ct_len);
    if (rc < 0) {
        tf_log(TF_LOG_ERROR, "cipher", "encrypt failed: %s", gnutls_strerror(rc));
        out->clear();
        return TF_ERROR_INTERNAL;
    }
    out->resize(1 + TF_NONCE_BYTES + ct_len);
    return TF_OK;
}

tf_status decrypt(const Key& key, const uint8_t* ciphertext, size_t len,
                  std::vector<uint8_t>* out) {
    if (!out) return TF_ERROR_INVALID_ARG;
    if (!ciphertext || len < TF_CIPHER_OVERHEAD) return TF_ERROR_DECRYPTION;
    if (ciphertext[0] != kVersion) return TF_ERROR_DECRYPTION;

    AeadHandle aead(key);
    if (!aead.ok()) {
        tf_log(TF_LOG_ERROR, "cipher", "aead init failed: %s", gnutls_strerror(aead.rc()));
        return TF_ERROR_INTERNAL;
    }

    const uint8_t* nonce = ciphertext + 1;
    const uint8_t* body  = nonce + TF_NONCE_BYTES;
    size_t body_len = len - 1 - TF_NONCE_BYTES;   /* includes tag */

    /* One spare byte keeps data() non-null for an empty plaintext. */
    out->resize(body_len - TF_TAG_BYTES + 1);
    size_t pt_len = out->size();
    int rc = gnutls_aead_cipher_decrypt(aead.get(),
                                        nonce, TF_NONCE_BYTES,
                                        &kVersion, 1,
                                        TF_TAG_BYTES,
                                        body, body_len,
                                        out->data(), &pt_len);
    if (rc < 0) {
        out->clear();
        return TF_ERROR_DECRYPTION;
    }
    out->resize(pt_len);
    return TF_OK;
}

tf_status random_bytes(void* buf, size_t len) {
    if (!buf && len > 0) return TF_ERROR_INVALID_ARG;
    if (len == 0) return TF_OK;
    int rc = gnutls_rnd(GNUTLS_RND_NONCE, buf, len);
    return rc < 0 ? TF_ERROR_INTERNAL : TF_OK;
}

tf_status generate_otp(size_t length, std::string* out) {
    static const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    constexpr unsigned kAlphabetSize = sizeof(kAlphabet) - 1;   /* 36 */
    /* Largest multiple of 36 below 256: bytes at or above it are redrawn. */
    constexpr unsigned kLimit = 256 - (256 % kAlphabetSize);

    if (!out || length == 0) return TF_ERROR_INVALID_ARG;
    out->clear();
    out->reserve(length);

    uint8_t pool[64];
    while (out->size() < length) {
        int rc = gnutls_rnd(GNUTLS_RND_RANDOM, pool, sizeof(pool));
        if (rc < 0) {
            tf_log(TF_LOG_ERROR, "cipher", "gnutls_rnd failed: %s", gnutls_strerror(rc));
            out->clear();
            return TF_ERROR_INTERNAL;
        }
        for (uint8_t b : pool) {
            if (b >= kLimit) continue;
            out->push_back(kAlphabet[b % kAlphabetSize]);
            if (out->size() == length) break;
        }
    }
    return TF_OK;
}

std::string key_to_hex(const Key& key) {
    static const char kHex[] = "0123456789abcdef";
    std::string s;
    s.reserve(key.size() * 2);
    for (uint8_t b : key) {
        s.push_back(kHex[b >> 4]);
        s.push_back(kHex[b & 0x0F]);
    }
    return s;
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool key_from_hex(const std::string& hex, Key* out) {
    if (!out || hex.size() != TF_KEY_BYTES * 2) return false;
    Key k{};
    for (size_t i = 0; i < k.size(); ++i) {
        int hi = hex_nibble(hex[2 * i]);
        int lo = hex_nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        k[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    *out = k;
    return true;
}

}} // namespace taskfabric::cipher
