/**
 * @file cipher_test.cpp
 * @brief AES-256-GCM channel cipher, PBKDF2 derivation, OTP generation
 */

#include "taskfabric/cipher.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#define CHECK(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL [%s:%d]: %s\n", __FILE__, __LINE__, msg); \
        exit(1); \
    } \
} while(0)

using namespace taskfabric;

static std::vector<uint8_t> bytes_of(const char* s) {
    return std::vector<uint8_t>(s, s + std::strlen(s));
}

static void test_round_trip() {
    cipher::Key k{};
    CHECK(cipher::generate_key(&k) == TF_OK, "generate_key");

    auto plain = bytes_of("hello taskfabric");
    std::vector<uint8_t> ct, back;
    CHECK(cipher::encrypt(k, plain.data(), plain.size(), &ct) == TF_OK, "encrypt");
    CHECK(ct.size() == plain.size() + TF_CIPHER_OVERHEAD, "ciphertext size");
    CHECK(ct[0] == TF_CIPHER_VERSION, "version byte");
    CHECK(cipher::decrypt(k, ct.data(), ct.size(), &back) == TF_OK, "decrypt");
    CHECK(back == plain, "plaintext restored");

    /* Empty plaintext is legal. */
    CHECK(cipher::encrypt(k, nullptr, 0, &ct) == TF_OK, "encrypt empty");
    CHECK(ct.size() == TF_CIPHER_OVERHEAD, "empty ciphertext size");
    CHECK(cipher::decrypt(k, ct.data(), ct.size(), &back) == TF_OK, "decrypt empty");
    CHECK(back.empty(), "empty restored");

    fprintf(stderr, "  [PASS] test_round_trip\n");
}

static void test_nondeterministic() {
    cipher::Key k{};
    CHECK(cipher::generate_key(&k) == TF_OK, "generate_key");
    auto plain = bytes_of("same input");
    std::vector<uint8_t> a, b;
    CHECK(cipher::encrypt(k, plain.data(), plain.size(), &a) == TF_OK, "encrypt a");
    CHECK(cipher::encrypt(k, plain.data(), plain.size(), &b) == TF_OK, "encrypt b");
    CHECK(a != b, "fresh nonce per call");
    fprintf(stderr, "  [PASS] test_nondeterministic\n");
}

static void test_rejects_bad_input() {
    cipher::Key k1{}, k2{};
    CHECK(cipher::generate_key(&k1) == TF_OK, "key 1");
    CHECK(cipher::generate_key(&k2) == TF_OK, "key 2");

    auto plain = bytes_of("secret payload");
    std::vector<uint8_t> ct, out;
    CHECK(cipher::encrypt(k1, plain.data(), plain.size(), &ct) == TF_OK, "encrypt");

    CHECK(cipher::decrypt(k2, ct.data(), ct.size(), &out) == TF_ERROR_DECRYPTION,
          "wrong key rejected");

    auto flipped = ct;
    flipped[flipped.size() / 2] ^= 0x01;
    CHECK(cipher::decrypt(k1, flipped.data(), flipped.size(), &out) == TF_ERROR_DECRYPTION,
          "altered body rejected");

    auto bad_version = ct;
    bad_version[0] = 0x7F;
    CHECK(cipher::decrypt(k1, bad_version.data(), bad_version.size(), &out) == TF_ERROR_DECRYPTION,
          "unknown version rejected");

    CHECK(cipher::decrypt(k1, ct.data(), TF_CIPHER_OVERHEAD - 1, &out) == TF_ERROR_DECRYPTION,
          "short input rejected");

    fprintf(stderr, "  [PASS] test_rejects_bad_input\n");
}

static void test_derive_key() {
    std::vector<uint8_t> salt;
    cipher::Key a{}, b{}, c{};
    CHECK(cipher::derive_key("correct horse", &salt, &a) == TF_OK, "derive with fresh salt");
    CHECK(salt.size() == TF_SALT_BYTES, "salt filled");

    std::vector<uint8_t> same = salt;
    CHECK(cipher::derive_key("correct horse", &same, &b) == TF_OK, "derive again");
    CHECK(same == salt, "given salt kept");
    CHECK(a == b, "same password + salt -> same key");

    CHECK(cipher::derive_key("battery staple", &same, &c) == TF_OK, "other password");
    CHECK(a != c, "different password -> different key");

    std::vector<uint8_t> salt2;
    CHECK(cipher::derive_key("correct horse", &salt2, &c) == TF_OK, "second fresh salt");
    CHECK(salt2 != salt, "fresh salts differ");
    CHECK(a != c, "different salt -> different key");

    fprintf(stderr, "  [PASS] test_derive_key\n");
}

static void test_otp() {
    std::string otp;
    CHECK(cipher::generate_otp(8, &otp) == TF_OK, "otp");
    CHECK(otp.size() == 8, "otp length");
    for (char c : otp)
        CHECK((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'), "otp alphabet");

    std::string longer;
    CHECK(cipher::generate_otp(200, &longer) == TF_OK, "long otp");
    CHECK(longer.size() == 200, "long otp length");

    std::string other;
    CHECK(cipher::generate_otp(200, &other) == TF_OK, "second long otp");
    CHECK(longer != other, "otps differ");

    CHECK(cipher::generate_otp(0, &otp) == TF_ERROR_INVALID_ARG, "zero length rejected");
    fprintf(stderr, "  [PASS] test_otp\n");
}

static void test_hex() {
    cipher::Key k{}, back{};
    CHECK(cipher::generate_key(&k) == TF_OK, "key");
    std::string hex = cipher::key_to_hex(k);
    CHECK(hex.size() == 64, "64 hex digits");
    for (char c : hex)
        CHECK((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'), "lowercase hex");
    CHECK(cipher::key_from_hex(hex, &back), "parse hex");
    CHECK(back == k, "hex round trip");

    std::string upper = hex;
    for (auto& c : upper) if (c >= 'a' && c <= 'f') c = static_cast<char>(c - 'a' + 'A');
    CHECK(cipher::key_from_hex(upper, &back) && back == k, "uppercase accepted");

    CHECK(!cipher::key_from_hex(hex.substr(2), &back), "short hex rejected");
    std::string junk = hex;
    junk[10] = 'g';
    CHECK(!cipher::key_from_hex(junk, &back), "non-hex rejected");

    fprintf(stderr, "  [PASS] test_hex\n");
}

int main() {
    fprintf(stderr, "[cipher_test]\n");
    test_round_trip();
    test_nondeterministic();
    test_rejects_bad_input();
    test_derive_key();
    test_otp();
    test_hex();
    fprintf(stderr, "[cipher_test] ALL PASSED\n");
    return 0;
}
