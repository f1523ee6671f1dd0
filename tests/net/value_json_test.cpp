/**
 * @file value_json_test.cpp
 * @brief Value tree, canonical JSON text, byte-leaf wrapping, base64
 */

#include "taskfabric/value.hpp"
#include "taskfabric/wire_protocol.h"

#include <cstdio>
#include <cstdlib>
#include <string>

#define CHECK(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL [%s:%d]: %s\n", __FILE__, __LINE__, msg); \
        exit(1); \
    } \
} while(0)

using namespace taskfabric;

static void test_canonical_text() {
    Value v = Value::object();
    v["b"] = 1;
    v["a"] = "x";
    v["c"] = Value::array();
    v["c"].push_back(true);
    v["c"].push_back(nullptr);
    v["c"].push_back(1.5);
    v["c"].push_back(2.0);
    CHECK(to_json(v) == "{\"a\":\"x\",\"b\":1,\"c\":[true,null,1.5,2.0]}",
          "sorted keys, compact, doubles keep a fraction");

    Value w = Value::object();
    w["c"] = v["c"];
    w["a"] = "x";
    w["b"] = 1;
    CHECK(to_json(w) == to_json(v), "insertion order does not matter");
    fprintf(stderr, "  [PASS] test_canonical_text\n");
}

static void test_binary_leaf() {
    const uint8_t raw[] = {0x00, 0x01, 0x02, 0xFF};
    Value v = Value::object();
    v["blob"] = Value::bytes(raw, sizeof(raw));
    CHECK(to_json(v) == "{\"blob\":{\"__binary__\":\"AAEC/w==\"}}", "byte leaf wrapped");

    Value back;
    CHECK(parse_json(to_json(v), &back) == TF_OK, "parse");
    const Value* blob = back.find("blob");
    CHECK(blob && blob->is_bytes(), "byte leaf unwrapped");
    CHECK(blob->size() == 4 && blob->as_bytes()[3] == 0xFF, "bytes intact");
    CHECK(back == v, "tree equal");

    /* Byte leaves nested inside arrays and objects. */
    Value deep = Value::object();
    deep["list"] = Value::array();
    deep["list"].push_back(Value::bytes("abc", 3));
    deep["list"].push_back(Value::object());
    deep["list"].as_array()[1]["inner"] = Value::bytes("", 0);
    Value deep_back;
    CHECK(parse_json(to_json(deep), &deep_back) == TF_OK, "parse nested");
    CHECK(deep_back == deep, "nested byte leaves survive");

    Value bad;
    std::string err;
    CHECK(parse_json("{\"__binary__\":\"@@@@\"}", &bad, &err) == TF_ERROR_PROTOCOL,
          "bad base64 rejected");
    CHECK(parse_json("{\"__binary__\":5}", &bad, &err) == TF_ERROR_PROTOCOL,
          "non-string binary tag rejected");
    fprintf(stderr, "  [PASS] test_binary_leaf\n");
}

static void test_strings_and_escapes() {
    Value v("quote\" back\\ nl\n tab\t ctl\x01");
    std::string text = to_json(v);
    CHECK(text == "\"quote\\\" back\\\\ nl\\n tab\\t ctl\\u0001\"", "escaped");
    Value back;
    CHECK(parse_json(text, &back) == TF_OK && back == v, "escape round trip");

    CHECK(parse_json("\"caf\\u00e9\"", &back) == TF_OK, "\\u escape");
    CHECK(back.as_string() == "caf\xC3\xA9", "utf-8 output");

    CHECK(parse_json("\"\\ud83d\\ude00\"", &back) == TF_OK, "surrogate pair");
    CHECK(back.as_string() == "\xF0\x9F\x98\x80", "astral code point");

    CHECK(parse_json("\"\\ud83d\"", &back) == TF_ERROR_PROTOCOL, "lone surrogate rejected");
    fprintf(stderr, "  [PASS] test_strings_and_escapes\n");
}

static void test_numbers() {
    Value v;
    CHECK(parse_json("-42", &v) == TF_OK && v.is_int() && v.as_int() == -42, "int");
    CHECK(parse_json("3.25", &v) == TF_OK && v.is_double() && v.as_double() == 3.25, "double");
    CHECK(parse_json("1e3", &v) == TF_OK && v.is_double() && v.as_double() == 1000.0, "exponent");
    CHECK(parse_json("9223372036854775808", &v) == TF_OK && v.is_double(),
          "int64 overflow becomes double");

    Value d(0.1);
    Value back;
    CHECK(parse_json(to_json(d), &back) == TF_OK && back == d, "double round trip exact");
    fprintf(stderr, "  [PASS] test_numbers\n");
}

static void test_malformed() {
    const char* bad[] = {"", "{", "[1,]", "tru", "1 2", "{\"a\" 1}", "\"open",
                         "01", "-", "[1.]", "{\"a\":1,}"};
    for (const char* text : bad) {
        Value v;
        std::string err;
        CHECK(parse_json(text, &v, &err) == TF_ERROR_PROTOCOL, text);
        CHECK(err.find("offset") != std::string::npos, "error names an offset");
    }

    std::string deep(300, '[');
    deep += std::string(300, ']');
    Value v;
    CHECK(parse_json(deep, &v) == TF_ERROR_PROTOCOL, "nesting limit");
    fprintf(stderr, "  [PASS] test_malformed\n");
}

static void test_base64() {
    const char* cases[][2] = {
        {"", ""}, {"f", "Zg=="}, {"fo", "Zm8="}, {"foo", "Zm9v"},
        {"foob", "Zm9vYg=="}, {"fooba", "Zm9vYmE="}, {"foobar", "Zm9vYmFy"},
    };
    for (auto& c : cases) {
        std::string in = c[0];
        std::string enc = base64_encode(reinterpret_cast<const uint8_t*>(in.data()), in.size());
        CHECK(enc == c[1], "RFC 4648 vector");
        std::vector<uint8_t> dec;
        CHECK(base64_decode(enc, &dec), "decode");
        CHECK(std::string(dec.begin(), dec.end()) == in, "decode matches");
    }
    std::vector<uint8_t> out;
    CHECK(!base64_decode("Zm9", &out), "bad length rejected");
    CHECK(!base64_decode("Zm9v!A==", &out), "bad character rejected");
    fprintf(stderr, "  [PASS] test_base64\n");
}

static void test_reserved_key_not_encodable() {
    /* Looks like a byte leaf but is an ordinary object. */
    Value lookalike = Value::object();
    lookalike[TF_BINARY_TAG] = "QUJD";
    std::string why;
    CHECK(!is_encodable(lookalike, &why), "string under reserved key");
    CHECK(why.find(TF_BINARY_TAG) != std::string::npos, "reason names the key");

    Value numeric = Value::object();
    numeric[TF_BINARY_TAG] = 5;
    CHECK(!is_encodable(numeric), "number under reserved key");

    Value nested = Value::object();
    nested["list"] = Value::array();
    nested["list"].push_back(numeric);
    CHECK(!is_encodable(nested), "found inside arrays");

    /* Real byte leaves and wider objects are fine. */
    Value ok = Value::object();
    ok["blob"] = Value(Value::Bytes{1, 2, 3});
    ok["pair"] = Value::object();
    ok["pair"][TF_BINARY_TAG] = "QUJD";
    ok["pair"]["other"] = 1;
    CHECK(is_encodable(ok), "bytes and two-key object encodable");
    Value back;
    CHECK(parse_json(to_json(ok), &back) == TF_OK && back == ok, "parses back equal");

    fprintf(stderr, "  [PASS] test_reserved_key_not_encodable\n");
}

static void test_display_string() {
    CHECK(to_display_string(Value("boom")) == "boom", "strings verbatim");
    CHECK(to_display_string(Value(7)) == "7", "numbers as json");
    fprintf(stderr, "  [PASS] test_display_string\n");
}

int main() {
    fprintf(stderr, "[value_json_test]\n");
    test_canonical_text();
    test_binary_leaf();
    test_strings_and_escapes();
    test_numbers();
    test_malformed();
    test_base64();
    test_reserved_key_not_encodable();
    test_display_string();
    fprintf(stderr, "[value_json_test] ALL PASSED\n");
    return 0;
}
