/**
 * @file value.cpp
 * @brief Value tree, canonical JSON writer, JSON parser, base64
 */

#include "taskfabric/value.hpp"
#include "taskfabric/wire_protocol.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace taskfabric {

/* ================================================================== */
/*  Value                                                              */
/* ================================================================== */

const Value* Value::find(const std::string& key) const {
    if (!is_object()) return nullptr;
    auto it = object_.find(key);
    return (it != object_.end()) ? &it->second : nullptr;
}

Value& Value::operator[](const std::string& key) {
    if (is_null()) kind_ = Kind::Object;
    return object_[key];
}

void Value::push_back(Value v) {
    if (is_null()) kind_ = Kind::Array;
    array_.push_back(std::move(v));
}

size_t Value::size() const {
    switch (kind_) {
        case Kind::String: return str_.size();
        case Kind::Bytes:  return bytes_.size();
        case Kind::Array:  return array_.size();
        case Kind::Object: return object_.size();
        default:           return 0;
    }
}

bool Value::operator==(const Value& o) const {
    if (kind_ != o.kind_) return false;
    switch (kind_) {
        case Kind::Null:   return true;
        case Kind::Bool:   return bool_ == o.bool_;
        case Kind::Int:    return int_ == o.int_;
        case Kind::Double: return double_ == o.double_;
        case Kind::String: return str_ == o.str_;
        case Kind::Bytes:  return bytes_ == o.bytes_;
        case Kind::Array:  return array_ == o.array_;
        case Kind::Object: return object_ == o.object_;
    }
    return false;
}

/* ================================================================== */
/*  Base64                                                             */
/* ================================================================== */

static const char kB64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) |
                     uint32_t(data[i + 2]);
        out.push_back(kB64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kB64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kB64Alphabet[(n >> 6) & 0x3F]);
        out.push_back(kB64Alphabet[n & 0x3F]);
    }
    size_t rem = len - i;
    if (rem == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out.push_back(kB64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kB64Alphabet[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rem == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(kB64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kB64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kB64Alphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

static int b64_index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

bool base64_decode(std::string_view text, std::vector<uint8_t>* out) {
    out->clear();
    if (text.size() % 4 != 0) return false;
    out->reserve(text.size() / 4 * 3);
    for (size_t i = 0; i < text.size(); i += 4) {
        int v[4];
        int pad = 0;
        for (int k = 0; k < 4; ++k) {
            char c = text[i + k];
            if (c == '=') {
                /* Padding only in the last quantum, only in slots 2-3. */
                if (i + 4 != text.size() || k < 2) return false;
                v[k] = 0;
                ++pad;
            } else {
                if (pad > 0) return false;
                v[k] = b64_index(c);
                if (v[k] < 0) return false;
            }
        }
        uint32_t n = (uint32_t(v[0]) << 18) | (uint32_t(v[1]) << 12) |
                     (uint32_t(v[2]) << 6) | uint32_t(v[3]);
        out->push_back(static_cast<uint8_t>(n >> 16));
        if (pad < 2) out->push_back(static_cast<uint8_t>(n >> 8));
        if (pad < 1) out->push_back(static_cast<uint8_t>(n));
    }
    return true;
}

/* ================================================================== */
/*  JSON writer                                                        */
/* ================================================================== */

static void write_string(std::string& out, const std::string& s) {
    out.push_back('"');
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out.append("\\\""); break;
            case '\\': out.append("\\\\"); break;
            case '\b': out.append("\\b");  break;
            case '\f': out.append("\\f");  break;
            case '\n': out.append("\\n");  break;
            case '\r': out.append("\\r");  break;
            case '\t': out.append("\\t");  break;
            default:
                if (c < 0x20) {
                    char esc[8];
                    std::snprintf(esc, sizeof(esc), "\\u%04x", c);
                    out.append(esc);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back('"');
}

static void write_value(std::string& out, const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Null:
            out.append("null");
            break;
        case Value::Kind::Bool:
            out.append(v.as_bool() ? "true" : "false");
            break;
        case Value::Kind::Int:
            out.append(std::to_string(v.as_int()));
            break;
        case Value::Kind::Double: {
            double d = v.as_double();
            if (!std::isfinite(d)) { out.append("null"); break; }
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", d);
            out.append(buf);
            /* Keep the value a double when it is parsed back. */
            if (!std::strpbrk(buf, ".eE")) out.append(".0");
            break;
        }
        case Value::Kind::String:
            write_string(out, v.as_string());
            break;
        case Value::Kind::Bytes: {
            const auto& b = v.as_bytes();
            out.append("{\"" TF_BINARY_TAG "\":\"");
            out.append(base64_encode(b.data(), b.size()));
            out.append("\"}");
            break;
        }
        case Value::Kind::Array: {
            out.push_back('[');
            bool first = true;
            for (const auto& e : v.as_array()) {
                if (!first) out.push_back(',');
                first = false;
                write_value(out, e);
            }
            out.push_back(']');
            break;
        }
        case Value::Kind::Object: {
            out.push_back('{');
            bool first = true;
            for (const auto& [k, e] : v.as_object()) {
                if (!first) out.push_back(',');
                first = false;
                write_string(out, k);
                out.push_back(':');
                write_value(out, e);
            }
            out.push_back('}');
            break;
        }
    }
}

std::string to_json(const Value& v) {
    std::string out;
    write_value(out, v);
    return out;
}

bool is_encodable(const Value& v, std::string* why) {
    if (v.is_array()) {
        for (const auto& e : v.as_array())
            if (!is_encodable(e, why)) return false;
        return true;
    }
    if (!v.is_object()) return true;
    const auto& obj = v.as_object();
    if (obj.size() == 1 && obj.count(TF_BINARY_TAG)) {
        if (why) *why = "object with the reserved key " TF_BINARY_TAG;
        return false;
    }
    for (const auto& [k, e] : obj)
        if (!is_encodable(e, why)) return false;
    return true;
}

std::string to_display_string(const Value& v) {
    if (v.is_string()) return v.as_string();
    return to_json(v);
}

/* ================================================================== */
/*  JSON parser — recursive descent                                    */
/* ================================================================== */

namespace {

constexpr int kMaxDepth = 256;

class JsonParser {
public:
    explicit JsonParser(std::string_view text) : s_(text) {}

    tf_status parse(Value* out, std::string* err) {
        skip_ws();
        if (!parse_value(out, 0)) return fail(err);
        skip_ws();
        if (pos_ != s_.size()) {
            error_ = "trailing characters";
            return fail(err);
        }
        return TF_OK;
    }

private:
    tf_status fail(std::string* err) const {
        if (err) *err = error_ + " at offset " + std::to_string(pos_);
        return TF_ERROR_PROTOCOL;
    }

    void skip_ws() {
        while (pos_ < s_.size() &&
               (s_[pos_] == ' ' || s_[pos_] == '\t' ||
                s_[pos_] == '\n' || s_[pos_] == '\r'))
            ++pos_;
    }

    bool consume(std::string_view lit) {
        if (s_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    bool parse_value(Value* out, int depth) {
        if (depth > kMaxDepth) { error_ = "nesting too deep"; return false; }
        if (pos_ >= s_.size()) { error_ = "unexpected end of input"; return false; }

        char c = s_[pos_];
        if (c == '{') return parse_object(out, depth);
        if (c == '[') return parse_array(out, depth);
        if (c == '"') {
            std::string str;
            if (!parse_string(&str)) return false;
            *out = Value(std::move(str));
            return true;
        }
        if (c == 't') {
            if (!consume("true")) { error_ = "invalid literal"; return false; }
            *out = Value(true);
            return true;
        }
        if (c == 'f') {
            if (!consume("false")) { error_ = "invalid literal"; return false; }
            *out = Value(false);
            return true;
        }
        if (c == 'n') {
            if (!consume("null")) { error_ = "invalid literal"; return false; }
            *out = Value();
            return true;
        }
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number(out);

        error_ = "unexpected character";
        return false;
    }

    bool parse_object(Value* out, int depth) {
        ++pos_; /* '{' */
        Value::Object obj;
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == '}') {
            ++pos_;
            *out = Value(std::move(obj));
            return true;
        }
        for (;;) {
            skip_ws();
            if (pos_ >= s_.size() || s_[pos_] != '"') {
                error_ = "expected object key";
                return false;
            }
            std::string key;
            if (!parse_string(&key)) return false;
            skip_ws();
            if (pos_ >= s_.size() || s_[pos_] != ':') {
                error_ = "expected ':'";
                return false;
            }
            ++pos_;
            skip_ws();
            Value member;
            if (!parse_value(&member, depth + 1)) return false;
            obj[std::move(key)] = std::move(member);
            skip_ws();
            if (pos_ >= s_.size()) { error_ = "unterminated object"; return false; }
            if (s_[pos_] == ',') { ++pos_; continue; }
            if (s_[pos_] == '}') { ++pos_; break; }
            error_ = "expected ',' or '}'";
            return false;
        }

        /* {"__binary__": "<base64>"} is a byte leaf. */
        if (obj.size() == 1) {
            auto it = obj.find(TF_BINARY_TAG);
            if (it != obj.end()) {
                if (!it->second.is_string()) {
                    error_ = "binary tag must carry a string";
                    return false;
                }
                Value::Bytes bytes;
                if (!base64_decode(it->second.as_string(), &bytes)) {
                    error_ = "invalid base64 in binary leaf";
                    return false;
                }
                *out = Value(std::move(bytes));
                return true;
            }
        }
        *out = Value(std::move(obj));
        return true;
    }

    bool parse_array(Value* out, int depth) {
        ++pos_; /* '[' */
        Value::Array arr;
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == ']') {
            ++pos_;
            *out = Value(std::move(arr));
            return true;
        }
        for (;;) {
            skip_ws();
            Value elem;
            if (!parse_value(&elem, depth + 1)) return false;
            arr.push_back(std::move(elem));
            skip_ws();
            if (pos_ >= s_.size()) { error_ = "unterminated array"; return false; }
            if (s_[pos_] == ',') { ++pos_; continue; }
            if (s_[pos_] == ']') { ++pos_; break; }
            error_ = "expected ',' or ']'";
            return false;
        }
        *out = Value(std::move(arr));
        return true;
    }

    bool parse_hex4(uint32_t* cp) {
        if (pos_ + 4 > s_.size()) { error_ = "truncated \\u escape"; return false; }
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = s_[pos_++];
            v <<= 4;
            if (c >= '0' && c <= '9')      v |= uint32_t(c - '0');
            else if (c >= 'a' && c <= 'f') v |= uint32_t(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') v |= uint32_t(c - 'A' + 10);
            else { error_ = "invalid \\u escape"; return false; }
        }
        *cp = v;
        return true;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    bool parse_string(std::string* out) {
        ++pos_; /* opening quote */
        out->clear();
        while (pos_ < s_.size()) {
            char c = s_[pos_++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) {
                error_ = "control character in string";
                return false;
            }
            if (c != '\\') { out->push_back(c); continue; }

            if (pos_ >= s_.size()) break;
            char e = s_[pos_++];
            switch (e) {
                case '"':  out->push_back('"');  break;
                case '\\': out->push_back('\\'); break;
                case '/':  out->push_back('/');  break;
                case 'b':  out->push_back('\b'); break;
                case 'f':  out->push_back('\f'); break;
                case 'n':  out->push_back('\n'); break;
                case 'r':  out->push_back('\r'); break;
                case 't':  out->push_back('\t'); break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parse_hex4(&cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        /* High surrogate: a low surrogate must follow. */
                        uint32_t lo = 0;
                        if (!consume("\\u") || !parse_hex4(&lo) ||
                            lo < 0xDC00 || lo > 0xDFFF) {
                            error_ = "unpaired surrogate";
                            return false;
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        error_ = "unpaired surrogate";
                        return false;
                    }
                    append_utf8(*out, cp);
                    break;
                }
                default:
                    error_ = "invalid escape";
                    return false;
            }
        }
        error_ = "unterminated string";
        return false;
    }

    bool parse_number(Value* out) {
        size_t start = pos_;
        bool is_float = false;
        if (s_[pos_] == '-') ++pos_;
        if (pos_ >= s_.size() || !(s_[pos_] >= '0' && s_[pos_] <= '9')) {
            error_ = "invalid number";
            return false;
        }
        if (s_[pos_] == '0') {
            ++pos_;
        } else {
            while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') ++pos_;
        }
        if (pos_ < s_.size() && s_[pos_] == '.') {
            is_float = true;
            ++pos_;
            size_t digits = pos_;
            while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') ++pos_;
            if (pos_ == digits) { error_ = "invalid fraction"; return false; }
        }
        if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
            is_float = true;
            ++pos_;
            if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) ++pos_;
            size_t digits = pos_;
            while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') ++pos_;
            if (pos_ == digits) { error_ = "invalid exponent"; return false; }
        }

        std::string num(s_.substr(start, pos_ - start));
        if (!is_float) {
            errno = 0;
            long long v = std::strtoll(num.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                *out = Value(static_cast<int64_t>(v));
                return true;
            }
            /* Out of int64 range: fall through to double. */
        }
        *out = Value(std::strtod(num.c_str(), nullptr));
        return true;
    }

    std::string_view s_;
    size_t           pos_ = 0;
    std::string      error_;
};

} // namespace

tf_status parse_json(std::string_view text, Value* out, std::string* err) {
    if (!out) return TF_ERROR_INVALID_ARG;
    JsonParser p(text);
    return p.parse(out, err);
}

} // namespace taskfabric
