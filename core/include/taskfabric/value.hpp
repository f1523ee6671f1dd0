/**
 * @file value.hpp
 * @brief TaskFabric — payload tree and its JSON text encoding
 *
 * Every message plaintext is a Value tree: null, bool, integer, double,
 * string, raw bytes, array, object. The text encoding is compact JSON
 * with object keys in sorted order, so equal trees encode to equal
 * bytes. Raw byte leaves are written as {"__binary__": "<base64>"} and
 * unwrapped again on parse.
 */

#ifndef TASKFABRIC_VALUE_HPP
#define TASKFABRIC_VALUE_HPP

#include "taskfabric/status.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace taskfabric {

class Value {
public:
    enum class Kind : uint8_t {
        Null,
        Bool,
        Int,
        Double,
        String,
        Bytes,
        Array,
        Object
    };

    using Bytes  = std::vector<uint8_t>;
    using Array  = std::vector<Value>;
    using Object = std::map<std::string, Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : kind_(Kind::Bool), bool_(b) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> &&
                               !std::is_same_v<T, bool>, int> = 0>
    Value(T v) : kind_(Kind::Int), int_(static_cast<int64_t>(v)) {}

    Value(double d) : kind_(Kind::Double), double_(d) {}
    Value(const char* s) : kind_(Kind::String), str_(s ? s : "") {}
    Value(std::string s) : kind_(Kind::String), str_(std::move(s)) {}
    Value(Bytes b) : kind_(Kind::Bytes), bytes_(std::move(b)) {}
    Value(Array a) : kind_(Kind::Array), array_(std::move(a)) {}
    Value(Object o) : kind_(Kind::Object), object_(std::move(o)) {}

    static Value object() { return Value(Object{}); }
    static Value array()  { return Value(Array{}); }
    static Value bytes(const void* data, size_t len) {
        const auto* p = static_cast<const uint8_t*>(data);
        return Value(Bytes(p, p + len));
    }

    /* ---- Kind queries --------------------------------------------- */

    Kind kind() const { return kind_; }
    bool is_null()   const { return kind_ == Kind::Null; }
    bool is_bool()   const { return kind_ == Kind::Bool; }
    bool is_int()    const { return kind_ == Kind::Int; }
    bool is_double() const { return kind_ == Kind::Double; }
    bool is_number() const { return is_int() || is_double(); }
    bool is_string() const { return kind_ == Kind::String; }
    bool is_bytes()  const { return kind_ == Kind::Bytes; }
    bool is_array()  const { return kind_ == Kind::Array; }
    bool is_object() const { return kind_ == Kind::Object; }

    /* ---- Accessors ------------------------------------------------ */
    /* Scalar accessors return a zero value on kind mismatch. */

    bool    as_bool() const { return is_bool() && bool_; }
    int64_t as_int() const {
        if (is_int()) return int_;
        if (is_double()) return static_cast<int64_t>(double_);
        return 0;
    }
    double as_double() const {
        if (is_double()) return double_;
        if (is_int()) return static_cast<double>(int_);
        return 0.0;
    }

    const std::string& as_string() const { return str_; }
    const Bytes&       as_bytes()  const { return bytes_; }
    const Array&       as_array()  const { return array_; }
    const Object&      as_object() const { return object_; }
    Array&             as_array()        { return array_; }
    Object&            as_object()       { return object_; }

    /** Object member lookup; nullptr if absent or not an object. */
    const Value* find(const std::string& key) const;

    /** Object member access; a null Value becomes an empty object. */
    Value& operator[](const std::string& key);

    /** Array append; a null Value becomes an empty array. */
    void push_back(Value v);

    /** Element count for arrays/objects, byte count for bytes/strings. */
    size_t size() const;

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    Kind        kind_   = Kind::Null;
    bool        bool_   = false;
    int64_t     int_    = 0;
    double      double_ = 0.0;
    std::string str_;
    Bytes       bytes_;
    Array       array_;
    Object      object_;
};

/* ================================================================== */
/*  Text encoding                                                      */
/* ================================================================== */

/** Compact canonical JSON; byte leaves become {"__binary__": base64}. */
std::string to_json(const Value& v);

/**
 * False when the tree holds an object whose only key is "__binary__".
 * That shape is reserved for byte leaves and would not parse back as the
 * same tree. *why names the offending object.
 */
bool is_encodable(const Value& v, std::string* why = nullptr);

/**
 * Parse JSON text. Objects of the exact shape {"__binary__": "<base64>"}
 * become byte leaves. Returns TF_ERROR_PROTOCOL on malformed input, with
 * a position-annotated reason in *err when provided.
 */
tf_status parse_json(std::string_view text, Value* out,
                     std::string* err = nullptr);

/** Strings as-is, everything else as JSON. Used for error texts. */
std::string to_display_string(const Value& v);

/* ---- Base64 (RFC 4648, standard alphabet, padded) ---------------- */

std::string base64_encode(const uint8_t* data, size_t len);
bool        base64_decode(std::string_view text, std::vector<uint8_t>* out);

} // namespace taskfabric

#endif // TASKFABRIC_VALUE_HPP
