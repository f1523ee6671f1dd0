/**
 * @file value_traits.hpp
 * @brief TaskFabric — C++ type ↔ Value conversions for typed handlers/stubs
 *
 * Specialize ValueTraits<T> with
 *   static Value to_value(const T&);
 *   static bool  from_value(const Value&, T*);
 * to pass a custom type through RemoteFunction or register_typed().
 */

#ifndef TASKFABRIC_VALUE_TRAITS_HPP
#define TASKFABRIC_VALUE_TRAITS_HPP

#include "taskfabric/value.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

namespace taskfabric {

template <typename T, typename Enable = void>
struct ValueTraits;

template <>
struct ValueTraits<Value> {
    static Value to_value(const Value& v) { return v; }
    static bool from_value(const Value& v, Value* out) { *out = v; return true; }
};

template <>
struct ValueTraits<bool> {
    static Value to_value(bool b) { return Value(b); }
    static bool from_value(const Value& v, bool* out) {
        if (!v.is_bool()) return false;
        *out = v.as_bool();
        return true;
    }
};

/* All integer types share one rule: only integral JSON numbers that fit
 * in T convert. Unsigned values above INT64_MAX travel as doubles. */
template <typename T>
struct ValueTraits<T, std::enable_if_t<std::is_integral_v<T> &&
                                       !std::is_same_v<T, bool>>> {
    static Value to_value(T i) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
            if (i > static_cast<T>(std::numeric_limits<int64_t>::max()))
                return Value(static_cast<double>(i));
        }
        return Value(i);
    }
    static bool from_value(const Value& v, T* out) {
        if (!v.is_int()) return false;
        int64_t i = v.as_int();
        if constexpr (std::is_signed_v<T>) {
            if (i < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                i > static_cast<int64_t>(std::numeric_limits<T>::max()))
                return false;
        } else {
            if (i < 0 || static_cast<uint64_t>(i) > std::numeric_limits<T>::max())
                return false;
        }
        *out = static_cast<T>(i);
        return true;
    }
};

template <>
struct ValueTraits<double> {
    static Value to_value(double d) { return Value(d); }
    static bool from_value(const Value& v, double* out) {
        if (!v.is_number()) return false;
        *out = v.as_double();
        return true;
    }
};

template <>
struct ValueTraits<std::string> {
    static Value to_value(const std::string& s) { return Value(s); }
    static bool from_value(const Value& v, std::string* out) {
        if (!v.is_string()) return false;
        *out = v.as_string();
        return true;
    }
};

/** Raw bytes travel as a byte leaf, not as an array of integers. */
template <>
struct ValueTraits<std::vector<uint8_t>> {
    static Value to_value(const std::vector<uint8_t>& b) { return Value(b); }
    static bool from_value(const Value& v, std::vector<uint8_t>* out) {
        if (!v.is_bytes()) return false;
        *out = v.as_bytes();
        return true;
    }
};

template <typename T>
struct ValueTraits<std::vector<T>,
                   std::enable_if_t<!std::is_same_v<T, uint8_t>>> {
    static Value to_value(const std::vector<T>& xs) {
        Value arr = Value::array();
        for (const auto& x : xs) arr.push_back(ValueTraits<T>::to_value(x));
        return arr;
    }
    static bool from_value(const Value& v, std::vector<T>* out) {
        if (!v.is_array()) return false;
        std::vector<T> tmp;
        tmp.reserve(v.size());
        for (const auto& e : v.as_array()) {
            T x{};
            if (!ValueTraits<T>::from_value(e, &x)) return false;
            tmp.push_back(std::move(x));
        }
        *out = std::move(tmp);
        return true;
    }
};

template <typename T>
struct ValueTraits<std::map<std::string, T>> {
    static Value to_value(const std::map<std::string, T>& m) {
        Value obj = Value::object();
        for (const auto& [k, x] : m) obj[k] = ValueTraits<T>::to_value(x);
        return obj;
    }
    static bool from_value(const Value& v, std::map<std::string, T>* out) {
        if (!v.is_object()) return false;
        std::map<std::string, T> tmp;
        for (const auto& [k, e] : v.as_object()) {
            T x{};
            if (!ValueTraits<T>::from_value(e, &x)) return false;
            tmp.emplace(k, std::move(x));
        }
        *out = std::move(tmp);
        return true;
    }
};

} // namespace taskfabric

#endif // TASKFABRIC_VALUE_TRAITS_HPP
