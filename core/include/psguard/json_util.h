#pragma once

// json_util.h
//
// Thin RAII layer over json-c. Requests are parsed once into a Doc and read
// through typed accessors on the borrowed json_object*.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace psguard::json_util {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Transfer ownership to the caller (e.g. when adding into a parent object).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: trailing garbage or a tokener error yields an empty Doc.
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

inline json_object* member(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline bool has_key(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return false;
    json_object* v = nullptr;
    return json_object_object_get_ex(obj, key, &v);
}

inline std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), static_cast<size_t>(json_object_get_string_len(v)));
}

// Accepts JSON integers and doubles (callers frequently send 5.0 for 5).
inline std::optional<int64_t> get_number_as_int(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v) return std::nullopt;
    if (json_object_is_type(v, json_type_int)) return static_cast<int64_t>(json_object_get_int64(v));
    if (json_object_is_type(v, json_type_double)) {
        const double d = json_object_get_double(v);
        if (!std::isfinite(d)) return std::nullopt;
        // saturate: the cast is undefined outside the int64 range
        if (d >= 9223372036854775807.0) return INT64_MAX;
        if (d <= -9223372036854775808.0) return INT64_MIN;
        return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

inline std::optional<bool> get_bool(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> get_array_strings(json_object* obj, const char* key) {
    std::vector<std::string> out;
    json_object* arr = member(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

// String-valued members of a nested object. Non-string values are skipped.
inline std::map<std::string, std::string> get_string_map(json_object* obj, const char* key) {
    std::map<std::string, std::string> out;
    json_object* m = member(obj, key);
    if (!m || !json_object_is_type(m, json_type_object)) return out;
    json_object_object_foreach(m, k, v) {
        if (v && json_object_is_type(v, json_type_string)) {
            out[k] = json_object_get_string(v);
        }
    }
    return out;
}

// ---- builders ----

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

inline void add_string(json_object* obj, const char* key, const std::string& s) {
    json_object_object_add(obj, key, new_string(s));
}

inline void add_int(json_object* obj, const char* key, int64_t v) {
    json_object_object_add(obj, key, json_object_new_int64(v));
}

inline void add_bool(json_object* obj, const char* key, bool v) {
    json_object_object_add(obj, key, json_object_new_boolean(v ? 1 : 0));
}

inline json_object* new_string_map(const std::map<std::string, std::string>& m) {
    json_object* o = json_object_new_object();
    for (const auto& kv : m) add_string(o, kv.first.c_str(), kv.second);
    return o;
}

inline std::string to_string(json_object* obj) {
    if (!obj) return "null";
    return std::string(json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE));
}

} // namespace psguard::json_util
