#include "psguard/serialization.h"
#include "psguard/json_util.h"

#include <algorithm>
#include <sstream>
#include <vector>

namespace psguard {

using namespace json_util;

json_object* execution_result_to_json(const ExecutionResult& r) {
    json_object* o = json_object_new_object();
    add_int(o, "exit_code", r.exit_code);
    add_string(o, "stdout", r.stdout_data);
    add_string(o, "stderr", r.stderr_data);
    add_int(o, "duration_ms", r.duration_ms);
    add_bool(o, "timed_out", r.timed_out);
    add_bool(o, "started", r.started);
    if (r.lines_executed) add_int(o, "lines_executed", *r.lines_executed);
    if (r.stdout_truncated) add_bool(o, "stdout_truncated", true);
    if (r.stderr_truncated) add_bool(o, "stderr_truncated", true);
    if (!r.error.empty()) add_string(o, "error", r.error);
    return o;
}

json_object* validation_to_json(const ValidationOutcome& v) {
    json_object* o = json_object_new_object();
    add_bool(o, "valid", v.valid);
    if (!v.reason.empty()) add_string(o, "reason", v.reason);
    if (!v.rule.empty()) add_string(o, "rule", v.rule);
    if (!v.pattern.empty()) add_string(o, "pattern", v.pattern);
    if (v.line > 0) add_int(o, "line", v.line);
    return o;
}

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = new_string(keys[i]);
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            canonical_serialize(member(obj, keys[i].c_str()), out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        // strings, numbers, booleans: json-c output is already canonical
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

} // namespace psguard
