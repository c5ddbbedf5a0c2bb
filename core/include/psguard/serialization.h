#pragma once

#include "types.h"

#include <json-c/json.h>

#include <string>

namespace psguard {

// --- Result serialization (caller owns the returned object) ---

json_object* execution_result_to_json(const ExecutionResult& r);
json_object* validation_to_json(const ValidationOutcome& v);

// --- Canonical JSON ---
// Sorted keys at every level, no whitespace. Deterministic for a given
// document, so it can be hashed.

std::string canonical_json(json_object* obj);

} // namespace psguard
