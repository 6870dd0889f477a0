// diagnostics_json.hpp - JSON serialization of script errors for tools and editors
#pragma once
#include "ebs/errors.hpp"
#include "ebs/runtime_env.hpp"
#include <string>

namespace ebs {

// Escape a string for safe JSON output (includes the surrounding quotes).
std::string json_escape(const std::string& s);

// Serialize one failure as {"success":false,"errors":[{...}]}.
std::string diagnostics_to_json(const ScriptError& e);

// Serialize a success marker; used by tools that always emit a JSON line.
std::string diagnostics_success_json();

// Print diagnostics JSON to stderr when env.diagJson is set (EBS_DIAG_JSON).
void maybe_print_json(const ScriptError& e, const RuntimeEnv& env);

} // namespace ebs
