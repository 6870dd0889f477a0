#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>

namespace ebs {

// Feature flags sourced from environment
inline bool env_flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

struct RuntimeEnv {
    bool traceExec = false;      // EBS_TRACE_EXEC: one line per executed statement
    bool traceCalls = false;     // EBS_TRACE_CALLS: function and builtin calls
    bool traceCallbacks = false; // EBS_TRACE_CALLBACKS: executor queue and timers
    bool diagJson = false;       // EBS_DIAG_JSON: tools print JSON diagnostics
    size_t maxCallDepth = 512;   // EBS_MAX_CALL_DEPTH
};

// Detect runtime configuration from process env vars.
RuntimeEnv detect_env();

} // namespace ebs
