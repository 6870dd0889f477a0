#include "ebs/runtime_env.hpp"
#include <cstdlib>
#include <string>

namespace ebs {

// Reads process env vars and constructs a RuntimeEnv.
// InterpreterOptions copies the result so each instance can still be tuned in code.
RuntimeEnv detect_env(){
    RuntimeEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    e.traceExec = env_flag_enabled("EBS_TRACE_EXEC");
    e.traceCalls = env_flag_enabled("EBS_TRACE_CALLS");
    e.traceCallbacks = env_flag_enabled("EBS_TRACE_CALLBACKS");
    e.diagJson = env_flag_enabled("EBS_DIAG_JSON");

    // Recursion limit; ignore junk and zero
    if (const char* v = get("EBS_MAX_CALL_DEPTH")) {
        char* end = nullptr;
        unsigned long long n = std::strtoull(v, &end, 10);
        if (end && *end == '\0' && n > 0) e.maxCallDepth = static_cast<size_t>(n);
    }

    return e;
}

} // namespace ebs
