#pragma once

// Test-only helpers: scoped environment variables and one-shot script runs.

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include "ebs/ebs.hpp"

namespace ebs::test {

// Sets NAME=VALUE for the lifetime of the object and restores the previous value.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::optional<std::string> previous_;
};

struct ScriptRun {
    ExecutionResult result;
    std::string out; // everything `print` wrote
};

// Parses and runs `src` in a fresh interpreter with the standard builtins.
// Script errors propagate to the caller.
ScriptRun run_script(const std::string& src, const Bindings& bindings = {},
                     std::shared_ptr<const BuiltinRegistry> builtins = nullptr);

// Value of the top-level `return`, or null.
Value eval_script(const std::string& src);

} // namespace ebs::test
