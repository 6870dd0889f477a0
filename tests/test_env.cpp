// Shared fixtures for the test suites. Environment changes go through
// setenv/unsetenv on POSIX and _putenv_s on Windows.

#include "test_env.hpp"
#include <cstdlib>

namespace ebs::test {

namespace {

void put_env(const std::string& name, const std::optional<std::string>& value){
#if defined(_WIN32)
    _putenv_s(name.c_str(), value ? value->c_str() : "");
#else
    if(value) ::setenv(name.c_str(), value->c_str(), 1);
    else ::unsetenv(name.c_str());
#endif
}

} // namespace

ScopedEnv::ScopedEnv(const char* name, const char* value): name_(name) {
    if(const char* old = std::getenv(name)) previous_ = old;
    put_env(name_, value ? std::optional<std::string>(value) : std::nullopt);
}

ScopedEnv::~ScopedEnv(){ put_env(name_, previous_); }

ScriptRun run_script(const std::string& src, const Bindings& bindings, std::shared_ptr<const BuiltinRegistry> builtins){
    std::ostringstream out;
    InterpreterOptions opts;
    opts.out = &out;
    Interpreter interp(builtins ? std::move(builtins) : standard_builtins(), opts);
    ScriptRun r;
    r.result = interp.run(parse(src, "test"), bindings);
    r.out = out.str();
    return r;
}

Value eval_script(const std::string& src){
    return run_script(src).result.value;
}

} // namespace ebs::test
