// Tree-walking evaluator for one script instance.
#pragma once
#include <functional>
#include <future>
#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ebs/ast.hpp"
#include "ebs/builtins.hpp"
#include "ebs/runtime_env.hpp"
#include "ebs/value.hpp"

namespace ebs {

// Statement completion. return/break/continue travel as values, never as exceptions.
struct Flow {
    enum class Kind { Normal, Return, Break, Continue };
    Kind kind = Kind::Normal;
    Value value; // Return only

    static Flow normal(){ return {}; }
    static Flow ret(Value v){ return {Kind::Return, std::move(v)}; }
    static Flow brk(){ return {Kind::Break, {}}; }
    static Flow cont(){ return {Kind::Continue, {}}; }
    bool is_normal() const { return kind==Kind::Normal; }
};

struct ExecutionResult {
    enum class Status { Completed, Returned, Cancelled };
    Status status = Status::Completed;
    Value value; // set when a top-level `return` ended the unit
};

struct InterpreterOptions {
    std::string name = "main";        // container segment of host paths
    std::ostream* out = nullptr;      // `print` target; std::cout when null
    RuntimeEnv env = detect_env();
    // Errors raised by fire-and-forget callbacks (timers, post_callback).
    std::function<void(const std::string& function, const ScriptError& error)> on_callback_error;
};

// Host paths: "container.varset.var" (the container may be omitted).
using Bindings = std::vector<std::pair<std::string, Value>>;

// All entry points are funneled through one serialized executor, so a script
// instance never sees two units interleave. Calls made from inside a running
// unit (e.g. by a builtin) execute inline.
class Interpreter {
public:
    explicit Interpreter(std::shared_ptr<const BuiltinRegistry> builtins = nullptr, InterpreterOptions options = {});
    ~Interpreter();
    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // Registers functions and materializes VarSets with their initial values.
    void load(ProgramPtr program);
    // Executes the loaded program's top level. Bindings are host writes applied
    // before the unit starts. Script errors propagate unchanged.
    ExecutionResult run(const Bindings& bindings = {});
    ExecutionResult run(ProgramPtr program, const Bindings& bindings = {});

    // FIFO-queued invocation of a script function on the script thread.
    std::future<Value> submit_callback(std::string function, std::vector<Value> args = {});
    // Blocking form of submit_callback.
    Value call_function(const std::string& function, std::vector<Value> args = {});

    Value get_var(const std::string& path);
    void set_var(const std::string& path, const Value& value);
    // Paths of every Var in a non-internal VarSet, in declaration order.
    std::vector<std::string> list_vars();

    // Cooperative: honoured at loop back-edges, call entry and after builtin calls.
    void request_stop();
    bool stop_requested() const;

    const std::string& name() const;

    class Impl;

private:
    std::unique_ptr<Impl> impl_;
};

} // namespace ebs
