// Builtin call seam: qualified-name -> host handler table.
#pragma once
#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "ebs/errors.hpp"
#include "ebs/types.hpp"
#include "ebs/value.hpp"

namespace ebs {

class TimerService;

// What a handler may touch while it runs. Implemented by the interpreter; every
// call happens on the script's logical thread.
class ExecContext {
public:
    virtual ~ExecContext() = default;

    virtual std::ostream& out() = 0;

    // Host-path ("container.set.var") access with script-origin scope rules.
    virtual Value read_var(const std::string& path) = 0;
    virtual void write_var(const std::string& path, const Value& v) = 0;
    virtual std::vector<std::string> list_vars() = 0;

    // Queues `function(args)` behind the current unit. Safe from any thread.
    virtual void post_callback(const std::string& function, std::vector<Value> args) = 0;

    virtual const TypeRegistry& types() const = 0;
    virtual TimerService& timers() = 0;
    virtual bool stop_requested() const = 0;
    virtual SourceLoc call_site() const = 0;
};

using BuiltinFn = std::function<Value(std::vector<Value>& args, ExecContext& ctx)>;

inline constexpr size_t kVariadic = std::numeric_limits<size_t>::max();

struct BuiltinEntry {
    std::string name;       // lower-case "ns.fn"
    BuiltinFn fn;
    size_t min_args = 0;
    size_t max_args = kVariadic;
    // The interpreter stores args[0] back into the first argument's l-value after the call.
    bool writes_back = false;
};

// Immutable after build(); shared by every interpreter it is injected into.
class BuiltinRegistry {
public:
    class Builder {
    public:
        // Throws registry_error for a malformed name or a name already added.
        Builder& add(std::string_view name, BuiltinFn fn, size_t min_args = 0, size_t max_args = kVariadic, bool writes_back = false);
        bool contains(std::string_view name) const;
        std::shared_ptr<const BuiltinRegistry> build();
    private:
        std::unordered_map<std::string, BuiltinEntry> entries_;
    };

    // Case-insensitive; nullptr when not registered.
    const BuiltinEntry* find(std::string_view name) const;
    std::vector<std::string> names() const; // sorted
    size_t size() const { return entries_.size(); }

    static std::shared_ptr<const BuiltinRegistry> empty();

private:
    std::unordered_map<std::string, BuiltinEntry> entries_;
};

// Argument helpers for handler implementations; failures raise HostError.
const std::string& arg_string(const std::vector<Value>& args, size_t i, const char* fn);
int64_t arg_int(const std::vector<Value>& args, size_t i, const char* fn);
double arg_number(const std::vector<Value>& args, size_t i, const char* fn);
bool arg_bool(const std::vector<Value>& args, size_t i, const char* fn);

} // namespace ebs
