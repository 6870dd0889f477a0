// Variable storage for one script instance: a scope stack plus the VarSets that
// expose globals to the host.
#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "ebs/ast.hpp"
#include "ebs/types.hpp"
#include "ebs/value.hpp"

namespace ebs {

struct Var {
    std::string name;     // declared spelling ("x", or "set.x" for VarSet members)
    TypePtr type;         // DataType::any() for untyped declarations
    Value value;
    Value default_value;
    std::string varset;   // owning VarSet; empty for locals
    bool is_const = false;
};

struct VarSet {
    std::string name;
    VarScope scope = VarScope::Visible;
    std::vector<std::string> vars; // Var keys in declaration order
};

enum class ScopeKind { Global, Function, Block };

// Who is writing a Var. Script writes include builtins acting on behalf of the script.
enum class Access { Script, Host };

// Name of the VarSet holding top-level declarations made outside any `varset` block.
inline constexpr const char* kScriptVarSet = "script";

class Environment {
public:
    Environment();

    void push_scope(ScopeKind kind);
    void pop_scope();
    size_t depth() const { return scopes_.size(); }
    bool at_global() const { return scopes_.size()==1; }

    // Declares in the innermost scope. Throws InterpreterError when the name is
    // already declared in that same scope; outer declarations are shadowed.
    Var& declare(Var v, SourceLoc loc = {});

    // Innermost-first. A function scope hides the scopes of its callers, so lookup
    // continues at the global scope after it.
    Var* lookup(std::string_view name);
    const Var* lookup(std::string_view name) const;

    Var* find_global(std::string_view key);

    // VarSets are created by `load` and survive across runs.
    VarSet& define_varset(const std::string& name, VarScope scope);
    VarSet* find_varset(std::string_view name);
    const VarSet* find_varset(std::string_view name) const;
    std::vector<const VarSet*> varsets() const;
    // "set.var" key of a VarSet member, or the bare name for the implicit script set.
    static std::string member_key(std::string_view varset, std::string_view var);

    // Throws ScopeViolationError when `who` may not write `v` in the current phase.
    void check_write(const Var& v, Access who) const;
    void set_started(bool started){ started_ = started; }
    bool started() const { return started_; }

    // Drops every scope but the global one and every global not declared in an explicit VarSet.
    void reset_to_globals();
    // Removes all variables and VarSets.
    void clear();

private:
    struct Scope {
        ScopeKind kind;
        std::unordered_map<std::string, Var> vars; // key: lower-case name
    };
    std::vector<Scope> scopes_;
    std::unordered_map<std::string, VarSet> varsets_; // key: lower-case name
    std::vector<std::string> varset_order_;
    bool started_ = false;
};

// RAII scope push/pop so unwinding errors never leave stale scopes behind.
class ScopeGuard {
public:
    ScopeGuard(Environment& env, ScopeKind kind): env_(env) { env_.push_scope(kind); }
    ~ScopeGuard(){ env_.pop_scope(); }
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;
private:
    Environment& env_;
};

} // namespace ebs
