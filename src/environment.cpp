#include "ebs/environment.hpp"
#include "ebs/strings.hpp"

namespace ebs {

Environment::Environment(){
    scopes_.push_back(Scope{ScopeKind::Global, {}});
}

void Environment::push_scope(ScopeKind kind){
    scopes_.push_back(Scope{kind, {}});
}

void Environment::pop_scope(){
    if(scopes_.size() > 1) scopes_.pop_back();
}

Var& Environment::declare(Var v, SourceLoc loc){
    std::string key = to_lower(v.name);
    auto& vars = scopes_.back().vars;
    if(vars.count(key)) throw InterpreterError(ErrorKind::Any, "variable '" + v.name + "' is already declared in this scope", loc);
    return vars.emplace(std::move(key), std::move(v)).first->second;
}

Var* Environment::lookup(std::string_view name){
    std::string key = to_lower(name);
    for(size_t i = scopes_.size(); i-- > 0;){
        auto& s = scopes_[i];
        auto it = s.vars.find(key);
        if(it!=s.vars.end()) return &it->second;
        if(s.kind==ScopeKind::Function) break;
    }
    auto& globals = scopes_.front().vars;
    auto it = globals.find(key);
    return it==globals.end() ? nullptr : &it->second;
}

const Var* Environment::lookup(std::string_view name) const {
    return const_cast<Environment*>(this)->lookup(name);
}

Var* Environment::find_global(std::string_view key){
    auto& globals = scopes_.front().vars;
    auto it = globals.find(to_lower(key));
    return it==globals.end() ? nullptr : &it->second;
}

VarSet& Environment::define_varset(const std::string& name, VarScope scope){
    std::string key = to_lower(name);
    auto it = varsets_.find(key);
    if(it!=varsets_.end()) return it->second;
    varset_order_.push_back(key);
    return varsets_.emplace(key, VarSet{name, scope, {}}).first->second;
}

VarSet* Environment::find_varset(std::string_view name){
    auto it = varsets_.find(to_lower(name));
    return it==varsets_.end() ? nullptr : &it->second;
}

const VarSet* Environment::find_varset(std::string_view name) const {
    auto it = varsets_.find(to_lower(name));
    return it==varsets_.end() ? nullptr : &it->second;
}

std::vector<const VarSet*> Environment::varsets() const {
    std::vector<const VarSet*> out;
    for(const auto& k : varset_order_) out.push_back(&varsets_.at(k));
    return out;
}

std::string Environment::member_key(std::string_view varset, std::string_view var){
    if(iequals(varset, kScriptVarSet)) return to_lower(var);
    return to_lower(varset) + "." + to_lower(var);
}

void Environment::check_write(const Var& v, Access who) const {
    if(v.varset.empty()) return;
    const VarSet* set = find_varset(v.varset);
    if(!set) return;
    const char* side = who==Access::Host ? "host" : "script";
    switch(set->scope){
        case VarScope::In:
            if(who==Access::Script)
                throw ScopeViolationError("cannot write '" + v.name + "': varset '" + set->name + "' is in-scoped and read-only to the script");
            if(started_)
                throw ScopeViolationError("cannot write '" + v.name + "': varset '" + set->name + "' accepts host writes only before execution starts");
            break;
        case VarScope::Out:
            if(who==Access::Host)
                throw ScopeViolationError("cannot write '" + v.name + "' from " + side + ": varset '" + set->name + "' is out-scoped");
            break;
        case VarScope::InOut: case VarScope::Visible: case VarScope::Internal:
            break;
    }
}

void Environment::reset_to_globals(){
    scopes_.resize(1);
    auto& globals = scopes_.front().vars;
    for(auto it = globals.begin(); it!=globals.end();){
        const std::string& set = it->second.varset;
        if(set.empty() || iequals(set, kScriptVarSet)) it = globals.erase(it);
        else ++it;
    }
    if(VarSet* script = find_varset(kScriptVarSet)) script->vars.clear();
}

void Environment::clear(){
    scopes_.clear();
    scopes_.push_back(Scope{ScopeKind::Global, {}});
    varsets_.clear();
    varset_order_.clear();
    started_ = false;
}

} // namespace ebs
