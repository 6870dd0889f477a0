#include "ebs/interpreter.hpp"
#include "ebs/environment.hpp"
#include "ebs/executor.hpp"
#include "ebs/strings.hpp"
#include "ebs/type_check.hpp"
#include <atomic>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>
#include <unordered_map>

namespace ebs {

namespace {

// Unwinds the unit after request_stop(); deliberately not a ScriptError so
// `try ... exceptions` can never intercept it.
struct execution_cancelled {};

const char* kStmtNames[] = {"var", "type", "expr", "print", "block", "if", "while", "do", "for", "foreach",
                            "break", "continue", "return", "function", "try", "raise", "varset", "import"};
static_assert(sizeof(kStmtNames)/sizeof(kStmtNames[0])==std::variant_size_v<StmtData>, "statement name table out of sync");

std::vector<std::string> split_path(const std::string& path){
    std::vector<std::string> parts;
    size_t start = 0;
    while(true){
        size_t dot = path.find('.', start);
        parts.push_back(path.substr(start, dot==std::string::npos ? std::string::npos : dot - start));
        if(dot==std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

bool is_lvalue(const Expr& e){
    return std::holds_alternative<VariableExpr>(e.data) || std::holds_alternative<MemberExpr>(e.data) || std::holds_alternative<IndexExpr>(e.data);
}

// False when the result does not fit in int64.
bool int_pow(int64_t base, int64_t exp, int64_t& out){
    int64_t r = 1;
    while(exp > 0){
        if((exp & 1) && __builtin_mul_overflow(r, base, &r)) return false;
        exp >>= 1;
        if(exp > 0 && __builtin_mul_overflow(base, base, &base)) return false;
    }
    out = r;
    return true;
}

} // namespace

class Interpreter::Impl : public ExecContext {
public:
    Impl(std::shared_ptr<const BuiltinRegistry> builtins, InterpreterOptions options)
        : options_(std::move(options)),
          builtins_(builtins ? std::move(builtins) : BuiltinRegistry::empty()),
          types_(std::make_shared<TypeRegistry>()),
          executor_(options_.env.traceCallbacks),
          timers_([this](const std::string& timer, const std::string& callback){ post_callback(callback, {Value(timer)}); },
                  options_.env.traceCallbacks) {}

    ~Impl() override {
        stop_ = true;
        timers_.stop_all();
        executor_.shutdown();
    }

    // ---- host entry points (all run on the executor) ----
    void load(ProgramPtr program){
        executor_.run_sync([&]{ load_unit(std::move(program)); });
    }

    ExecutionResult run(const Bindings& bindings){
        return executor_.run_sync([&]{ return run_unit(bindings); });
    }

    ExecutionResult load_and_run(ProgramPtr program, const Bindings& bindings){
        return executor_.run_sync([&]{
            load_unit(std::move(program));
            return run_unit(bindings);
        });
    }

    std::future<Value> submit(std::string function, std::vector<Value> args){
        return executor_.submit([this, function = std::move(function), args = std::move(args)]() mutable {
            return callback_unit(function, std::move(args));
        });
    }

    Value call(const std::string& function, std::vector<Value> args){
        if(executor_.on_worker_thread()) return callback_unit(function, std::move(args));
        return submit(function, std::move(args)).get();
    }

    Value get(const std::string& path){
        return executor_.run_sync([&]{ return host_var(path).value; });
    }

    void set(const std::string& path, const Value& v){
        executor_.run_sync([&]{ write_path(path, v, Access::Host); });
    }

    std::vector<std::string> list(){
        return executor_.run_sync([&]{ return list_paths(); });
    }

    void request_stop(){ stop_ = true; }
    const std::string& name() const { return options_.name; }

    // ---- ExecContext ----
    std::ostream& out() override { return options_.out ? *options_.out : std::cout; }
    Value read_var(const std::string& path) override { return host_var(path).value; }
    void write_var(const std::string& path, const Value& v) override { write_path(path, v, Access::Script); }
    std::vector<std::string> list_vars() override { return list_paths(); }
    void post_callback(const std::string& function, std::vector<Value> args) override {
        executor_.post([this, function, args = std::move(args)]() mutable { fire_and_forget(function, std::move(args)); });
    }
    const TypeRegistry& types() const override { return *types_; }
    TimerService& timers() override { return timers_; }
    bool stop_requested() const override { return stop_; }
    SourceLoc call_site() const override { return call_site_; }

private:
    struct CallFrame {
        std::string function;
        SourceLoc call_site;
    };

    struct FrameGuard {
        std::vector<CallFrame>& frames;
        FrameGuard(std::vector<CallFrame>& f, CallFrame frame): frames(f) { frames.push_back(std::move(frame)); }
        ~FrameGuard(){ frames.pop_back(); }
    };

    // A writable Value cell together with the type every store into it must satisfy.
    struct Place {
        Var* var = nullptr;
        Value* slot = nullptr;
        TypePtr type;
        std::optional<size_t> capacity; // of the array holding `slot`, for diagnostics
    };

    // An l-value with its index expressions already evaluated.
    struct PathStep {
        bool is_member = false;
        std::string name;
        Value index;
        SourceLoc loc;
    };
    struct LPath {
        std::string root;
        SourceLoc root_loc;
        std::vector<PathStep> steps;
    };

    InterpreterOptions options_;
    std::shared_ptr<const BuiltinRegistry> builtins_;
    ProgramPtr program_;
    std::shared_ptr<TypeRegistry> types_;
    Environment vars_;
    std::unordered_map<std::string, const FunctionDecl*> functions_;
    std::vector<CallFrame> frames_;
    std::atomic<bool> stop_{false};
    SourceLoc call_site_;
    // Declared last: timers go first on destruction, then the executor joins its worker.
    SerialExecutor executor_;
    TimerService timers_;

    // ---- units ----
    void load_unit(ProgramPtr program){
        if(!program) throw InterpreterError(ErrorKind::Any, "cannot load a null program");
        stop_ = false;
        program_ = std::move(program);
        types_ = program_->types ? program_->types : std::make_shared<TypeRegistry>();
        vars_.clear();
        functions_.clear();
        frames_.clear();
        vars_.define_varset(kScriptVarSet, VarScope::Internal);
        register_decls(program_->body);
        if(options_.env.traceExec)
            std::fprintf(stderr, "[exec][load] %s: %zu function(s), %zu varset(s)\n", program_->source_name.c_str(), functions_.size(), vars_.varsets().size());
    }

    void register_decls(const std::vector<StmtPtr>& body){
        for(const auto& s : body){
            if(auto f = std::get_if<FunctionDecl>(&s->data)){
                functions_[to_lower(f->name)] = f;
            } else if(auto vs = std::get_if<VarSetDecl>(&s->data)){
                materialize(*vs);
            } else if(auto im = std::get_if<ImportStmt>(&s->data)){
                register_decls(im->body);
            }
        }
    }

    void materialize(const VarSetDecl& vs){
        VarSet& set = vars_.define_varset(vs.name, vs.scope);
        for(const auto& s : vs.vars){
            const auto& d = std::get<VarDeclStmt>(s->data);
            Var v;
            v.name = vs.name + "." + d.name;
            v.type = d.type ? d.type : DataType::any();
            v.value = d.init ? coerce(v.type, eval(*d.init), s->loc) : initial_value(d);
            v.default_value = v.value;
            v.varset = vs.name;
            v.is_const = d.is_const;
            vars_.declare(std::move(v), s->loc);
            set.vars.push_back(Environment::member_key(vs.name, d.name));
        }
    }

    ExecutionResult run_unit(const Bindings& bindings){
        if(!program_) throw InterpreterError(ErrorKind::Any, "no program loaded");
        stop_ = false;
        vars_.reset_to_globals();
        frames_.clear();
        vars_.set_started(false);
        for(const auto& b : bindings) write_path(b.first, b.second, Access::Host);
        vars_.set_started(true);
        struct StartedGuard { Environment& env; ~StartedGuard(){ env.set_started(false); } } guard{vars_};

        ExecutionResult result;
        try {
            for(const auto& s : program_->body){
                Flow f = exec(*s);
                if(f.kind==Flow::Kind::Return){
                    result.status = ExecutionResult::Status::Returned;
                    result.value = std::move(f.value);
                    break;
                }
            }
        } catch(const execution_cancelled&) {
            if(options_.env.traceExec) std::fprintf(stderr, "[exec][cancel] unit stopped\n");
            result.status = ExecutionResult::Status::Cancelled;
            result.value = Value();
        }
        return result;
    }

    Value callback_unit(const std::string& function, std::vector<Value> args){
        if(!program_) throw InterpreterError(ErrorKind::Any, "no program loaded");
        if(options_.env.traceCallbacks) std::fprintf(stderr, "[callback][run] %s(%zu args)\n", function.c_str(), args.size());
        std::vector<std::pair<std::string, Value>> named;
        try {
            return call_user(function, std::move(args), std::move(named), SourceLoc{});
        } catch(const execution_cancelled&) {
            throw InterpreterError(ErrorKind::Any, "callback '" + function + "' cancelled");
        }
    }

    void fire_and_forget(const std::string& function, std::vector<Value> args){
        try {
            callback_unit(function, std::move(args));
        } catch(const ScriptError& e) {
            std::fprintf(stderr, "[callback][error] %s: %s\n", function.c_str(), e.what());
            if(options_.on_callback_error) options_.on_callback_error(function, e);
        } catch(const std::exception& e) {
            std::fprintf(stderr, "[callback][error] %s: %s\n", function.c_str(), e.what());
        }
    }

    // ---- host paths ----
    Var& host_var(const std::string& path){
        auto parts = split_path(path);
        if(parts.size()==3){
            if(!iequals(parts[0], options_.name))
                throw InterpreterError(ErrorKind::NotFound, "unknown container '" + parts[0] + "' in path '" + path + "'");
            parts.erase(parts.begin());
        }
        if(parts.size()!=2) throw InterpreterError(ErrorKind::NotFound, "invalid variable path '" + path + "' (expected container.varset.var)");
        if(!vars_.find_varset(parts[0])) throw InterpreterError(ErrorKind::NotFound, "unknown varset '" + parts[0] + "' in path '" + path + "'");
        Var* v = vars_.find_global(Environment::member_key(parts[0], parts[1]));
        if(!v) throw InterpreterError(ErrorKind::NotFound, "unknown variable '" + path + "'");
        return *v;
    }

    void write_path(const std::string& path, const Value& value, Access who){
        Var& v = host_var(path);
        if(v.is_const) throw InterpreterError(ErrorKind::Access, "cannot assign to constant '" + v.name + "'");
        vars_.check_write(v, who);
        v.value = coerce(v.type, value, {});
    }

    std::vector<std::string> list_paths(){
        std::vector<std::string> out;
        for(const VarSet* set : vars_.varsets()){
            if(set->scope==VarScope::Internal) continue;
            for(const auto& key : set->vars){
                const Var* v = vars_.find_global(key);
                if(v) out.push_back(options_.name + "." + v->name);
            }
        }
        return out;
    }

    // ---- helpers ----
    void check_stop(){
        if(stop_) throw execution_cancelled{};
    }

    Value coerce(const TypePtr& t, Value v, SourceLoc loc){
        if(!t || t->kind==TypeKind::Any) return v;
        try {
            return TypeChecker(*types_).convert(*t, v);
        } catch(const TypeError& e) {
            if(e.loc().known()) throw;
            throw TypeError(e.message(), loc, e.code());
        }
    }

    Value initial_value(const VarDeclStmt& d){
        if(!d.typed || !d.type) return Value();
        return TypeChecker(*types_).default_value(*d.type);
    }

    bool truthy(const Value& v, SourceLoc loc, const char* what){
        if(!v.is_bool()) throw InterpreterError(ErrorKind::Type, std::string(what) + " must be bool, got " + v.type_name(), loc);
        return v.as_bool();
    }

    // ---- statements ----
    Flow exec(const Stmt& s){
        if(options_.env.traceExec)
            std::fprintf(stderr, "[exec][stmt] %d:%d %s\n", s.loc.line, s.loc.col, kStmtNames[s.data.index()]);
        struct V {
            Impl& in; const Stmt& s;
            Flow operator()(const VarDeclStmt& d){ in.declare_var(d, s.loc); return Flow::normal(); }
            Flow operator()(const TypeDeclStmt&){ return Flow::normal(); }
            Flow operator()(const ExprStmt& e){ in.eval(*e.expr); return Flow::normal(); }
            Flow operator()(const PrintStmt& p){
                std::string line;
                for(size_t i=0;i<p.args.size(); ++i){
                    if(i) line += " ";
                    line += display_string(in.eval(*p.args[i]));
                }
                in.out() << line << "\n";
                return Flow::normal();
            }
            Flow operator()(const BlockStmt& b){
                ScopeGuard scope(in.vars_, ScopeKind::Block);
                return in.exec_list(b.body);
            }
            Flow operator()(const IfStmt& i){
                if(in.truthy(in.eval(*i.cond), i.cond->loc, "if condition")) return in.exec_scoped(*i.then_branch);
                if(i.else_branch) return in.exec_scoped(*i.else_branch);
                return Flow::normal();
            }
            Flow operator()(const WhileStmt& w){
                while(true){
                    in.check_stop();
                    if(!in.truthy(in.eval(*w.cond), w.cond->loc, "while condition")) break;
                    Flow f = in.exec_scoped(*w.body);
                    if(f.kind==Flow::Kind::Break) break;
                    if(f.kind==Flow::Kind::Return) return f;
                }
                return Flow::normal();
            }
            Flow operator()(const DoWhileStmt& w){
                while(true){
                    in.check_stop();
                    Flow f = in.exec_scoped(*w.body);
                    if(f.kind==Flow::Kind::Break) break;
                    if(f.kind==Flow::Kind::Return) return f;
                    if(!in.truthy(in.eval(*w.cond), w.cond->loc, "do-while condition")) break;
                }
                return Flow::normal();
            }
            Flow operator()(const ForStmt& f){
                ScopeGuard scope(in.vars_, ScopeKind::Block);
                if(f.init) in.exec(*f.init);
                while(true){
                    in.check_stop();
                    if(f.cond && !in.truthy(in.eval(*f.cond), f.cond->loc, "for condition")) break;
                    Flow r = in.exec_scoped(*f.body);
                    if(r.kind==Flow::Kind::Break) break;
                    if(r.kind==Flow::Kind::Return) return r;
                    if(f.step) in.eval(*f.step);
                }
                return Flow::normal();
            }
            Flow operator()(const ForEachStmt& f){ return in.exec_foreach(f, s.loc); }
            Flow operator()(const BreakStmt&){ return Flow::brk(); }
            Flow operator()(const ContinueStmt&){ return Flow::cont(); }
            Flow operator()(const ReturnStmt& r){ return Flow::ret(r.value ? in.eval(*r.value) : Value()); }
            Flow operator()(const FunctionDecl&){ return Flow::normal(); }
            Flow operator()(const TryStmt& t){ return in.exec_try(t); }
            Flow operator()(const RaiseStmt& r){ in.raise(r, s.loc); return Flow::normal(); }
            Flow operator()(const VarSetDecl&){ return Flow::normal(); }
            // A `return` at the top of an imported file ends that file only.
            Flow operator()(const ImportStmt& i){ in.exec_list(i.body); return Flow::normal(); }
        };
        return std::visit(V{*this, s}, s.data);
    }

    Flow exec_list(const std::vector<StmtPtr>& body){
        for(const auto& st : body){
            Flow f = exec(*st);
            if(!f.is_normal()) return f;
        }
        return Flow::normal();
    }

    // Branch and loop bodies that are not blocks still get their own scope.
    Flow exec_scoped(const Stmt& s){
        if(std::holds_alternative<BlockStmt>(s.data)) return exec(s);
        ScopeGuard scope(vars_, ScopeKind::Block);
        return exec(s);
    }

    void declare_var(const VarDeclStmt& d, SourceLoc loc){
        Var v;
        v.name = d.name;
        v.type = d.type ? d.type : DataType::any();
        v.value = d.init ? coerce(v.type, eval(*d.init), loc) : initial_value(d);
        v.default_value = v.value;
        v.is_const = d.is_const;
        bool top_level = vars_.at_global();
        if(top_level) v.varset = kScriptVarSet;
        vars_.declare(std::move(v), loc);
        if(top_level){
            if(VarSet* script = vars_.find_varset(kScriptVarSet)) script->vars.push_back(to_lower(d.name));
        }
    }

    Flow exec_foreach(const ForEachStmt& f, SourceLoc loc){
        Value coll = eval(*f.iterable);
        std::vector<Value> items;
        if(coll.is_array()) items = coll.as_array().items;
        else if(coll.is_queue()) items = coll.as_queue().items;
        else if(coll.is_string()){ for(char c : coll.as_string()) items.emplace_back(std::string(1, c)); }
        else if(coll.is_object()){ for(const auto& e : coll.as_object().fields) items.emplace_back(e.key); }
        else if(coll.is_map()){ for(const auto& e : coll.as_map().entries) items.emplace_back(e.key); }
        else if(coll.is_null()) throw InterpreterError(ErrorKind::Null, "cannot iterate over null", f.iterable->loc);
        else throw InterpreterError(ErrorKind::Type, "cannot iterate over " + coll.type_name(), f.iterable->loc);

        for(auto& item : items){
            check_stop();
            ScopeGuard scope(vars_, ScopeKind::Block);
            Var v;
            v.name = f.var;
            v.type = DataType::any();
            v.value = std::move(item);
            vars_.declare(std::move(v), loc);
            Flow r = exec_scoped(*f.body);
            if(r.kind==Flow::Kind::Break) break;
            if(r.kind==Flow::Kind::Return) return r;
        }
        return Flow::normal();
    }

    static bool handler_matches(const Handler& h, const ScriptError& e){
        if(iequals(h.error_name, "ANY_ERROR")) return true;
        if(auto kind = error_kind_from_name(h.error_name)) return e.kind()==*kind;
        if(auto ie = dynamic_cast<const InterpreterError*>(&e)) return iequals(ie->custom_name(), h.error_name);
        return false;
    }

    Flow exec_try(const TryStmt& t){
        try {
            return exec(*t.body);
        } catch(const ScriptError& e) {
            const Handler* match = nullptr;
            for(const auto& h : t.handlers) if(handler_matches(h, e)){ match = &h; break; }
            if(!match) throw;
            if(options_.env.traceExec)
                std::fprintf(stderr, "[exec][catch] %s by handler %s at %d:%d\n", e.category(), match->error_name.c_str(), match->loc.line, match->loc.col);
            ScopeGuard scope(vars_, ScopeKind::Block);
            if(!match->var.empty()){
                Var v;
                v.name = match->var;
                v.type = DataType::string();
                v.value = Value(e.message());
                vars_.declare(std::move(v), match->loc);
            }
            return exec(*match->body);
        }
    }

    [[noreturn]] void raise(const RaiseStmt& r, SourceLoc loc){
        std::vector<std::string> parts;
        for(const auto& a : r.args) parts.push_back(display_string(eval(*a)));
        if(auto kind = error_kind_from_name(r.error_name)){
            std::string msg = parts.empty() ? std::string(error_kind_name(*kind)) : parts.front();
            throw InterpreterError(*kind, msg, loc);
        }
        std::string msg;
        for(size_t i=0;i<parts.size(); ++i){ if(i) msg += ", "; msg += parts[i]; }
        if(msg.empty()) msg = r.error_name;
        throw InterpreterError(ErrorKind::Any, msg, loc, r.error_name);
    }

    // ---- expressions ----
    Value eval(const Expr& e){
        struct V {
            Impl& in; const Expr& e;
            Value operator()(const LiteralExpr& l){ return l.value; }
            Value operator()(const VariableExpr& v){
                const Var* var = in.vars_.lookup(v.name);
                if(!var) throw InterpreterError(ErrorKind::NotFound, "undefined variable '" + v.name + "'", e.loc);
                return var->value;
            }
            Value operator()(const UnaryExpr& u){
                Value x = in.eval(*u.operand);
                switch(u.op){
                    case UnaryOp::Neg:
                        if(x.is_int()){
                            if(x.as_int()==std::numeric_limits<int64_t>::min())
                                throw InterpreterError(ErrorKind::Math, "integer overflow in unary '-'", e.loc);
                            return Value(-x.as_int());
                        }
                        if(x.is_double()) return Value(-x.as_double());
                        throw InterpreterError(ErrorKind::Type, "operator '-' cannot be applied to " + x.type_name(), e.loc);
                    case UnaryOp::Not:
                        return Value(!in.truthy(x, e.loc, "operand of '!'"));
                    case UnaryOp::TypeOf:
                        return Value(x.type_name());
                }
                return x;
            }
            Value operator()(const BinaryExpr& b){
                if(b.op==BinaryOp::And || b.op==BinaryOp::Or){
                    bool lhs = in.truthy(in.eval(*b.lhs), b.lhs->loc, "operand of logical operator");
                    if(b.op==BinaryOp::And && !lhs) return Value(false);
                    if(b.op==BinaryOp::Or && lhs) return Value(true);
                    return Value(in.truthy(in.eval(*b.rhs), b.rhs->loc, "operand of logical operator"));
                }
                Value lhs = in.eval(*b.lhs);
                Value rhs = in.eval(*b.rhs);
                return in.binary(b.op, lhs, rhs, e.loc);
            }
            Value operator()(const TernaryExpr& t){
                return in.truthy(in.eval(*t.cond), t.cond->loc, "conditional expression") ? in.eval(*t.then_expr) : in.eval(*t.else_expr);
            }
            Value operator()(const AssignExpr& a){ return in.assign(a, e.loc); }
            Value operator()(const IncDecExpr& i){
                Place p = in.resolve(*i.target);
                Value old = *p.slot;
                if(!old.is_number())
                    throw InterpreterError(ErrorKind::Type, std::string("operator '") + (i.increment ? "++" : "--") + "' cannot be applied to " + old.type_name(), e.loc);
                Value next = in.binary(i.increment ? BinaryOp::Add : BinaryOp::Sub, old, Value(int64_t{1}), e.loc);
                Value stored = in.store(p, next, e.loc);
                return i.prefix ? stored : old;
            }
            Value operator()(const CallExpr& c){ return in.eval_call(c, e.loc); }
            Value operator()(const MemberExpr& m){ return in.member(in.eval(*m.object), m.member, e.loc); }
            Value operator()(const IndexExpr& ix){
                Value obj = in.eval(*ix.object);
                Value idx = in.eval(*ix.index);
                return in.index(obj, idx, e.loc);
            }
            Value operator()(const ArrayLiteral& a){
                std::vector<Value> items;
                items.reserve(a.elements.size());
                for(const auto& el : a.elements) items.push_back(in.eval(*el));
                return make_array(std::move(items));
            }
            Value operator()(const ObjectLiteral& o){
                ObjectValue obj;
                for(const auto& kv : o.entries) obj.fields.push_back(Entry{kv.first, in.eval(*kv.second)});
                return Value(std::move(obj));
            }
            Value operator()(const CastExpr& c){ return in.cast(c, e.loc); }
            Value operator()(const ChainCompareExpr& c){
                Value lhs = in.eval(*c.operands.front());
                for(size_t i=0;i<c.ops.size(); ++i){
                    Value rhs = in.eval(*c.operands[i + 1]);
                    if(!in.binary(c.ops[i], lhs, rhs, e.loc).as_bool()) return Value(false);
                    lhs = std::move(rhs);
                }
                return Value(true);
            }
        };
        return std::visit(V{*this, e}, e.data);
    }

    Value cast(const CastExpr& c, SourceLoc loc){
        Value v = eval(*c.operand);
        if(c.target->kind==TypeKind::Int && v.is_double()){
            double d = v.as_double();
            // 2^63 is exactly representable; anything at or past it does not fit.
            if(!std::isfinite(d) || d >= 9223372036854775808.0 || d < -9223372036854775808.0)
                throw InterpreterError(ErrorKind::Math, "value " + display_string(v) + " does not fit in int", loc);
            return Value(static_cast<int64_t>(std::trunc(d)));
        }
        if(c.target->kind==TypeKind::String && !v.is_null()) return Value(display_string(v));
        return coerce(c.target, std::move(v), loc);
    }

    Value binary(BinaryOp op, const Value& a, const Value& b, SourceLoc loc){
        auto bad = [&]() -> Value {
            throw InterpreterError(ErrorKind::Type, std::string("operator '") + binary_op_spelling(op) + "' cannot be applied to " + a.type_name() + " and " + b.type_name(), loc);
        };
        auto overflow = [&]() -> Value {
            throw InterpreterError(ErrorKind::Math, std::string("integer overflow in '") + binary_op_spelling(op) + "'", loc);
        };
        switch(op){
            case BinaryOp::Eq: return Value(values_equal(a, b));
            case BinaryOp::NotEq: return Value(!values_equal(a, b));
            case BinaryOp::Add:
                if(a.is_string() || b.is_string()) return Value(display_string(a) + display_string(b));
                [[fallthrough]];
            case BinaryOp::Sub: case BinaryOp::Mul: case BinaryOp::Div: case BinaryOp::Mod: case BinaryOp::Pow: {
                if(!a.is_number() || !b.is_number()) return bad();
                if(a.is_int() && b.is_int()){
                    int64_t x = a.as_int(), y = b.as_int(), r = 0;
                    switch(op){
                        case BinaryOp::Add: return __builtin_add_overflow(x, y, &r) ? overflow() : Value(r);
                        case BinaryOp::Sub: return __builtin_sub_overflow(x, y, &r) ? overflow() : Value(r);
                        case BinaryOp::Mul: return __builtin_mul_overflow(x, y, &r) ? overflow() : Value(r);
                        case BinaryOp::Div:
                            if(y==0) throw InterpreterError(ErrorKind::Math, "division by zero", loc);
                            if(y==-1 && x==std::numeric_limits<int64_t>::min()) return overflow();
                            return Value(x / y);
                        case BinaryOp::Mod:
                            if(y==0) throw InterpreterError(ErrorKind::Math, "modulo by zero", loc);
                            if(y==-1) return Value(int64_t{0});
                            return Value(x % y);
                        case BinaryOp::Pow:
                            if(y >= 0) return int_pow(x, y, r) ? Value(r) : overflow();
                            return Value(std::pow(static_cast<double>(x), static_cast<double>(y)));
                        default: break;
                    }
                }
                double x = a.as_number(), y = b.as_number();
                switch(op){
                    case BinaryOp::Add: return Value(x + y);
                    case BinaryOp::Sub: return Value(x - y);
                    case BinaryOp::Mul: return Value(x * y);
                    case BinaryOp::Div:
                        if(y==0.0) throw InterpreterError(ErrorKind::Math, "division by zero", loc);
                        return Value(x / y);
                    case BinaryOp::Mod:
                        if(y==0.0) throw InterpreterError(ErrorKind::Math, "modulo by zero", loc);
                        return Value(std::fmod(x, y));
                    case BinaryOp::Pow: return Value(std::pow(x, y));
                    default: break;
                }
                return bad();
            }
            case BinaryOp::Less: case BinaryOp::LessEq: case BinaryOp::Greater: case BinaryOp::GreaterEq: {
                int cmp;
                if(a.is_number() && b.is_number()){
                    if(a.is_int() && b.is_int()) cmp = a.as_int() < b.as_int() ? -1 : (a.as_int() > b.as_int() ? 1 : 0);
                    else cmp = a.as_number() < b.as_number() ? -1 : (a.as_number() > b.as_number() ? 1 : 0);
                } else if(a.is_string() && b.is_string()){
                    int c = a.as_string().compare(b.as_string());
                    cmp = c < 0 ? -1 : (c > 0 ? 1 : 0);
                } else {
                    return bad();
                }
                switch(op){
                    case BinaryOp::Less: return Value(cmp < 0);
                    case BinaryOp::LessEq: return Value(cmp <= 0);
                    case BinaryOp::Greater: return Value(cmp > 0);
                    default: return Value(cmp >= 0);
                }
            }
            case BinaryOp::And: case BinaryOp::Or: break;
        }
        return bad();
    }

    Value member(const Value& obj, const std::string& name, SourceLoc loc){
        if(obj.is_null()) throw InterpreterError(ErrorKind::Null, "cannot read member '" + name + "' of null", loc);
        if(obj.is_object()){
            const auto& o = obj.as_object();
            if(const Value* v = o.find(name)) return *v;
            if(iequals(name, "length") || iequals(name, "size")) return Value(static_cast<int64_t>(o.fields.size()));
            if(!o.record.empty())
                throw InterpreterError(ErrorKind::NotFound, "record '" + obj.type_name() + "' has no field '" + name + "'", loc);
            return Value();
        }
        if(obj.is_map()){
            if(const Value* v = obj.as_map().find(name)) return *v;
            if(iequals(name, "length") || iequals(name, "size")) return Value(static_cast<int64_t>(obj.as_map().entries.size()));
            return Value();
        }
        if(iequals(name, "length") || iequals(name, "size")){
            if(obj.is_string()) return Value(static_cast<int64_t>(obj.as_string().size()));
            if(obj.is_array()) return Value(static_cast<int64_t>(obj.as_array().items.size()));
            if(obj.is_queue()) return Value(static_cast<int64_t>(obj.as_queue().items.size()));
        }
        throw InterpreterError(ErrorKind::Type, "cannot read member '" + name + "' of " + obj.type_name(), loc);
    }

    int64_t index_value(const Value& idx, SourceLoc loc){
        if(idx.is_int()) return idx.as_int();
        if(idx.is_double() && std::trunc(idx.as_double())==idx.as_double()) return static_cast<int64_t>(idx.as_double());
        throw InterpreterError(ErrorKind::Type, "index must be int, got " + idx.type_name(), loc);
    }

    Value index(const Value& obj, const Value& idx, SourceLoc loc){
        if(obj.is_null()) throw InterpreterError(ErrorKind::Null, "cannot index null", loc);
        if(obj.is_object() || obj.is_map()){
            std::string key = idx.is_string() ? idx.as_string() : display_string(idx);
            return member(obj, key, loc);
        }
        const std::vector<Value>* items = nullptr;
        if(obj.is_array()) items = &obj.as_array().items;
        else if(obj.is_queue()) items = &obj.as_queue().items;
        int64_t i = index_value(idx, loc);
        if(obj.is_string()){
            const std::string& s = obj.as_string();
            if(i < 0 || static_cast<size_t>(i) >= s.size())
                throw InterpreterError(ErrorKind::Index, "index " + std::to_string(i) + " out of range for string of length " + std::to_string(s.size()), loc);
            return Value(std::string(1, s[static_cast<size_t>(i)]));
        }
        if(!items) throw InterpreterError(ErrorKind::Type, "cannot index " + obj.type_name(), loc);
        if(i < 0 || static_cast<size_t>(i) >= items->size())
            throw InterpreterError(ErrorKind::Index, "index " + std::to_string(i) + " out of range for " + obj.type_name() + " of length " + std::to_string(items->size()), loc);
        return (*items)[static_cast<size_t>(i)];
    }

    // ---- l-values ----
    TypePtr field_type(const Value& obj, const TypePtr& declared, const std::string& field){
        if(obj.is_object() && !obj.as_object().record.empty()){
            if(const RecordType* rec = types_->find_record(obj.as_object().record)){
                if(const FieldDef* f = rec->find(field)) return f->type;
            }
        }
        if(obj.is_map() && declared && declared->kind==TypeKind::Map) return declared->elem;
        return DataType::any();
    }

    // Evaluates the index expressions of an l-value once, left to right.
    LPath capture_path(const Expr& e){
        if(auto v = std::get_if<VariableExpr>(&e.data)) return LPath{v->name, e.loc, {}};
        if(auto m = std::get_if<MemberExpr>(&e.data)){
            LPath path = capture_path(*m->object);
            PathStep step;
            step.is_member = true;
            step.name = m->member;
            step.loc = e.loc;
            path.steps.push_back(std::move(step));
            return path;
        }
        const auto& ix = std::get<IndexExpr>(e.data);
        LPath path = capture_path(*ix.object);
        PathStep step;
        step.index = eval(*ix.index);
        step.loc = e.loc;
        path.steps.push_back(std::move(step));
        return path;
    }

    // Reads the current value at a captured path without creating anything.
    Value read_path(const LPath& path){
        const Var* var = vars_.lookup(path.root);
        if(!var) throw InterpreterError(ErrorKind::NotFound, "undefined variable '" + path.root + "'", path.root_loc);
        Value cur = var->value;
        for(const auto& step : path.steps)
            cur = step.is_member ? member(cur, step.name, step.loc) : index(cur, step.index, step.loc);
        return cur;
    }

    Place resolve(const Expr& e){
        return resolve_path(capture_path(e));
    }

    Place resolve_path(const LPath& path){
        Var* var = vars_.lookup(path.root);
        if(!var) throw InterpreterError(ErrorKind::NotFound, "undefined variable '" + path.root + "'", path.root_loc);
        if(var->is_const) throw InterpreterError(ErrorKind::Access, "cannot assign to constant '" + var->name + "'", path.root_loc);
        try {
            vars_.check_write(*var, Access::Script);
        } catch(const ScopeViolationError& err) {
            throw ScopeViolationError(err.message(), path.root_loc);
        }
        Place place{var, &var->value, var->type, std::nullopt};
        for(const auto& step : path.steps)
            place = step.is_member ? member_place(place, step.name, step.loc) : index_place(place, step.index, step.loc);
        return place;
    }

    Place index_place(const Place& base, const Value& idx, SourceLoc loc){
        Value& obj = *base.slot;
        if(obj.is_object() || obj.is_map()){
            std::string key = idx.is_string() ? idx.as_string() : display_string(idx);
            return member_place(base, key, loc);
        }
        if(obj.is_null()) throw InterpreterError(ErrorKind::Null, "cannot index null", loc);
        int64_t i = index_value(idx, loc);
        TypePtr elem = base.type && (base.type->kind==TypeKind::Array || base.type->kind==TypeKind::Queue) && base.type->elem ? base.type->elem : DataType::any();
        std::optional<size_t> cap = base.type && base.type->kind==TypeKind::Array ? base.type->capacity : std::nullopt;
        if(obj.is_array()){
            auto& items = obj.as_array().items;
            if(i < 0) throw InterpreterError(ErrorKind::Index, "negative index " + std::to_string(i), loc);
            size_t at = static_cast<size_t>(i);
            if(cap && at >= *cap)
                throw InterpreterError(ErrorKind::Index, "index " + std::to_string(i) + " out of bounds for fixed array of capacity " + std::to_string(*cap), loc);
            if(at >= items.size()){
                Value fill = TypeChecker(*types_).default_value(*elem);
                items.resize(at + 1, fill);
            }
            return Place{base.var, &items[at], elem, cap};
        }
        if(obj.is_queue()){
            auto& items = obj.as_queue().items;
            if(i < 0 || static_cast<size_t>(i) >= items.size())
                throw InterpreterError(ErrorKind::Index, "index " + std::to_string(i) + " out of range for queue of length " + std::to_string(items.size()), loc);
            return Place{base.var, &items[static_cast<size_t>(i)], elem, std::nullopt};
        }
        throw InterpreterError(ErrorKind::Type, "cannot assign through index of " + obj.type_name(), loc);
    }

    Place member_place(const Place& base, const std::string& name, SourceLoc loc){
        Value& obj = *base.slot;
        if(obj.is_null()) throw InterpreterError(ErrorKind::Null, "cannot set member '" + name + "' of null", loc);
        TypePtr t = field_type(obj, base.type, name);
        if(obj.is_object()){
            auto& o = obj.as_object();
            if(Value* slot = o.find(name)) return Place{base.var, slot, t, std::nullopt};
            if(!o.record.empty())
                throw TypeError("field '" + name + "' is not declared in record type '" + obj.type_name() + "'", loc, "E3205");
            o.fields.push_back(Entry{name, Value()});
            return Place{base.var, &o.fields.back().value, t, std::nullopt};
        }
        if(obj.is_map()){
            auto& m = obj.as_map();
            if(Value* slot = m.find(name)) return Place{base.var, slot, t, std::nullopt};
            m.entries.push_back(Entry{name, Value()});
            return Place{base.var, &m.entries.back().value, t, std::nullopt};
        }
        throw InterpreterError(ErrorKind::Type, "cannot set member '" + name + "' of " + obj.type_name(), loc);
    }

    Value store(const Place& p, const Value& v, SourceLoc loc){
        Value converted = coerce(p.type, v, loc);
        *p.slot = converted;
        return converted;
    }

    Value assign(const AssignExpr& a, SourceLoc loc){
        Value rhs = eval(*a.value);
        Place p = resolve(*a.target);
        if(a.op==AssignOp::Set) return store(p, rhs, loc);
        BinaryOp op = BinaryOp::Add;
        switch(a.op){
            case AssignOp::Add: op = BinaryOp::Add; break;
            case AssignOp::Sub: op = BinaryOp::Sub; break;
            case AssignOp::Mul: op = BinaryOp::Mul; break;
            case AssignOp::Div: op = BinaryOp::Div; break;
            case AssignOp::Set: break;
        }
        Value next = binary(op, *p.slot, rhs, loc);
        return store(p, next, loc);
    }

    // ---- calls ----
    Value eval_call(const CallExpr& c, SourceLoc loc){
        if(c.builtin) return call_builtin(c, loc);
        std::vector<Value> positional;
        std::vector<std::pair<std::string, Value>> named;
        for(const auto& a : c.args){
            if(a.name.empty()) positional.push_back(eval(*a.value));
            else named.emplace_back(a.name, eval(*a.value));
        }
        return call_user(c.callee, std::move(positional), std::move(named), loc);
    }

    Value call_user(const std::string& name, std::vector<Value> positional, std::vector<std::pair<std::string, Value>> named, SourceLoc loc){
        auto it = functions_.find(to_lower(name));
        if(it==functions_.end()) throw InterpreterError(ErrorKind::NotFound, "undefined function '" + name + "'", loc);
        const FunctionDecl& fn = *it->second;
        check_stop();
        if(frames_.size() >= options_.env.maxCallDepth)
            throw InterpreterError(ErrorKind::Any, "maximum call depth " + std::to_string(options_.env.maxCallDepth) + " exceeded in call to '" + fn.name + "'", loc);
        if(positional.size() > fn.params.size())
            throw InterpreterError(ErrorKind::Any, "function '" + fn.name + "' expects at most " + std::to_string(fn.params.size()) + " argument(s), got " + std::to_string(positional.size()), loc);

        std::vector<std::optional<Value>> bound(fn.params.size());
        for(size_t i=0;i<positional.size(); ++i) bound[i] = std::move(positional[i]);
        for(auto& kv : named){
            size_t i = 0;
            while(i < fn.params.size() && !iequals(fn.params[i].name, kv.first)) ++i;
            if(i==fn.params.size()) throw InterpreterError(ErrorKind::Any, "function '" + fn.name + "' has no parameter '" + kv.first + "'", loc);
            if(bound[i]) throw InterpreterError(ErrorKind::Any, "parameter '" + fn.params[i].name + "' of '" + fn.name + "' is bound twice", loc);
            bound[i] = std::move(kv.second);
        }

        if(options_.env.traceCalls)
            std::fprintf(stderr, "[exec][call] %s depth=%zu\n", fn.name.c_str(), frames_.size() + 1);
        FrameGuard frame(frames_, CallFrame{fn.name, loc});
        ScopeGuard scope(vars_, ScopeKind::Function);
        for(size_t i=0;i<fn.params.size(); ++i){
            const Param& p = fn.params[i];
            Value v;
            if(bound[i]) v = std::move(*bound[i]);
            else if(p.default_value) v = eval(*p.default_value);
            else throw InterpreterError(ErrorKind::Any, "missing argument '" + p.name + "' in call to '" + fn.name + "'", loc);
            Var var;
            var.name = p.name;
            var.type = p.type ? p.type : DataType::any();
            var.value = coerce(var.type, std::move(v), loc);
            vars_.declare(std::move(var), loc);
        }
        Flow f = exec(*fn.body);
        Value result = f.kind==Flow::Kind::Return ? std::move(f.value) : Value();
        if(fn.return_type) result = coerce(fn.return_type, std::move(result), loc);
        return result;
    }

    Value call_builtin(const CallExpr& c, SourceLoc loc){
        const BuiltinEntry* entry = builtins_->find(c.callee);
        if(!entry) throw UnknownBuiltinError("unknown builtin '" + c.callee + "'", loc);
        // The first argument of a mutating builtin is written back through the
        // same path it was read from, so its indices are evaluated only once.
        std::optional<LPath> target;
        std::vector<Value> args;
        args.reserve(c.args.size());
        for(const auto& a : c.args){
            if(!a.name.empty()) throw InterpreterError(ErrorKind::Any, "builtin '" + c.callee + "' does not accept named argument '" + a.name + "'", loc);
            if(args.empty() && entry->writes_back && is_lvalue(*a.value)){
                target = capture_path(*a.value);
                args.push_back(read_path(*target));
            } else {
                args.push_back(eval(*a.value));
            }
        }
        if(args.size() < entry->min_args || args.size() > entry->max_args){
            std::string want = entry->min_args==entry->max_args ? std::to_string(entry->min_args)
                             : entry->max_args==kVariadic ? "at least " + std::to_string(entry->min_args)
                             : std::to_string(entry->min_args) + " to " + std::to_string(entry->max_args);
            throw InterpreterError(ErrorKind::Any, "builtin '" + c.callee + "' expects " + want + " argument(s), got " + std::to_string(args.size()), loc);
        }
        check_stop();
        if(options_.env.traceCalls) std::fprintf(stderr, "[builtin][call] %s(%zu args)\n", entry->name.c_str(), args.size());
        Value result;
        {
            struct CallSite { SourceLoc& slot; SourceLoc saved; ~CallSite(){ slot = saved; } } site{call_site_, call_site_};
            call_site_ = loc;
            try {
                result = entry->fn(args, *this);
            } catch(const HostError& e) {
                throw InterpreterError(e.kind(), e.message(), loc);
            } catch(const ScopeViolationError& e) {
                if(e.loc().known()) throw;
                throw ScopeViolationError(e.message(), loc);
            } catch(const TypeError& e) {
                if(e.loc().known()) throw;
                throw TypeError(e.message(), loc, e.code());
            } catch(const InterpreterError& e) {
                if(e.loc().known()) throw;
                throw InterpreterError(e.kind(), e.message(), loc, e.custom_name());
            } catch(const ScriptError&) {
                throw;
            } catch(const std::exception& e) {
                throw InterpreterError(ErrorKind::Any, std::string("builtin '") + entry->name + "' failed: " + e.what(), loc);
            }
        }
        if(target) store(resolve_path(*target), args.front(), loc);
        check_stop();
        return result;
    }
};

Interpreter::Interpreter(std::shared_ptr<const BuiltinRegistry> builtins, InterpreterOptions options)
    : impl_(std::make_unique<Impl>(std::move(builtins), std::move(options))) {}

Interpreter::~Interpreter() = default;

void Interpreter::load(ProgramPtr program){ impl_->load(std::move(program)); }

ExecutionResult Interpreter::run(const Bindings& bindings){ return impl_->run(bindings); }

ExecutionResult Interpreter::run(ProgramPtr program, const Bindings& bindings){
    return impl_->load_and_run(std::move(program), bindings);
}

std::future<Value> Interpreter::submit_callback(std::string function, std::vector<Value> args){
    return impl_->submit(std::move(function), std::move(args));
}

Value Interpreter::call_function(const std::string& function, std::vector<Value> args){
    return impl_->call(function, std::move(args));
}

Value Interpreter::get_var(const std::string& path){ return impl_->get(path); }
void Interpreter::set_var(const std::string& path, const Value& value){ impl_->set(path, value); }
std::vector<std::string> Interpreter::list_vars(){ return impl_->list(); }
void Interpreter::request_stop(){ impl_->request_stop(); }
bool Interpreter::stop_requested() const { return impl_->stop_requested(); }
const std::string& Interpreter::name() const { return impl_->name(); }

} // namespace ebs
