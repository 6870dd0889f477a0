#include "ebs/pretty.hpp"
#include "ebs/strings.hpp"
#include <cstdio>

namespace ebs {

std::string quote_string(const std::string& s){
    std::string out; out.reserve(s.size()+2); out.push_back('"');
    for(char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\0': out += "\\0"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else out.push_back(c);
        }
    }
    out.push_back('"');
    return out;
}

namespace {

bool is_primary(const Expr& e){
    return std::holds_alternative<LiteralExpr>(e.data) || std::holds_alternative<VariableExpr>(e.data)
        || std::holds_alternative<CallExpr>(e.data) || std::holds_alternative<MemberExpr>(e.data)
        || std::holds_alternative<IndexExpr>(e.data) || std::holds_alternative<ArrayLiteral>(e.data)
        || std::holds_alternative<ObjectLiteral>(e.data) || std::holds_alternative<CastExpr>(e.data);
}

std::string literal(const Value& v){
    if(v.is_null()) return "null";
    if(v.is_bool()) return v.as_bool() ? "true" : "false";
    if(v.is_int()) return std::to_string(v.as_int());
    if(v.is_double()) return format_double(v.as_double());
    if(v.is_string()) return quote_string(v.as_string());
    return display_string(v);
}

std::string child(const ExprPtr& e){
    std::string s = to_source(*e);
    return is_primary(*e) ? s : "(" + s + ")";
}

std::string call_args(const std::vector<Argument>& args){
    std::string out = "(";
    for(size_t i=0;i<args.size(); ++i){
        if(i) out += ", ";
        if(!args[i].name.empty()) out += args[i].name + " = " + to_source(*args[i].value);
        // A bare `x = v` in argument position reads back as a named argument.
        else if(std::holds_alternative<AssignExpr>(args[i].value->data)) out += "(" + to_source(*args[i].value) + ")";
        else out += to_source(*args[i].value);
    }
    return out + ")";
}

class Printer {
public:
    Printer(const TypeRegistry& types, int width): types_(types), width_(width) {}

    std::string program(const Program& p){
        for(const auto& s : p.body) stmt(*s, 0);
        return std::move(out_);
    }

private:
    const TypeRegistry& types_;
    int width_;
    std::string out_;

    std::string pad(int depth) const { return std::string(static_cast<size_t>(depth * width_), ' '); }
    std::string type(const TypePtr& t) const { return types_.to_string(t); }

    std::string var_decl(const VarDeclStmt& d) const {
        std::string s = d.is_const ? "const " : "var ";
        s += d.name;
        if(d.typed) s += ": " + type(d.type);
        if(d.init) s += " = " + to_source(*d.init);
        return s;
    }

    std::string record_body(const RecordType& rec) const {
        std::string s = "record{";
        for(size_t i=0;i<rec.fields.size(); ++i){
            if(i) s += ", ";
            s += rec.fields[i].name + ": " + type(rec.fields[i].type);
        }
        return s + "}";
    }

    // Blocks open on the current line; other bodies go on their own indented line.
    void body(const Stmt& s, int depth){
        if(std::holds_alternative<BlockStmt>(s.data)){
            out_ += " ";
            block(std::get<BlockStmt>(s.data), depth);
        } else {
            out_ += "\n";
            stmt(s, depth + 1, false);
        }
    }

    void block(const BlockStmt& b, int depth){
        out_ += "{\n";
        for(const auto& s : b.body) stmt(*s, depth + 1);
        out_ += pad(depth) + "}";
    }

    void stmt(const Stmt& s, int depth, bool newline_after = true){
        out_ += pad(depth);
        struct V {
            Printer& p; int depth;
            void operator()(const VarDeclStmt& d){ p.out_ += p.var_decl(d) + ";"; }
            void operator()(const TypeDeclStmt& d){
                const RecordType* rec = d.type && d.type->kind==TypeKind::Record ? p.types_.find_record(d.type->name) : nullptr;
                if(rec && !rec->anonymous && iequals(rec->name, d.name)) p.out_ += d.name + " typeof " + p.record_body(*rec) + ";";
                else p.out_ += d.name + " typeof " + p.type(d.type) + ";";
            }
            void operator()(const ExprStmt& e){ p.out_ += (e.explicit_call ? "call " : "") + to_source(*e.expr) + ";"; }
            void operator()(const PrintStmt& pr){
                p.out_ += "print ";
                for(size_t i=0;i<pr.args.size(); ++i){ if(i) p.out_ += ", "; p.out_ += to_source(*pr.args[i]); }
                p.out_ += ";";
            }
            void operator()(const BlockStmt& b){ p.block(b, depth); }
            void operator()(const IfStmt& i){
                p.out_ += "if " + child(i.cond);
                p.body(*i.then_branch, depth);
                if(i.else_branch){
                    p.out_ += "\n" + p.pad(depth) + "else";
                    p.body(*i.else_branch, depth);
                }
            }
            void operator()(const WhileStmt& w){ p.out_ += "while " + child(w.cond); p.body(*w.body, depth); }
            void operator()(const DoWhileStmt& w){
                p.out_ += "do";
                p.body(*w.body, depth);
                p.out_ += "\n" + p.pad(depth) + "while " + child(w.cond) + ";";
            }
            void operator()(const ForStmt& f){
                p.out_ += "for (";
                if(f.init){
                    if(auto d = std::get_if<VarDeclStmt>(&f.init->data)) p.out_ += p.var_decl(*d);
                    else if(auto e = std::get_if<ExprStmt>(&f.init->data)) p.out_ += to_source(*e->expr);
                }
                p.out_ += "; ";
                if(f.cond) p.out_ += to_source(*f.cond);
                p.out_ += "; ";
                if(f.step) p.out_ += to_source(*f.step);
                p.out_ += ")";
                p.body(*f.body, depth);
            }
            void operator()(const ForEachStmt& f){ p.out_ += "foreach " + f.var + " in " + child(f.iterable); p.body(*f.body, depth); }
            void operator()(const BreakStmt&){ p.out_ += "break;"; }
            void operator()(const ContinueStmt&){ p.out_ += "continue;"; }
            void operator()(const ReturnStmt& r){ p.out_ += r.value ? "return " + to_source(*r.value) + ";" : std::string("return;"); }
            void operator()(const FunctionDecl& f){
                p.out_ += "function " + f.name + "(";
                for(size_t i=0;i<f.params.size(); ++i){
                    const Param& prm = f.params[i];
                    if(i) p.out_ += ", ";
                    p.out_ += prm.name;
                    if(prm.typed) p.out_ += ": " + p.type(prm.type);
                    if(prm.default_value) p.out_ += " = " + to_source(*prm.default_value);
                }
                p.out_ += ")";
                if(f.return_type) p.out_ += " return " + p.type(f.return_type);
                p.body(*f.body, depth);
            }
            void operator()(const TryStmt& t){
                p.out_ += "try";
                p.body(*t.body, depth);
                p.out_ += "\n" + p.pad(depth) + "exceptions {\n";
                for(const auto& h : t.handlers){
                    p.out_ += p.pad(depth + 1) + "when " + h.error_name;
                    if(!h.var.empty()) p.out_ += "(" + h.var + ")";
                    p.body(*h.body, depth + 1);
                    p.out_ += "\n";
                }
                p.out_ += p.pad(depth) + "}";
            }
            void operator()(const RaiseStmt& r){
                p.out_ += "raise exception " + r.error_name + "(";
                for(size_t i=0;i<r.args.size(); ++i){ if(i) p.out_ += ", "; p.out_ += to_source(*r.args[i]); }
                p.out_ += ");";
            }
            void operator()(const VarSetDecl& v){
                p.out_ += "varset " + v.name + " " + var_scope_name(v.scope) + " {\n";
                for(const auto& s : v.vars) p.stmt(*s, depth + 1);
                p.out_ += p.pad(depth) + "}";
            }
            void operator()(const ImportStmt& i){ p.out_ += "import " + quote_string(i.path) + ";"; }
        };
        std::visit(V{*this, depth}, s.data);
        if(newline_after) out_ += "\n";
    }
};

} // namespace

std::string to_source(const Expr& e){
    struct V {
        std::string operator()(const LiteralExpr& l) const { return literal(l.value); }
        std::string operator()(const VariableExpr& v) const { return v.name; }
        std::string operator()(const UnaryExpr& u) const {
            switch(u.op){
                case UnaryOp::Neg: return "-" + child(u.operand);
                case UnaryOp::Not: return "!" + child(u.operand);
                case UnaryOp::TypeOf: return "typeof " + child(u.operand);
            }
            return child(u.operand);
        }
        std::string operator()(const BinaryExpr& b) const { return child(b.lhs) + " " + binary_op_spelling(b.op) + " " + child(b.rhs); }
        std::string operator()(const TernaryExpr& t) const { return child(t.cond) + " ? " + child(t.then_expr) + " : " + child(t.else_expr); }
        std::string operator()(const AssignExpr& a) const { return to_source(*a.target) + " " + assign_op_spelling(a.op) + " " + child(a.value); }
        std::string operator()(const IncDecExpr& i) const {
            const char* op = i.increment ? "++" : "--";
            return i.prefix ? op + child(i.target) : child(i.target) + op;
        }
        std::string operator()(const CallExpr& c) const { return c.callee + call_args(c.args); }
        std::string operator()(const MemberExpr& m) const { return child(m.object) + "." + m.member; }
        std::string operator()(const IndexExpr& i) const { return child(i.object) + "[" + to_source(*i.index) + "]"; }
        std::string operator()(const ArrayLiteral& a) const {
            std::string s = "[";
            for(size_t i=0;i<a.elements.size(); ++i){ if(i) s += ", "; s += to_source(*a.elements[i]); }
            return s + "]";
        }
        std::string operator()(const ObjectLiteral& o) const {
            std::string s = "{";
            for(size_t i=0;i<o.entries.size(); ++i){
                if(i) s += ", ";
                s += quote_string(o.entries[i].first) + ": " + to_source(*o.entries[i].second);
            }
            return s + "}";
        }
        std::string operator()(const CastExpr& c) const {
            TypeRegistry none;
            return none.to_string(c.target) + "(" + to_source(*c.operand) + ")";
        }
        std::string operator()(const ChainCompareExpr& c) const {
            std::string s = child(c.operands.front());
            for(size_t i=0;i<c.ops.size(); ++i) s += std::string(" ") + binary_op_spelling(c.ops[i]) + " " + child(c.operands[i + 1]);
            return s;
        }
    };
    return std::visit(V{}, e.data);
}

std::string to_source(const Program& prog, int indentWidth){
    TypeRegistry empty;
    return Printer(prog.types ? *prog.types : empty, indentWidth).program(prog);
}

} // namespace ebs
