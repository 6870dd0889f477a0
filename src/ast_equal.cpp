// Structural equality of syntax trees (source locations ignored).
#include "ebs/ast.hpp"

namespace ebs {

namespace {

struct Ctx {
    const TypeRegistry& ra;
    const TypeRegistry& rb;
};

bool type_eq(const TypePtr& a, const TypePtr& b, const Ctx& c){
    if(!a || !b) return !a && !b;
    return same_type(*a, c.ra, *b, c.rb);
}

bool literal_eq(const Value& a, const Value& b){
    return a.data.index()==b.data.index() && values_equal(a, b);
}

bool expr_eq(const ExprPtr& a, const ExprPtr& b, const Ctx& c);
bool stmt_eq(const StmtPtr& a, const StmtPtr& b, const Ctx& c);

bool exprs_eq(const std::vector<ExprPtr>& a, const std::vector<ExprPtr>& b, const Ctx& c){
    if(a.size()!=b.size()) return false;
    for(size_t i=0;i<a.size(); ++i) if(!expr_eq(a[i], b[i], c)) return false;
    return true;
}

bool stmts_eq(const std::vector<StmtPtr>& a, const std::vector<StmtPtr>& b, const Ctx& c){
    if(a.size()!=b.size()) return false;
    for(size_t i=0;i<a.size(); ++i) if(!stmt_eq(a[i], b[i], c)) return false;
    return true;
}

struct ExprEqVisitor {
    const Expr& b; const Ctx& c;
    template<class T> const T& other() const { return std::get<T>(b.data); }
    bool operator()(const LiteralExpr& x) const { return literal_eq(x.value, other<LiteralExpr>().value); }
    bool operator()(const VariableExpr& x) const { return x.name==other<VariableExpr>().name; }
    bool operator()(const UnaryExpr& x) const { auto& y = other<UnaryExpr>(); return x.op==y.op && expr_eq(x.operand, y.operand, c); }
    bool operator()(const BinaryExpr& x) const { auto& y = other<BinaryExpr>(); return x.op==y.op && expr_eq(x.lhs, y.lhs, c) && expr_eq(x.rhs, y.rhs, c); }
    bool operator()(const TernaryExpr& x) const {
        auto& y = other<TernaryExpr>();
        return expr_eq(x.cond, y.cond, c) && expr_eq(x.then_expr, y.then_expr, c) && expr_eq(x.else_expr, y.else_expr, c);
    }
    bool operator()(const AssignExpr& x) const { auto& y = other<AssignExpr>(); return x.op==y.op && expr_eq(x.target, y.target, c) && expr_eq(x.value, y.value, c); }
    bool operator()(const IncDecExpr& x) const { auto& y = other<IncDecExpr>(); return x.increment==y.increment && x.prefix==y.prefix && expr_eq(x.target, y.target, c); }
    bool operator()(const CallExpr& x) const {
        auto& y = other<CallExpr>();
        if(x.callee!=y.callee || x.builtin!=y.builtin || x.args.size()!=y.args.size()) return false;
        for(size_t i=0;i<x.args.size(); ++i){
            if(x.args[i].name!=y.args[i].name || !expr_eq(x.args[i].value, y.args[i].value, c)) return false;
        }
        return true;
    }
    bool operator()(const MemberExpr& x) const { auto& y = other<MemberExpr>(); return x.member==y.member && expr_eq(x.object, y.object, c); }
    bool operator()(const IndexExpr& x) const { auto& y = other<IndexExpr>(); return expr_eq(x.object, y.object, c) && expr_eq(x.index, y.index, c); }
    bool operator()(const ArrayLiteral& x) const { return exprs_eq(x.elements, other<ArrayLiteral>().elements, c); }
    bool operator()(const ObjectLiteral& x) const {
        auto& y = other<ObjectLiteral>();
        if(x.entries.size()!=y.entries.size()) return false;
        for(size_t i=0;i<x.entries.size(); ++i){
            if(x.entries[i].first!=y.entries[i].first || !expr_eq(x.entries[i].second, y.entries[i].second, c)) return false;
        }
        return true;
    }
    bool operator()(const CastExpr& x) const { auto& y = other<CastExpr>(); return type_eq(x.target, y.target, c) && expr_eq(x.operand, y.operand, c); }
    bool operator()(const ChainCompareExpr& x) const {
        auto& y = other<ChainCompareExpr>();
        return x.ops==y.ops && exprs_eq(x.operands, y.operands, c);
    }
};

bool expr_eq(const ExprPtr& a, const ExprPtr& b, const Ctx& c){
    if(a.get()==b.get()) return true;
    if(!a || !b) return false;
    if(a->data.index()!=b->data.index()) return false;

    return std::visit(ExprEqVisitor{*b, c}, a->data);
}

struct StmtEqVisitor {
    const Stmt& b; const Ctx& c;
    template<class T> const T& other() const { return std::get<T>(b.data); }
    bool operator()(const VarDeclStmt& x) const {
        auto& y = other<VarDeclStmt>();
        return x.name==y.name && x.typed==y.typed && x.is_const==y.is_const && x.varset==y.varset
            && type_eq(x.type, y.type, c) && expr_eq(x.init, y.init, c);
    }
    bool operator()(const TypeDeclStmt& x) const { auto& y = other<TypeDeclStmt>(); return x.name==y.name && type_eq(x.type, y.type, c); }
    bool operator()(const ExprStmt& x) const { auto& y = other<ExprStmt>(); return x.explicit_call==y.explicit_call && expr_eq(x.expr, y.expr, c); }
    bool operator()(const PrintStmt& x) const { return exprs_eq(x.args, other<PrintStmt>().args, c); }
    bool operator()(const BlockStmt& x) const { return stmts_eq(x.body, other<BlockStmt>().body, c); }
    bool operator()(const IfStmt& x) const {
        auto& y = other<IfStmt>();
        return expr_eq(x.cond, y.cond, c) && stmt_eq(x.then_branch, y.then_branch, c) && stmt_eq(x.else_branch, y.else_branch, c);
    }
    bool operator()(const WhileStmt& x) const { auto& y = other<WhileStmt>(); return expr_eq(x.cond, y.cond, c) && stmt_eq(x.body, y.body, c); }
    bool operator()(const DoWhileStmt& x) const { auto& y = other<DoWhileStmt>(); return expr_eq(x.cond, y.cond, c) && stmt_eq(x.body, y.body, c); }
    bool operator()(const ForStmt& x) const {
        auto& y = other<ForStmt>();
        return stmt_eq(x.init, y.init, c) && expr_eq(x.cond, y.cond, c) && expr_eq(x.step, y.step, c) && stmt_eq(x.body, y.body, c);
    }
    bool operator()(const ForEachStmt& x) const {
        auto& y = other<ForEachStmt>();
        return x.var==y.var && expr_eq(x.iterable, y.iterable, c) && stmt_eq(x.body, y.body, c);
    }
    bool operator()(const BreakStmt&) const { return true; }
    bool operator()(const ContinueStmt&) const { return true; }
    bool operator()(const ReturnStmt& x) const { return expr_eq(x.value, other<ReturnStmt>().value, c); }
    bool operator()(const FunctionDecl& x) const {
        auto& y = other<FunctionDecl>();
        if(x.name!=y.name || x.params.size()!=y.params.size()) return false;
        for(size_t i=0;i<x.params.size(); ++i){
            const Param& p = x.params[i]; const Param& q = y.params[i];
            if(p.name!=q.name || p.typed!=q.typed || !type_eq(p.type, q.type, c) || !expr_eq(p.default_value, q.default_value, c)) return false;
        }
        return type_eq(x.return_type, y.return_type, c) && stmt_eq(x.body, y.body, c);
    }
    bool operator()(const TryStmt& x) const {
        auto& y = other<TryStmt>();
        if(!stmt_eq(x.body, y.body, c) || x.handlers.size()!=y.handlers.size()) return false;
        for(size_t i=0;i<x.handlers.size(); ++i){
            const Handler& h = x.handlers[i]; const Handler& k = y.handlers[i];
            if(h.error_name!=k.error_name || h.var!=k.var || !stmt_eq(h.body, k.body, c)) return false;
        }
        return true;
    }
    bool operator()(const RaiseStmt& x) const { auto& y = other<RaiseStmt>(); return x.error_name==y.error_name && exprs_eq(x.args, y.args, c); }
    bool operator()(const VarSetDecl& x) const {
        auto& y = other<VarSetDecl>();
        return x.name==y.name && x.scope==y.scope && stmts_eq(x.vars, y.vars, c);
    }
    bool operator()(const ImportStmt& x) const { auto& y = other<ImportStmt>(); return x.path==y.path && stmts_eq(x.body, y.body, c); }
};

bool stmt_eq(const StmtPtr& a, const StmtPtr& b, const Ctx& c){
    if(a.get()==b.get()) return true;
    if(!a || !b) return false;
    if(a->data.index()!=b->data.index()) return false;

    return std::visit(StmtEqVisitor{*b, c}, a->data);
}

} // namespace

bool equal(const Program& a, const Program& b){
    TypeRegistry empty;
    Ctx c{a.types ? *a.types : empty, b.types ? *b.types : empty};
    return stmts_eq(a.body, b.body, c);
}

bool equal(const ExprPtr& a, const TypeRegistry& ra, const ExprPtr& b, const TypeRegistry& rb){
    return expr_eq(a, b, Ctx{ra, rb});
}

} // namespace ebs
