// Immutable syntax tree produced by the parser.
#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "ebs/errors.hpp"
#include "ebs/types.hpp"
#include "ebs/value.hpp"

namespace ebs
{

    struct Expr;
    struct Stmt;
    using ExprPtr = std::shared_ptr<const Expr>;
    using StmtPtr = std::shared_ptr<const Stmt>;

    enum class UnaryOp
    {
        Neg,
        Not,
        TypeOf
    };

    enum class BinaryOp
    {
        Add,
        Sub,
        Mul,
        Div,
        Mod,
        Pow,
        Eq,
        NotEq,
        Less,
        LessEq,
        Greater,
        GreaterEq,
        And,
        Or
    };

    enum class AssignOp
    {
        Set,
        Add,
        Sub,
        Mul,
        Div
    };

    // VarSet visibility/direction at the host boundary.
    enum class VarScope
    {
        Visible,
        Internal,
        In,
        Out,
        InOut
    };

    const char *binary_op_spelling(BinaryOp op);
    const char *assign_op_spelling(AssignOp op);
    const char *var_scope_name(VarScope s);

    // ---- expressions ----
    struct LiteralExpr
    {
        Value value; // null, bool, int, double or string
    };
    struct VariableExpr
    {
        std::string name; // "x", or "set.x" for VarSet members
    };
    struct UnaryExpr
    {
        UnaryOp op;
        ExprPtr operand;
    };
    struct BinaryExpr
    {
        BinaryOp op;
        ExprPtr lhs;
        ExprPtr rhs;
    };
    struct TernaryExpr
    {
        ExprPtr cond;
        ExprPtr then_expr;
        ExprPtr else_expr;
    };
    struct AssignExpr
    {
        AssignOp op;
        ExprPtr target; // VariableExpr, MemberExpr or IndexExpr
        ExprPtr value;
    };
    struct IncDecExpr
    {
        bool increment;
        bool prefix;
        ExprPtr target;
    };
    struct Argument
    {
        std::string name; // empty for positional
        ExprPtr value;
    };
    struct CallExpr
    {
        std::string callee;      // function name, or qualified "ns.fn" for builtins
        std::vector<Argument> args;
        bool builtin = false;    // callee contained a '.'
    };
    struct MemberExpr
    {
        ExprPtr object;
        std::string member;
    };
    struct IndexExpr
    {
        ExprPtr object;
        ExprPtr index;
    };
    struct ArrayLiteral
    {
        std::vector<ExprPtr> elements;
    };
    struct ObjectLiteral
    {
        std::vector<std::pair<std::string, ExprPtr>> entries;
    };
    // `int(x)`, `double(x)`, `string(x)`, `bool(x)`
    struct CastExpr
    {
        TypePtr target; // scalar
        ExprPtr operand;
    };
    // `a < b <= c`: every operand is evaluated at most once, left to right.
    struct ChainCompareExpr
    {
        std::vector<BinaryOp> ops;     // Less, LessEq, Greater, GreaterEq
        std::vector<ExprPtr> operands; // ops.size() + 1
    };

    using ExprData = std::variant<LiteralExpr, VariableExpr, UnaryExpr, BinaryExpr, TernaryExpr, AssignExpr, IncDecExpr,
                                  CallExpr, MemberExpr, IndexExpr, ArrayLiteral, ObjectLiteral, CastExpr, ChainCompareExpr>;

    struct Expr
    {
        ExprData data;
        SourceLoc loc;
    };

    // ---- statements ----
    struct VarDeclStmt
    {
        std::string name;
        TypePtr type;       // declared type; DataType::any() when omitted
        bool typed = false; // false for `var x = ...`
        ExprPtr init;       // may be null
        bool is_const = false;
        std::string varset; // owning VarSet for host-visible declarations, empty for locals
    };
    struct TypeDeclStmt
    {
        std::string name;
        TypePtr type;
    };
    struct ExprStmt
    {
        ExprPtr expr;
        bool explicit_call = false; // written as `call f(...)` / `#f(...)`
    };
    struct PrintStmt
    {
        std::vector<ExprPtr> args;
    };
    struct BlockStmt
    {
        std::vector<StmtPtr> body;
    };
    struct IfStmt
    {
        ExprPtr cond;
        StmtPtr then_branch;
        StmtPtr else_branch; // may be null
    };
    struct WhileStmt
    {
        ExprPtr cond;
        StmtPtr body;
    };
    struct DoWhileStmt
    {
        StmtPtr body;
        ExprPtr cond;
    };
    struct ForStmt
    {
        StmtPtr init; // VarDeclStmt or ExprStmt, may be null
        ExprPtr cond; // may be null (loop forever)
        ExprPtr step; // may be null
        StmtPtr body;
    };
    struct ForEachStmt
    {
        std::string var;
        ExprPtr iterable;
        StmtPtr body;
    };
    struct BreakStmt
    {
    };
    struct ContinueStmt
    {
    };
    struct ReturnStmt
    {
        ExprPtr value; // may be null
    };
    struct Param
    {
        std::string name;
        TypePtr type;
        bool typed = false;
        ExprPtr default_value; // may be null
    };
    struct FunctionDecl
    {
        std::string name;
        std::vector<Param> params;
        TypePtr return_type; // null for no declared return type
        StmtPtr body;        // BlockStmt
    };
    struct Handler
    {
        std::string error_name; // ANY_ERROR, MATH_ERROR, ... or a custom exception name
        std::string var;        // may be empty
        StmtPtr body;
        SourceLoc loc;
    };
    struct TryStmt
    {
        StmtPtr body;
        std::vector<Handler> handlers;
    };
    struct RaiseStmt
    {
        std::string error_name;
        std::vector<ExprPtr> args;
    };
    // `import "file";` The imported file's statements are parsed in place; a file
    // that was already imported by the same program yields an empty body.
    struct ImportStmt
    {
        std::string path;          // as written
        std::vector<StmtPtr> body; // top-level statements of the imported file
    };
    struct VarSetDecl
    {
        std::string name;
        VarScope scope = VarScope::Visible;
        std::vector<StmtPtr> vars; // VarDeclStmt
    };

    using StmtData = std::variant<VarDeclStmt, TypeDeclStmt, ExprStmt, PrintStmt, BlockStmt, IfStmt, WhileStmt, DoWhileStmt,
                                  ForStmt, ForEachStmt, BreakStmt, ContinueStmt, ReturnStmt, FunctionDecl, TryStmt, RaiseStmt,
                                  VarSetDecl, ImportStmt>;

    struct Stmt
    {
        StmtData data;
        SourceLoc loc;
    };

    // A parsed compilation unit. Types referenced by the tree live in `types`.
    struct Program
    {
        std::string source_name;
        std::vector<StmtPtr> body;
        std::shared_ptr<TypeRegistry> types;
    };
    using ProgramPtr = std::shared_ptr<const Program>;

    inline ExprPtr make_expr(ExprData d, SourceLoc loc) { return std::make_shared<const Expr>(Expr{std::move(d), loc}); }
    inline StmtPtr make_stmt(StmtData d, SourceLoc loc) { return std::make_shared<const Stmt>(Stmt{std::move(d), loc}); }

    // Structural equality that ignores source locations; types compare through each program's registry.
    bool equal(const Program &a, const Program &b);
    bool equal(const ExprPtr &a, const TypeRegistry &ra, const ExprPtr &b, const TypeRegistry &rb);

} // namespace ebs
