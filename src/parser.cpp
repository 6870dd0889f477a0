#include "ebs/parser.hpp"
#include "ebs/lexer.hpp"
#include "ebs/strings.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace ebs {

namespace {

struct BinaryInfo { BinaryOp op; int prec; bool right_assoc; };

std::optional<BinaryInfo> binary_info(TokenKind k){
    switch(k){
        case TokenKind::OrOr: case TokenKind::KwOr: return BinaryInfo{BinaryOp::Or, 1, false};
        case TokenKind::AndAnd: case TokenKind::KwAnd: return BinaryInfo{BinaryOp::And, 2, false};
        case TokenKind::Eq: return BinaryInfo{BinaryOp::Eq, 3, false};
        case TokenKind::NotEq: return BinaryInfo{BinaryOp::NotEq, 3, false};
        case TokenKind::Less: return BinaryInfo{BinaryOp::Less, 4, false};
        case TokenKind::LessEq: return BinaryInfo{BinaryOp::LessEq, 4, false};
        case TokenKind::Greater: return BinaryInfo{BinaryOp::Greater, 4, false};
        case TokenKind::GreaterEq: return BinaryInfo{BinaryOp::GreaterEq, 4, false};
        case TokenKind::Plus: return BinaryInfo{BinaryOp::Add, 5, false};
        case TokenKind::Minus: return BinaryInfo{BinaryOp::Sub, 5, false};
        case TokenKind::Star: return BinaryInfo{BinaryOp::Mul, 6, false};
        case TokenKind::Slash: return BinaryInfo{BinaryOp::Div, 6, false};
        case TokenKind::Percent: return BinaryInfo{BinaryOp::Mod, 6, false};
        case TokenKind::Caret: return BinaryInfo{BinaryOp::Pow, 7, true};
        default: return std::nullopt;
    }
}

constexpr int kRelationalPrec = 4;
// Guard units (one per statement, type, or expression-level frame) before input is rejected.
constexpr int kMaxNesting = 1000;

std::optional<AssignOp> assign_op(TokenKind k){
    switch(k){
        case TokenKind::Assign: return AssignOp::Set;
        case TokenKind::PlusAssign: return AssignOp::Add;
        case TokenKind::MinusAssign: return AssignOp::Sub;
        case TokenKind::StarAssign: return AssignOp::Mul;
        case TokenKind::SlashAssign: return AssignOp::Div;
        default: return std::nullopt;
    }
}

bool is_lvalue(const ExprPtr& e){
    return std::holds_alternative<VariableExpr>(e->data) || std::holds_alternative<MemberExpr>(e->data) || std::holds_alternative<IndexExpr>(e->data);
}

// "a.b.c" for a chain of plain names, used to recognise builtin calls.
std::optional<std::string> dotted_name(const ExprPtr& e){
    if(auto v = std::get_if<VariableExpr>(&e->data)) return v->name;
    if(auto m = std::get_if<MemberExpr>(&e->data)){
        if(auto base = dotted_name(m->object)) return *base + "." + m->member;
    }
    return std::nullopt;
}

TypePtr cast_target(const std::string& word){
    if(word=="int" || word=="integer" || word=="long" || word=="byte") return DataType::integer();
    if(word=="double" || word=="float") return DataType::floating();
    if(word=="string") return DataType::string();
    if(word=="bool" || word=="boolean") return DataType::boolean();
    return nullptr;
}

std::string imported_context(const std::string& path, const ScriptError& e){
    return "in imported file '" + path + "' at line " + std::to_string(e.loc().line) + ", col " + std::to_string(e.loc().col) + ": ";
}

// State shared by a program and every file it imports.
struct ParseSession {
    std::shared_ptr<TypeRegistry> types;
    ImportLoader loader;
    std::unordered_set<std::string> functions; // lower-case
    std::unordered_set<std::string> varsets;   // lower-case
    std::vector<std::string> import_stack;     // file names, outermost first
    std::unordered_set<std::string> imported;
};

class ParserImpl {
public:
    ParserImpl(TokenStream toks, ParseSession& session, std::string source_name)
        : toks_(std::move(toks)), session_(session), types_(session.types), source_name_(std::move(source_name)),
          functions_(session.functions), varsets_(session.varsets) {}

    std::vector<StmtPtr> program(){
        std::vector<StmtPtr> out;
        while(!at(TokenKind::Eof)){
            if(auto s = statement()) out.push_back(std::move(s));
        }
        return out;
    }

    ExprPtr single_expression(){
        auto e = expression();
        expect(TokenKind::Eof, "after expression");
        return e;
    }

private:
    TokenStream toks_;
    size_t pos_ = 0;
    ParseSession& session_;
    std::shared_ptr<TypeRegistry> types_;
    std::string source_name_;
    int loop_depth_ = 0;
    int block_depth_ = 0;
    int nesting_ = 0;
    bool in_function_ = false;
    std::string pending_alias_;
    std::unordered_set<std::string>& functions_;
    std::unordered_set<std::string>& varsets_;

    struct NestingGuard {
        ParserImpl& p;
        NestingGuard(ParserImpl& parser): p(parser) {
            if(++p.nesting_ > kMaxNesting){
                --p.nesting_;
                throw ParseError("nesting too deep", p.peek().loc, "E2119");
            }
        }
        ~NestingGuard(){ --p.nesting_; }
    };

    // ---- token helpers ----
    const Token& peek(size_t ahead = 0) const { size_t i = pos_ + ahead; return i < toks_.size() ? toks_[i] : toks_.back(); }
    bool at(TokenKind k) const { return peek().kind == k; }
    bool at_type_word(const char* w) const { return peek().kind==TokenKind::TypeName && peek().text==w; }
    const Token& advance(){ const Token& t = toks_[pos_]; if(pos_ + 1 < toks_.size()) ++pos_; return t; }
    bool accept(TokenKind k){ if(at(k)){ advance(); return true; } return false; }

    [[noreturn]] void fail(const std::string& msg, const Token& t) const {
        std::string found = t.kind==TokenKind::Eof ? "end of input" : "'" + t.lexeme + "'";
        throw ParseError(msg + ", found " + found, t.loc);
    }
    const Token& expect(TokenKind k, const char* context){
        if(!at(k)) fail(std::string("expected ") + token_kind_name(k) + " " + context, peek());
        return advance();
    }
    // Names accept type words too so builtin namespaces like `json.parse` read naturally.
    bool at_name() const { return at(TokenKind::Ident) || at(TokenKind::TypeName); }
    std::string expect_name(const char* context){
        if(!at_name()) fail(std::string("expected identifier ") + context, peek());
        return advance().lexeme;
    }
    std::string expect_ident(const char* context){
        return expect(TokenKind::Ident, context).lexeme;
    }
    void expect_semi(const char* context){ expect(TokenKind::Semi, context); }

    // ---- statements ----
    StmtPtr statement(){
        NestingGuard nest(*this);
        const Token& t = peek();
        switch(t.kind){
            case TokenKind::Semi: advance(); return nullptr;
            case TokenKind::KwVar: case TokenKind::KwLet: case TokenKind::KwConst: {
                auto s = var_decl("");
                expect_semi("after variable declaration");
                return s;
            }
            case TokenKind::KwFunction: return function_decl();
            case TokenKind::KwIf: return if_stmt();
            case TokenKind::KwWhile: return while_stmt();
            case TokenKind::KwDo: return do_while_stmt();
            case TokenKind::KwFor: return for_stmt();
            case TokenKind::KwForeach: return foreach_stmt();
            case TokenKind::KwBreak: case TokenKind::KwContinue: {
                advance();
                if(loop_depth_==0) throw ParseError(std::string("'") + t.lexeme + "' outside of a loop", t.loc, "E2101");
                expect_semi("after loop control");
                if(t.kind==TokenKind::KwBreak) return make_stmt(BreakStmt{}, t.loc);
                return make_stmt(ContinueStmt{}, t.loc);
            }
            case TokenKind::KwReturn: {
                advance();
                ReturnStmt r;
                if(!at(TokenKind::Semi)) r.value = expression();
                expect_semi("after return");
                return make_stmt(std::move(r), t.loc);
            }
            case TokenKind::KwPrint: {
                advance();
                PrintStmt p;
                p.args.push_back(expression());
                while(accept(TokenKind::Comma)) p.args.push_back(expression());
                expect_semi("after print");
                return make_stmt(std::move(p), t.loc);
            }
            case TokenKind::KwTry: return try_stmt();
            case TokenKind::KwRaise: return raise_stmt();
            case TokenKind::KwVarset: return varset_decl();
            case TokenKind::KwImport: return import_stmt();
            case TokenKind::LBrace: return block();
            case TokenKind::KwCall: case TokenKind::Hash: {
                auto call = explicit_call();
                expect_semi("after call");
                return make_stmt(ExprStmt{call, true}, t.loc);
            }
            case TokenKind::Ident:
                if(peek(1).kind==TokenKind::KwTypeof) return type_decl();
                break;
            default: break;
        }
        auto e = expression();
        expect_semi("after expression");
        return make_stmt(ExprStmt{e, false}, t.loc);
    }

    StmtPtr block(){
        const Token& open = expect(TokenKind::LBrace, "to open block");
        BlockStmt b;
        ++block_depth_;
        while(!at(TokenKind::RBrace)){
            if(at(TokenKind::Eof)) fail("expected '}' to close block opened at line " + std::to_string(open.loc.line), peek());
            if(auto s = statement()) b.body.push_back(std::move(s));
        }
        --block_depth_;
        advance();
        return make_stmt(std::move(b), open.loc);
    }

    StmtPtr loop_body(){
        ++loop_depth_;
        auto body = statement_or_block();
        --loop_depth_;
        return body;
    }

    StmtPtr statement_or_block(){
        const Token& t = peek();
        if(at(TokenKind::KwFunction) || at(TokenKind::KwVarset)) fail("expected statement", t);
        ++block_depth_;
        auto s = statement();
        --block_depth_;
        if(!s) return make_stmt(BlockStmt{}, t.loc);
        return s;
    }

    StmtPtr var_decl(const std::string& varset){
        const Token& kw = advance();
        VarDeclStmt d;
        d.is_const = kw.kind==TokenKind::KwConst;
        d.name = expect_ident("in declaration");
        d.varset = varset;
        d.type = DataType::any();
        if(accept(TokenKind::Colon)){ d.type = parse_type(); d.typed = true; }
        if(accept(TokenKind::Assign)) d.init = expression();
        if(d.is_const && !d.init) throw ParseError("constant '" + d.name + "' requires an initializer", kw.loc, "E2102");
        return make_stmt(std::move(d), kw.loc);
    }

    StmtPtr type_decl(){
        const Token& name_tok = advance();
        advance(); // typeof
        TypeDeclStmt d;
        d.name = name_tok.lexeme;
        pending_alias_ = d.name;
        try {
            if(at_type_word("record")){
                advance();
                RecordType rec;
                rec.name = d.name;
                rec.fields = record_fields();
                types_->define_record(std::move(rec));
                d.type = DataType::record(d.name);
            } else {
                d.type = parse_type();
            }
            types_->define_alias(d.name, d.type);
        } catch(const TypeError& e) {
            pending_alias_.clear();
            throw TypeError(e.message(), name_tok.loc, e.code());
        }
        pending_alias_.clear();
        expect_semi("after type declaration");
        return make_stmt(std::move(d), name_tok.loc);
    }

    StmtPtr function_decl(){
        const Token& kw = advance();
        if(block_depth_>0 || in_function_) throw ParseError("functions may only be declared at top level", kw.loc, "E2103");
        FunctionDecl f;
        f.name = expect_ident("after 'function'");
        if(!functions_.insert(to_lower(f.name)).second) throw ParseError("function '" + f.name + "' is already declared", kw.loc, "E2104");
        expect(TokenKind::LParen, "after function name");
        std::unordered_set<std::string> seen;
        bool had_default = false;
        if(!at(TokenKind::RParen)){
            do {
                Param p;
                const Token& pt = peek();
                p.name = expect_ident("for parameter name");
                if(!seen.insert(to_lower(p.name)).second) throw ParseError("duplicate parameter '" + p.name + "'", pt.loc, "E2105");
                p.type = DataType::any();
                if(accept(TokenKind::Colon)){ p.type = parse_type(); p.typed = true; }
                if(accept(TokenKind::Assign)){ p.default_value = expression(); had_default = true; }
                else if(had_default) throw ParseError("parameter '" + p.name + "' without default follows a defaulted parameter", pt.loc, "E2106");
                f.params.push_back(std::move(p));
            } while(accept(TokenKind::Comma));
        }
        expect(TokenKind::RParen, "after parameters");
        if(accept(TokenKind::KwReturn)) f.return_type = parse_type();
        in_function_ = true;
        int saved_loops = loop_depth_; loop_depth_ = 0;
        f.body = block();
        loop_depth_ = saved_loops;
        in_function_ = false;
        return make_stmt(std::move(f), kw.loc);
    }

    StmtPtr if_stmt(){
        const Token& kw = advance();
        IfStmt s;
        s.cond = expression();
        accept(TokenKind::KwThen);
        s.then_branch = statement_or_block();
        if(accept(TokenKind::KwElse)) s.else_branch = statement_or_block();
        return make_stmt(std::move(s), kw.loc);
    }

    StmtPtr while_stmt(){
        const Token& kw = advance();
        WhileStmt s;
        s.cond = expression();
        s.body = loop_body();
        return make_stmt(std::move(s), kw.loc);
    }

    StmtPtr do_while_stmt(){
        const Token& kw = advance();
        DoWhileStmt s;
        s.body = loop_body();
        expect(TokenKind::KwWhile, "after do body");
        s.cond = expression();
        expect_semi("after do-while condition");
        return make_stmt(std::move(s), kw.loc);
    }

    StmtPtr for_stmt(){
        const Token& kw = advance();
        expect(TokenKind::LParen, "after 'for'");
        ForStmt s;
        if(!at(TokenKind::Semi)){
            const Token& it = peek();
            if(at(TokenKind::KwVar) || at(TokenKind::KwLet) || at(TokenKind::KwConst)) s.init = var_decl("");
            else s.init = make_stmt(ExprStmt{expression(), false}, it.loc);
        }
        expect_semi("after for initializer");
        if(!at(TokenKind::Semi)) s.cond = expression();
        expect_semi("after for condition");
        if(!at(TokenKind::RParen)) s.step = expression();
        expect(TokenKind::RParen, "after for clauses");
        s.body = loop_body();
        return make_stmt(std::move(s), kw.loc);
    }

    StmtPtr foreach_stmt(){
        const Token& kw = advance();
        ForEachStmt s;
        s.var = expect_ident("after 'foreach'");
        expect(TokenKind::KwIn, "after foreach variable");
        s.iterable = expression();
        s.body = loop_body();
        return make_stmt(std::move(s), kw.loc);
    }

    StmtPtr try_stmt(){
        const Token& kw = advance();
        TryStmt s;
        s.body = block();
        expect(TokenKind::KwExceptions, "after try block");
        expect(TokenKind::LBrace, "after 'exceptions'");
        while(at(TokenKind::KwWhen)){
            const Token& w = advance();
            Handler h;
            h.loc = w.loc;
            h.error_name = expect_ident("after 'when'");
            if(accept(TokenKind::LParen)){
                h.var = expect_ident("for error variable");
                expect(TokenKind::RParen, "after error variable");
            }
            h.body = block();
            s.handlers.push_back(std::move(h));
        }
        if(s.handlers.empty()) fail("expected at least one 'when' handler", peek());
        expect(TokenKind::RBrace, "after exception handlers");
        return make_stmt(std::move(s), kw.loc);
    }

    StmtPtr raise_stmt(){
        const Token& kw = advance();
        expect(TokenKind::KwException, "after 'raise'");
        RaiseStmt s;
        const Token& name_tok = peek();
        s.error_name = expect_ident("for exception name");
        expect(TokenKind::LParen, "after exception name");
        if(!at(TokenKind::RParen)){
            do { s.args.push_back(expression()); } while(accept(TokenKind::Comma));
        }
        expect(TokenKind::RParen, "after exception arguments");
        if(error_kind_from_name(s.error_name) && s.args.size() > 1)
            throw ParseError("standard exception '" + s.error_name + "' takes at most one message argument", name_tok.loc, "E2107");
        expect_semi("after raise");
        return make_stmt(std::move(s), kw.loc);
    }

    StmtPtr import_stmt(){
        const Token& kw = advance();
        if(block_depth_>0 || in_function_) throw ParseError("import may only appear at top level", kw.loc, "E2116");
        if(!at(TokenKind::String)) fail("expected file name string after 'import'", peek());
        ImportStmt s;
        s.path = advance().text;
        expect_semi("after import");

        std::optional<ImportSource> src;
        if(session_.loader) src = session_.loader(s.path, source_name_);
        if(!src) throw ParseError("cannot read imported file '" + s.path + "'", kw.loc, "E2117");
        auto& stack = session_.import_stack;
        for(size_t i=0;i<stack.size(); ++i){
            if(stack[i]!=src->name) continue;
            std::string chain;
            for(size_t j=i;j<stack.size(); ++j) chain += stack[j] + " -> ";
            throw ParseError("circular import: " + chain + src->name, kw.loc, "E2118");
        }
        if(!session_.imported.insert(src->name).second) return make_stmt(std::move(s), kw.loc);

        stack.push_back(src->name);
        struct Pop { std::vector<std::string>& st; ~Pop(){ st.pop_back(); } } pop{stack};
        try {
            ParserImpl nested(Lexer(src->name).tokenize(src->text), session_, src->name);
            s.body = nested.program();
        } catch(const TypeError& e) {
            throw TypeError(imported_context(s.path, e) + e.message(), kw.loc, e.code());
        } catch(const ScriptError& e) {
            if(e.code()=="E2118") throw ParseError(e.message(), kw.loc, e.code());
            throw ParseError(imported_context(s.path, e) + e.message(), kw.loc, e.code());
        }
        return make_stmt(std::move(s), kw.loc);
    }

    StmtPtr varset_decl(){
        const Token& kw = advance();
        if(block_depth_>0 || in_function_) throw ParseError("varset may only be declared at top level", kw.loc, "E2108");
        VarSetDecl d;
        d.name = expect_ident("after 'varset'");
        if(!varsets_.insert(to_lower(d.name)).second) throw ParseError("varset '" + d.name + "' is already declared", kw.loc, "E2109");
        const Token& scope_tok = peek();
        std::string scope = to_lower(scope_tok.lexeme);
        if(scope=="visible") d.scope = VarScope::Visible;
        else if(scope=="internal") d.scope = VarScope::Internal;
        else if(scope=="in") d.scope = VarScope::In;
        else if(scope=="out") d.scope = VarScope::Out;
        else if(scope=="inout") d.scope = VarScope::InOut;
        else fail("expected varset scope (visible, internal, in, out, inout)", scope_tok);
        advance();
        expect(TokenKind::LBrace, "after varset scope");
        while(!at(TokenKind::RBrace)){
            if(!(at(TokenKind::KwVar) || at(TokenKind::KwLet) || at(TokenKind::KwConst))) fail("expected variable declaration in varset", peek());
            d.vars.push_back(var_decl(d.name));
            expect_semi("after variable declaration");
        }
        advance();
        return make_stmt(std::move(d), kw.loc);
    }

    // ---- types ----
    std::vector<FieldDef> record_fields(){
        expect(TokenKind::LBrace, "after 'record'");
        std::vector<FieldDef> fields;
        if(!at(TokenKind::RBrace)){
            do {
                FieldDef f;
                if(at(TokenKind::String)) f.name = advance().text;
                else f.name = expect_name("for field name");
                expect(TokenKind::Colon, "after field name");
                f.type = parse_type();
                fields.push_back(std::move(f));
            } while(accept(TokenKind::Comma));
        }
        expect(TokenKind::RBrace, "to close record type");
        return fields;
    }

    TypePtr parse_type(){
        NestingGuard nest(*this);
        const Token& t = peek();
        TypePtr base;
        if(t.kind==TokenKind::TypeName){
            advance();
            const std::string& w = t.text;
            if(w=="int" || w=="integer" || w=="long" || w=="byte") base = DataType::integer();
            else if(w=="double" || w=="float") base = DataType::floating();
            else if(w=="string") base = DataType::string();
            else if(w=="bool" || w=="boolean") base = DataType::boolean();
            else if(w=="json") base = DataType::json();
            else if(w=="any") base = DataType::any();
            else if(w=="image") base = DataType::handle("image");
            else if(w=="record"){
                try { base = types_->define_anonymous_record(record_fields()); }
                catch(const TypeError& e){ throw TypeError(e.message(), t.loc, e.code()); }
            }
            else if(w=="array"){
                TypePtr elem = DataType::any();
                if(accept(TokenKind::Dot)) elem = parse_type();
                base = DataType::array_of(elem);
            }
            else if(w=="queue"){
                TypePtr elem = DataType::any();
                if(accept(TokenKind::Less)){ elem = parse_type(); expect(TokenKind::Greater, "to close queue<...>"); }
                base = DataType::queue_of(elem);
            }
            else if(w=="map"){
                TypePtr key = DataType::string(), value = DataType::any();
                if(accept(TokenKind::Less)){
                    key = parse_type();
                    if(key->kind!=TypeKind::String && key->kind!=TypeKind::Int) throw ParseError("map keys must be string or int", t.loc, "E2110");
                    expect(TokenKind::Comma, "between map key and value types");
                    value = parse_type();
                    expect(TokenKind::Greater, "to close map<...>");
                }
                base = DataType::map_of(key, value);
            }
        } else if(t.kind==TokenKind::Ident){
            advance();
            if(!pending_alias_.empty() && iequals(t.lexeme, pending_alias_)) base = DataType::record(pending_alias_);
            else base = types_->lookup(t.lexeme);
            if(!base) throw ParseError("unknown type '" + t.lexeme + "'", t.loc, "E2111");
        } else {
            fail("expected type", t);
        }
        while(at(TokenKind::LBracket)){
            const Token& open = advance();
            std::optional<size_t> cap;
            if(at(TokenKind::Int)){
                long long n = std::strtoll(advance().lexeme.c_str(), nullptr, 10);
                if(n <= 0) throw ParseError("array capacity must be positive", open.loc, "E2112");
                cap = static_cast<size_t>(n);
            } else {
                accept(TokenKind::Star);
            }
            expect(TokenKind::RBracket, "to close array type");
            base = DataType::array_of(base, cap);
        }
        return base;
    }

    // ---- expressions ----
    ExprPtr expression(){ return assignment(); }

    ExprPtr assignment(){
        NestingGuard nest(*this);
        auto lhs = ternary();
        if(auto op = assign_op(peek().kind)){
            const Token& t = advance();
            if(!is_lvalue(lhs)) throw ParseError("invalid assignment target", t.loc, "E2113");
            auto rhs = assignment();
            return make_expr(AssignExpr{*op, lhs, rhs}, t.loc);
        }
        return lhs;
    }

    ExprPtr ternary(){
        NestingGuard nest(*this);
        auto cond = binary(1);
        if(at(TokenKind::Question)){
            const Token& q = advance();
            auto then_e = expression();
            expect(TokenKind::Colon, "in conditional expression");
            auto else_e = ternary();
            return make_expr(TernaryExpr{cond, then_e, else_e}, q.loc);
        }
        return cond;
    }

    // Precedence climbing over the binary operator table. Two or more relational
    // operators in a row form one chained comparison.
    ExprPtr binary(int min_prec){
        NestingGuard nest(*this);
        auto lhs = unary();
        while(true){
            auto info = binary_info(peek().kind);
            if(!info || info->prec < min_prec) break;
            const Token& t = advance();
            auto rhs = binary(info->right_assoc ? info->prec : info->prec + 1);
            auto next = binary_info(peek().kind);
            if(info->prec==kRelationalPrec && next && next->prec==kRelationalPrec){
                ChainCompareExpr chain;
                chain.ops.push_back(info->op);
                chain.operands.push_back(lhs);
                chain.operands.push_back(rhs);
                while(true){
                    auto more = binary_info(peek().kind);
                    if(!more || more->prec!=kRelationalPrec) break;
                    advance();
                    chain.ops.push_back(more->op);
                    chain.operands.push_back(binary(kRelationalPrec + 1));
                }
                lhs = make_expr(std::move(chain), t.loc);
                continue;
            }
            lhs = make_expr(BinaryExpr{info->op, lhs, rhs}, t.loc);
        }
        return lhs;
    }

    ExprPtr unary(){
        NestingGuard nest(*this);
        const Token& t = peek();
        switch(t.kind){
            case TokenKind::Minus: advance(); return make_expr(UnaryExpr{UnaryOp::Neg, unary()}, t.loc);
            case TokenKind::Bang: case TokenKind::KwNot: advance(); return make_expr(UnaryExpr{UnaryOp::Not, unary()}, t.loc);
            case TokenKind::KwTypeof: advance(); return make_expr(UnaryExpr{UnaryOp::TypeOf, unary()}, t.loc);
            case TokenKind::Plus: advance(); return unary();
            case TokenKind::PlusPlus: case TokenKind::MinusMinus: {
                advance();
                auto target = unary();
                if(!is_lvalue(target)) throw ParseError("operand of '" + t.lexeme + "' must be assignable", t.loc, "E2113");
                return make_expr(IncDecExpr{t.kind==TokenKind::PlusPlus, true, target}, t.loc);
            }
            default: return postfix(primary());
        }
    }

    std::vector<Argument> call_args(){
        expect(TokenKind::LParen, "to open argument list");
        std::vector<Argument> args;
        bool named_seen = false;
        if(!at(TokenKind::RParen)){
            do {
                Argument a;
                const Token& at_tok = peek();
                if(at(TokenKind::Ident) && peek(1).kind==TokenKind::Assign){
                    a.name = advance().lexeme;
                    advance();
                    named_seen = true;
                } else if(named_seen) {
                    throw ParseError("positional argument after named argument", at_tok.loc, "E2114");
                }
                a.value = expression();
                args.push_back(std::move(a));
            } while(accept(TokenKind::Comma));
        }
        expect(TokenKind::RParen, "to close argument list");
        return args;
    }

    ExprPtr postfix(ExprPtr e){
        while(true){
            const Token& t = peek();
            if(t.kind==TokenKind::Dot){
                advance();
                std::string member = expect_name("after '.'");
                if(at(TokenKind::LParen)){
                    auto base = dotted_name(e);
                    if(!base) fail("expected builtin name before '('", peek());
                    e = make_expr(CallExpr{*base + "." + member, call_args(), true}, e->loc);
                } else {
                    e = make_expr(MemberExpr{e, member}, t.loc);
                }
            } else if(t.kind==TokenKind::LBracket){
                advance();
                auto idx = expression();
                expect(TokenKind::RBracket, "after index");
                e = make_expr(IndexExpr{e, idx}, t.loc);
            } else if(t.kind==TokenKind::LParen){
                auto v = std::get_if<VariableExpr>(&e->data);
                if(!v) fail("expression is not callable", t);
                std::string name = v->name;
                bool builtin = name.find('.')!=std::string::npos;
                e = make_expr(CallExpr{name, call_args(), builtin}, e->loc);
            } else if(t.kind==TokenKind::PlusPlus || t.kind==TokenKind::MinusMinus){
                if(!is_lvalue(e)) break;
                advance();
                e = make_expr(IncDecExpr{t.kind==TokenKind::PlusPlus, false, e}, t.loc);
            } else {
                break;
            }
        }
        return e;
    }

    ExprPtr explicit_call(){
        const Token& kw = advance(); // call / #
        std::string name = expect_name("for call target");
        while(accept(TokenKind::Dot)) name += "." + expect_name("in qualified name");
        bool builtin = name.find('.')!=std::string::npos;
        return make_expr(CallExpr{name, call_args(), builtin}, kw.loc);
    }

    ExprPtr primary(){
        const Token& t = peek();
        switch(t.kind){
            case TokenKind::Int: advance(); return make_expr(LiteralExpr{Value(static_cast<int64_t>(std::strtoll(t.lexeme.c_str(), nullptr, 10)))}, t.loc);
            case TokenKind::Double: advance(); return make_expr(LiteralExpr{Value(std::strtod(t.lexeme.c_str(), nullptr))}, t.loc);
            case TokenKind::String: advance(); return make_expr(LiteralExpr{Value(t.text)}, t.loc);
            case TokenKind::KwTrue: advance(); return make_expr(LiteralExpr{Value(true)}, t.loc);
            case TokenKind::KwFalse: advance(); return make_expr(LiteralExpr{Value(false)}, t.loc);
            case TokenKind::KwNull: advance(); return make_expr(LiteralExpr{Value()}, t.loc);
            case TokenKind::KwCall: case TokenKind::Hash: return explicit_call();
            case TokenKind::Ident: {
                advance();
                // VarSet members read as one qualified variable unless the chain is a builtin call.
                if(varsets_.count(to_lower(t.lexeme)) && peek().kind==TokenKind::Dot && peek(1).kind==TokenKind::Ident && peek(2).kind!=TokenKind::LParen){
                    advance();
                    const Token& member = advance();
                    return make_expr(VariableExpr{t.lexeme + "." + member.lexeme}, t.loc);
                }
                return make_expr(VariableExpr{t.lexeme}, t.loc);
            }
            case TokenKind::TypeName:
                if(peek(1).kind==TokenKind::Dot){ advance(); return make_expr(VariableExpr{t.lexeme}, t.loc); }
                if(peek(1).kind==TokenKind::LParen){
                    TypePtr target = cast_target(t.text);
                    if(!target) fail("'" + t.lexeme + "' cannot be used as a conversion", t);
                    advance();
                    advance();
                    auto operand = expression();
                    expect(TokenKind::RParen, "to close conversion");
                    return make_expr(CastExpr{target, operand}, t.loc);
                }
                break;
            case TokenKind::LParen: {
                advance();
                auto e = expression();
                expect(TokenKind::RParen, "to close parenthesized expression");
                return e;
            }
            case TokenKind::LBracket: {
                advance();
                ArrayLiteral a;
                if(!at(TokenKind::RBracket)){
                    do { a.elements.push_back(expression()); } while(accept(TokenKind::Comma));
                }
                expect(TokenKind::RBracket, "to close array literal");
                return make_expr(std::move(a), t.loc);
            }
            case TokenKind::LBrace: {
                advance();
                ObjectLiteral o;
                std::unordered_set<std::string> keys;
                if(!at(TokenKind::RBrace)){
                    do {
                        const Token& k = peek();
                        std::string key;
                        if(at(TokenKind::String)) key = advance().text;
                        else key = expect_name("or string for object key");
                        if(!keys.insert(to_lower(key)).second) throw ParseError("duplicate key '" + key + "' in object literal", k.loc, "E2115");
                        expect(TokenKind::Colon, "after object key");
                        o.entries.emplace_back(std::move(key), expression());
                    } while(accept(TokenKind::Comma));
                }
                expect(TokenKind::RBrace, "to close object literal");
                return make_expr(std::move(o), t.loc);
            }
            default: break;
        }
        fail("expected expression", t);
    }
};

std::string file_key(const std::string& path){
    std::error_code ec;
    if(!std::filesystem::exists(path, ec)) return path;
    auto canon = std::filesystem::weakly_canonical(path, ec);
    return ec ? path : canon.string();
}

} // namespace

std::optional<ImportSource> load_import_file(const std::string& path, const std::string& from){
    std::filesystem::path p(path);
    if(p.is_relative()) p = std::filesystem::path(from).parent_path() / p;
    std::ifstream ifs(p);
    if(!ifs) return std::nullopt;
    std::stringstream ss; ss << ifs.rdbuf();
    return ImportSource{file_key(p.string()), ss.str()};
}

ProgramPtr Parser::parse(std::string_view src, std::string_view filename) const {
    ParseSession session;
    session.types = types_ ? std::make_shared<TypeRegistry>(*types_) : std::make_shared<TypeRegistry>();
    session.loader = loader_;
    std::string root = std::string(filename);
    std::string root_key = file_key(root);
    session.import_stack.push_back(root_key);
    session.imported.insert(root_key);
    TokenStream toks = Lexer(root).tokenize(src);
    ParserImpl impl(std::move(toks), session, root_key);
    auto prog = std::make_shared<Program>();
    prog->source_name = root;
    prog->body = impl.program();
    prog->types = std::move(session.types);
    return prog;
}

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    ParseResult r;
    try {
        r.program = parse(src, filename);
        r.success = true;
    } catch(const ScriptError& e) {
        r.success = false;
        r.error_message = e.what();
        r.error_code = e.code();
        r.line = e.loc().line;
        r.column = e.loc().col;
    }
    return r;
}

ExprPtr Parser::parse_expression(std::string_view src) const {
    ParseSession session;
    session.types = types_ ? std::make_shared<TypeRegistry>(*types_) : std::make_shared<TypeRegistry>();
    ParserImpl impl(Lexer("<expr>").tokenize(src), session, "<expr>");
    return impl.single_expression();
}

} // namespace ebs
