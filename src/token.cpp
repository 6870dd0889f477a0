#include "ebs/token.hpp"
#include "ebs/strings.hpp"
#include <unordered_map>

namespace ebs {

namespace {

const std::unordered_map<std::string, TokenKind>& keyword_table(){
    static const std::unordered_map<std::string, TokenKind> t = {
        {"var", TokenKind::KwVar}, {"let", TokenKind::KwLet}, {"const", TokenKind::KwConst},
        {"function", TokenKind::KwFunction}, {"return", TokenKind::KwReturn},
        {"if", TokenKind::KwIf}, {"then", TokenKind::KwThen}, {"else", TokenKind::KwElse},
        {"while", TokenKind::KwWhile}, {"do", TokenKind::KwDo}, {"for", TokenKind::KwFor},
        {"foreach", TokenKind::KwForeach}, {"in", TokenKind::KwIn},
        {"break", TokenKind::KwBreak}, {"exit", TokenKind::KwBreak}, {"continue", TokenKind::KwContinue},
        {"call", TokenKind::KwCall}, {"print", TokenKind::KwPrint}, {"typeof", TokenKind::KwTypeof},
        {"true", TokenKind::KwTrue}, {"false", TokenKind::KwFalse}, {"null", TokenKind::KwNull},
        {"and", TokenKind::KwAnd}, {"or", TokenKind::KwOr}, {"not", TokenKind::KwNot},
        {"try", TokenKind::KwTry}, {"exceptions", TokenKind::KwExceptions}, {"when", TokenKind::KwWhen},
        {"raise", TokenKind::KwRaise}, {"exception", TokenKind::KwException}, {"import", TokenKind::KwImport},
        {"varset", TokenKind::KwVarset},
        // type names share one kind; the parser looks at the spelling
        {"int", TokenKind::TypeName}, {"integer", TokenKind::TypeName}, {"long", TokenKind::TypeName},
        {"byte", TokenKind::TypeName}, {"float", TokenKind::TypeName}, {"double", TokenKind::TypeName},
        {"string", TokenKind::TypeName}, {"bool", TokenKind::TypeName}, {"boolean", TokenKind::TypeName},
        {"json", TokenKind::TypeName}, {"array", TokenKind::TypeName}, {"queue", TokenKind::TypeName},
        {"map", TokenKind::TypeName}, {"record", TokenKind::TypeName}, {"image", TokenKind::TypeName},
        {"any", TokenKind::TypeName},
    };
    return t;
}

const std::unordered_map<std::string_view, TokenKind>& operator_table(){
    static const std::unordered_map<std::string_view, TokenKind> t = {
        {"(", TokenKind::LParen}, {")", TokenKind::RParen}, {"[", TokenKind::LBracket}, {"]", TokenKind::RBracket},
        {"{", TokenKind::LBrace}, {"}", TokenKind::RBrace}, {",", TokenKind::Comma}, {";", TokenKind::Semi},
        {":", TokenKind::Colon}, {".", TokenKind::Dot}, {"?", TokenKind::Question}, {"#", TokenKind::Hash},
        {"+", TokenKind::Plus}, {"-", TokenKind::Minus}, {"*", TokenKind::Star}, {"/", TokenKind::Slash},
        {"%", TokenKind::Percent}, {"^", TokenKind::Caret}, {"!", TokenKind::Bang}, {"=", TokenKind::Assign},
        {"+=", TokenKind::PlusAssign}, {"-=", TokenKind::MinusAssign}, {"*=", TokenKind::StarAssign}, {"/=", TokenKind::SlashAssign},
        {"++", TokenKind::PlusPlus}, {"--", TokenKind::MinusMinus}, {"==", TokenKind::Eq}, {"!=", TokenKind::NotEq},
        {"<", TokenKind::Less}, {"<=", TokenKind::LessEq}, {">", TokenKind::Greater}, {">=", TokenKind::GreaterEq},
        {"&&", TokenKind::AndAnd}, {"||", TokenKind::OrOr},
    };
    return t;
}

} // namespace

TokenKind keyword_kind(std::string_view word){
    auto& t = keyword_table();
    auto it = t.find(to_lower(word));
    return it==t.end() ? TokenKind::Ident : it->second;
}

TokenKind operator_kind(std::string_view op){
    auto& t = operator_table();
    auto it = t.find(op);
    return it==t.end() ? TokenKind::Eof : it->second;
}

const char* token_kind_name(TokenKind k){
    switch(k){
        case TokenKind::Int: return "integer literal";
        case TokenKind::Double: return "floating literal";
        case TokenKind::String: return "string literal";
        case TokenKind::Ident: return "identifier";
        case TokenKind::TypeName: return "type name";
        case TokenKind::LParen: return "'('"; case TokenKind::RParen: return "')'";
        case TokenKind::LBracket: return "'['"; case TokenKind::RBracket: return "']'";
        case TokenKind::LBrace: return "'{'"; case TokenKind::RBrace: return "'}'";
        case TokenKind::Comma: return "','"; case TokenKind::Semi: return "';'";
        case TokenKind::Colon: return "':'"; case TokenKind::Dot: return "'.'";
        case TokenKind::Assign: return "'='";
        case TokenKind::Eof: return "end of input";
        default: break;
    }
    if(k>=TokenKind::KwVar && k<=TokenKind::KwVarset) return "keyword";
    return "operator";
}

} // namespace ebs
