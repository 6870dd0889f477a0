// Token kinds and reserved-word tables.
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "ebs/errors.hpp"

namespace ebs
{

    enum class TokenKind
    {
        // literals / names
        Int,
        Double,
        String,
        Ident,
        // reserved words
        KwVar,
        KwLet,
        KwConst,
        KwFunction,
        KwReturn,
        KwIf,
        KwThen,
        KwElse,
        KwWhile,
        KwDo,
        KwFor,
        KwForeach,
        KwIn,
        KwBreak,
        KwContinue,
        KwCall,
        KwPrint,
        KwTypeof,
        KwTrue,
        KwFalse,
        KwNull,
        KwAnd,
        KwOr,
        KwNot,
        KwTry,
        KwExceptions,
        KwWhen,
        KwRaise,
        KwException,
        KwImport,
        KwVarset,
        TypeName, // int, string, record, queue, ... (lexeme says which)
        // punctuation / operators
        LParen,
        RParen,
        LBracket,
        RBracket,
        LBrace,
        RBrace,
        Comma,
        Semi,
        Colon,
        Dot,
        Question,
        Hash,
        Plus,
        Minus,
        Star,
        Slash,
        Percent,
        Caret,
        Bang,
        Assign,
        PlusAssign,
        MinusAssign,
        StarAssign,
        SlashAssign,
        PlusPlus,
        MinusMinus,
        Eq,
        NotEq,
        Less,
        LessEq,
        Greater,
        GreaterEq,
        AndAnd,
        OrOr,
        Eof
    };

    struct Token
    {
        TokenKind kind = TokenKind::Eof;
        std::string lexeme; // source spelling
        std::string text;   // decoded value for String; lower-cased spelling for reserved words
        SourceLoc loc;
    };

    using TokenStream = std::vector<Token>;

    const char *token_kind_name(TokenKind k);

    // Reserved-word lookup is case-insensitive; returns Ident when `word` is not reserved.
    TokenKind keyword_kind(std::string_view word);

    // Operator / punctuation lookup for an exact spelling; Eof when unknown.
    TokenKind operator_kind(std::string_view op);

} // namespace ebs
