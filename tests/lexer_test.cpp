#include <gtest/gtest.h>
#include "ebs/lexer.hpp"

using namespace ebs;

namespace {

std::vector<TokenKind> kinds(const TokenStream& ts){
    std::vector<TokenKind> out;
    for(const auto& t : ts) out.push_back(t.kind);
    return out;
}

} // namespace

TEST(Lexer, NumbersStringsAndNames){
    auto ts = tokenize("count 42 2.5 1e3 \"hi\\n\" 'it\\'s'");
    ASSERT_EQ(ts.size(), 7u);
    EXPECT_EQ(ts[0].kind, TokenKind::Ident);
    EXPECT_EQ(ts[0].lexeme, "count");
    EXPECT_EQ(ts[1].kind, TokenKind::Int);
    EXPECT_EQ(ts[2].kind, TokenKind::Double);
    EXPECT_EQ(ts[3].kind, TokenKind::Double);
    EXPECT_EQ(ts[4].kind, TokenKind::String);
    EXPECT_EQ(ts[4].text, "hi\n");
    EXPECT_EQ(ts[5].text, "it's");
    EXPECT_EQ(ts[6].kind, TokenKind::Eof);
}

TEST(Lexer, UnicodeEscapeDecodesToUtf8){
    auto ts = tokenize("\"\\u00e9\"");
    EXPECT_EQ(ts[0].text, "\xC3\xA9");
}

TEST(Lexer, SurrogatePairsCombine){
    auto ts = tokenize("\"\\uD83D\\uDE00!\" '\\ud834\\udd1e'");
    EXPECT_EQ(ts[0].text, "\xF0\x9F\x98\x80!");
    EXPECT_EQ(ts[1].text, "\xF0\x9D\x84\x9E");
}

TEST(Lexer, LoneSurrogatesAreLexErrors){
    for(const char* src : {"\"\\uD83D\"", "\"\\uDE00\"", "\"\\uD83Dx\"", "\"\\uD83D\\u0041\"", "\"\\uD83D\\n\""}){
        SCOPED_TRACE(src);
        try {
            tokenize(std::string("var s = ") + src + ";");
            FAIL() << "expected LexError";
        } catch(const LexError& e) {
            EXPECT_EQ(e.code(), "E1001");
            EXPECT_NE(e.message().find("surrogate"), std::string::npos) << e.message();
            EXPECT_EQ(e.loc().col, 9);
        }
    }
}

TEST(Lexer, ReservedWordsAreCaseInsensitive){
    auto ts = tokenize("VAR Function WHILE exit record Int");
    EXPECT_EQ(ts[0].kind, TokenKind::KwVar);
    EXPECT_EQ(ts[1].kind, TokenKind::KwFunction);
    EXPECT_EQ(ts[2].kind, TokenKind::KwWhile);
    EXPECT_EQ(ts[3].kind, TokenKind::KwBreak);
    EXPECT_EQ(ts[4].kind, TokenKind::TypeName);
    EXPECT_EQ(ts[5].kind, TokenKind::TypeName);
    EXPECT_EQ(ts[5].text, "int");
    EXPECT_EQ(ts[5].lexeme, "Int");
}

TEST(Lexer, OperatorsUseLongestMatch){
    auto ts = tokenize("a++ += -- -= == != <= >= && || = < !");
    std::vector<TokenKind> want = {TokenKind::Ident, TokenKind::PlusPlus, TokenKind::PlusAssign, TokenKind::MinusMinus,
                                   TokenKind::MinusAssign, TokenKind::Eq, TokenKind::NotEq, TokenKind::LessEq, TokenKind::GreaterEq,
                                   TokenKind::AndAnd, TokenKind::OrOr, TokenKind::Assign, TokenKind::Less, TokenKind::Bang, TokenKind::Eof};
    EXPECT_EQ(kinds(ts), want);
}

TEST(Lexer, CommentsAreSkippedAndPositionsTracked){
    auto ts = tokenize("// header\nvar /* inline\n comment */ x;\n");
    ASSERT_EQ(ts.size(), 4u);
    EXPECT_EQ(ts[0].kind, TokenKind::KwVar);
    EXPECT_EQ(ts[0].loc.line, 2);
    EXPECT_EQ(ts[0].loc.col, 1);
    EXPECT_EQ(ts[1].lexeme, "x");
    EXPECT_EQ(ts[1].loc.line, 3);
    EXPECT_EQ(ts[1].loc.col, 13);
}

TEST(Lexer, UnterminatedStringIsLexError){
    try {
        tokenize("var s = \"abc");
        FAIL() << "expected LexError";
    } catch(const LexError& e) {
        EXPECT_NE(std::string(e.message()).find("unterminated string"), std::string::npos);
        EXPECT_EQ(e.loc().line, 1);
    }
}

TEST(Lexer, StringMayNotSpanLines){
    EXPECT_THROW(tokenize("\"abc\ndef\""), LexError);
}

TEST(Lexer, UnterminatedBlockCommentIsLexError){
    try {
        tokenize("x /* never closed");
        FAIL() << "expected LexError";
    } catch(const LexError& e) {
        EXPECT_NE(std::string(e.message()).find("block comment"), std::string::npos);
    }
}

TEST(Lexer, BadEscapeIsLexError){
    EXPECT_THROW(tokenize("'\\q'"), LexError);
}

TEST(Lexer, IllegalCharacterNamesTheCharacter){
    try {
        tokenize("var x = 1 @ 2;");
        FAIL() << "expected LexError";
    } catch(const LexError& e) {
        EXPECT_NE(std::string(e.message()).find("'@'"), std::string::npos);
        EXPECT_EQ(e.loc().col, 11);
        EXPECT_EQ(e.code(), "E1001");
    }
}
