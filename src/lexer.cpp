#include "ebs/lexer.hpp"
#include "ebs/strings.hpp"
#include "lexer_grammar.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <type_traits>

namespace ebs {

namespace {

namespace g = lex_grammar;

struct LexState {
    TokenStream tokens;
};

template<typename Position>
SourceLoc loc_of(const Position& p){ return SourceLoc{static_cast<int>(p.line), static_cast<int>(p.column)}; }

template<typename Rule> struct lex_message { static constexpr const char* text = nullptr; };
template<> struct lex_message<g::string_body<'"'>> { static constexpr const char* text = "unterminated string literal"; };
template<> struct lex_message<g::string_body<'\''>> { static constexpr const char* text = "unterminated string literal"; };
template<> struct lex_message<g::escape_code> { static constexpr const char* text = "invalid escape sequence in string literal"; };
template<> struct lex_message<g::block_comment_body> { static constexpr const char* text = "unterminated block comment"; };
template<> struct lex_message<g::exponent_digits> { static constexpr const char* text = "malformed exponent in numeric literal"; };

// Every must<> failure becomes a LexError at the failing position.
template<typename Rule>
struct lex_control : tao::pegtl::normal<Rule> {
    template<typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&... /*unused*/){
        if constexpr (std::is_same_v<Rule, tao::pegtl::eof>){
            std::string msg = "illegal character";
            if(!in.empty()){
                unsigned char c = static_cast<unsigned char>(in.peek_char());
                if(c>=0x20 && c<0x7f) msg += std::string(" '") + static_cast<char>(c) + "'";
                else { char buf[16]; std::snprintf(buf, sizeof(buf), " 0x%02X", c); msg += buf; }
            }
            throw LexError(msg, loc_of(in.position()));
        } else if constexpr (lex_message<Rule>::text != nullptr){
            throw LexError(lex_message<Rule>::text, loc_of(in.position()));
        } else {
            throw LexError("unexpected input", loc_of(in.position()));
        }
    }
};

void append_utf8(std::string& out, unsigned cp){
    if(cp < 0x80){ out += static_cast<char>(cp); }
    else if(cp < 0x800){ out += static_cast<char>(0xC0 | (cp>>6)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    else if(cp < 0x10000){ out += static_cast<char>(0xE0 | (cp>>12)); out += static_cast<char>(0x80 | ((cp>>6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    else {
        out += static_cast<char>(0xF0 | (cp>>18));
        out += static_cast<char>(0x80 | ((cp>>12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp>>6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool is_high_surrogate(unsigned cp){ return cp >= 0xD800 && cp <= 0xDBFF; }
bool is_low_surrogate(unsigned cp){ return cp >= 0xDC00 && cp <= 0xDFFF; }

unsigned hex4(std::string_view raw, size_t at){
    return static_cast<unsigned>(std::stoul(std::string(raw.substr(at, 4)), nullptr, 16));
}

// Body of a quoted literal (quotes stripped); escapes were validated by the grammar.
// A \u escape naming a UTF-16 surrogate must be a high half immediately followed by a low half.
std::string decode_string(std::string_view raw, SourceLoc loc){
    std::string out; out.reserve(raw.size());
    for(size_t i=0;i<raw.size();++i){
        char c = raw[i];
        if(c!='\\'){ out += c; continue; }
        char e = raw[++i];
        switch(e){
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case '0': out += '\0'; break;
            case 'u': {
                unsigned cp = hex4(raw, i+1);
                i += 4;
                if(is_low_surrogate(cp)) throw LexError("unpaired low surrogate in \\u escape", loc);
                if(is_high_surrogate(cp)){
                    if(i + 6 >= raw.size() || raw[i+1]!='\\' || raw[i+2]!='u') throw LexError("unpaired high surrogate in \\u escape", loc);
                    unsigned lo = hex4(raw, i+3);
                    if(!is_low_surrogate(lo)) throw LexError("unpaired high surrogate in \\u escape", loc);
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    i += 6;
                }
                append_utf8(out, cp);
                break;
            }
            default: out += e; break; // \\ \" \' \/
        }
    }
    return out;
}

template<typename Rule> struct lex_action : tao::pegtl::nothing<Rule> {};

template<> struct lex_action<g::number> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, LexState& st){
        Token t; t.lexeme = in.string(); t.loc = loc_of(in.position());
        bool is_double = t.lexeme.find_first_of(".eE") != std::string::npos;
        t.kind = is_double ? TokenKind::Double : TokenKind::Int;
        if(!is_double){
            errno = 0;
            (void)std::strtoll(t.lexeme.c_str(), nullptr, 10);
            if(errno==ERANGE) throw LexError("integer literal out of range: " + t.lexeme, t.loc);
        }
        t.text = t.lexeme;
        st.tokens.push_back(std::move(t));
    }
};

template<typename Rule>
struct string_action {
    template<typename ActionInput>
    static void apply(const ActionInput& in, LexState& st){
        Token t; t.kind = TokenKind::String; t.lexeme = in.string(); t.loc = loc_of(in.position());
        t.text = decode_string(std::string_view(t.lexeme).substr(1, t.lexeme.size()-2), t.loc);
        st.tokens.push_back(std::move(t));
    }
};
template<> struct lex_action<g::dq_string> : string_action<g::dq_string> {};
template<> struct lex_action<g::sq_string> : string_action<g::sq_string> {};

template<> struct lex_action<g::word> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, LexState& st){
        Token t; t.lexeme = in.string(); t.loc = loc_of(in.position());
        t.kind = keyword_kind(t.lexeme);
        t.text = t.kind==TokenKind::Ident ? t.lexeme : to_lower(t.lexeme);
        st.tokens.push_back(std::move(t));
    }
};

template<> struct lex_action<g::op> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, LexState& st){
        Token t; t.lexeme = in.string(); t.text = t.lexeme; t.loc = loc_of(in.position());
        t.kind = operator_kind(t.lexeme);
        st.tokens.push_back(std::move(t));
    }
};

} // namespace

TokenStream Lexer::tokenize(std::string_view src) const {
    tao::pegtl::memory_input in(src.data(), src.size(), source_name_);
    LexState st;
    tao::pegtl::parse<g::file, lex_action, lex_control>(in, st);
    Token eof; eof.kind = TokenKind::Eof; eof.loc = loc_of(in.position());
    st.tokens.push_back(std::move(eof));
    return std::move(st.tokens);
}

} // namespace ebs
