#pragma once
#include <tao/pegtl.hpp>

namespace ebs::lex_grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct line_comment : seq< two<'/'>, until< eolf > > {};
struct block_comment_body : until< string<'*','/'> > {};
struct block_comment : if_must< string<'/','*'>, block_comment_body > {};
struct blank : plus< space > {};
struct skip : sor< blank, line_comment, block_comment > {};

// Numbers: 12, 1.5, 2e10, 3.25E-2
struct exponent_digits : plus< digit > {};
struct exponent : if_must< one<'e','E'>, opt< one<'+','-'> >, exponent_digits > {};
struct fraction : seq< one<'.'>, plus< digit > > {};
struct number : seq< plus< digit >, opt< fraction >, opt< exponent > > {};

// Strings: '...' or "..." with backslash escapes, no raw newlines
struct unicode_escape : seq< one<'u'>, rep< 4, xdigit > > {};
struct escape_code : sor< one<'n','t','r','0','\\','"','\'','/'>, unicode_escape > {};
struct escape : if_must< one<'\\'>, escape_code > {};
template<char Q> struct string_char : sor< escape, not_one< Q, '\\', '\n', '\r' > > {};
template<char Q> struct string_body : until< one<Q>, string_char<Q> > {};
struct dq_string : if_must< one<'"'>, string_body<'"'> > {};
struct sq_string : if_must< one<'\''>, string_body<'\''> > {};

struct word : identifier {};

// Longest match: two-character operators are tried first.
struct op2 : sor< string<'+','+'>, string<'-','-'>, string<'+','='>, string<'-','='>,
                  string<'*','='>, string<'/','='>, string<'=','='>, string<'!','='>,
                  string<'<','='>, string<'>','='>, string<'&','&'>, string<'|','|'> > {};
struct op1 : one< '(', ')', '[', ']', '{', '}', ',', ';', ':', '.', '?', '#',
                  '+', '-', '*', '/', '%', '^', '!', '=', '<', '>' > {};
struct op : sor< op2, op1 > {};

struct token : sor< skip, number, dq_string, sq_string, word, op > {};
struct file : seq< star< token >, must< eof > > {};

} // namespace ebs::lex_grammar
