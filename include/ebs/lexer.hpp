#pragma once
#include <string>
#include <string_view>
#include "ebs/token.hpp"

namespace ebs {

// Source text -> token stream. Throws LexError and produces nothing on the first
// unterminated string/comment, bad escape or illegal character.
class Lexer {
public:
    explicit Lexer(std::string source_name = "<memory>"): source_name_(std::move(source_name)) {}
    TokenStream tokenize(std::string_view src) const;
    const std::string& source_name() const { return source_name_; }
private:
    std::string source_name_;
};

inline TokenStream tokenize(std::string_view src, std::string source_name = "<memory>"){ return Lexer(std::move(source_name)).tokenize(src); }

} // namespace ebs
