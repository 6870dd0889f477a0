// Source rendering of syntax trees. The output parses back to an equal tree.
#pragma once
#include <string>
#include "ebs/ast.hpp"

namespace ebs {

std::string to_source(const Program& prog, int indentWidth = 4);
std::string to_source(const Expr& e);
// Quoted, escaped string literal.
std::string quote_string(const std::string& s);

} // namespace ebs
