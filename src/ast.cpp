#include "ebs/ast.hpp"

namespace ebs {

const char* binary_op_spelling(BinaryOp op){
    switch(op){
        case BinaryOp::Add: return "+";
        case BinaryOp::Sub: return "-";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
        case BinaryOp::Mod: return "%";
        case BinaryOp::Pow: return "^";
        case BinaryOp::Eq: return "==";
        case BinaryOp::NotEq: return "!=";
        case BinaryOp::Less: return "<";
        case BinaryOp::LessEq: return "<=";
        case BinaryOp::Greater: return ">";
        case BinaryOp::GreaterEq: return ">=";
        case BinaryOp::And: return "&&";
        case BinaryOp::Or: return "||";
    }
    return "?";
}

const char* assign_op_spelling(AssignOp op){
    switch(op){
        case AssignOp::Set: return "=";
        case AssignOp::Add: return "+=";
        case AssignOp::Sub: return "-=";
        case AssignOp::Mul: return "*=";
        case AssignOp::Div: return "/=";
    }
    return "?";
}

const char* var_scope_name(VarScope s){
    switch(s){
        case VarScope::Visible: return "visible";
        case VarScope::Internal: return "internal";
        case VarScope::In: return "in";
        case VarScope::Out: return "out";
        case VarScope::InOut: return "inout";
    }
    return "?";
}

} // namespace ebs
