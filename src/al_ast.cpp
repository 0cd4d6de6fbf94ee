#include "al_ast.hpp"

namespace asmlower {

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::FunctionDef:     return "FunctionDef";
        case NodeKind::Assign:          return "Assign";
        case NodeKind::AugAssign:       return "AugAssign";
        case NodeKind::Return:          return "Return";
        case NodeKind::ExprStatement:   return "Expr";
        case NodeKind::If:              return "If";
        case NodeKind::While:           return "While";
        case NodeKind::BinaryOp:        return "BinOp";
        case NodeKind::Compare:         return "Compare";
        case NodeKind::Call:            return "Call";
        case NodeKind::ListLiteral:     return "List";
        case NodeKind::DictLiteral:     return "Dict";
        case NodeKind::Subscript:       return "Subscript";
        case NodeKind::AttributeAccess: return "Attribute";
        case NodeKind::NameRef:         return "Name";
        case NodeKind::Constant:        return "Constant";
    }
    return "<unknown>";
}

const char* binary_operator_name(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Add:  return "Add";
        case BinaryOperator::Sub:  return "Sub";
        case BinaryOperator::Mult: return "Mult";
        case BinaryOperator::Div:  return "Div";
        case BinaryOperator::Mod:  return "Mod";
    }
    return "<unknown>";
}

const char* compare_operator_name(CompareOperator op) {
    switch (op) {
        case CompareOperator::Greater:      return "Gt";
        case CompareOperator::Less:         return "Lt";
        case CompareOperator::Equal:        return "Eq";
        case CompareOperator::NotEqual:     return "NotEq";
        case CompareOperator::LessEqual:    return "LtE";
        case CompareOperator::GreaterEqual: return "GtE";
    }
    return "<unknown>";
}

} // namespace asmlower
