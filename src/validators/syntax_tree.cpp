/**
 * @file syntax_tree.cpp
 * @brief Syntax tree node helpers
 * @date 2025
 */

#include "warden/validators/syntax_tree.hpp"

#include <iomanip>
#include <sstream>

namespace warden {
namespace validators {

std::string Node::Dump() const {
    std::ostringstream oss;
    oss << "(" << ToString(kind);
    if (!text.empty()) {
        oss << " " << std::quoted(text);
    }
    if (!alias.empty()) {
        oss << " as " << std::quoted(alias);
    }
    for (const auto& child : children) {
        oss << " " << child->Dump();
    }
    oss << ")";
    return oss.str();
}

bool IsExpressionKind(NodeKind kind) {
    return static_cast<int>(kind) >= static_cast<int>(NodeKind::NAME);
}

std::string ToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::MODULE:         return "Module";
        case NodeKind::BLOCK:          return "Block";
        case NodeKind::EXPR_STMT:      return "Expr";
        case NodeKind::ASSIGN:         return "Assign";
        case NodeKind::AUG_ASSIGN:     return "AugAssign";
        case NodeKind::ANN_ASSIGN:     return "AnnAssign";
        case NodeKind::IMPORT:         return "Import";
        case NodeKind::IMPORT_FROM:    return "ImportFrom";
        case NodeKind::ALIAS:          return "Alias";
        case NodeKind::FUNCTION_DEF:   return "FunctionDef";
        case NodeKind::CLASS_DEF:      return "ClassDef";
        case NodeKind::DECORATOR:      return "Decorator";
        case NodeKind::ARGUMENTS:      return "Arguments";
        case NodeKind::ARG:            return "Arg";
        case NodeKind::IF:             return "If";
        case NodeKind::FOR:            return "For";
        case NodeKind::WHILE:          return "While";
        case NodeKind::TRY:            return "Try";
        case NodeKind::EXCEPT_HANDLER: return "ExceptHandler";
        case NodeKind::WITH:           return "With";
        case NodeKind::WITH_ITEM:      return "WithItem";
        case NodeKind::RETURN:         return "Return";
        case NodeKind::RAISE:          return "Raise";
        case NodeKind::ASSERT:         return "Assert";
        case NodeKind::DELETE:         return "Delete";
        case NodeKind::GLOBAL:         return "Global";
        case NodeKind::NONLOCAL:       return "Nonlocal";
        case NodeKind::PASS:           return "Pass";
        case NodeKind::BREAK:          return "Break";
        case NodeKind::CONTINUE:       return "Continue";
        case NodeKind::NAME:           return "Name";
        case NodeKind::NUMBER:         return "Number";
        case NodeKind::STRING:         return "String";
        case NodeKind::JOINED_STRING:  return "JoinedString";
        case NodeKind::CONSTANT:       return "Constant";
        case NodeKind::ATTRIBUTE:      return "Attribute";
        case NodeKind::CALL:           return "Call";
        case NodeKind::KEYWORD:        return "Keyword";
        case NodeKind::STARRED:        return "Starred";
        case NodeKind::SUBSCRIPT:      return "Subscript";
        case NodeKind::SLICE:          return "Slice";
        case NodeKind::BIN_OP:         return "BinOp";
        case NodeKind::UNARY_OP:       return "UnaryOp";
        case NodeKind::BOOL_OP:        return "BoolOp";
        case NodeKind::COMPARE:        return "Compare";
        case NodeKind::IF_EXP:         return "IfExp";
        case NodeKind::NAMED_EXPR:     return "NamedExpr";
        case NodeKind::LAMBDA:         return "Lambda";
        case NodeKind::AWAIT:          return "Await";
        case NodeKind::YIELD:          return "Yield";
        case NodeKind::LIST:           return "List";
        case NodeKind::TUPLE:          return "Tuple";
        case NodeKind::SET:            return "Set";
        case NodeKind::DICT:           return "Dict";
        case NodeKind::LIST_COMP:      return "ListComp";
        case NodeKind::SET_COMP:       return "SetComp";
        case NodeKind::DICT_COMP:      return "DictComp";
        case NodeKind::GENERATOR_EXP:  return "GeneratorExp";
        case NodeKind::COMPREHENSION:  return "Comprehension";
    }
    return "Unknown";
}

} // namespace validators
} // namespace warden
