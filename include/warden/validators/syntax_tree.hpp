/**
 * @file syntax_tree.hpp
 * @brief Generic tagged-node syntax tree consumed by the capability validator
 *
 * Every construct of the script language maps onto one Node with a kind
 * tag, an optional text payload and ordered children. The validator never
 * needs language reflection; it walks this tree and classifies nodes by tag.
 *
 * **Child Layout** (selected kinds):
 * - CALL:        [callee, arg...]  (keyword args are KEYWORD nodes)
 * - ATTRIBUTE:   [value]           text = attribute name
 * - IMPORT:      [ALIAS...]        ALIAS.text = dotted module, ALIAS.alias = as-name
 * - IMPORT_FROM: [ALIAS...]        text = module
 * - IF:          [test, BLOCK, (BLOCK | IF)?]
 * - FOR:         [target, iter, BLOCK, BLOCK?]
 * - TRY:         [BLOCK, EXCEPT_HANDLER..., BLOCK("else")?, BLOCK("finally")?]
 * - FUNCTION_DEF:[ARGUMENTS, DECORATOR..., BLOCK]   text = name
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace warden {
namespace validators {

/**
 * @enum NodeKind
 * @brief Syntax tree node tags
 */
enum class NodeKind {
    // Structure
    MODULE,
    BLOCK,

    // Statements
    EXPR_STMT,
    ASSIGN,
    AUG_ASSIGN,
    ANN_ASSIGN,
    IMPORT,
    IMPORT_FROM,
    ALIAS,
    FUNCTION_DEF,
    CLASS_DEF,
    DECORATOR,
    ARGUMENTS,
    ARG,
    IF,
    FOR,
    WHILE,
    TRY,
    EXCEPT_HANDLER,
    WITH,
    WITH_ITEM,
    RETURN,
    RAISE,
    ASSERT,
    DELETE,
    GLOBAL,
    NONLOCAL,
    PASS,
    BREAK,
    CONTINUE,

    // Expressions
    NAME,
    NUMBER,
    STRING,
    JOINED_STRING,   ///< f-string; children are the embedded expressions
    CONSTANT,        ///< True / False / None / Ellipsis
    ATTRIBUTE,
    CALL,
    KEYWORD,
    STARRED,
    SUBSCRIPT,
    SLICE,
    BIN_OP,
    UNARY_OP,
    BOOL_OP,
    COMPARE,
    IF_EXP,
    NAMED_EXPR,
    LAMBDA,
    AWAIT,
    YIELD,
    LIST,
    TUPLE,
    SET,
    DICT,
    LIST_COMP,
    SET_COMP,
    DICT_COMP,
    GENERATOR_EXP,
    COMPREHENSION
};

/**
 * @struct Node
 * @brief One syntax tree node
 */
struct Node {
    NodeKind kind;
    std::string text;    ///< Identifier, operator, literal value or module name
    std::string alias;   ///< as-name for ALIAS nodes
    int line{0};         ///< 1-based
    int column{0};       ///< 1-based
    std::vector<std::unique_ptr<Node>> children;

    Node(NodeKind k, std::string t, int l, int c)
        : kind(k), text(std::move(t)), line(l), column(c) {}

    /// Append a child and return a raw pointer to it
    Node* Add(std::unique_ptr<Node> child) {
        children.push_back(std::move(child));
        return children.back().get();
    }

    /// Canonical S-expression form, stable across runs
    std::string Dump() const;
};

using NodePtr = std::unique_ptr<Node>;

/// Create a node
inline NodePtr MakeNode(NodeKind kind, std::string text = {}, int line = 0, int column = 0) {
    return std::make_unique<Node>(kind, std::move(text), line, column);
}

/// true for kinds that denote expressions rather than statements
bool IsExpressionKind(NodeKind kind);

std::string ToString(NodeKind kind);

} // namespace validators
} // namespace warden
