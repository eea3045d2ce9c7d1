/**
 * @file script_parser.hpp
 * @brief Tokenizer and recursive-descent parser for submitted scripts
 *
 * Parses the Python-like language produced by the code generators into the
 * generic syntax tree. Indentation is tokenized into INDENT/DEDENT tokens,
 * f-string replacement fields are parsed as nested expressions so that calls
 * hidden inside string formatting are visible to the validator, and a
 * nesting bound stops pathological inputs from exhausting the stack.
 *
 * Unsupported or malformed input raises ParseError with a 1-based line and
 * column. The parser never executes anything.
 *
 * @date 2025
 */

#pragma once

#include "warden/validators/syntax_tree.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace warden {
namespace validators {

/**
 * @class ParseError
 * @brief Syntax error with source location
 */
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, int line, int column)
        : std::runtime_error(message), line_(line), column_(column) {}

    int Line() const { return line_; }
    int Column() const { return column_; }

private:
    int line_;
    int column_;
};

/**
 * @struct Token
 * @brief Lexical token
 */
struct Token {
    enum class Type {
        NAME,
        NUMBER,
        STRING,
        OP,
        NEWLINE,
        INDENT,
        DEDENT,
        END
    };

    Type type{Type::END};
    std::string text;     ///< Identifier, operator, number or decoded string value
    std::string raw;      ///< Undecoded string body (strings only)
    std::string prefix;   ///< Lowercased string prefix ("", "r", "f", "rb", ...)
    int line{0};
    int column{0};
};

/**
 * @class Tokenizer
 * @brief Converts source text into a token stream
 */
class Tokenizer {
public:
    /**
     * @param source Script text
     * @param first_line Line number assigned to the first line
     */
    explicit Tokenizer(const std::string& source, int first_line = 1);

    /// @throws ParseError on malformed input
    std::vector<Token> Tokenize();

private:
    char Peek(std::size_t offset = 0) const;
    int Column() const;
    void Emit(Token::Type type, std::string text, int line, int column);
    void HandleIndentation();
    void ReadName();
    void ReadNumber();
    void ReadString(std::string prefix, int line, int column);
    void ReadOperator();

    std::string source_;
    std::size_t pos_{0};
    int line_;
    std::size_t line_start_{0};
    int paren_depth_{0};
    bool at_line_start_{true};
    std::vector<int> indent_stack_{0};
    std::vector<Token> tokens_;
};

/**
 * @class ScriptParser
 * @brief Recursive-descent parser producing a syntax tree
 *
 * **Usage Example**:
 * @code
 * ScriptParser parser;
 * try {
 *     auto tree = parser.ParseModule("import numpy as np\nx = np.log(2)\n");
 * } catch (const ParseError& e) {
 *     spdlog::warn("syntax error at {}:{}: {}", e.Line(), e.Column(), e.what());
 * }
 * @endcode
 */
class ScriptParser {
public:
    /**
     * @param max_nesting Recursion bound for nested constructs
     */
    explicit ScriptParser(std::size_t max_nesting = 600);

    /**
     * @brief Parse a complete script
     * @return MODULE node
     * @throws ParseError
     */
    NodePtr ParseModule(const std::string& source);

private:
    // Token cursor
    const Token& Peek(std::size_t offset = 0) const;
    const Token& Next();
    bool CheckOp(const std::string& op, std::size_t offset = 0) const;
    bool CheckKeyword(const std::string& keyword, std::size_t offset = 0) const;
    bool AcceptOp(const std::string& op);
    bool AcceptKeyword(const std::string& keyword);
    const Token& ExpectOp(const std::string& op);
    const Token& ExpectKeyword(const std::string& keyword);
    std::string ExpectName();
    bool AtExpressionEnd() const;
    [[noreturn]] void Fail(const std::string& message) const;
    [[noreturn]] void Fail(const std::string& message, const Token& token) const;

    // Statements
    void ParseStatement(Node* parent);
    void ParseSimpleStatement(Node* parent);
    NodePtr ParseSmallStatement();
    NodePtr ParseExpressionStatement();
    NodePtr ParseImport();
    NodePtr ParseFromImport();
    NodePtr ParseBlock();
    NodePtr ParseIf();
    NodePtr ParseWhile();
    NodePtr ParseFor();
    NodePtr ParseTry();
    NodePtr ParseWith();
    NodePtr ParseFunctionDef(std::vector<NodePtr> decorators);
    NodePtr ParseClassDef(std::vector<NodePtr> decorators);
    NodePtr ParseDecorated();
    NodePtr ParseParameters(const std::string& closing, bool annotations);

    // Expressions
    NodePtr ParseTestListStarExpr();
    NodePtr ParseTestOrStar();
    NodePtr ParseNamedExpr();
    NodePtr ParseTest();
    NodePtr ParseLambda();
    NodePtr ParseOrTest();
    NodePtr ParseAndTest();
    NodePtr ParseNotTest();
    NodePtr ParseComparison();
    NodePtr ParseBinary(int level);
    NodePtr ParseFactor();
    NodePtr ParsePower();
    NodePtr ParseAtomExpr();
    NodePtr ParseAtom();
    NodePtr ParseStrings();
    NodePtr ParseParenthesized();
    NodePtr ParseListDisplay();
    NodePtr ParseBraceDisplay();
    NodePtr ParseYield();
    NodePtr ParseExprList();
    void ParseComprehensions(Node* parent);
    void ParseArguments(Node* call);
    NodePtr ParseSubscripts();
    NodePtr ParseSlice();
    void ParseFormatFields(Node* joined, const std::string& body, int line);
    NodePtr ParseFieldExpression(const std::string& expression, int line);

    struct NestingGuard {
        explicit NestingGuard(ScriptParser& parser);
        ~NestingGuard();
        ScriptParser& parser_;
    };

    std::vector<Token> tokens_;
    std::size_t index_{0};
    std::size_t depth_{0};
    std::size_t max_nesting_;
};

} // namespace validators
} // namespace warden
