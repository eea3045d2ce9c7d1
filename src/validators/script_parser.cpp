/**
 * @file script_parser.cpp
 * @brief Implementation of the script tokenizer and recursive-descent parser
 *
 * **Grammar Coverage**:
 * - Statements: import / from-import, assignment (plain, augmented, annotated),
 *   def, class, decorators, if/elif/else, for, while, try/except/else/finally,
 *   with, return, raise, assert, del, global, nonlocal, pass, break, continue
 * - Expressions: lambda, conditional, boolean, comparison, bitwise, arithmetic,
 *   power, await, calls, attributes, subscripts and slices, displays,
 *   comprehensions, walrus, yield, string concatenation and f-strings
 *
 * Binary operator tiers, loosest first:
 * ```
 * |   ^   &   << >>   + -   * / // % @
 * ```
 *
 * @date 2025
 */

#include "warden/validators/script_parser.hpp"

#include <array>
#include <cctype>
#include <set>

namespace warden {
namespace validators {

namespace {

const std::set<std::string> kKeywords = {
    "False", "None", "True", "and", "as", "assert", "async", "await", "break",
    "class", "continue", "def", "del", "elif", "else", "except", "finally",
    "for", "from", "global", "if", "import", "in", "is", "lambda", "nonlocal",
    "not", "or", "pass", "raise", "return", "try", "while", "with", "yield"
};

const std::set<std::string> kStringPrefixes = {
    "r", "u", "b", "f", "br", "rb", "fr", "rf"
};

const std::set<std::string> kAugmentedOps = {
    "+=", "-=", "*=", "/=", "//=", "%=", "**=", ">>=", "<<=", "&=", "|=", "^=", "@="
};

// Longest operators first
const std::vector<std::string> kOperators = {
    "**=", "//=", ">>=", "<<=", "...",
    "->", ":=", "**", "//", "<<", ">>", "<=", ">=", "==", "!=",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=",
    "+", "-", "*", "/", "%", "@", "&", "|", "^", "~", "<", ">",
    "(", ")", "[", "]", "{", "}", ",", ":", ".", ";", "="
};

const std::array<std::set<std::string>, 6> kBinaryTiers = {{
    {"|"},
    {"^"},
    {"&"},
    {"<<", ">>"},
    {"+", "-"},
    {"*", "/", "//", "%", "@"}
}};

bool IsIdentifierStart(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool IsIdentifierChar(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Decode backslash escapes of a non-raw string body
std::string DecodeEscapes(const std::string& body) {
    std::string out;
    out.reserve(body.size());

    for (std::size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out.push_back(c);
            continue;
        }

        char e = body[++i];
        switch (e) {
            case 'n':  out.push_back('\n'); break;
            case 't':  out.push_back('\t'); break;
            case 'r':  out.push_back('\r'); break;
            case '0':  out.push_back('\0'); break;
            case '\\': out.push_back('\\'); break;
            case '\'': out.push_back('\''); break;
            case '"':  out.push_back('"'); break;
            case '\n': break;  // line continuation inside the literal
            case 'x':
                if (i + 2 < body.size() && HexValue(body[i + 1]) >= 0 && HexValue(body[i + 2]) >= 0) {
                    out.push_back(static_cast<char>(HexValue(body[i + 1]) * 16 + HexValue(body[i + 2])));
                    i += 2;
                } else {
                    out += "\\x";
                }
                break;
            default:
                out.push_back('\\');
                out.push_back(e);
                break;
        }
    }

    return out;
}

} // anonymous namespace

// ============================================================================
// TOKENIZER
// ============================================================================

Tokenizer::Tokenizer(const std::string& source, int first_line)
    : source_(source), line_(first_line) {
}

char Tokenizer::Peek(std::size_t offset) const {
    return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
}

int Tokenizer::Column() const {
    return static_cast<int>(pos_ - line_start_) + 1;
}

void Tokenizer::Emit(Token::Type type, std::string text, int line, int column) {
    Token token;
    token.type = type;
    token.text = std::move(text);
    token.line = line;
    token.column = column;
    tokens_.push_back(std::move(token));
}

std::vector<Token> Tokenizer::Tokenize() {
    while (pos_ < source_.size()) {
        if (at_line_start_ && paren_depth_ == 0) {
            HandleIndentation();
            if (at_line_start_) {
                continue;  // blank or comment-only line consumed
            }
        }

        char c = Peek();

        if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
            ++pos_;
        }
        else if (c == '#') {
            while (pos_ < source_.size() && Peek() != '\n') {
                ++pos_;
            }
        }
        else if (c == '\\' && (Peek(1) == '\n' || (Peek(1) == '\r' && Peek(2) == '\n'))) {
            pos_ += Peek(1) == '\r' ? 3 : 2;
            ++line_;
            line_start_ = pos_;
        }
        else if (c == '\n') {
            if (paren_depth_ == 0 && !tokens_.empty() &&
                tokens_.back().type != Token::Type::NEWLINE) {
                Emit(Token::Type::NEWLINE, "\n", line_, Column());
            }
            ++pos_;
            ++line_;
            line_start_ = pos_;
            at_line_start_ = (paren_depth_ == 0);
        }
        else if (IsIdentifierStart(c)) {
            ReadName();
        }
        else if (std::isdigit(static_cast<unsigned char>(c)) ||
                 (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
            ReadNumber();
        }
        else if (c == '\'' || c == '"') {
            ReadString("", line_, Column());
        }
        else {
            ReadOperator();
        }
    }

    if (paren_depth_ > 0) {
        throw ParseError("unexpected end of input inside brackets", line_, Column());
    }

    if (!tokens_.empty() && tokens_.back().type != Token::Type::NEWLINE &&
        tokens_.back().type != Token::Type::DEDENT) {
        Emit(Token::Type::NEWLINE, "\n", line_, Column());
    }
    while (indent_stack_.size() > 1) {
        indent_stack_.pop_back();
        Emit(Token::Type::DEDENT, "", line_, 1);
    }
    Emit(Token::Type::END, "", line_, Column());

    return std::move(tokens_);
}

void Tokenizer::HandleIndentation() {
    int width = 0;
    while (pos_ < source_.size()) {
        char c = Peek();
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (c != '\f' && c != '\r') {
            break;
        }
        ++pos_;
    }

    if (pos_ >= source_.size()) {
        return;
    }

    char c = Peek();
    if (c == '\n' || c == '#') {
        while (pos_ < source_.size() && Peek() != '\n') {
            ++pos_;
        }
        if (pos_ < source_.size()) {
            ++pos_;
            ++line_;
            line_start_ = pos_;
        }
        return;
    }

    at_line_start_ = false;

    if (width > indent_stack_.back()) {
        indent_stack_.push_back(width);
        Emit(Token::Type::INDENT, "", line_, Column());
        return;
    }

    while (width < indent_stack_.back()) {
        indent_stack_.pop_back();
        Emit(Token::Type::DEDENT, "", line_, Column());
    }

    if (width != indent_stack_.back()) {
        throw ParseError("unindent does not match any outer indentation level", line_, Column());
    }
}

void Tokenizer::ReadName() {
    int column = Column();
    std::size_t start = pos_;
    while (pos_ < source_.size() && IsIdentifierChar(Peek())) {
        ++pos_;
    }
    std::string name = source_.substr(start, pos_ - start);

    std::string lower;
    for (char ch : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if ((Peek() == '\'' || Peek() == '"') && kStringPrefixes.count(lower)) {
        ReadString(lower, line_, column);
        return;
    }

    Emit(Token::Type::NAME, name, line_, column);
}

void Tokenizer::ReadNumber() {
    int column = Column();
    std::size_t start = pos_;
    bool hex = Peek() == '0' && (Peek(1) == 'x' || Peek(1) == 'X');

    while (pos_ < source_.size()) {
        char c = Peek();
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            break;
        }
        // Signed exponent: 1e-5, 2E+3
        if (!hex && (c == 'e' || c == 'E') && (Peek(1) == '+' || Peek(1) == '-') &&
            std::isdigit(static_cast<unsigned char>(Peek(2)))) {
            pos_ += 2;
            continue;
        }
        ++pos_;
    }
    Emit(Token::Type::NUMBER, source_.substr(start, pos_ - start), line_, column);
}

void Tokenizer::ReadString(std::string prefix, int line, int column) {
    char quote = Peek();
    bool triple = Peek(1) == quote && Peek(2) == quote;
    pos_ += triple ? 3 : 1;

    std::size_t body_start = pos_;
    while (true) {
        if (pos_ >= source_.size()) {
            throw ParseError("unterminated string literal", line, column);
        }

        char c = Peek();
        if (c == '\\') {
            if (Peek(1) == '\n') {
                ++line_;
                line_start_ = pos_ + 2;
            }
            pos_ += 2;
            continue;
        }
        if (c == '\n') {
            if (!triple) {
                throw ParseError("unterminated string literal", line, column);
            }
            ++pos_;
            ++line_;
            line_start_ = pos_;
            continue;
        }
        if (c == quote && (!triple || (Peek(1) == quote && Peek(2) == quote))) {
            break;
        }
        ++pos_;
    }

    std::string body = source_.substr(body_start, pos_ - body_start);
    pos_ += triple ? 3 : 1;

    bool raw = prefix.find('r') != std::string::npos;

    Token token;
    token.type = Token::Type::STRING;
    token.raw = body;
    token.text = raw ? body : DecodeEscapes(body);
    token.prefix = std::move(prefix);
    token.line = line;
    token.column = column;
    tokens_.push_back(std::move(token));
}

void Tokenizer::ReadOperator() {
    int column = Column();
    for (const auto& op : kOperators) {
        if (source_.compare(pos_, op.size(), op) != 0) {
            continue;
        }

        if (op == "(" || op == "[" || op == "{") {
            ++paren_depth_;
        } else if (op == ")" || op == "]" || op == "}") {
            if (paren_depth_ == 0) {
                throw ParseError("unmatched '" + op + "'", line_, column);
            }
            --paren_depth_;
        }
        pos_ += op.size();
        Emit(Token::Type::OP, op, line_, column);
        return;
    }

    throw ParseError("invalid character '" + std::string(1, Peek()) + "'", line_, column);
}

// ============================================================================
// PARSER: TOKEN CURSOR
// ============================================================================

ScriptParser::ScriptParser(std::size_t max_nesting)
    : max_nesting_(max_nesting) {
}

ScriptParser::NestingGuard::NestingGuard(ScriptParser& parser)
    : parser_(parser) {
    if (++parser_.depth_ > parser_.max_nesting_) {
        --parser_.depth_;
        parser_.Fail("too many nested constructs");
    }
}

ScriptParser::NestingGuard::~NestingGuard() {
    --parser_.depth_;
}

const Token& ScriptParser::Peek(std::size_t offset) const {
    auto i = index_ + offset;
    return i < tokens_.size() ? tokens_[i] : tokens_.back();
}

const Token& ScriptParser::Next() {
    const Token& token = Peek();
    if (index_ + 1 < tokens_.size()) {
        ++index_;
    }
    return token;
}

bool ScriptParser::CheckOp(const std::string& op, std::size_t offset) const {
    const auto& token = Peek(offset);
    return token.type == Token::Type::OP && token.text == op;
}

bool ScriptParser::CheckKeyword(const std::string& keyword, std::size_t offset) const {
    const auto& token = Peek(offset);
    return token.type == Token::Type::NAME && token.text == keyword;
}

bool ScriptParser::AcceptOp(const std::string& op) {
    if (CheckOp(op)) {
        Next();
        return true;
    }
    return false;
}

bool ScriptParser::AcceptKeyword(const std::string& keyword) {
    if (CheckKeyword(keyword)) {
        Next();
        return true;
    }
    return false;
}

const Token& ScriptParser::ExpectOp(const std::string& op) {
    if (!CheckOp(op)) {
        Fail("expected '" + op + "'");
    }
    return Next();
}

const Token& ScriptParser::ExpectKeyword(const std::string& keyword) {
    if (!CheckKeyword(keyword)) {
        Fail("expected '" + keyword + "'");
    }
    return Next();
}

std::string ScriptParser::ExpectName() {
    const auto& token = Peek();
    if (token.type != Token::Type::NAME || kKeywords.count(token.text)) {
        Fail("expected identifier");
    }
    return Next().text;
}

bool ScriptParser::AtExpressionEnd() const {
    const auto& token = Peek();
    if (token.type == Token::Type::NEWLINE || token.type == Token::Type::END ||
        token.type == Token::Type::DEDENT) {
        return true;
    }
    if (token.type == Token::Type::OP) {
        return token.text == ")" || token.text == "]" || token.text == "}" ||
               token.text == "=" || token.text == ":" || token.text == ";" ||
               kAugmentedOps.count(token.text) > 0;
    }
    return token.type == Token::Type::NAME && (token.text == "in" || token.text == "for");
}

void ScriptParser::Fail(const std::string& message) const {
    Fail(message, Peek());
}

void ScriptParser::Fail(const std::string& message, const Token& token) const {
    std::string near;
    switch (token.type) {
        case Token::Type::NEWLINE: near = "end of line"; break;
        case Token::Type::END:     near = "end of input"; break;
        case Token::Type::INDENT:  near = "indent"; break;
        case Token::Type::DEDENT:  near = "dedent"; break;
        default:                   near = "'" + token.text + "'"; break;
    }
    throw ParseError(message + " near " + near, token.line, token.column);
}

// ============================================================================
// PARSER: STATEMENTS
// ============================================================================

NodePtr ScriptParser::ParseModule(const std::string& source) {
    tokens_ = Tokenizer(source).Tokenize();
    index_ = 0;
    depth_ = 0;

    auto module = MakeNode(NodeKind::MODULE, "", 1, 1);
    while (Peek().type != Token::Type::END) {
        if (Peek().type == Token::Type::NEWLINE) {
            Next();
            continue;
        }
        if (Peek().type == Token::Type::INDENT) {
            Fail("unexpected indent");
        }
        ParseStatement(module.get());
    }
    return module;
}

void ScriptParser::ParseStatement(Node* parent) {
    NestingGuard guard(*this);

    if (CheckKeyword("if"))    { parent->Add(ParseIf()); return; }
    if (CheckKeyword("while")) { parent->Add(ParseWhile()); return; }
    if (CheckKeyword("for"))   { parent->Add(ParseFor()); return; }
    if (CheckKeyword("try"))   { parent->Add(ParseTry()); return; }
    if (CheckKeyword("with"))  { parent->Add(ParseWith()); return; }
    if (CheckKeyword("def"))   { parent->Add(ParseFunctionDef({})); return; }
    if (CheckKeyword("class")) { parent->Add(ParseClassDef({})); return; }
    if (CheckOp("@"))          { parent->Add(ParseDecorated()); return; }

    if (AcceptKeyword("async")) {
        if (CheckKeyword("def"))  { parent->Add(ParseFunctionDef({})); return; }
        if (CheckKeyword("for"))  { parent->Add(ParseFor()); return; }
        if (CheckKeyword("with")) { parent->Add(ParseWith()); return; }
        Fail("expected def, for or with after async");
    }

    ParseSimpleStatement(parent);
}

void ScriptParser::ParseSimpleStatement(Node* parent) {
    parent->Add(ParseSmallStatement());
    while (AcceptOp(";")) {
        if (Peek().type == Token::Type::NEWLINE || Peek().type == Token::Type::END) {
            break;
        }
        parent->Add(ParseSmallStatement());
    }

    if (Peek().type == Token::Type::NEWLINE) {
        Next();
    } else if (Peek().type != Token::Type::END) {
        Fail("invalid syntax");
    }
}

NodePtr ScriptParser::ParseSmallStatement() {
    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    if (AcceptKeyword("pass"))     return MakeNode(NodeKind::PASS, "", line, column);
    if (AcceptKeyword("break"))    return MakeNode(NodeKind::BREAK, "", line, column);
    if (AcceptKeyword("continue")) return MakeNode(NodeKind::CONTINUE, "", line, column);

    if (AcceptKeyword("del")) {
        auto node = MakeNode(NodeKind::DELETE, "", line, column);
        node->Add(ParseExprList());
        return node;
    }

    if (AcceptKeyword("return")) {
        auto node = MakeNode(NodeKind::RETURN, "", line, column);
        if (!AtExpressionEnd()) {
            node->Add(ParseTestListStarExpr());
        }
        return node;
    }

    if (AcceptKeyword("raise")) {
        auto node = MakeNode(NodeKind::RAISE, "", line, column);
        if (!AtExpressionEnd()) {
            node->Add(ParseTest());
            if (AcceptKeyword("from")) {
                node->Add(ParseTest());
            }
        }
        return node;
    }

    if (CheckKeyword("global") || CheckKeyword("nonlocal")) {
        auto kind = Next().text == "global" ? NodeKind::GLOBAL : NodeKind::NONLOCAL;
        auto node = MakeNode(kind, "", line, column);
        do {
            const Token& token = Peek();
            node->Add(MakeNode(NodeKind::NAME, ExpectName(), token.line, token.column));
        } while (AcceptOp(","));
        return node;
    }

    if (AcceptKeyword("assert")) {
        auto node = MakeNode(NodeKind::ASSERT, "", line, column);
        node->Add(ParseTest());
        if (AcceptOp(",")) {
            node->Add(ParseTest());
        }
        return node;
    }

    if (CheckKeyword("import")) return ParseImport();
    if (CheckKeyword("from"))   return ParseFromImport();

    return ParseExpressionStatement();
}

NodePtr ScriptParser::ParseExpressionStatement() {
    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    auto value = [this]() {
        return CheckKeyword("yield") ? ParseYield() : ParseTestListStarExpr();
    };

    NodePtr first = value();

    // x: int = 3
    if (AcceptOp(":")) {
        auto node = MakeNode(NodeKind::ANN_ASSIGN, "", line, column);
        node->Add(std::move(first));
        node->Add(ParseTest());
        if (AcceptOp("=")) {
            node->Add(value());
        }
        return node;
    }

    // x += 1
    if (Peek().type == Token::Type::OP && kAugmentedOps.count(Peek().text)) {
        auto node = MakeNode(NodeKind::AUG_ASSIGN, Next().text, line, column);
        node->Add(std::move(first));
        node->Add(value());
        return node;
    }

    // a = b = value
    if (CheckOp("=")) {
        auto node = MakeNode(NodeKind::ASSIGN, "", line, column);
        node->Add(std::move(first));
        while (AcceptOp("=")) {
            node->Add(value());
        }
        return node;
    }

    auto node = MakeNode(NodeKind::EXPR_STMT, "", line, column);
    node->Add(std::move(first));
    return node;
}

NodePtr ScriptParser::ParseImport() {
    const Token& start = ExpectKeyword("import");
    auto node = MakeNode(NodeKind::IMPORT, "", start.line, start.column);

    do {
        const Token& token = Peek();
        std::string dotted = ExpectName();
        while (AcceptOp(".")) {
            dotted += "." + ExpectName();
        }
        auto alias = MakeNode(NodeKind::ALIAS, dotted, token.line, token.column);
        if (AcceptKeyword("as")) {
            alias->alias = ExpectName();
        }
        node->Add(std::move(alias));
    } while (AcceptOp(","));

    return node;
}

NodePtr ScriptParser::ParseFromImport() {
    const Token& start = ExpectKeyword("from");
    int line = start.line;
    int column = start.column;

    std::string module;
    while (CheckOp(".") || CheckOp("...")) {
        module += Next().text;
    }
    if (!CheckKeyword("import")) {
        module += ExpectName();
        while (AcceptOp(".")) {
            module += "." + ExpectName();
        }
    }
    ExpectKeyword("import");

    auto node = MakeNode(NodeKind::IMPORT_FROM, module, line, column);

    if (CheckOp("*")) {
        const Token& star = Next();
        node->Add(MakeNode(NodeKind::ALIAS, "*", star.line, star.column));
        return node;
    }

    bool parenthesized = AcceptOp("(");
    do {
        if (parenthesized && CheckOp(")")) {
            break;
        }
        const Token& token = Peek();
        auto alias = MakeNode(NodeKind::ALIAS, ExpectName(), token.line, token.column);
        if (AcceptKeyword("as")) {
            alias->alias = ExpectName();
        }
        node->Add(std::move(alias));
    } while (AcceptOp(","));
    if (parenthesized) {
        ExpectOp(")");
    }

    return node;
}

NodePtr ScriptParser::ParseBlock() {
    const Token& start = Peek();
    auto block = MakeNode(NodeKind::BLOCK, "", start.line, start.column);

    if (Peek().type != Token::Type::NEWLINE) {
        ParseSimpleStatement(block.get());
        return block;
    }

    Next();
    if (Peek().type != Token::Type::INDENT) {
        Fail("expected an indented block");
    }
    Next();

    while (Peek().type != Token::Type::DEDENT && Peek().type != Token::Type::END) {
        if (Peek().type == Token::Type::NEWLINE) {
            Next();
            continue;
        }
        ParseStatement(block.get());
    }
    if (Peek().type == Token::Type::DEDENT) {
        Next();
    }

    return block;
}

NodePtr ScriptParser::ParseIf() {
    const Token& start = Next();  // 'if' or 'elif'
    auto node = MakeNode(NodeKind::IF, "", start.line, start.column);
    node->Add(ParseNamedExpr());
    ExpectOp(":");
    node->Add(ParseBlock());

    if (CheckKeyword("elif")) {
        node->Add(ParseIf());
    } else if (AcceptKeyword("else")) {
        ExpectOp(":");
        auto orelse = ParseBlock();
        orelse->text = "else";
        node->Add(std::move(orelse));
    }
    return node;
}

NodePtr ScriptParser::ParseWhile() {
    const Token& start = ExpectKeyword("while");
    auto node = MakeNode(NodeKind::WHILE, "", start.line, start.column);
    node->Add(ParseNamedExpr());
    ExpectOp(":");
    node->Add(ParseBlock());

    if (AcceptKeyword("else")) {
        ExpectOp(":");
        auto orelse = ParseBlock();
        orelse->text = "else";
        node->Add(std::move(orelse));
    }
    return node;
}

NodePtr ScriptParser::ParseFor() {
    const Token& start = ExpectKeyword("for");
    auto node = MakeNode(NodeKind::FOR, "", start.line, start.column);
    node->Add(ParseExprList());
    ExpectKeyword("in");
    node->Add(ParseTestListStarExpr());
    ExpectOp(":");
    node->Add(ParseBlock());

    if (AcceptKeyword("else")) {
        ExpectOp(":");
        auto orelse = ParseBlock();
        orelse->text = "else";
        node->Add(std::move(orelse));
    }
    return node;
}

NodePtr ScriptParser::ParseTry() {
    const Token& start = ExpectKeyword("try");
    auto node = MakeNode(NodeKind::TRY, "", start.line, start.column);
    ExpectOp(":");
    node->Add(ParseBlock());

    bool has_handler = false;
    while (CheckKeyword("except")) {
        const Token& except = Next();
        AcceptOp("*");  // except* groups
        auto handler = MakeNode(NodeKind::EXCEPT_HANDLER, "", except.line, except.column);
        if (!CheckOp(":")) {
            handler->Add(ParseTest());
            if (AcceptKeyword("as")) {
                handler->text = ExpectName();
            }
        }
        ExpectOp(":");
        handler->Add(ParseBlock());
        node->Add(std::move(handler));
        has_handler = true;
    }

    if (has_handler && AcceptKeyword("else")) {
        ExpectOp(":");
        auto orelse = ParseBlock();
        orelse->text = "else";
        node->Add(std::move(orelse));
    }

    bool has_finally = false;
    if (AcceptKeyword("finally")) {
        ExpectOp(":");
        auto final_block = ParseBlock();
        final_block->text = "finally";
        node->Add(std::move(final_block));
        has_finally = true;
    }

    if (!has_handler && !has_finally) {
        Fail("expected 'except' or 'finally' block");
    }
    return node;
}

NodePtr ScriptParser::ParseWith() {
    const Token& start = ExpectKeyword("with");
    auto node = MakeNode(NodeKind::WITH, "", start.line, start.column);

    do {
        const Token& token = Peek();
        auto item = MakeNode(NodeKind::WITH_ITEM, "", token.line, token.column);
        item->Add(ParseTest());
        if (AcceptKeyword("as")) {
            item->Add(ParseExprList());
        }
        node->Add(std::move(item));
    } while (AcceptOp(","));

    ExpectOp(":");
    node->Add(ParseBlock());
    return node;
}

NodePtr ScriptParser::ParseFunctionDef(std::vector<NodePtr> decorators) {
    const Token& start = ExpectKeyword("def");
    int line = start.line;
    int column = start.column;
    auto node = MakeNode(NodeKind::FUNCTION_DEF, ExpectName(), line, column);

    ExpectOp("(");
    node->Add(ParseParameters(")", true));
    ExpectOp(")");

    for (auto& decorator : decorators) {
        node->Add(std::move(decorator));
    }

    // Return annotation is kept under ARGUMENTS
    if (AcceptOp("->")) {
        node->children.front()->Add(ParseTest());
    }
    ExpectOp(":");
    node->Add(ParseBlock());
    return node;
}

NodePtr ScriptParser::ParseClassDef(std::vector<NodePtr> decorators) {
    const Token& start = ExpectKeyword("class");
    int line = start.line;
    int column = start.column;
    auto node = MakeNode(NodeKind::CLASS_DEF, ExpectName(), line, column);

    if (AcceptOp("(")) {
        auto bases = MakeNode(NodeKind::ARGUMENTS, "", line, column);
        ParseArguments(bases.get());
        ExpectOp(")");
        node->Add(std::move(bases));
    }

    for (auto& decorator : decorators) {
        node->Add(std::move(decorator));
    }

    ExpectOp(":");
    node->Add(ParseBlock());
    return node;
}

NodePtr ScriptParser::ParseDecorated() {
    std::vector<NodePtr> decorators;
    while (CheckOp("@")) {
        const Token& at = Next();
        auto decorator = MakeNode(NodeKind::DECORATOR, "", at.line, at.column);
        decorator->Add(ParseNamedExpr());
        if (Peek().type != Token::Type::NEWLINE) {
            Fail("expected newline after decorator");
        }
        Next();
        decorators.push_back(std::move(decorator));
    }

    AcceptKeyword("async");
    if (CheckKeyword("def")) {
        return ParseFunctionDef(std::move(decorators));
    }
    if (CheckKeyword("class")) {
        return ParseClassDef(std::move(decorators));
    }
    Fail("expected def or class after decorator");
}

NodePtr ScriptParser::ParseParameters(const std::string& closing, bool annotations) {
    const Token& start = Peek();
    auto args = MakeNode(NodeKind::ARGUMENTS, "", start.line, start.column);

    while (!CheckOp(closing)) {
        const Token& token = Peek();

        if (AcceptOp("/")) {
            // positional-only marker
        } else if (AcceptOp("**")) {
            auto arg = MakeNode(NodeKind::ARG, "**" + ExpectName(), token.line, token.column);
            if (annotations && AcceptOp(":")) {
                arg->Add(ParseTest());
            }
            args->Add(std::move(arg));
        } else if (AcceptOp("*")) {
            std::string name = "*";
            if (!CheckOp(",") && !CheckOp(closing)) {
                name += ExpectName();
            }
            auto arg = MakeNode(NodeKind::ARG, name, token.line, token.column);
            if (annotations && name.size() > 1 && AcceptOp(":")) {
                arg->Add(ParseTest());
            }
            args->Add(std::move(arg));
        } else {
            auto arg = MakeNode(NodeKind::ARG, ExpectName(), token.line, token.column);
            if (annotations && AcceptOp(":")) {
                arg->Add(ParseTest());
            }
            if (AcceptOp("=")) {
                arg->Add(ParseTest());
            }
            args->Add(std::move(arg));
        }

        if (!AcceptOp(",")) {
            break;
        }
    }

    return args;
}

// ============================================================================
// PARSER: EXPRESSIONS
// ============================================================================

NodePtr ScriptParser::ParseTestListStarExpr() {
    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    auto first = ParseTestOrStar();
    if (!CheckOp(",")) {
        return first;
    }

    auto tuple = MakeNode(NodeKind::TUPLE, "", line, column);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
        if (AtExpressionEnd()) {
            break;
        }
        tuple->Add(ParseTestOrStar());
    }
    return tuple;
}

NodePtr ScriptParser::ParseTestOrStar() {
    if (CheckOp("*")) {
        const Token& star = Next();
        auto node = MakeNode(NodeKind::STARRED, "*", star.line, star.column);
        node->Add(ParseBinary(0));
        return node;
    }
    return ParseNamedExpr();
}

NodePtr ScriptParser::ParseNamedExpr() {
    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    auto target = ParseTest();
    if (AcceptOp(":=")) {
        auto node = MakeNode(NodeKind::NAMED_EXPR, "", line, column);
        node->Add(std::move(target));
        node->Add(ParseTest());
        return node;
    }
    return target;
}

NodePtr ScriptParser::ParseTest() {
    NestingGuard guard(*this);

    if (CheckKeyword("lambda")) {
        return ParseLambda();
    }

    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    auto body = ParseOrTest();
    if (AcceptKeyword("if")) {
        // children: test, body, orelse
        auto node = MakeNode(NodeKind::IF_EXP, "", line, column);
        node->Add(ParseOrTest());
        node->Add(std::move(body));
        ExpectKeyword("else");
        node->Add(ParseTest());
        return node;
    }
    return body;
}

NodePtr ScriptParser::ParseLambda() {
    const Token& start = ExpectKeyword("lambda");
    auto node = MakeNode(NodeKind::LAMBDA, "", start.line, start.column);
    node->Add(ParseParameters(":", false));
    ExpectOp(":");
    node->Add(ParseTest());
    return node;
}

NodePtr ScriptParser::ParseOrTest() {
    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    auto first = ParseAndTest();
    if (!CheckKeyword("or")) {
        return first;
    }

    auto node = MakeNode(NodeKind::BOOL_OP, "or", line, column);
    node->Add(std::move(first));
    while (AcceptKeyword("or")) {
        node->Add(ParseAndTest());
    }
    return node;
}

NodePtr ScriptParser::ParseAndTest() {
    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    auto first = ParseNotTest();
    if (!CheckKeyword("and")) {
        return first;
    }

    auto node = MakeNode(NodeKind::BOOL_OP, "and", line, column);
    node->Add(std::move(first));
    while (AcceptKeyword("and")) {
        node->Add(ParseNotTest());
    }
    return node;
}

NodePtr ScriptParser::ParseNotTest() {
    if (CheckKeyword("not")) {
        NestingGuard guard(*this);
        const Token& token = Next();
        auto node = MakeNode(NodeKind::UNARY_OP, "not", token.line, token.column);
        node->Add(ParseNotTest());
        return node;
    }
    return ParseComparison();
}

NodePtr ScriptParser::ParseComparison() {
    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    auto first = ParseBinary(0);
    NodePtr node;

    while (true) {
        std::string op;
        const Token& token = Peek();
        if (token.type == Token::Type::OP &&
            (token.text == "<" || token.text == ">" || token.text == "==" ||
             token.text == ">=" || token.text == "<=" || token.text == "!=")) {
            op = Next().text;
        } else if (AcceptKeyword("in")) {
            op = "in";
        } else if (CheckKeyword("not") && CheckKeyword("in", 1)) {
            Next();
            Next();
            op = "not in";
        } else if (AcceptKeyword("is")) {
            op = AcceptKeyword("not") ? "is not" : "is";
        } else {
            break;
        }

        if (!node) {
            node = MakeNode(NodeKind::COMPARE, "", line, column);
            node->Add(std::move(first));
        }
        node->text += node->text.empty() ? op : " " + op;
        node->Add(ParseBinary(0));
    }

    if (node) {
        return node;
    }
    return first;
}

NodePtr ScriptParser::ParseBinary(int level) {
    if (level >= static_cast<int>(kBinaryTiers.size())) {
        return ParseFactor();
    }

    auto left = ParseBinary(level + 1);
    const auto& ops = kBinaryTiers[static_cast<std::size_t>(level)];

    while (Peek().type == Token::Type::OP && ops.count(Peek().text)) {
        const Token& op = Next();
        auto node = MakeNode(NodeKind::BIN_OP, op.text, op.line, op.column);
        node->Add(std::move(left));
        node->Add(ParseBinary(level + 1));
        left = std::move(node);
    }
    return left;
}

NodePtr ScriptParser::ParseFactor() {
    NestingGuard guard(*this);

    if (CheckOp("+") || CheckOp("-") || CheckOp("~")) {
        const Token& op = Next();
        auto node = MakeNode(NodeKind::UNARY_OP, op.text, op.line, op.column);
        node->Add(ParseFactor());
        return node;
    }
    return ParsePower();
}

NodePtr ScriptParser::ParsePower() {
    NodePtr base;
    if (CheckKeyword("await")) {
        const Token& token = Next();
        base = MakeNode(NodeKind::AWAIT, "", token.line, token.column);
        base->Add(ParseAtomExpr());
    } else {
        base = ParseAtomExpr();
    }

    if (CheckOp("**")) {
        const Token& op = Next();
        auto node = MakeNode(NodeKind::BIN_OP, "**", op.line, op.column);
        node->Add(std::move(base));
        node->Add(ParseFactor());
        return node;
    }
    return base;
}

NodePtr ScriptParser::ParseAtomExpr() {
    auto node = ParseAtom();

    while (true) {
        if (CheckOp("(")) {
            Next();
            auto call = MakeNode(NodeKind::CALL, "", node->line, node->column);
            call->Add(std::move(node));
            ParseArguments(call.get());
            ExpectOp(")");
            node = std::move(call);
        } else if (CheckOp("[")) {
            const Token& open = Next();
            auto subscript = MakeNode(NodeKind::SUBSCRIPT, "", open.line, open.column);
            subscript->Add(std::move(node));
            subscript->Add(ParseSubscripts());
            ExpectOp("]");
            node = std::move(subscript);
        } else if (CheckOp(".")) {
            const Token& dot = Next();
            if (Peek().type != Token::Type::NAME) {
                Fail("expected attribute name");
            }
            auto attribute = MakeNode(NodeKind::ATTRIBUTE, Next().text, dot.line, dot.column);
            attribute->Add(std::move(node));
            node = std::move(attribute);
        } else {
            break;
        }
    }

    return node;
}

NodePtr ScriptParser::ParseAtom() {
    NestingGuard guard(*this);
    const Token& token = Peek();

    switch (token.type) {
        case Token::Type::NUMBER:
            Next();
            return MakeNode(NodeKind::NUMBER, token.text, token.line, token.column);
        case Token::Type::STRING:
            return ParseStrings();
        case Token::Type::NAME:
            if (token.text == "None" || token.text == "True" || token.text == "False") {
                Next();
                return MakeNode(NodeKind::CONSTANT, token.text, token.line, token.column);
            }
            if (kKeywords.count(token.text)) {
                Fail("unexpected keyword");
            }
            Next();
            return MakeNode(NodeKind::NAME, token.text, token.line, token.column);
        case Token::Type::OP:
            if (token.text == "(") return ParseParenthesized();
            if (token.text == "[") return ParseListDisplay();
            if (token.text == "{") return ParseBraceDisplay();
            if (token.text == "...") {
                Next();
                return MakeNode(NodeKind::CONSTANT, "...", token.line, token.column);
            }
            break;
        default:
            break;
    }

    Fail("invalid syntax");
}

NodePtr ScriptParser::ParseStrings() {
    const Token& first = Peek();
    int line = first.line;
    int column = first.column;

    std::string value;
    NodePtr joined;

    while (Peek().type == Token::Type::STRING) {
        const Token& token = Next();
        if (token.prefix.find('f') != std::string::npos) {
            if (!joined) {
                joined = MakeNode(NodeKind::JOINED_STRING, "", line, column);
            }
            ParseFormatFields(joined.get(), token.raw, token.line);
        }
        value += token.text;
    }

    if (joined) {
        joined->text = value;
        return joined;
    }
    return MakeNode(NodeKind::STRING, value, line, column);
}

void ScriptParser::ParseFormatFields(Node* joined, const std::string& body, int line) {
    std::size_t i = 0;
    while (i < body.size()) {
        char c = body[i];
        if (c == '{' && i + 1 < body.size() && body[i + 1] == '{') {
            i += 2;
            continue;
        }
        if (c != '{') {
            ++i;
            continue;
        }

        // Locate the closing brace, skipping nested brackets and quoted text
        std::size_t start = ++i;
        int depth = 0;
        char quote = '\0';
        std::size_t split = std::string::npos;
        for (; i < body.size(); ++i) {
            char ch = body[i];
            if (quote) {
                if (ch == quote) quote = '\0';
                continue;
            }
            if (ch == '\'' || ch == '"') { quote = ch; continue; }
            if (ch == '(' || ch == '[' || ch == '{') { ++depth; continue; }
            if (ch == ')' || ch == ']') { --depth; continue; }
            if (ch == '}') {
                if (depth == 0) break;
                --depth;
                continue;
            }
            if (depth == 0 && split == std::string::npos) {
                bool conversion = ch == '!' && i + 1 < body.size() && body[i + 1] != '=';
                bool spec = ch == ':';
                if (conversion || spec) {
                    split = i;
                }
            }
        }
        if (i >= body.size()) {
            throw ParseError("f-string: expecting '}'", line, 1);
        }

        std::string expression = body.substr(start, (split == std::string::npos ? i : split) - start);

        // f"{x=}" debug form
        if (expression.size() > 1 && expression.back() == '=') {
            char before = expression[expression.size() - 2];
            if (before != '=' && before != '!' && before != '<' && before != '>') {
                expression.pop_back();
            }
        }
        joined->Add(ParseFieldExpression(expression, line));

        // Format spec may nest replacement fields: f"{x:{width}}"
        if (split != std::string::npos) {
            ParseFormatFields(joined, body.substr(split + 1, i - split - 1), line);
        }
        ++i;
    }
}

NodePtr ScriptParser::ParseFieldExpression(const std::string& expression, int line) {
    bool blank = true;
    for (char c : expression) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            blank = false;
            break;
        }
    }
    if (blank) {
        throw ParseError("f-string: empty expression not allowed", line, 1);
    }

    ScriptParser nested(max_nesting_ > depth_ ? max_nesting_ - depth_ : 1);
    nested.tokens_ = Tokenizer("(" + expression + ")", line).Tokenize();
    nested.index_ = 0;

    auto node = nested.ParseTestListStarExpr();
    if (nested.Peek().type == Token::Type::NEWLINE) {
        nested.Next();
    }
    if (nested.Peek().type != Token::Type::END) {
        nested.Fail("f-string: invalid expression");
    }
    return node;
}

NodePtr ScriptParser::ParseParenthesized() {
    const Token& open = ExpectOp("(");
    int line = open.line;
    int column = open.column;

    if (AcceptOp(")")) {
        return MakeNode(NodeKind::TUPLE, "", line, column);
    }
    if (CheckKeyword("yield")) {
        auto node = ParseYield();
        ExpectOp(")");
        return node;
    }

    auto first = ParseTestOrStar();

    if (CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1))) {
        auto generator = MakeNode(NodeKind::GENERATOR_EXP, "", line, column);
        generator->Add(std::move(first));
        ParseComprehensions(generator.get());
        ExpectOp(")");
        return generator;
    }

    if (AcceptOp(")")) {
        return first;
    }

    auto tuple = MakeNode(NodeKind::TUPLE, "", line, column);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
        if (CheckOp(")")) {
            break;
        }
        tuple->Add(ParseTestOrStar());
    }
    ExpectOp(")");
    return tuple;
}

NodePtr ScriptParser::ParseListDisplay() {
    const Token& open = ExpectOp("[");
    int line = open.line;
    int column = open.column;

    if (AcceptOp("]")) {
        return MakeNode(NodeKind::LIST, "", line, column);
    }

    auto first = ParseTestOrStar();

    if (CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1))) {
        auto comp = MakeNode(NodeKind::LIST_COMP, "", line, column);
        comp->Add(std::move(first));
        ParseComprehensions(comp.get());
        ExpectOp("]");
        return comp;
    }

    auto list = MakeNode(NodeKind::LIST, "", line, column);
    list->Add(std::move(first));
    while (AcceptOp(",")) {
        if (CheckOp("]")) {
            break;
        }
        list->Add(ParseTestOrStar());
    }
    ExpectOp("]");
    return list;
}

NodePtr ScriptParser::ParseBraceDisplay() {
    const Token& open = ExpectOp("{");
    int line = open.line;
    int column = open.column;

    if (AcceptOp("}")) {
        return MakeNode(NodeKind::DICT, "", line, column);
    }

    auto parse_unpack = [this]() {
        const Token& star = Next();
        auto unpack = MakeNode(NodeKind::STARRED, "**", star.line, star.column);
        unpack->Add(ParseBinary(0));
        return unpack;
    };

    bool is_dict = CheckOp("**");
    NodePtr first_key;
    NodePtr first_value;

    if (is_dict) {
        first_key = parse_unpack();
    } else {
        first_key = ParseTestOrStar();
        if (AcceptOp(":")) {
            is_dict = true;
            first_value = ParseTest();
        }
    }

    bool comprehension = CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1));

    if (is_dict) {
        if (first_value && comprehension) {
            auto comp = MakeNode(NodeKind::DICT_COMP, "", line, column);
            comp->Add(std::move(first_key));
            comp->Add(std::move(first_value));
            ParseComprehensions(comp.get());
            ExpectOp("}");
            return comp;
        }

        auto dict = MakeNode(NodeKind::DICT, "", line, column);
        dict->Add(std::move(first_key));
        if (first_value) {
            dict->Add(std::move(first_value));
        }
        while (AcceptOp(",")) {
            if (CheckOp("}")) {
                break;
            }
            if (CheckOp("**")) {
                dict->Add(parse_unpack());
                continue;
            }
            dict->Add(ParseTest());
            ExpectOp(":");
            dict->Add(ParseTest());
        }
        ExpectOp("}");
        return dict;
    }

    if (comprehension) {
        auto comp = MakeNode(NodeKind::SET_COMP, "", line, column);
        comp->Add(std::move(first_key));
        ParseComprehensions(comp.get());
        ExpectOp("}");
        return comp;
    }

    auto set = MakeNode(NodeKind::SET, "", line, column);
    set->Add(std::move(first_key));
    while (AcceptOp(",")) {
        if (CheckOp("}")) {
            break;
        }
        set->Add(ParseTestOrStar());
    }
    ExpectOp("}");
    return set;
}

void ScriptParser::ParseComprehensions(Node* parent) {
    while (CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1))) {
        AcceptKeyword("async");
        const Token& start = ExpectKeyword("for");
        auto comp = MakeNode(NodeKind::COMPREHENSION, "", start.line, start.column);
        comp->Add(ParseExprList());
        ExpectKeyword("in");
        comp->Add(ParseOrTest());
        while (AcceptKeyword("if")) {
            comp->Add(ParseOrTest());
        }
        parent->Add(std::move(comp));
    }
}

NodePtr ScriptParser::ParseYield() {
    const Token& start = ExpectKeyword("yield");
    auto node = MakeNode(NodeKind::YIELD, "", start.line, start.column);
    if (AcceptKeyword("from")) {
        node->text = "from";
        node->Add(ParseTest());
    } else if (!AtExpressionEnd()) {
        node->Add(ParseTestListStarExpr());
    }
    return node;
}

NodePtr ScriptParser::ParseExprList() {
    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    auto parse_one = [this]() {
        if (CheckOp("*")) {
            const Token& star = Next();
            auto node = MakeNode(NodeKind::STARRED, "*", star.line, star.column);
            node->Add(ParseBinary(0));
            return node;
        }
        return ParseBinary(0);
    };

    auto first = parse_one();
    if (!CheckOp(",")) {
        return first;
    }

    auto tuple = MakeNode(NodeKind::TUPLE, "", line, column);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
        if (AtExpressionEnd()) {
            break;
        }
        tuple->Add(parse_one());
    }
    return tuple;
}

void ScriptParser::ParseArguments(Node* call) {
    while (!CheckOp(")")) {
        const Token& token = Peek();

        if (CheckOp("*") || CheckOp("**")) {
            auto star = MakeNode(NodeKind::STARRED, Next().text, token.line, token.column);
            star->Add(ParseTest());
            call->Add(std::move(star));
        } else if (token.type == Token::Type::NAME && !kKeywords.count(token.text) && CheckOp("=", 1)) {
            Next();
            Next();
            auto keyword = MakeNode(NodeKind::KEYWORD, token.text, token.line, token.column);
            keyword->Add(ParseTest());
            call->Add(std::move(keyword));
        } else {
            auto argument = ParseNamedExpr();
            if (CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1))) {
                auto generator = MakeNode(NodeKind::GENERATOR_EXP, "", token.line, token.column);
                generator->Add(std::move(argument));
                ParseComprehensions(generator.get());
                argument = std::move(generator);
            }
            call->Add(std::move(argument));
        }

        if (!AcceptOp(",")) {
            break;
        }
    }
}

NodePtr ScriptParser::ParseSubscripts() {
    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    auto first = ParseSlice();
    if (!CheckOp(",")) {
        return first;
    }

    auto tuple = MakeNode(NodeKind::TUPLE, "", line, column);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
        if (CheckOp("]")) {
            break;
        }
        tuple->Add(ParseSlice());
    }
    return tuple;
}

NodePtr ScriptParser::ParseSlice() {
    const Token& start = Peek();
    int line = start.line;
    int column = start.column;

    NodePtr lower;
    if (!CheckOp(":")) {
        lower = ParseTestOrStar();
        if (!CheckOp(":")) {
            return lower;
        }
    }

    auto slice = MakeNode(NodeKind::SLICE, ":", line, column);
    if (lower) {
        slice->Add(std::move(lower));
    }
    ExpectOp(":");
    if (!CheckOp(":") && !CheckOp("]") && !CheckOp(",")) {
        slice->Add(ParseTest());
    }
    if (AcceptOp(":") && !CheckOp("]") && !CheckOp(",")) {
        slice->Add(ParseTest());
    }
    return slice;
}

} // namespace validators
} // namespace warden
