/**
 * @file test_script_parser.cpp
 * @brief Tests for the tokenizer and recursive-descent parser
 * @date 2025
 */

#include "warden/validators/script_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace warden::validators;

namespace {

NodePtr Parse(const std::string& source) {
    return ScriptParser().ParseModule(source);
}

} // anonymous namespace

// ============================================================================
// TREE SHAPES
// ============================================================================

TEST(ScriptParserTest, CallDumpsCalleeThenArguments) {
    EXPECT_EQ(Parse("f(1)")->Dump(), R"((Module (Expr (Call (Name "f") (Number "1")))))");
}

TEST(ScriptParserTest, BinaryOperatorsKeepPrecedence) {
    EXPECT_EQ(Parse("a + b * 2")->Dump(),
              R"((Module (Expr (BinOp "+" (Name "a") (BinOp "*" (Name "b") (Number "2"))))))");
}

TEST(ScriptParserTest, FactorExpression) {
    auto tree = Parse("mean(close) - mean(close, 20)");
    ASSERT_EQ(tree->children.size(), 1u);

    const auto& stmt = *tree->children[0];
    ASSERT_EQ(stmt.kind, NodeKind::EXPR_STMT);
    const auto& op = *stmt.children[0];
    EXPECT_EQ(op.kind, NodeKind::BIN_OP);
    EXPECT_EQ(op.text, "-");
    ASSERT_EQ(op.children.size(), 2u);
    EXPECT_EQ(op.children[1]->kind, NodeKind::CALL);
    EXPECT_EQ(op.children[1]->children.size(), 3u);
}

TEST(ScriptParserTest, AttributeWrapsReceiver) {
    auto tree = Parse("os.path.join('a', 'b')");
    const auto& call = *tree->children[0]->children[0];
    ASSERT_EQ(call.kind, NodeKind::CALL);

    const auto& join = *call.children[0];
    EXPECT_EQ(join.kind, NodeKind::ATTRIBUTE);
    EXPECT_EQ(join.text, "join");
    ASSERT_EQ(join.children.size(), 1u);
    EXPECT_EQ(join.children[0]->kind, NodeKind::ATTRIBUTE);
    EXPECT_EQ(join.children[0]->text, "path");
    EXPECT_EQ(join.children[0]->children[0]->text, "os");
}

TEST(ScriptParserTest, ImportAliases) {
    EXPECT_EQ(Parse("import numpy as np, os.path")->Dump(),
              R"((Module (Import (Alias "numpy" as "np") (Alias "os.path"))))");
    EXPECT_EQ(Parse("from math import sqrt, log as ln")->Dump(),
              R"((Module (ImportFrom "math" (Alias "sqrt") (Alias "log" as "ln"))))");
    EXPECT_EQ(Parse("from .pkg import *")->Dump(),
              R"((Module (ImportFrom ".pkg" (Alias "*"))))");
}

TEST(ScriptParserTest, SemicolonSeparatesStatements) {
    auto tree = Parse("import os; os.system('rm -rf /')");
    ASSERT_EQ(tree->children.size(), 2u);
    EXPECT_EQ(tree->children[0]->kind, NodeKind::IMPORT);
    EXPECT_EQ(tree->children[1]->kind, NodeKind::EXPR_STMT);
}

TEST(ScriptParserTest, KeywordAndStarredArguments) {
    auto tree = Parse("f(x, *rest, key=1, **extra)");
    const auto& call = *tree->children[0]->children[0];
    ASSERT_EQ(call.children.size(), 5u);
    EXPECT_EQ(call.children[1]->kind, NodeKind::NAME);
    EXPECT_EQ(call.children[2]->kind, NodeKind::STARRED);
    EXPECT_EQ(call.children[3]->kind, NodeKind::KEYWORD);
    EXPECT_EQ(call.children[3]->text, "key");
    EXPECT_EQ(call.children[4]->kind, NodeKind::STARRED);
    EXPECT_EQ(call.children[4]->text, "**");
}

TEST(ScriptParserTest, AssignmentTargetsPrecedeValue) {
    auto tree = Parse("a = b = 3");
    const auto& assign = *tree->children[0];
    ASSERT_EQ(assign.kind, NodeKind::ASSIGN);
    ASSERT_EQ(assign.children.size(), 3u);
    EXPECT_EQ(assign.children[2]->kind, NodeKind::NUMBER);
}

TEST(ScriptParserTest, CompoundStatementsWithIndentation) {
    const std::string source =
        "def score(values, n=5):\n"
        "    total = 0\n"
        "    for v in values:\n"
        "        if v > 0:\n"
        "            total += v\n"
        "    return total / n\n"
        "\n"
        "result = score([1, 2, 3])\n";

    auto tree = Parse(source);
    ASSERT_EQ(tree->children.size(), 2u);
    EXPECT_EQ(tree->children[0]->kind, NodeKind::FUNCTION_DEF);
    EXPECT_EQ(tree->children[0]->text, "score");
    EXPECT_EQ(tree->children[1]->kind, NodeKind::ASSIGN);
    EXPECT_EQ(tree->children[1]->line, 8);
}

TEST(ScriptParserTest, FormatStringFieldsAreParsed) {
    auto tree = Parse("f'{__import__(\"os\")}'");
    const auto& joined = *tree->children[0]->children[0];
    ASSERT_EQ(joined.kind, NodeKind::JOINED_STRING);
    ASSERT_EQ(joined.children.size(), 1u);

    const auto& call = *joined.children[0];
    EXPECT_EQ(call.kind, NodeKind::CALL);
    EXPECT_EQ(call.children[0]->text, "__import__");
}

TEST(ScriptParserTest, RecordsPositions) {
    auto tree = Parse("x = 1\ny = eval('2')\n");
    const auto& call = *tree->children[1]->children[1];
    EXPECT_EQ(call.kind, NodeKind::CALL);
    EXPECT_EQ(call.line, 2);
    EXPECT_EQ(call.column, 5);
}

// ============================================================================
// ERRORS
// ============================================================================

TEST(ScriptParserTest, UnterminatedStringReportsLine) {
    try {
        Parse("x = 1\ny = 'open\n");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("unterminated string literal"), std::string::npos);
        EXPECT_EQ(e.Line(), 2);
    }
}

TEST(ScriptParserTest, InvalidSyntaxThrows) {
    EXPECT_THROW(Parse("def (:\n    pass\n"), ParseError);
    EXPECT_THROW(Parse("x = )"), ParseError);
    EXPECT_THROW(Parse("if x:\npass\n"), ParseError);
}

TEST(ScriptParserTest, DeepNestingIsRejected) {
    std::string source(1000, '(');
    source += "1";
    source += std::string(1000, ')');

    try {
        Parse(source);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("too many nested constructs"), std::string::npos);
    }
}

TEST(ScriptParserTest, NestingLimitIsConfigurable) {
    std::string source = "((((1))))";
    EXPECT_NO_THROW(ScriptParser().ParseModule(source));
    EXPECT_THROW(ScriptParser(4).ParseModule(source), ParseError);
}
