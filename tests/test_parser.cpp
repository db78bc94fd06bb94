#include <gatedrepl/script/parser.hpp>
#include <gatedrepl/script/errors.hpp>

#include <gtest/gtest.h>

using namespace gatedrepl::script;

namespace {

std::string syntax_error_of(const std::string& source) {
    try {
        Parser::parse(source);
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.type(), "SyntaxError");
        return e.message();
    }
    return "";
}

} // namespace

TEST(LexerTest, IndentAndDedentTokens) {
    Lexer lexer("if x:\n    y = 1\nz = 2\n");
    std::vector<Token> tokens = lexer.tokenize();

    int indents = 0;
    int dedents = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].type == TokenType::INDENT) ++indents;
        if (tokens[i].type == TokenType::DEDENT) ++dedents;
    }
    EXPECT_EQ(indents, 1);
    EXPECT_EQ(dedents, 1);
    EXPECT_EQ(tokens.back().type, TokenType::END);
}

TEST(LexerTest, NumbersAndStrings) {
    Lexer lexer("0x1F 1_000 2.5 'a\\tb' r'\\n'");
    std::vector<Token> tokens = lexer.tokenize();
    ASSERT_GE(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].int_value, 31);
    EXPECT_EQ(tokens[1].int_value, 1000);
    EXPECT_DOUBLE_EQ(tokens[2].float_value, 2.5);
    EXPECT_EQ(tokens[3].text, "a\tb");
    EXPECT_EQ(tokens[4].text, "\\n");
}

TEST(LexerTest, BracketsJoinLines) {
    Lexer lexer("x = [1,\n     2]\n");
    std::vector<Token> tokens = lexer.tokenize();
    int newlines = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].type == TokenType::NEWLINE) ++newlines;
    }
    EXPECT_EQ(newlines, 1);
}

TEST(LexerTest, UnterminatedString) {
    EXPECT_THROW(Lexer("s = 'abc\n").tokenize(), ScriptError);
    EXPECT_THROW(Lexer("x = (1, 2\n").tokenize(), ScriptError);
}

TEST(ParserTest, StatementKinds) {
    Module module = Parser::parse(
        "import math\n"
        "def f(a, b=2, *rest, **kw):\n"
        "    return a + b\n"
        "for i in range(3):\n"
        "    pass\n"
        "try:\n"
        "    x = 1\n"
        "except ValueError as e:\n"
        "    x = 2\n"
        "finally:\n"
        "    y = 3\n"
        "total += 1\n"
        "f(1)\n");

    ASSERT_EQ(module.body.size(), 6u);
    EXPECT_EQ(module.body[0]->kind, StmtKind::IMPORT);
    EXPECT_EQ(module.body[1]->kind, StmtKind::FUNCTIONDEF);
    EXPECT_EQ(module.body[2]->kind, StmtKind::FOR);
    EXPECT_EQ(module.body[3]->kind, StmtKind::TRY);
    EXPECT_EQ(module.body[4]->kind, StmtKind::AUGASSIGN);
    EXPECT_EQ(module.body[5]->kind, StmtKind::EXPR);

    const FunctionDef& def = *module.body[1]->func;
    EXPECT_EQ(def.name, "f");
    ASSERT_EQ(def.params.size(), 2u);
    EXPECT_TRUE(def.params[1].default_value != nullptr);
    EXPECT_EQ(def.vararg, "rest");
    EXPECT_EQ(def.kwarg, "kw");

    ASSERT_EQ(module.body[3]->handlers.size(), 1u);
    EXPECT_EQ(module.body[3]->handlers[0].name, "e");
    EXPECT_EQ(module.body[3]->finalbody.size(), 1u);
}

TEST(ParserTest, OperatorPrecedence) {
    Module module = Parser::parse("1 + 2 * 3 ** 2\n");
    ASSERT_EQ(module.body.size(), 1u);
    const Expr& top = *module.body[0]->value;
    ASSERT_EQ(top.kind, ExprKind::BINOP);
    EXPECT_EQ(top.bin_op, BinOp::ADD);
    ASSERT_EQ(top.right->kind, ExprKind::BINOP);
    EXPECT_EQ(top.right->bin_op, BinOp::MUL);
    EXPECT_EQ(top.right->right->bin_op, BinOp::POW);
}

TEST(ParserTest, LineNumbersFollowFirstLine) {
    Module module = Parser::parse("a = 1\n\nb = 2\n", 10);
    ASSERT_EQ(module.body.size(), 2u);
    EXPECT_EQ(module.body[0]->line, 10);
    EXPECT_EQ(module.body[1]->line, 12);
}

TEST(ParserTest, FunctionScopeAnalysis) {
    Module module = Parser::parse(
        "def outer():\n"
        "    count = 0\n"
        "    def inner():\n"
        "        nonlocal count\n"
        "        global total\n"
        "        count += 1\n"
        "    return inner\n");
    const FunctionDef& outer = *module.body[0]->func;
    EXPECT_TRUE(outer.local_names.count("count"));
    EXPECT_TRUE(outer.local_names.count("inner"));

    const FunctionDef& inner = *outer.body[1]->func;
    EXPECT_TRUE(inner.nonlocal_names.count("count"));
    EXPECT_TRUE(inner.global_names.count("total"));
    EXPECT_FALSE(inner.local_names.count("count"));
}

TEST(ParserTest, RejectsUnsupportedConstructs) {
    EXPECT_EQ(syntax_error_of("class A:\n    pass\n"), "'class' statements are not supported");
    EXPECT_EQ(syntax_error_of("with f() as g:\n    pass\n"), "'with' statements are not supported");
    EXPECT_EQ(syntax_error_of("@wrap\ndef f():\n    pass\n"), "decorators are not supported");
    EXPECT_EQ(syntax_error_of("from . import x\n"), "relative imports are not supported");
}

TEST(ParserTest, RejectsMisplacedStatements) {
    EXPECT_EQ(syntax_error_of("return 1\n"), "'return' outside function");
    EXPECT_EQ(syntax_error_of("break\n"), "'break' outside loop");
    EXPECT_EQ(syntax_error_of("f() = 1\n"), "cannot assign to function call");
    EXPECT_EQ(syntax_error_of("1 = x\n"), "cannot assign to literal");
    EXPECT_EQ(syntax_error_of("def f(a=1, b):\n    pass\n"), "non-default argument follows default argument");
    EXPECT_EQ(syntax_error_of("if x:\ny = 1\n"), "expected an indented block");
}

TEST(ParserTest, FStringErrors) {
    EXPECT_EQ(syntax_error_of("f'{}'\n"), "f-string: empty expression not allowed");
    EXPECT_EQ(syntax_error_of("f'a }'\n"), "f-string: single '}' is not allowed");
}

TEST(ParserTest, DeepNestingIsRejected) {
    std::string source(500, '(');
    source += "1";
    source += std::string(500, ')');
    source += "\n";
    EXPECT_EQ(syntax_error_of(source), "too many nested expressions or blocks");
}

TEST(ParserTest, KeywordList) {
    EXPECT_TRUE(is_keyword("lambda"));
    EXPECT_TRUE(is_keyword("nonlocal"));
    EXPECT_FALSE(is_keyword("print"));
}
