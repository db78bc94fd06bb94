/*
 * gatedrepl C++ - Script Parser
 *
 * Recursive-descent parser over the Lexer's token stream. Produces a Module
 * of statements with Python operator precedence. Constructs outside the
 * sandbox language (class, with, yield, async, decorators) are rejected
 * with SyntaxError rather than silently misparsed.
 */
#ifndef gatedrepl_SCRIPT_PARSER_HPP
#define gatedrepl_SCRIPT_PARSER_HPP

#include "ast.hpp"
#include "lexer.hpp"

#include <string>
#include <vector>

namespace gatedrepl {
namespace script {

class Parser {
public:
    explicit Parser(const std::vector<Token>& tokens);

    // Lex and parse a whole program. Throws ScriptError("SyntaxError").
    static Module parse(const std::string& source, int first_line = 1);

    Module parse_module();

    // Single expression followed by end of input (f-string fields)
    ExprPtr parse_standalone_expression();

private:
    // Statements
    void parse_statement(std::vector<StmtPtr>& out);
    void parse_simple_statement(std::vector<StmtPtr>& out);
    StmtPtr parse_small_statement();
    StmtPtr parse_expression_statement();
    StmtPtr parse_if();
    StmtPtr parse_while();
    StmtPtr parse_for();
    StmtPtr parse_try();
    StmtPtr parse_def();
    StmtPtr parse_import();
    StmtPtr parse_from_import();
    void parse_block(std::vector<StmtPtr>& out);

    // Expressions
    ExprPtr parse_testlist(bool allow_star);
    ExprPtr parse_target_list();
    ExprPtr parse_star_or_test();
    ExprPtr parse_test();
    ExprPtr parse_lambda();
    ExprPtr parse_or_test();
    ExprPtr parse_and_test();
    ExprPtr parse_not_test();
    ExprPtr parse_comparison();
    ExprPtr parse_bitor();
    ExprPtr parse_bitxor();
    ExprPtr parse_bitand();
    ExprPtr parse_shift();
    ExprPtr parse_arith();
    ExprPtr parse_term();
    ExprPtr parse_factor();
    ExprPtr parse_power();
    ExprPtr parse_atom_expr();
    ExprPtr parse_atom();
    ExprPtr parse_call(ExprPtr callee);
    ExprPtr parse_subscript();
    ExprPtr parse_slice_item();
    ExprPtr parse_paren();
    ExprPtr parse_list_display();
    ExprPtr parse_brace_display();
    ExprPtr parse_strings();
    void parse_comp_clauses(std::vector<CompClause>& comps);
    void parse_params(FunctionDef& def, const char* closer);

    void parse_fstring(const std::string& body, bool raw, int line, std::vector<FStringPart>& parts);

    // Scope analysis for a finished function body
    void analyze_scope(FunctionDef& def);
    void collect_assigned(const std::vector<StmtPtr>& body, FunctionDef& def);
    void collect_target_names(const Expr& target, std::set<std::string>& names);
    void validate_target(const Expr& target, bool allow_starred) const;

    // Token helpers
    const Token& peek(size_t ahead = 0) const;
    const Token& advance();
    bool check_op(const char* op, size_t ahead = 0) const;
    bool match_op(const char* op);
    void expect_op(const char* op);
    bool check_keyword(const char* kw, size_t ahead = 0) const;
    bool match_keyword(const char* kw);
    void expect_keyword(const char* kw);
    std::string expect_name();
    bool at_statement_end() const;
    bool starts_expression() const;
    void fail(const std::string& message) const;
    void fail_at(const Token& tok, const std::string& message) const;

    struct DepthGuard {
        explicit DepthGuard(Parser& p);
        ~DepthGuard();
        Parser& parser;
    };

    std::vector<Token> tokens_;
    size_t pos_;
    int function_depth_;
    int loop_depth_;
    int nesting_;
};

// Reserved words of the script language
bool is_keyword(const std::string& name);

} // namespace script
} // namespace gatedrepl

#endif // gatedrepl_SCRIPT_PARSER_HPP
