/*
 * gatedrepl C++ - Script AST
 *
 * Expression and statement nodes produced by the Parser. Nodes are plain
 * structs tagged by a kind enum; only the fields relevant to a kind are
 * populated. Function bodies are held by shared FunctionDef nodes so that
 * function values outlive the program that defined them.
 */
#ifndef gatedrepl_SCRIPT_AST_HPP
#define gatedrepl_SCRIPT_AST_HPP

#include "value.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace gatedrepl {
namespace script {

struct Expr;
struct Stmt;
struct FunctionDef;

typedef std::unique_ptr<Expr> ExprPtr;
typedef std::unique_ptr<Stmt> StmtPtr;

enum class ExprKind {
    CONSTANT,
    NAME,
    FSTRING,
    LIST,
    TUPLE,
    DICT,
    SET,
    BINOP,
    UNARYOP,
    BOOLOP,
    COMPARE,
    IFEXP,
    CALL,
    ATTRIBUTE,
    SUBSCRIPT,
    SLICE,
    LAMBDA,
    LISTCOMP,
    SETCOMP,
    DICTCOMP,
    GENEXP,
    STARRED
};

enum class BinOp {
    ADD, SUB, MUL, DIV, FLOORDIV, MOD, POW,
    LSHIFT, RSHIFT, BITAND, BITOR, BITXOR
};

enum class UnaryOp { NEG, POS, NOT, INVERT };

enum class CmpOp { EQ, NE, LT, LE, GT, GE, IN, NOT_IN, IS, IS_NOT };

const char* binop_symbol(BinOp op);

// One piece of an f-string: literal text, or a replacement field
struct FStringPart {
    std::string literal;
    ExprPtr expr;           // null for literal parts
    char conversion;        // 0, 'r', 's' or 'a'
    ExprPtr format_spec;    // FSTRING expression, may be null

    FStringPart() : conversion(0) {}
};

// "for target in iter if cond..." inside a comprehension
struct CompClause {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> conds;
};

struct Keyword {
    std::string name;       // empty for **mapping
    ExprPtr value;
};

struct Expr {
    ExprKind kind;
    int line;

    Value constant;                     // CONSTANT
    std::string id;                     // NAME, ATTRIBUTE (attribute name)

    BinOp bin_op;
    UnaryOp unary_op;
    bool is_and;                        // BOOLOP
    std::vector<CmpOp> cmp_ops;         // COMPARE

    // BINOP: left/right. UNARYOP, STARRED, ATTRIBUTE, CALL, SUBSCRIPT:
    // left is the operand / object / callee. SUBSCRIPT: right is the index.
    // IFEXP: left=body, right=orelse, cond=test. Comprehensions: left is the
    // element (key for DICTCOMP), right the value for DICTCOMP.
    ExprPtr left;
    ExprPtr right;
    ExprPtr cond;

    // SLICE bounds (each may be null)
    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;

    // LIST/TUPLE/SET elements, BOOLOP operands, COMPARE comparators,
    // CALL positional arguments, DICT keys (null entry = **spread)
    std::vector<ExprPtr> items;
    std::vector<ExprPtr> values;        // DICT values
    std::vector<Keyword> keywords;      // CALL
    std::vector<CompClause> comps;
    std::vector<FStringPart> parts;     // FSTRING
    std::shared_ptr<FunctionDef> func;  // LAMBDA

    Expr(ExprKind k, int l)
        : kind(k), line(l), bin_op(BinOp::ADD), unary_op(UnaryOp::NEG), is_and(false) {}
};

enum class StmtKind {
    EXPR,
    ASSIGN,
    AUGASSIGN,
    IF,
    WHILE,
    FOR,
    BREAK,
    CONTINUE,
    PASS,
    FUNCTIONDEF,
    RETURN,
    DEL,
    GLOBAL,
    NONLOCAL,
    ASSERT,
    RAISE,
    TRY,
    IMPORT,
    IMPORTFROM
};

struct ExceptHandler {
    ExprPtr type;           // null for a bare except
    std::string name;       // "as" binding
    std::vector<StmtPtr> body;
    int line;

    ExceptHandler() : line(0) {}
};

struct ImportName {
    std::string name;       // module or attribute
    std::string asname;
};

struct Stmt {
    StmtKind kind;
    int line;

    ExprPtr value;                      // EXPR, ASSIGN, AUGASSIGN, RETURN, RAISE, ASSERT message
    std::vector<ExprPtr> targets;       // ASSIGN (chained), DEL
    ExprPtr target;                     // AUGASSIGN, FOR
    BinOp aug_op;
    ExprPtr test;                       // IF, WHILE, ASSERT; FOR iterable
    std::vector<StmtPtr> body;
    std::vector<StmtPtr> orelse;
    std::vector<StmtPtr> finalbody;
    std::vector<ExceptHandler> handlers;
    std::shared_ptr<FunctionDef> func;  // FUNCTIONDEF
    std::vector<std::string> names;     // GLOBAL, NONLOCAL
    std::string module;                 // IMPORTFROM
    std::vector<ImportName> imports;    // IMPORT, IMPORTFROM ("*" for star)

    Stmt(StmtKind k, int l) : kind(k), line(l), aug_op(BinOp::ADD) {}
};

struct Param {
    std::string name;
    ExprPtr default_value;
    bool kw_only;

    Param() : kw_only(false) {}
};

struct FunctionDef {
    std::string name;
    std::vector<Param> params;
    std::string vararg;                 // *args name, empty when absent
    std::string kwarg;                  // **kwargs name
    std::vector<StmtPtr> body;
    ExprPtr lambda_body;                // set for lambdas instead of body
    int line;

    // Scope analysis
    std::set<std::string> local_names;
    std::set<std::string> global_names;
    std::set<std::string> nonlocal_names;

    FunctionDef() : line(0) {}
    bool is_lambda() const { return lambda_body != nullptr; }
};

// Parsed program; top-level statements in order
struct Module {
    std::vector<StmtPtr> body;
};

} // namespace script
} // namespace gatedrepl

#endif // gatedrepl_SCRIPT_AST_HPP
