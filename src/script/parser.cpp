/*
 * gatedrepl C++ - Script Parser Implementation
 *
 * Statement and expression grammar, f-string fields and per-function
 * scope analysis (locals, global and nonlocal declarations).
 */
#include <gatedrepl/script/parser.hpp>
#include <gatedrepl/script/errors.hpp>

#include <cstring>

namespace gatedrepl {
namespace script {

static const int kMaxNesting = 200;

bool is_keyword(const std::string& name) {
    static const char* keywords[] = {
        "False", "None", "True", "and", "as", "assert", "async", "await",
        "break", "class", "continue", "def", "del", "elif", "else", "except",
        "finally", "for", "from", "global", "if", "import", "in", "is",
        "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
        "while", "with", "yield", NULL
    };
    for (int i = 0; keywords[i] != NULL; ++i) {
        if (name == keywords[i]) return true;
    }
    return false;
}

const char* binop_symbol(BinOp op) {
    switch (op) {
        case BinOp::ADD: return "+";
        case BinOp::SUB: return "-";
        case BinOp::MUL: return "*";
        case BinOp::DIV: return "/";
        case BinOp::FLOORDIV: return "//";
        case BinOp::MOD: return "%";
        case BinOp::POW: return "**";
        case BinOp::LSHIFT: return "<<";
        case BinOp::RSHIFT: return ">>";
        case BinOp::BITAND: return "&";
        case BinOp::BITOR: return "|";
        case BinOp::BITXOR: return "^";
    }
    return "?";
}

static ExprPtr make_expr(ExprKind kind, int line) {
    return ExprPtr(new Expr(kind, line));
}

static StmtPtr make_stmt(StmtKind kind, int line) {
    return StmtPtr(new Stmt(kind, line));
}

Parser::DepthGuard::DepthGuard(Parser& p) : parser(p) {
    if (++parser.nesting_ > kMaxNesting) {
        parser.fail("too many nested expressions or blocks");
    }
}

Parser::DepthGuard::~DepthGuard() {
    --parser.nesting_;
}

Parser::Parser(const std::vector<Token>& tokens)
    : tokens_(tokens)
    , pos_(0)
    , function_depth_(0)
    , loop_depth_(0)
    , nesting_(0)
{
    if (tokens_.empty() || tokens_.back().type != TokenType::END) {
        tokens_.push_back(Token(TokenType::END, "", tokens_.empty() ? 1 : tokens_.back().line));
    }
}

Module Parser::parse(const std::string& source, int first_line) {
    Lexer lexer(source, first_line);
    Parser parser(lexer.tokenize());
    return parser.parse_module();
}

// ============================================================================
// Token helpers
// ============================================================================

const Token& Parser::peek(size_t ahead) const {
    size_t p = pos_ + ahead;
    return p < tokens_.size() ? tokens_[p] : tokens_.back();
}

const Token& Parser::advance() {
    const Token& tok = peek();
    if (pos_ < tokens_.size() - 1) ++pos_;
    return tok;
}

bool Parser::check_op(const char* op, size_t ahead) const {
    const Token& tok = peek(ahead);
    return tok.type == TokenType::OP && tok.text == op;
}

bool Parser::match_op(const char* op) {
    if (check_op(op)) {
        advance();
        return true;
    }
    return false;
}

void Parser::expect_op(const char* op) {
    if (!match_op(op)) {
        fail(std::string("expected '") + op + "'");
    }
}

bool Parser::check_keyword(const char* kw, size_t ahead) const {
    const Token& tok = peek(ahead);
    return tok.type == TokenType::NAME && tok.text == kw;
}

bool Parser::match_keyword(const char* kw) {
    if (check_keyword(kw)) {
        advance();
        return true;
    }
    return false;
}

void Parser::expect_keyword(const char* kw) {
    if (!match_keyword(kw)) {
        fail(std::string("expected '") + kw + "'");
    }
}

std::string Parser::expect_name() {
    const Token& tok = peek();
    if (tok.type != TokenType::NAME || is_keyword(tok.text)) {
        fail("expected a name");
    }
    advance();
    return tok.text;
}

bool Parser::at_statement_end() const {
    const Token& tok = peek();
    return tok.type == TokenType::NEWLINE || tok.type == TokenType::END ||
           (tok.type == TokenType::OP && tok.text == ";");
}

bool Parser::starts_expression() const {
    const Token& tok = peek();
    switch (tok.type) {
        case TokenType::INT:
        case TokenType::FLOAT:
        case TokenType::STRING:
        case TokenType::FSTRING:
            return true;
        case TokenType::NAME:
            return !is_keyword(tok.text) || tok.text == "None" || tok.text == "True" ||
                   tok.text == "False" || tok.text == "not" || tok.text == "lambda";
        case TokenType::OP:
            return tok.text == "(" || tok.text == "[" || tok.text == "{" || tok.text == "-" ||
                   tok.text == "+" || tok.text == "~" || tok.text == "*" || tok.text == "...";
        default:
            return false;
    }
}

void Parser::fail(const std::string& message) const {
    fail_at(peek(), message);
}

void Parser::fail_at(const Token& tok, const std::string& message) const {
    throw ScriptError("SyntaxError", message, tok.line);
}

// ============================================================================
// Statements
// ============================================================================

Module Parser::parse_module() {
    Module module;
    while (peek().type != TokenType::END) {
        if (peek().type == TokenType::NEWLINE) {
            advance();
            continue;
        }
        if (peek().type == TokenType::INDENT) {
            fail("unexpected indent");
        }
        parse_statement(module.body);
    }
    return module;
}

ExprPtr Parser::parse_standalone_expression() {
    ExprPtr expr = parse_testlist(true);
    while (peek().type == TokenType::NEWLINE) advance();
    if (peek().type != TokenType::END) {
        fail("invalid syntax in expression");
    }
    return expr;
}

void Parser::parse_statement(std::vector<StmtPtr>& out) {
    DepthGuard guard(*this);
    const Token& tok = peek();

    if (tok.type == TokenType::OP && tok.text == "@") {
        fail("decorators are not supported");
    }
    if (tok.type == TokenType::NAME) {
        if (tok.text == "if") { out.push_back(parse_if()); return; }
        if (tok.text == "while") { out.push_back(parse_while()); return; }
        if (tok.text == "for") { out.push_back(parse_for()); return; }
        if (tok.text == "try") { out.push_back(parse_try()); return; }
        if (tok.text == "def") { out.push_back(parse_def()); return; }
        if (tok.text == "class" || tok.text == "with" || tok.text == "async" || tok.text == "yield") {
            fail("'" + tok.text + "' statements are not supported");
        }
    }
    parse_simple_statement(out);
}

void Parser::parse_simple_statement(std::vector<StmtPtr>& out) {
    out.push_back(parse_small_statement());
    while (match_op(";")) {
        if (peek().type == TokenType::NEWLINE || peek().type == TokenType::END) break;
        out.push_back(parse_small_statement());
    }
    if (peek().type == TokenType::NEWLINE) {
        advance();
    } else if (peek().type != TokenType::END) {
        fail("invalid syntax");
    }
}

StmtPtr Parser::parse_small_statement() {
    const Token& tok = peek();
    int line = tok.line;

    if (tok.type == TokenType::NAME) {
        if (tok.text == "pass") {
            advance();
            return make_stmt(StmtKind::PASS, line);
        }
        if (tok.text == "break" || tok.text == "continue") {
            if (loop_depth_ == 0) fail("'" + tok.text + "' outside loop");
            StmtKind kind = tok.text == "break" ? StmtKind::BREAK : StmtKind::CONTINUE;
            advance();
            return make_stmt(kind, line);
        }
        if (tok.text == "return") {
            if (function_depth_ == 0) fail("'return' outside function");
            advance();
            StmtPtr s = make_stmt(StmtKind::RETURN, line);
            if (!at_statement_end()) s->value = parse_testlist(true);
            return s;
        }
        if (tok.text == "del") {
            advance();
            StmtPtr s = make_stmt(StmtKind::DEL, line);
            ExprPtr targets = parse_target_list();
            if (targets->kind == ExprKind::TUPLE) {
                for (size_t i = 0; i < targets->items.size(); ++i) {
                    validate_target(*targets->items[i], false);
                    s->targets.push_back(std::move(targets->items[i]));
                }
            } else {
                validate_target(*targets, false);
                s->targets.push_back(std::move(targets));
            }
            return s;
        }
        if (tok.text == "global" || tok.text == "nonlocal") {
            bool is_global = tok.text == "global";
            if (!is_global && function_depth_ == 0) {
                fail("nonlocal declaration not allowed at module level");
            }
            advance();
            StmtPtr s = make_stmt(is_global ? StmtKind::GLOBAL : StmtKind::NONLOCAL, line);
            s->names.push_back(expect_name());
            while (match_op(",")) s->names.push_back(expect_name());
            return s;
        }
        if (tok.text == "assert") {
            advance();
            StmtPtr s = make_stmt(StmtKind::ASSERT, line);
            s->test = parse_test();
            if (match_op(",")) s->value = parse_test();
            return s;
        }
        if (tok.text == "raise") {
            advance();
            StmtPtr s = make_stmt(StmtKind::RAISE, line);
            if (!at_statement_end()) {
                s->value = parse_test();
                if (match_keyword("from")) parse_test();
            }
            return s;
        }
        if (tok.text == "import") return parse_import();
        if (tok.text == "from") return parse_from_import();
        if (tok.text == "yield" || tok.text == "await") {
            fail("'" + tok.text + "' is not supported");
        }
    }
    return parse_expression_statement();
}

StmtPtr Parser::parse_expression_statement() {
    int line = peek().line;
    ExprPtr first = parse_testlist(true);

    static const char* aug_ops[] = { "+=", "-=", "*=", "/=", "//=", "%=", "**=",
                                     "<<=", ">>=", "&=", "|=", "^=", NULL };
    static const BinOp aug_kinds[] = { BinOp::ADD, BinOp::SUB, BinOp::MUL, BinOp::DIV,
                                       BinOp::FLOORDIV, BinOp::MOD, BinOp::POW, BinOp::LSHIFT,
                                       BinOp::RSHIFT, BinOp::BITAND, BinOp::BITOR, BinOp::BITXOR };
    for (int i = 0; aug_ops[i] != NULL; ++i) {
        if (check_op(aug_ops[i])) {
            if (first->kind != ExprKind::NAME && first->kind != ExprKind::SUBSCRIPT &&
                first->kind != ExprKind::ATTRIBUTE) {
                fail("illegal expression for augmented assignment");
            }
            advance();
            StmtPtr s = make_stmt(StmtKind::AUGASSIGN, line);
            s->aug_op = aug_kinds[i];
            s->target = std::move(first);
            s->value = parse_testlist(true);
            return s;
        }
    }

    // Annotated assignment; the annotation is evaluated by nobody
    if (check_op(":")) {
        if (first->kind != ExprKind::NAME && first->kind != ExprKind::SUBSCRIPT &&
            first->kind != ExprKind::ATTRIBUTE) {
            fail("illegal target for annotation");
        }
        advance();
        parse_test();
        if (!match_op("=")) {
            return make_stmt(StmtKind::PASS, line);
        }
        StmtPtr s = make_stmt(StmtKind::ASSIGN, line);
        s->targets.push_back(std::move(first));
        s->value = parse_testlist(true);
        return s;
    }

    if (check_op("=")) {
        StmtPtr s = make_stmt(StmtKind::ASSIGN, line);
        validate_target(*first, false);
        s->targets.push_back(std::move(first));
        while (match_op("=")) {
            ExprPtr next = parse_testlist(true);
            if (check_op("=")) {
                validate_target(*next, false);
                s->targets.push_back(std::move(next));
            } else {
                s->value = std::move(next);
            }
        }
        return s;
    }

    if (first->kind == ExprKind::STARRED) {
        fail("can't use starred expression here");
    }
    StmtPtr s = make_stmt(StmtKind::EXPR, line);
    s->value = std::move(first);
    return s;
}

void Parser::parse_block(std::vector<StmtPtr>& out) {
    expect_op(":");
    if (peek().type != TokenType::NEWLINE) {
        parse_simple_statement(out);
        return;
    }
    advance();
    if (peek().type != TokenType::INDENT) {
        fail("expected an indented block");
    }
    advance();
    while (peek().type != TokenType::DEDENT && peek().type != TokenType::END) {
        if (peek().type == TokenType::INDENT) {
            fail("unexpected indent");
        }
        parse_statement(out);
    }
    if (peek().type == TokenType::DEDENT) advance();
}

StmtPtr Parser::parse_if() {
    int line = advance().line;
    StmtPtr s = make_stmt(StmtKind::IF, line);
    s->test = parse_test();
    parse_block(s->body);

    if (check_keyword("elif")) {
        // elif chains become nested ifs in the else branch
        s->orelse.push_back(parse_if());
    } else if (match_keyword("else")) {
        parse_block(s->orelse);
    }
    return s;
}

StmtPtr Parser::parse_while() {
    int line = advance().line;
    StmtPtr s = make_stmt(StmtKind::WHILE, line);
    s->test = parse_test();
    ++loop_depth_;
    parse_block(s->body);
    --loop_depth_;
    if (match_keyword("else")) parse_block(s->orelse);
    return s;
}

StmtPtr Parser::parse_for() {
    int line = advance().line;
    StmtPtr s = make_stmt(StmtKind::FOR, line);
    s->target = parse_target_list();
    validate_target(*s->target, false);
    expect_keyword("in");
    s->test = parse_testlist(true);
    ++loop_depth_;
    parse_block(s->body);
    --loop_depth_;
    if (match_keyword("else")) parse_block(s->orelse);
    return s;
}

StmtPtr Parser::parse_try() {
    int line = advance().line;
    StmtPtr s = make_stmt(StmtKind::TRY, line);
    parse_block(s->body);

    while (check_keyword("except")) {
        ExceptHandler handler;
        handler.line = advance().line;
        if (!check_op(":")) {
            handler.type = parse_test();
            if (match_keyword("as")) handler.name = expect_name();
        }
        parse_block(handler.body);
        s->handlers.push_back(std::move(handler));
    }
    if (!s->handlers.empty() && match_keyword("else")) {
        parse_block(s->orelse);
    }
    if (match_keyword("finally")) {
        parse_block(s->finalbody);
    }
    if (s->handlers.empty() && s->finalbody.empty()) {
        fail("expected 'except' or 'finally' block");
    }
    return s;
}

StmtPtr Parser::parse_def() {
    int line = advance().line;
    StmtPtr s = make_stmt(StmtKind::FUNCTIONDEF, line);
    std::shared_ptr<FunctionDef> def = std::make_shared<FunctionDef>();
    def->line = line;
    def->name = expect_name();

    expect_op("(");
    parse_params(*def, ")");
    expect_op(")");
    if (match_op("->")) parse_test();

    int saved_loops = loop_depth_;
    loop_depth_ = 0;
    ++function_depth_;
    parse_block(def->body);
    --function_depth_;
    loop_depth_ = saved_loops;

    analyze_scope(*def);
    s->func = def;
    return s;
}

void Parser::parse_params(FunctionDef& def, const char* closer) {
    bool seen_default = false;
    bool kw_only = false;
    std::set<std::string> seen;

    while (!check_op(closer)) {
        if (match_op("/")) {
            // positional-only marker; all parameters accept positions here
        } else if (match_op("**")) {
            def.kwarg = expect_name();
            if (std::strcmp(closer, ")") == 0 && match_op(":")) parse_test();
        } else if (match_op("*")) {
            kw_only = true;
            if (peek().type == TokenType::NAME) {
                def.vararg = expect_name();
                if (std::strcmp(closer, ")") == 0 && match_op(":")) parse_test();
            }
        } else {
            if (!def.kwarg.empty()) fail("arguments cannot follow var-keyword argument");
            Param param;
            param.name = expect_name();
            param.kw_only = kw_only;
            if (std::strcmp(closer, ")") == 0 && match_op(":")) parse_test();
            if (match_op("=")) {
                param.default_value = parse_test();
                seen_default = true;
            } else if (seen_default && !kw_only) {
                fail("non-default argument follows default argument");
            }
            if (!seen.insert(param.name).second) {
                fail("duplicate argument '" + param.name + "' in function definition");
            }
            def.params.push_back(std::move(param));
        }
        if (!match_op(",")) break;
    }
}

StmtPtr Parser::parse_import() {
    int line = advance().line;
    StmtPtr s = make_stmt(StmtKind::IMPORT, line);
    do {
        ImportName name;
        name.name = expect_name();
        while (match_op(".")) name.name += "." + expect_name();
        if (match_keyword("as")) name.asname = expect_name();
        s->imports.push_back(name);
    } while (match_op(","));
    return s;
}

StmtPtr Parser::parse_from_import() {
    int line = advance().line;
    StmtPtr s = make_stmt(StmtKind::IMPORTFROM, line);
    if (check_op(".") || check_op("...")) {
        fail("relative imports are not supported");
    }
    s->module = expect_name();
    while (match_op(".")) s->module += "." + expect_name();
    expect_keyword("import");

    if (match_op("*")) {
        ImportName star;
        star.name = "*";
        s->imports.push_back(star);
        return s;
    }
    bool parens = match_op("(");
    do {
        if (parens && check_op(")")) break;
        ImportName name;
        name.name = expect_name();
        if (match_keyword("as")) name.asname = expect_name();
        s->imports.push_back(name);
    } while (match_op(","));
    if (parens) expect_op(")");
    return s;
}

// ============================================================================
// Scope analysis
// ============================================================================

void Parser::collect_target_names(const Expr& target, std::set<std::string>& names) {
    switch (target.kind) {
        case ExprKind::NAME:
            names.insert(target.id);
            break;
        case ExprKind::TUPLE:
        case ExprKind::LIST:
            for (size_t i = 0; i < target.items.size(); ++i) {
                collect_target_names(*target.items[i], names);
            }
            break;
        case ExprKind::STARRED:
            collect_target_names(*target.left, names);
            break;
        default:
            break;
    }
}

void Parser::collect_assigned(const std::vector<StmtPtr>& body, FunctionDef& def) {
    for (size_t i = 0; i < body.size(); ++i) {
        const Stmt& s = *body[i];
        switch (s.kind) {
            case StmtKind::ASSIGN:
            case StmtKind::DEL:
                for (size_t t = 0; t < s.targets.size(); ++t) {
                    collect_target_names(*s.targets[t], def.local_names);
                }
                break;
            case StmtKind::AUGASSIGN:
                collect_target_names(*s.target, def.local_names);
                break;
            case StmtKind::FOR:
                collect_target_names(*s.target, def.local_names);
                collect_assigned(s.body, def);
                collect_assigned(s.orelse, def);
                break;
            case StmtKind::IF:
            case StmtKind::WHILE:
                collect_assigned(s.body, def);
                collect_assigned(s.orelse, def);
                break;
            case StmtKind::TRY:
                collect_assigned(s.body, def);
                for (size_t h = 0; h < s.handlers.size(); ++h) {
                    if (!s.handlers[h].name.empty()) def.local_names.insert(s.handlers[h].name);
                    collect_assigned(s.handlers[h].body, def);
                }
                collect_assigned(s.orelse, def);
                collect_assigned(s.finalbody, def);
                break;
            case StmtKind::FUNCTIONDEF:
                def.local_names.insert(s.func->name);
                break;
            case StmtKind::IMPORT:
                for (size_t n = 0; n < s.imports.size(); ++n) {
                    const ImportName& imp = s.imports[n];
                    def.local_names.insert(!imp.asname.empty() ? imp.asname : imp.name.substr(0, imp.name.find('.')));
                }
                break;
            case StmtKind::IMPORTFROM:
                for (size_t n = 0; n < s.imports.size(); ++n) {
                    const ImportName& imp = s.imports[n];
                    if (imp.name != "*") def.local_names.insert(!imp.asname.empty() ? imp.asname : imp.name);
                }
                break;
            case StmtKind::GLOBAL:
                def.global_names.insert(s.names.begin(), s.names.end());
                break;
            case StmtKind::NONLOCAL:
                def.nonlocal_names.insert(s.names.begin(), s.names.end());
                break;
            default:
                break;
        }
    }
}

void Parser::analyze_scope(FunctionDef& def) {
    for (size_t i = 0; i < def.params.size(); ++i) {
        def.local_names.insert(def.params[i].name);
    }
    if (!def.vararg.empty()) def.local_names.insert(def.vararg);
    if (!def.kwarg.empty()) def.local_names.insert(def.kwarg);

    std::set<std::string> params(def.local_names);
    collect_assigned(def.body, def);

    for (std::set<std::string>::const_iterator it = def.global_names.begin(); it != def.global_names.end(); ++it) {
        if (params.count(*it)) {
            throw ScriptError("SyntaxError", "name '" + *it + "' is parameter and global", def.line);
        }
        def.local_names.erase(*it);
    }
    for (std::set<std::string>::const_iterator it = def.nonlocal_names.begin(); it != def.nonlocal_names.end(); ++it) {
        if (params.count(*it)) {
            throw ScriptError("SyntaxError", "name '" + *it + "' is parameter and nonlocal", def.line);
        }
        def.local_names.erase(*it);
    }
}

void Parser::validate_target(const Expr& target, bool allow_starred) const {
    switch (target.kind) {
        case ExprKind::NAME:
        case ExprKind::SUBSCRIPT:
        case ExprKind::ATTRIBUTE:
            return;
        case ExprKind::TUPLE:
        case ExprKind::LIST: {
            bool seen_star = false;
            for (size_t i = 0; i < target.items.size(); ++i) {
                if (target.items[i]->kind == ExprKind::STARRED) {
                    if (seen_star) {
                        throw ScriptError("SyntaxError", "multiple starred expressions in assignment", target.line);
                    }
                    seen_star = true;
                }
                validate_target(*target.items[i], true);
            }
            return;
        }
        case ExprKind::STARRED:
            if (!allow_starred) {
                throw ScriptError("SyntaxError", "starred assignment target must be in a list or tuple", target.line);
            }
            validate_target(*target.left, false);
            return;
        case ExprKind::CALL:
            throw ScriptError("SyntaxError", "cannot assign to function call", target.line);
        case ExprKind::CONSTANT:
        case ExprKind::FSTRING:
            throw ScriptError("SyntaxError", "cannot assign to literal", target.line);
        default:
            throw ScriptError("SyntaxError", "cannot assign to expression", target.line);
    }
}

// ============================================================================
// Expressions
// ============================================================================

ExprPtr Parser::parse_star_or_test() {
    if (check_op("*")) {
        int line = advance().line;
        ExprPtr e = make_expr(ExprKind::STARRED, line);
        e->left = parse_bitor();
        return e;
    }
    return parse_test();
}

ExprPtr Parser::parse_testlist(bool allow_star) {
    int line = peek().line;
    ExprPtr first = allow_star ? parse_star_or_test() : parse_test();
    if (!check_op(",")) return first;

    ExprPtr tuple = make_expr(ExprKind::TUPLE, line);
    tuple->items.push_back(std::move(first));
    while (match_op(",")) {
        if (!starts_expression()) break;
        tuple->items.push_back(allow_star ? parse_star_or_test() : parse_test());
    }
    return tuple;
}

ExprPtr Parser::parse_target_list() {
    int line = peek().line;
    ExprPtr first;
    if (check_op("*")) {
        advance();
        first = make_expr(ExprKind::STARRED, line);
        first->left = parse_bitor();
    } else {
        first = parse_bitor();
    }
    if (!check_op(",")) return first;

    ExprPtr tuple = make_expr(ExprKind::TUPLE, line);
    tuple->items.push_back(std::move(first));
    while (match_op(",")) {
        if (check_keyword("in") || check_op("=") || at_statement_end()) break;
        if (check_op("*")) {
            int star_line = advance().line;
            ExprPtr star = make_expr(ExprKind::STARRED, star_line);
            star->left = parse_bitor();
            tuple->items.push_back(std::move(star));
        } else {
            tuple->items.push_back(parse_bitor());
        }
    }
    return tuple;
}

ExprPtr Parser::parse_test() {
    DepthGuard guard(*this);
    if (check_keyword("lambda")) return parse_lambda();

    ExprPtr body = parse_or_test();
    if (check_keyword("if")) {
        int line = advance().line;
        ExprPtr e = make_expr(ExprKind::IFEXP, line);
        e->cond = parse_or_test();
        expect_keyword("else");
        e->left = std::move(body);
        e->right = parse_test();
        return e;
    }
    return body;
}

ExprPtr Parser::parse_lambda() {
    int line = advance().line;
    ExprPtr e = make_expr(ExprKind::LAMBDA, line);
    std::shared_ptr<FunctionDef> def = std::make_shared<FunctionDef>();
    def->name = "<lambda>";
    def->line = line;
    parse_params(*def, ":");
    expect_op(":");

    int saved_loops = loop_depth_;
    loop_depth_ = 0;
    ++function_depth_;
    def->lambda_body = parse_test();
    --function_depth_;
    loop_depth_ = saved_loops;

    analyze_scope(*def);
    e->func = def;
    return e;
}

ExprPtr Parser::parse_or_test() {
    ExprPtr first = parse_and_test();
    if (!check_keyword("or")) return first;

    ExprPtr e = make_expr(ExprKind::BOOLOP, first->line);
    e->is_and = false;
    e->items.push_back(std::move(first));
    while (match_keyword("or")) e->items.push_back(parse_and_test());
    return e;
}

ExprPtr Parser::parse_and_test() {
    ExprPtr first = parse_not_test();
    if (!check_keyword("and")) return first;

    ExprPtr e = make_expr(ExprKind::BOOLOP, first->line);
    e->is_and = true;
    e->items.push_back(std::move(first));
    while (match_keyword("and")) e->items.push_back(parse_not_test());
    return e;
}

ExprPtr Parser::parse_not_test() {
    if (check_keyword("not")) {
        DepthGuard guard(*this);
        int line = advance().line;
        ExprPtr e = make_expr(ExprKind::UNARYOP, line);
        e->unary_op = UnaryOp::NOT;
        e->left = parse_not_test();
        return e;
    }
    return parse_comparison();
}

ExprPtr Parser::parse_comparison() {
    ExprPtr first = parse_bitor();
    ExprPtr e;

    for (;;) {
        CmpOp op;
        const Token& tok = peek();
        if (tok.type == TokenType::OP && tok.text == "==") op = CmpOp::EQ;
        else if (tok.type == TokenType::OP && tok.text == "!=") op = CmpOp::NE;
        else if (tok.type == TokenType::OP && tok.text == "<") op = CmpOp::LT;
        else if (tok.type == TokenType::OP && tok.text == "<=") op = CmpOp::LE;
        else if (tok.type == TokenType::OP && tok.text == ">") op = CmpOp::GT;
        else if (tok.type == TokenType::OP && tok.text == ">=") op = CmpOp::GE;
        else if (check_keyword("in")) op = CmpOp::IN;
        else if (check_keyword("not") && check_keyword("in", 1)) op = CmpOp::NOT_IN;
        else if (check_keyword("is")) op = check_keyword("not", 1) ? CmpOp::IS_NOT : CmpOp::IS;
        else break;

        advance();
        if (op == CmpOp::NOT_IN || op == CmpOp::IS_NOT) advance();

        if (!e) {
            e = make_expr(ExprKind::COMPARE, first->line);
            e->left = std::move(first);
        }
        e->cmp_ops.push_back(op);
        e->items.push_back(parse_bitor());
    }
    if (e) return e;
    return first;
}

static ExprPtr make_binop(BinOp op, ExprPtr left, ExprPtr right) {
    ExprPtr e = make_expr(ExprKind::BINOP, left->line);
    e->bin_op = op;
    e->left = std::move(left);
    e->right = std::move(right);
    return e;
}

ExprPtr Parser::parse_bitor() {
    ExprPtr e = parse_bitxor();
    while (match_op("|")) e = make_binop(BinOp::BITOR, std::move(e), parse_bitxor());
    return e;
}

ExprPtr Parser::parse_bitxor() {
    ExprPtr e = parse_bitand();
    while (match_op("^")) e = make_binop(BinOp::BITXOR, std::move(e), parse_bitand());
    return e;
}

ExprPtr Parser::parse_bitand() {
    ExprPtr e = parse_shift();
    while (match_op("&")) e = make_binop(BinOp::BITAND, std::move(e), parse_shift());
    return e;
}

ExprPtr Parser::parse_shift() {
    ExprPtr e = parse_arith();
    for (;;) {
        if (match_op("<<")) e = make_binop(BinOp::LSHIFT, std::move(e), parse_arith());
        else if (match_op(">>")) e = make_binop(BinOp::RSHIFT, std::move(e), parse_arith());
        else return e;
    }
}

ExprPtr Parser::parse_arith() {
    ExprPtr e = parse_term();
    for (;;) {
        if (match_op("+")) e = make_binop(BinOp::ADD, std::move(e), parse_term());
        else if (match_op("-")) e = make_binop(BinOp::SUB, std::move(e), parse_term());
        else return e;
    }
}

ExprPtr Parser::parse_term() {
    ExprPtr e = parse_factor();
    for (;;) {
        if (match_op("*")) e = make_binop(BinOp::MUL, std::move(e), parse_factor());
        else if (match_op("/")) e = make_binop(BinOp::DIV, std::move(e), parse_factor());
        else if (match_op("//")) e = make_binop(BinOp::FLOORDIV, std::move(e), parse_factor());
        else if (match_op("%")) e = make_binop(BinOp::MOD, std::move(e), parse_factor());
        else if (check_op("@")) fail("matrix multiplication is not supported");
        else return e;
    }
}

ExprPtr Parser::parse_factor() {
    UnaryOp op;
    if (check_op("-")) op = UnaryOp::NEG;
    else if (check_op("+")) op = UnaryOp::POS;
    else if (check_op("~")) op = UnaryOp::INVERT;
    else return parse_power();

    DepthGuard guard(*this);
    int line = advance().line;
    ExprPtr e = make_expr(ExprKind::UNARYOP, line);
    e->unary_op = op;
    e->left = parse_factor();
    return e;
}

ExprPtr Parser::parse_power() {
    ExprPtr base = parse_atom_expr();
    if (match_op("**")) {
        return make_binop(BinOp::POW, std::move(base), parse_factor());
    }
    return base;
}

ExprPtr Parser::parse_atom_expr() {
    if (check_keyword("await")) fail("'await' is not supported");

    ExprPtr e = parse_atom();
    for (;;) {
        if (check_op("(")) {
            e = parse_call(std::move(e));
        } else if (check_op("[")) {
            int line = advance().line;
            ExprPtr sub = make_expr(ExprKind::SUBSCRIPT, line);
            sub->left = std::move(e);
            sub->right = parse_subscript();
            expect_op("]");
            e = std::move(sub);
        } else if (check_op(".")) {
            int line = advance().line;
            ExprPtr attr = make_expr(ExprKind::ATTRIBUTE, line);
            attr->left = std::move(e);
            attr->id = expect_name();
            e = std::move(attr);
        } else {
            return e;
        }
    }
}

ExprPtr Parser::parse_call(ExprPtr callee) {
    int line = advance().line;
    ExprPtr call = make_expr(ExprKind::CALL, line);
    call->left = std::move(callee);

    std::set<std::string> seen_keywords;
    while (!check_op(")")) {
        if (match_op("**")) {
            Keyword kw;
            kw.value = parse_test();
            call->keywords.push_back(std::move(kw));
        } else if (check_op("*")) {
            int star_line = advance().line;
            ExprPtr star = make_expr(ExprKind::STARRED, star_line);
            star->left = parse_test();
            call->items.push_back(std::move(star));
        } else if (peek().type == TokenType::NAME && check_op("=", 1) && !is_keyword(peek().text)) {
            Keyword kw;
            kw.name = advance().text;
            advance();
            if (!seen_keywords.insert(kw.name).second) {
                fail("keyword argument repeated: " + kw.name);
            }
            kw.value = parse_test();
            call->keywords.push_back(std::move(kw));
        } else {
            if (!call->keywords.empty()) {
                fail("positional argument follows keyword argument");
            }
            ExprPtr arg = parse_test();
            if (check_keyword("for")) {
                ExprPtr gen = make_expr(ExprKind::GENEXP, arg->line);
                gen->left = std::move(arg);
                parse_comp_clauses(gen->comps);
                arg = std::move(gen);
            }
            call->items.push_back(std::move(arg));
        }
        if (!match_op(",")) break;
    }
    expect_op(")");
    return call;
}

ExprPtr Parser::parse_subscript() {
    int line = peek().line;
    ExprPtr first = parse_slice_item();
    if (!check_op(",")) return first;

    ExprPtr tuple = make_expr(ExprKind::TUPLE, line);
    tuple->items.push_back(std::move(first));
    while (match_op(",")) {
        if (check_op("]")) break;
        tuple->items.push_back(parse_slice_item());
    }
    return tuple;
}

ExprPtr Parser::parse_slice_item() {
    int line = peek().line;
    ExprPtr lower;
    if (!check_op(":")) {
        lower = parse_test();
        if (!check_op(":")) return lower;
    }

    ExprPtr slice = make_expr(ExprKind::SLICE, line);
    slice->lower = std::move(lower);
    expect_op(":");
    if (!check_op(":") && !check_op("]") && !check_op(",")) {
        slice->upper = parse_test();
    }
    if (match_op(":")) {
        if (!check_op("]") && !check_op(",")) slice->step = parse_test();
    }
    return slice;
}

void Parser::parse_comp_clauses(std::vector<CompClause>& comps) {
    while (match_keyword("for")) {
        CompClause clause;
        clause.target = parse_target_list();
        validate_target(*clause.target, false);
        expect_keyword("in");
        clause.iter = parse_or_test();
        while (match_keyword("if")) {
            clause.conds.push_back(parse_or_test());
        }
        comps.push_back(std::move(clause));
    }
}

ExprPtr Parser::parse_atom() {
    DepthGuard guard(*this);
    const Token& tok = peek();

    switch (tok.type) {
        case TokenType::INT: {
            ExprPtr e = make_expr(ExprKind::CONSTANT, tok.line);
            e->constant = Value::from_int(tok.int_value);
            advance();
            return e;
        }
        case TokenType::FLOAT: {
            ExprPtr e = make_expr(ExprKind::CONSTANT, tok.line);
            e->constant = Value::from_float(tok.float_value);
            advance();
            return e;
        }
        case TokenType::STRING:
        case TokenType::FSTRING:
            return parse_strings();
        case TokenType::NAME: {
            ExprPtr e;
            if (tok.text == "None" || tok.text == "True" || tok.text == "False") {
                e = make_expr(ExprKind::CONSTANT, tok.line);
                if (tok.text != "None") e->constant = Value::from_bool(tok.text == "True");
            } else if (is_keyword(tok.text)) {
                fail("invalid syntax near '" + tok.text + "'");
            } else {
                e = make_expr(ExprKind::NAME, tok.line);
                e->id = tok.text;
            }
            advance();
            return e;
        }
        case TokenType::OP:
            if (tok.text == "(") return parse_paren();
            if (tok.text == "[") return parse_list_display();
            if (tok.text == "{") return parse_brace_display();
            if (tok.text == "...") {
                ExprPtr e = make_expr(ExprKind::CONSTANT, tok.line);
                advance();
                return e;
            }
            break;
        case TokenType::INDENT:
            fail("unexpected indent");
            break;
        default:
            break;
    }
    fail("invalid syntax");
    return ExprPtr();
}

ExprPtr Parser::parse_paren() {
    int line = advance().line;
    if (match_op(")")) {
        return make_expr(ExprKind::TUPLE, line);
    }
    if (check_keyword("yield")) fail("'yield' is not supported");

    ExprPtr first = parse_star_or_test();
    if (check_keyword("for")) {
        ExprPtr gen = make_expr(ExprKind::GENEXP, line);
        gen->left = std::move(first);
        parse_comp_clauses(gen->comps);
        expect_op(")");
        return gen;
    }
    if (!check_op(",")) {
        expect_op(")");
        if (first->kind == ExprKind::STARRED) fail("can't use starred expression here");
        return first;
    }

    ExprPtr tuple = make_expr(ExprKind::TUPLE, line);
    tuple->items.push_back(std::move(first));
    while (match_op(",")) {
        if (check_op(")")) break;
        tuple->items.push_back(parse_star_or_test());
    }
    expect_op(")");
    return tuple;
}

ExprPtr Parser::parse_list_display() {
    int line = advance().line;
    ExprPtr list = make_expr(ExprKind::LIST, line);
    if (match_op("]")) return list;

    ExprPtr first = parse_star_or_test();
    if (check_keyword("for")) {
        ExprPtr comp = make_expr(ExprKind::LISTCOMP, line);
        comp->left = std::move(first);
        parse_comp_clauses(comp->comps);
        expect_op("]");
        return comp;
    }
    list->items.push_back(std::move(first));
    while (match_op(",")) {
        if (check_op("]")) break;
        list->items.push_back(parse_star_or_test());
    }
    expect_op("]");
    return list;
}

ExprPtr Parser::parse_brace_display() {
    int line = advance().line;
    if (match_op("}")) {
        return make_expr(ExprKind::DICT, line);
    }

    // Dict display, or a set display with a leading plain element
    if (!check_op("*")) {
        ExprPtr key;
        ExprPtr value;
        bool spread = false;
        if (match_op("**")) {
            spread = true;
            value = parse_bitor();
        } else {
            key = parse_test();
            if (!check_op(":")) {
                // Set display
                ExprPtr set = make_expr(ExprKind::SET, line);
                if (check_keyword("for")) {
                    ExprPtr comp = make_expr(ExprKind::SETCOMP, line);
                    comp->left = std::move(key);
                    parse_comp_clauses(comp->comps);
                    expect_op("}");
                    return comp;
                }
                set->items.push_back(std::move(key));
                while (match_op(",")) {
                    if (check_op("}")) break;
                    set->items.push_back(parse_star_or_test());
                }
                expect_op("}");
                return set;
            }
            advance();
            value = parse_test();
        }

        if (!spread && check_keyword("for")) {
            ExprPtr comp = make_expr(ExprKind::DICTCOMP, line);
            comp->left = std::move(key);
            comp->right = std::move(value);
            parse_comp_clauses(comp->comps);
            expect_op("}");
            return comp;
        }

        ExprPtr dict = make_expr(ExprKind::DICT, line);
        dict->items.push_back(std::move(key));
        dict->values.push_back(std::move(value));
        while (match_op(",")) {
            if (check_op("}")) break;
            if (match_op("**")) {
                dict->items.push_back(ExprPtr());
                dict->values.push_back(parse_bitor());
            } else {
                dict->items.push_back(parse_test());
                expect_op(":");
                dict->values.push_back(parse_test());
            }
        }
        expect_op("}");
        return dict;
    }

    // Set display starting with *iterable
    ExprPtr set = make_expr(ExprKind::SET, line);
    set->items.push_back(parse_star_or_test());
    while (match_op(",")) {
        if (check_op("}")) break;
        set->items.push_back(parse_star_or_test());
    }
    expect_op("}");
    return set;
}

ExprPtr Parser::parse_strings() {
    int line = peek().line;
    bool has_fstring = false;
    for (size_t i = 0; peek(i).type == TokenType::STRING || peek(i).type == TokenType::FSTRING; ++i) {
        if (peek(i).type == TokenType::FSTRING) has_fstring = true;
    }

    if (!has_fstring) {
        std::string text;
        while (peek().type == TokenType::STRING) text += advance().text;
        ExprPtr e = make_expr(ExprKind::CONSTANT, line);
        e->constant = Value::from_string(text);
        return e;
    }

    ExprPtr e = make_expr(ExprKind::FSTRING, line);
    while (peek().type == TokenType::STRING || peek().type == TokenType::FSTRING) {
        const Token& tok = advance();
        if (tok.type == TokenType::STRING) {
            FStringPart part;
            part.literal = tok.text;
            e->parts.push_back(std::move(part));
        } else {
            parse_fstring(tok.text, tok.raw, tok.line, e->parts);
        }
    }
    return e;
}

// ============================================================================
// f-strings
// ============================================================================

void Parser::parse_fstring(const std::string& body, bool raw, int line, std::vector<FStringPart>& parts) {
    DepthGuard guard(*this);
    std::string literal;

    auto flush = [&]() {
        if (literal.empty()) return;
        FStringPart part;
        part.literal = raw ? literal : decode_escapes(literal, line);
        parts.push_back(std::move(part));
        literal.clear();
    };

    size_t i = 0;
    const size_t n = body.size();
    while (i < n) {
        char c = body[i];
        if (c == '{') {
            if (i + 1 < n && body[i + 1] == '{') {
                literal += '{';
                i += 2;
                continue;
            }
            flush();

            // Locate the end of the expression part
            size_t j = i + 1;
            int depth = 0;
            char in_quote = 0;
            while (j < n) {
                char ch = body[j];
                if (in_quote) {
                    if (ch == in_quote) in_quote = 0;
                } else if (ch == '\'' || ch == '"') {
                    in_quote = ch;
                } else if (ch == '(' || ch == '[' || ch == '{') {
                    ++depth;
                } else if (ch == ')' || ch == ']' || ch == '}') {
                    if (depth == 0) break;
                    --depth;
                } else if (depth == 0 && ch == '!' && j + 1 < n && body[j + 1] != '=') {
                    break;
                } else if (depth == 0 && ch == ':') {
                    break;
                }
                ++j;
            }
            if (j >= n) {
                throw ScriptError("SyntaxError", "f-string: expecting '}'", line);
            }

            std::string expr_text = body.substr(i + 1, j - i - 1);
            std::string trimmed = expr_text;
            while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t')) trimmed.pop_back();
            size_t lead = trimmed.find_first_not_of(" \t");
            if (lead == std::string::npos) {
                throw ScriptError("SyntaxError", "f-string: empty expression not allowed", line);
            }

            FStringPart part;
            bool self_documenting = false;
            if (trimmed.size() >= 2 && trimmed.back() == '=') {
                char prev = trimmed[trimmed.size() - 2];
                if (prev != '=' && prev != '!' && prev != '<' && prev != '>') {
                    self_documenting = true;
                    FStringPart label;
                    label.literal = expr_text;
                    parts.push_back(std::move(label));
                    trimmed.pop_back();
                }
            }

            if (body[j] == '!') {
                if (j + 1 >= n) throw ScriptError("SyntaxError", "f-string: expecting '}'", line);
                char conv = body[j + 1];
                if (conv != 'r' && conv != 's' && conv != 'a') {
                    throw ScriptError("SyntaxError", "f-string: invalid conversion character", line);
                }
                part.conversion = conv;
                j += 2;
            }
            if (j < n && body[j] == ':') {
                size_t k = j + 1;
                int spec_depth = 0;
                while (k < n) {
                    if (body[k] == '{') ++spec_depth;
                    else if (body[k] == '}') {
                        if (spec_depth == 0) break;
                        --spec_depth;
                    }
                    ++k;
                }
                if (k >= n) throw ScriptError("SyntaxError", "f-string: expecting '}'", line);
                ExprPtr spec = make_expr(ExprKind::FSTRING, line);
                parse_fstring(body.substr(j + 1, k - j - 1), true, line, spec->parts);
                part.format_spec = std::move(spec);
                j = k;
            }
            if (j >= n || body[j] != '}') {
                throw ScriptError("SyntaxError", "f-string: expecting '}'", line);
            }
            if (self_documenting && part.conversion == 0 && !part.format_spec) {
                part.conversion = 'r';
            }

            Lexer lexer("(" + trimmed + ")", line);
            Parser sub(lexer.tokenize());
            sub.nesting_ = nesting_;
            part.expr = sub.parse_standalone_expression();
            parts.push_back(std::move(part));
            i = j + 1;
        } else if (c == '}') {
            if (i + 1 < n && body[i + 1] == '}') {
                literal += '}';
                i += 2;
                continue;
            }
            throw ScriptError("SyntaxError", "f-string: single '}' is not allowed", line);
        } else if (c == '\\' && !raw && i + 1 < n) {
            literal += c;
            literal += body[i + 1];
            i += 2;
        } else {
            literal += c;
            ++i;
        }
    }
    flush();
}

} // namespace script
} // namespace gatedrepl
