/*
 * gatedrepl C++ - Script Lexer
 *
 * Turns source text into a token stream with explicit NEWLINE / INDENT /
 * DEDENT tokens. Newlines inside brackets and after a trailing backslash
 * are joined; blank and comment-only lines produce no tokens.
 */
#ifndef gatedrepl_SCRIPT_LEXER_HPP
#define gatedrepl_SCRIPT_LEXER_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace gatedrepl {
namespace script {

enum class TokenType {
    NAME,
    INT,
    FLOAT,
    STRING,     // text holds the decoded value
    FSTRING,    // text holds the raw body; parsed later into parts
    OP,
    NEWLINE,
    INDENT,
    DEDENT,
    END
};

struct Token {
    TokenType type;
    std::string text;
    int line;
    int64_t int_value;
    double float_value;
    bool raw;           // r-prefixed literal

    Token() : type(TokenType::END), line(0), int_value(0), float_value(0.0), raw(false) {}
    Token(TokenType t, const std::string& s, int l)
        : type(t), text(s), line(l), int_value(0), float_value(0.0), raw(false) {}
};

class Lexer {
public:
    explicit Lexer(const std::string& source, int first_line = 1);

    // Throws ScriptError("SyntaxError") on malformed input
    std::vector<Token> tokenize();

private:
    void scan_line_start();
    void scan_token();
    void scan_number();
    void scan_string(const std::string& prefix);
    void scan_name();
    void scan_operator();

    void emit(TokenType type, const std::string& text);
    void fail(const std::string& message) const;

    char peek(size_t ahead = 0) const;

    std::string src_;
    size_t pos_;
    int line_;
    int paren_depth_;
    bool at_line_start_;
    std::vector<int> indents_;
    std::vector<Token> tokens_;
};

// Decode backslash escapes of a non-raw string body
std::string decode_escapes(const std::string& body, int line);

} // namespace script
} // namespace gatedrepl

#endif // gatedrepl_SCRIPT_LEXER_HPP
