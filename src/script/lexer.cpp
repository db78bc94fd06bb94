#include <gatedrepl/script/lexer.hpp>
#include <gatedrepl/script/errors.hpp>
#include <gatedrepl/script/value.hpp>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>

namespace gatedrepl {
namespace script {

static bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

static bool is_name_char(char c) {
    return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

static bool is_string_prefix(const std::string& word) {
    static const char* prefixes[] = { "r", "u", "f", "b", "rf", "fr", "br", "rb", NULL };
    std::string lower;
    for (size_t i = 0; i < word.size(); ++i) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(word[i])));
    }
    for (int i = 0; prefixes[i] != NULL; ++i) {
        if (lower == prefixes[i]) return true;
    }
    return false;
}

Lexer::Lexer(const std::string& source, int first_line)
    : src_(source)
    , pos_(0)
    , line_(first_line)
    , paren_depth_(0)
    , at_line_start_(true)
{}

char Lexer::peek(size_t ahead) const {
    size_t p = pos_ + ahead;
    return p < src_.size() ? src_[p] : '\0';
}

void Lexer::emit(TokenType type, const std::string& text) {
    tokens_.push_back(Token(type, text, line_));
}

void Lexer::fail(const std::string& message) const {
    throw ScriptError("SyntaxError", message, line_);
}

std::vector<Token> Lexer::tokenize() {
    tokens_.clear();
    indents_.assign(1, 0);

    while (pos_ < src_.size()) {
        if (at_line_start_ && paren_depth_ == 0) {
            scan_line_start();
            continue;
        }

        char c = peek();
        if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
            ++pos_;
        } else if (c == '#') {
            while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
        } else if (c == '\\' && (peek(1) == '\n' || (peek(1) == '\r' && peek(2) == '\n'))) {
            pos_ += peek(1) == '\n' ? 2 : 3;
            ++line_;
        } else if (c == '\n') {
            if (paren_depth_ == 0 && !tokens_.empty() && tokens_.back().type != TokenType::NEWLINE) {
                emit(TokenType::NEWLINE, "");
                at_line_start_ = true;
            }
            ++pos_;
            ++line_;
        } else {
            scan_token();
        }
    }

    if (paren_depth_ > 0) {
        fail("unexpected EOF while parsing (unclosed bracket)");
    }
    if (!tokens_.empty() && tokens_.back().type != TokenType::NEWLINE &&
        tokens_.back().type != TokenType::DEDENT) {
        emit(TokenType::NEWLINE, "");
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        emit(TokenType::DEDENT, "");
    }
    emit(TokenType::END, "");
    return tokens_;
}

void Lexer::scan_line_start() {
    int col = 0;
    while (pos_ < src_.size()) {
        char c = src_[pos_];
        if (c == ' ') {
            ++col;
        } else if (c == '\t') {
            col = (col / 8 + 1) * 8;
        } else if (c == '\f' || c == '\r') {
            // ignored
        } else {
            break;
        }
        ++pos_;
    }

    if (pos_ >= src_.size()) {
        at_line_start_ = false;
        return;
    }

    // Blank or comment-only lines do not affect indentation
    char c = src_[pos_];
    if (c == '\n' || c == '#') {
        while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
        if (pos_ < src_.size()) {
            ++pos_;
            ++line_;
        }
        return;
    }

    at_line_start_ = false;
    if (col > indents_.back()) {
        indents_.push_back(col);
        emit(TokenType::INDENT, "");
        return;
    }
    while (col < indents_.back()) {
        indents_.pop_back();
        emit(TokenType::DEDENT, "");
    }
    if (col != indents_.back()) {
        fail("unindent does not match any outer indentation level");
    }
}

void Lexer::scan_token() {
    char c = peek();
    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
        scan_number();
    } else if (is_name_start(c)) {
        scan_name();
    } else if (c == '"' || c == '\'') {
        scan_string("");
    } else {
        scan_operator();
    }
}

void Lexer::scan_name() {
    size_t start = pos_;
    while (pos_ < src_.size() && is_name_char(src_[pos_])) ++pos_;
    std::string word = src_.substr(start, pos_ - start);

    if ((peek() == '"' || peek() == '\'') && is_string_prefix(word)) {
        scan_string(word);
        return;
    }
    emit(TokenType::NAME, word);
}

void Lexer::scan_number() {
    size_t start = pos_;
    Token tok(TokenType::INT, "", line_);

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'o' || peek(1) == 'O' ||
                          peek(1) == 'b' || peek(1) == 'B')) {
        char kind = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(1))));
        int base = kind == 'x' ? 16 : (kind == 'o' ? 8 : 2);
        pos_ += 2;
        std::string digits;
        while (pos_ < src_.size() && (std::isxdigit(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_')) {
            if (src_[pos_] != '_') digits += src_[pos_];
            ++pos_;
        }
        if (digits.empty()) fail("invalid number literal");

        uint64_t value = 0;
        for (size_t i = 0; i < digits.size(); ++i) {
            char d = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[i])));
            int digit = std::isdigit(static_cast<unsigned char>(d)) ? d - '0' : d - 'a' + 10;
            if (digit >= base) fail("invalid digit '" + std::string(1, digits[i]) + "' in number literal");
            if (value > (static_cast<uint64_t>(INT64_MAX) - static_cast<uint64_t>(digit)) / static_cast<uint64_t>(base)) {
                throw ScriptError("OverflowError", "integer literal too large", line_);
            }
            value = value * static_cast<uint64_t>(base) + static_cast<uint64_t>(digit);
        }
        tok.text = src_.substr(start, pos_ - start);
        tok.int_value = static_cast<int64_t>(value);
        tokens_.push_back(tok);
        return;
    }

    bool is_float = false;
    std::string clean;
    while (pos_ < src_.size() && (std::isdigit(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_')) {
        if (src_[pos_] != '_') clean += src_[pos_];
        ++pos_;
    }
    if (peek() == '.' && !(peek(1) == '.' && peek(2) == '.')) {
        is_float = true;
        clean += '.';
        ++pos_;
        while (pos_ < src_.size() && (std::isdigit(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_')) {
            if (src_[pos_] != '_') clean += src_[pos_];
            ++pos_;
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        size_t save = pos_;
        std::string exp = "e";
        ++pos_;
        if (peek() == '+' || peek() == '-') {
            exp += peek();
            ++pos_;
        }
        if (std::isdigit(static_cast<unsigned char>(peek()))) {
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
                exp += src_[pos_];
                ++pos_;
            }
            clean += exp;
            is_float = true;
        } else {
            pos_ = save;
        }
    }
    if (peek() == 'j' || peek() == 'J') {
        fail("complex numbers are not supported");
    }
    if (is_name_start(peek())) {
        fail("invalid decimal literal");
    }

    tok.text = src_.substr(start, pos_ - start);
    if (is_float) {
        tok.type = TokenType::FLOAT;
        tok.float_value = strtod(clean.c_str(), nullptr);
    } else {
        uint64_t value = 0;
        for (size_t i = 0; i < clean.size(); ++i) {
            uint64_t digit = static_cast<uint64_t>(clean[i] - '0');
            if (value > (static_cast<uint64_t>(INT64_MAX) - digit) / 10) {
                throw ScriptError("OverflowError", "integer literal too large", line_);
            }
            value = value * 10 + digit;
        }
        tok.int_value = static_cast<int64_t>(value);
    }
    tokens_.push_back(tok);
}

void Lexer::scan_string(const std::string& prefix) {
    std::string lower;
    for (size_t i = 0; i < prefix.size(); ++i) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(prefix[i])));
    }
    if (lower.find('b') != std::string::npos) {
        fail("bytes literals are not supported");
    }
    bool raw = lower.find('r') != std::string::npos;
    bool fstr = lower.find('f') != std::string::npos;

    int start_line = line_;
    char quote = peek();
    bool triple = peek(1) == quote && peek(2) == quote;
    pos_ += triple ? 3 : 1;

    std::string body;
    for (;;) {
        if (pos_ >= src_.size()) {
            line_ = start_line;
            fail(triple ? "unterminated triple-quoted string literal" : "unterminated string literal");
        }
        char c = src_[pos_];
        if (c == '\\' && pos_ + 1 < src_.size()) {
            body += c;
            body += src_[pos_ + 1];
            if (src_[pos_ + 1] == '\n') ++line_;
            pos_ += 2;
            continue;
        }
        if (c == quote) {
            if (!triple) {
                ++pos_;
                break;
            }
            if (peek(1) == quote && peek(2) == quote) {
                pos_ += 3;
                break;
            }
        }
        if (c == '\n') {
            if (!triple) {
                fail("unterminated string literal");
            }
            ++line_;
        }
        body += c;
        ++pos_;
    }

    Token tok(fstr ? TokenType::FSTRING : TokenType::STRING, "", start_line);
    tok.raw = raw;
    tok.text = (fstr || raw) ? body : decode_escapes(body, start_line);
    tokens_.push_back(tok);
}

void Lexer::scan_operator() {
    static const char* three[] = { "**=", "//=", ">>=", "<<=", "...", NULL };
    static const char* two[] = {
        "**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=",
        "&=", "|=", "^=", "->", "<<", ">>", ":=", NULL
    };
    static const char single[] = "+-*/%<>=()[]{},:.;@&|^~";

    for (int i = 0; three[i] != NULL; ++i) {
        if (src_.compare(pos_, 3, three[i]) == 0) {
            emit(TokenType::OP, three[i]);
            pos_ += 3;
            return;
        }
    }
    for (int i = 0; two[i] != NULL; ++i) {
        if (src_.compare(pos_, 2, two[i]) == 0) {
            emit(TokenType::OP, two[i]);
            pos_ += 2;
            return;
        }
    }

    char c = peek();
    if (c == '\0' || std::strchr(single, c) == NULL) {
        fail(std::string("invalid character '") + c + "'");
    }
    if (c == '(' || c == '[' || c == '{') {
        ++paren_depth_;
    } else if (c == ')' || c == ']' || c == '}') {
        if (paren_depth_ == 0) {
            fail(std::string("unmatched '") + c + "'");
        }
        --paren_depth_;
    }
    emit(TokenType::OP, std::string(1, c));
    ++pos_;
}

// ============================================================================
// Escapes
// ============================================================================

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string decode_escapes(const std::string& body, int line) {
    std::string out;
    out.reserve(body.size());

    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out += c;
            continue;
        }

        char e = body[++i];
        switch (e) {
            case '\n': break;
            case '\\': out += '\\'; break;
            case '\'': out += '\''; break;
            case '"': out += '"'; break;
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'a': out += '\a'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'v': out += '\v'; break;
            case 'x':
            case 'u':
            case 'U': {
                size_t width = e == 'x' ? 2 : (e == 'u' ? 4 : 8);
                if (i + width >= body.size()) {
                    throw ScriptError("SyntaxError", std::string("truncated \\") + e + " escape", line);
                }
                uint32_t cp = 0;
                for (size_t k = 1; k <= width; ++k) {
                    int h = hex_value(body[i + k]);
                    if (h < 0) {
                        throw ScriptError("SyntaxError", std::string("truncated \\") + e + " escape", line);
                    }
                    cp = cp * 16 + static_cast<uint32_t>(h);
                }
                if (cp > 0x10FFFF) {
                    throw ScriptError("SyntaxError", "illegal Unicode character", line);
                }
                out += utf8::encode(cp);
                i += width;
                break;
            }
            default:
                if (e >= '0' && e <= '7') {
                    uint32_t cp = static_cast<uint32_t>(e - '0');
                    for (int k = 0; k < 2 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7'; ++k) {
                        cp = cp * 8 + static_cast<uint32_t>(body[++i] - '0');
                    }
                    out += utf8::encode(cp);
                } else {
                    // Unknown escapes are kept verbatim
                    out += '\\';
                    out += e;
                }
        }
    }
    return out;
}

} // namespace script
} // namespace gatedrepl
