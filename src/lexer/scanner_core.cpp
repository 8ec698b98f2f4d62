//! # Scanner Core
//!
//! This file implements core scanner functionality including:
//!
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Token creation**: `make_token()`, `make_trimmed_token()`
//! - **Whitespace handling**: newline counting for blank-line markers
//! - **Dispatch**: `next_token()` selects a token lexer by leading byte
//!
//! ## Dispatch Table
//!
//! | Leading byte      | Lexer                 |
//! |-------------------|-----------------------|
//! | `(` `[` `{`       | delimiter (inline)    |
//! | `)` `]` `}`       | delimiter (inline)    |
//! | `;`               | `lex_line_comment()`  |
//! | `"`               | `lex_string()`        |
//! | `'` `` ` `` `,`   | `lex_quote()`         |
//! | `#`               | `lex_hash()`          |
//! | anything else     | `lex_atom()`          |

#include "schemat/lexer/scanner.hpp"

namespace schemat::lexer {

Scanner::Scanner(const Source& source) : source_(source) {}

auto Scanner::peek() const -> char {
    return source_.at(pos_);
}

auto Scanner::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Scanner::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Scanner::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Scanner::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Scanner::has_datum_at(size_t offset) const -> bool {
    return offset < source_.length() && !is_whitespace(source_.at(offset));
}

auto Scanner::find_pipe_close(size_t offset) const -> size_t {
    for (size_t i = offset + 1; i < source_.length(); ++i) {
        char c = source_.at(i);
        if (c == '\n') {
            break;
        }
        if (c == '|') {
            return i;
        }
        if (c == '\\' && i + 1 < source_.length() && source_.at(i + 1) != '\n') {
            ++i;
        }
    }
    return std::string::npos;
}

auto Scanner::at_line_start() const -> bool {
    size_t i = token_start_;
    while (i > 0) {
        char c = source_.at(i - 1);
        if (c == '\n') {
            return true;
        }
        if (c != ' ' && c != '\t') {
            return false;
        }
        --i;
    }
    return true;
}

auto Scanner::make_token(TokenKind kind) -> Token {
    auto start_loc = source_.location(token_start_);
    auto end_loc = source_.location(pos_ > token_start_ ? pos_ - 1 : token_start_);
    start_loc.length = static_cast<uint32_t>(pos_ - token_start_);
    end_loc.length = static_cast<uint32_t>(pos_ - token_start_);

    return Token{.kind = kind,
                 .span = {start_loc, end_loc},
                 .lexeme = source_.slice(token_start_, pos_),
                 .value = std::monostate{}};
}

auto Scanner::make_trimmed_token(TokenKind kind) -> Token {
    auto token = make_token(kind);
    auto end = token.lexeme.find_last_not_of(" \t\r\f\v");
    token.lexeme = end == std::string_view::npos ? std::string_view{} : token.lexeme.substr(0, end + 1);
    return token;
}

auto Scanner::skip_whitespace() -> int {
    int newlines = 0;
    while (!is_at_end() && is_whitespace(peek())) {
        if (advance() == '\n') {
            ++newlines;
        }
    }
    return newlines;
}

auto Scanner::next_token() -> Token {
    token_start_ = pos_;
    if (skip_whitespace() >= 2) {
        return make_token(TokenKind::BlankLine);
    }

    token_start_ = pos_;
    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();
    if (is_open_delimiter(c)) {
        advance();
        return make_token(TokenKind::Open, delimiter_kind(c));
    }
    if (is_close_delimiter(c)) {
        advance();
        return make_token(TokenKind::Close, delimiter_kind(c));
    }

    switch (c) {
    case ';':
        return lex_line_comment();
    case '"':
        return lex_string();
    case '\'':
    case '`':
    case ',':
        return lex_quote();
    case '#':
        return lex_hash();
    default:
        break;
    }

    // Control bytes that fit no rule stand alone so they cannot merge into
    // a neighbouring atom.
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte == 0x7f) {
        advance();
        return make_token(TokenKind::Atom);
    }

    return lex_atom();
}

auto Scanner::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        auto token = next_token();
        bool eof = token.is_eof();
        tokens.push_back(token);
        if (eof) {
            break;
        }
    }
    return tokens;
}

// ============================================================================
// Character Classes
// ============================================================================

auto Scanner::is_whitespace(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto Scanner::is_open_delimiter(char c) -> bool {
    return c == '(' || c == '[' || c == '{';
}

auto Scanner::is_close_delimiter(char c) -> bool {
    return c == ')' || c == ']' || c == '}';
}

auto Scanner::delimiter_kind(char c) -> DelimiterKind {
    switch (c) {
    case '[':
    case ']':
        return DelimiterKind::Bracket;
    case '{':
    case '}':
        return DelimiterKind::Brace;
    default:
        return DelimiterKind::Paren;
    }
}

} // namespace schemat::lexer
