//! # Scanner Literals, Prefixes and Trivia
//!
//! This file implements the token lexers selected by `next_token()`.
//!
//! ## Atoms
//!
//! An atom is any run of bytes up to whitespace, a delimiter, `"` or `;`.
//! A backslash escapes the following byte (`#\(`, `\#foo`) and `|...|`
//! quotes a run verbatim, so neither splits an atom.
//!
//! ## Hash Forms
//!
//! | Input                 | Token                            |
//! |-----------------------|----------------------------------|
//! | `#!...` at offset 0   | `Directive(Shebang)`             |
//! | `#lang ...` line      | `Directive(LangShorthand)`       |
//! | `#| ... |#`           | `BlockComment` (nestable)        |
//! | `#;` + datum          | `QuotePrefix(DatumComment)`      |
//! | `#u8(`, `#(`, `#'`    | `QuotePrefix(Hash)`              |
//! | `#t`, `#\a`, `#:key`  | `Atom`                           |

#include "schemat/lexer/scanner.hpp"

#include <cctype>

namespace schemat::lexer {

namespace {

constexpr std::string_view LANG_DIRECTIVE = "#lang";

} // anonymous namespace

auto Scanner::lex_quote() -> Token {
    size_t length = (peek() == ',' && peek_next() == '@') ? 2 : 1;

    // A prefix only binds to a datum written directly after it.
    if (!has_datum_at(pos_ + length)) {
        return lex_atom();
    }

    QuoteKind kind;
    switch (peek()) {
    case '\'':
        kind = QuoteKind::Quote;
        break;
    case '`':
        kind = QuoteKind::Quasiquote;
        break;
    default:
        kind = length == 2 ? QuoteKind::UnquoteSplicing : QuoteKind::Unquote;
        break;
    }

    pos_ += length;
    return make_token(TokenKind::QuotePrefix, kind);
}

auto Scanner::lex_hash() -> Token {
    if (pos_ == 0 && peek_next() == '!') {
        return lex_directive(DirectiveKind::Shebang);
    }

    if (at_line_start() && source_.slice(pos_, pos_ + LANG_DIRECTIVE.size()) == LANG_DIRECTIVE &&
        (pos_ + LANG_DIRECTIVE.size() >= source_.length() ||
         is_whitespace(source_.at(pos_ + LANG_DIRECTIVE.size())))) {
        return lex_directive(DirectiveKind::LangShorthand);
    }

    if (peek_next() == '|') {
        return lex_block_comment();
    }

    if (peek_next() == ';') {
        advance();
        advance();
        if (has_datum_at(pos_)) {
            return make_token(TokenKind::QuotePrefix, QuoteKind::DatumComment);
        }
        return make_token(TokenKind::Atom);
    }

    // `#`, `#u8`, `#hash`, `#rx`... glued to a list, string or quote.
    size_t end = pos_ + 1;
    while (end < source_.length() && std::isalnum(static_cast<unsigned char>(source_.at(end)))) {
        ++end;
    }
    if (end < source_.length()) {
        char following = source_.at(end);
        if (is_open_delimiter(following) || following == '"' || following == '\'' ||
            following == '`' || following == ',') {
            pos_ = end;
            return make_token(TokenKind::QuotePrefix, QuoteKind::Hash);
        }
    }

    return lex_atom();
}

auto Scanner::lex_atom() -> Token {
    while (!is_at_end()) {
        char c = peek();
        if (is_whitespace(c) || is_open_delimiter(c) || is_close_delimiter(c) || c == '"' ||
            c == ';') {
            break;
        }

        if (c == '\\') {
            advance();
            if (!is_at_end()) {
                advance();
            }
            continue;
        }

        // `|...|` quotes delimiters and spaces, but never past the end of
        // the line. An unpaired `|` is an ordinary symbol character.
        if (c == '|') {
            auto close = find_pipe_close(pos_);
            if (close != std::string::npos) {
                while (pos_ <= close) {
                    advance();
                }
                continue;
            }
        }

        advance();
    }

    return make_token(TokenKind::Atom);
}

auto Scanner::lex_string() -> Token {
    advance(); // opening quote

    while (!is_at_end()) {
        char c = advance();
        if (c == '\\') {
            if (!is_at_end()) {
                advance();
            }
        } else if (c == '"') {
            return make_token(TokenKind::String);
        }
    }

    return make_token(TokenKind::UnterminatedString);
}

auto Scanner::lex_line_comment() -> Token {
    while (!is_at_end() && peek() != '\n') {
        advance();
    }
    return make_trimmed_token(TokenKind::LineComment);
}

auto Scanner::lex_block_comment() -> Token {
    advance(); // #
    advance(); // |

    int depth = 1;
    while (!is_at_end() && depth > 0) {
        if (peek() == '#' && peek_next() == '|') {
            advance();
            advance();
            ++depth;
        } else if (peek() == '|' && peek_next() == '#') {
            advance();
            advance();
            --depth;
        } else {
            advance();
        }
    }

    if (depth > 0) {
        return make_token(TokenKind::UnterminatedComment);
    }
    return make_token(TokenKind::BlockComment);
}

auto Scanner::lex_directive(DirectiveKind kind) -> Token {
    while (!is_at_end() && peek() != '\n') {
        advance();
    }
    auto token = make_trimmed_token(TokenKind::Directive);
    token.value = kind;
    return token;
}

} // namespace schemat::lexer
