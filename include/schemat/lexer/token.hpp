//! # Token Definitions
//!
//! This module defines the tokens produced by the S-expression scanner.
//!
//! ## Overview
//!
//! Tokens are categorized into:
//!
//! - **Delimiters**: `(` `)`, `[` `]`, `{` `}`
//! - **Data**: atoms and string literals, both kept verbatim
//! - **Prefixes**: `'`, `` ` ``, `,`, `,@`, hash prefixes (`#`, `#u8`, ...) and `#;`
//! - **Trivia**: line comments, block comments and blank-line markers
//! - **Directives**: a leading shebang line or `#lang` line
//!
//! Whitespace is not represented except for the `BlankLine` marker, which
//! records that two or more consecutive newlines separated two tokens.

#ifndef SCHEMAT_LEXER_TOKEN_HPP
#define SCHEMAT_LEXER_TOKEN_HPP

#include "schemat/common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <variant>

namespace schemat::lexer {

/// All possible token kinds.
enum class TokenKind : uint8_t {
    Eof,                 ///< End of input
    Open,                ///< Opening delimiter: `(`, `[`, `{`
    Close,               ///< Closing delimiter: `)`, `]`, `}`
    Atom,                ///< Symbol, number, boolean, character, keyword...
    String,              ///< Double-quoted string literal, opaque
    QuotePrefix,         ///< Reader prefix glued to the next form
    LineComment,         ///< `; ...` up to (excluding) the end of line
    BlockComment,        ///< `#| ... |#`, nestable
    Directive,           ///< Shebang or `#lang` line
    BlankLine,           ///< One or more empty lines between two tokens
    UnterminatedString,  ///< String literal running to end of input
    UnterminatedComment, ///< Block comment running to end of input
};

/// The shape of a list delimiter pair.
enum class DelimiterKind : uint8_t {
    Paren,   ///< `(` `)`
    Bracket, ///< `[` `]`
    Brace,   ///< `{` `}`
};

/// Reader prefixes that attach to the following form without whitespace.
enum class QuoteKind : uint8_t {
    Quote,           ///< `'`
    Quasiquote,      ///< `` ` ``
    Unquote,         ///< `,`
    UnquoteSplicing, ///< `,@`
    Hash,            ///< `#(`, `#u8(`, `#'`, `#rx"..."`: text carried by the lexeme
    DatumComment,    ///< `#;`
};

/// Leading hash lines that are not S-expressions.
enum class DirectiveKind : uint8_t {
    Shebang,       ///< `#!...` at byte offset 0
    LangShorthand, ///< `#lang ...`
};

/// Returns the display name for a token kind.
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Returns the opening delimiter text for a delimiter kind.
[[nodiscard]] auto open_delimiter(DelimiterKind kind) -> std::string_view;

/// Returns the closing delimiter text for a delimiter kind.
[[nodiscard]] auto close_delimiter(DelimiterKind kind) -> std::string_view;

/// Returns the canonical prefix text for a quote kind.
///
/// `QuoteKind::Hash` returns `"#"`; the concrete hash prefix text lives in
/// the token lexeme.
[[nodiscard]] auto quote_prefix(QuoteKind kind) -> std::string_view;

// ============================================================================
// Token
// ============================================================================

/// A lexical token.
///
/// # Example
///
/// For the source `'(a "b")`, the scanner produces:
/// - `Token { kind: QuotePrefix, lexeme: "'", value: QuoteKind::Quote }`
/// - `Token { kind: Open, lexeme: "(", value: DelimiterKind::Paren }`
/// - `Token { kind: Atom, lexeme: "a" }`
/// - `Token { kind: String, lexeme: "\"b\"" }`
/// - `Token { kind: Close, lexeme: ")", value: DelimiterKind::Paren }`
/// - `Token { kind: Eof }`
struct Token {
    /// The kind of token.
    TokenKind kind;

    /// Source location of this token.
    SourceSpan span;

    /// Raw text from source code.
    std::string_view lexeme;

    /// Kind-specific payload.
    ///
    /// - `DelimiterKind` for `Open` and `Close`
    /// - `QuoteKind` for `QuotePrefix`
    /// - `DirectiveKind` for `Directive`
    /// - `std::monostate` otherwise
    std::variant<std::monostate, DelimiterKind, QuoteKind, DirectiveKind> value;

    /// Checks if this token is of the given kind.
    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    /// Checks if this token is one of the given kinds.
    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    /// Checks if this is an end-of-file token.
    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// Checks if this token is a comment of either form.
    [[nodiscard]] auto is_comment() const -> bool {
        return kind == TokenKind::LineComment || kind == TokenKind::BlockComment;
    }

    /// Checks if this token can begin a form (atom, string, list or prefixed form).
    [[nodiscard]] auto starts_form() const -> bool {
        return is_one_of(
            {TokenKind::Atom, TokenKind::String, TokenKind::Open, TokenKind::QuotePrefix});
    }

    /// Gets the delimiter kind. Asserts this is an `Open` or `Close` token.
    [[nodiscard]] auto delimiter() const -> DelimiterKind;

    /// Gets the quote kind. Asserts this is a `QuotePrefix` token.
    [[nodiscard]] auto quote() const -> QuoteKind;

    /// Gets the directive kind. Asserts this is a `Directive` token.
    [[nodiscard]] auto directive() const -> DirectiveKind;
};

} // namespace schemat::lexer

#endif // SCHEMAT_LEXER_TOKEN_HPP
