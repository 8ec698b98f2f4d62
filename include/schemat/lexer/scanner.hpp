//! # S-expression Scanner
//!
//! This module implements the lexical analyzer for S-expression source text.
//! The scanner converts source text into a stream of positioned tokens for
//! the parser.
//!
//! ## Features
//!
//! - **Delimiters**: all three list shapes, `()`, `[]` and `{}`
//! - **Reader prefixes**: `'`, `` ` ``, `,`, `,@`, hash prefixes and `#;`
//! - **Comments**: line comments and nestable `#| |#` block comments
//! - **Directives**: a shebang at offset 0 and `#lang` lines
//! - **Blank lines**: runs of two or more newlines become one `BlankLine`
//!
//! ## Totality
//!
//! Scanning never fails. Bytes that fit no other rule become single-character
//! atoms, and unterminated strings or block comments become dedicated tokens,
//! so that the parser reports a precise structural error instead.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("(define x 42)");
//! Scanner scanner(source);
//! std::vector<Token> tokens = scanner.tokenize();
//! ```

#ifndef SCHEMAT_LEXER_SCANNER_HPP
#define SCHEMAT_LEXER_SCANNER_HPP

#include "schemat/common.hpp"
#include "schemat/lexer/source.hpp"
#include "schemat/lexer/token.hpp"

#include <vector>

namespace schemat::lexer {

/// Lexical analyzer for S-expression source text.
class Scanner {
public:
    /// Constructs a scanner for the given source.
    ///
    /// The source must outlive the scanner and every token it produces.
    explicit Scanner(const Source& source);

    /// Returns the next token from the source.
    ///
    /// Returns `TokenKind::Eof` when the end of input is reached.
    [[nodiscard]] auto next_token() -> Token;

    /// Tokenizes the entire source and returns all tokens.
    ///
    /// The returned vector includes the final `Eof` token.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

private:
    // ========================================================================
    // State
    // ========================================================================

    const Source& source_;   ///< Reference to source being scanned.
    size_t pos_ = 0;         ///< Current byte position in source.
    size_t token_start_ = 0; ///< Start position of current token.

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    /// Returns true if a non-whitespace byte exists at `offset`.
    [[nodiscard]] auto has_datum_at(size_t offset) const -> bool;

    /// Position of the `|` closing a `|...|` run opened at `offset`, or
    /// `npos` when none follows on the same line.
    [[nodiscard]] auto find_pipe_close(size_t offset) const -> size_t;

    /// Returns true if only blanks precede the current token on its line.
    [[nodiscard]] auto at_line_start() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    [[nodiscard]] auto make_token(TokenKind kind) -> Token;

    template <typename V> [[nodiscard]] auto make_token(TokenKind kind, V value) -> Token {
        auto token = make_token(kind);
        token.value = value;
        return token;
    }

    /// Creates a token whose lexeme excludes trailing whitespace.
    [[nodiscard]] auto make_trimmed_token(TokenKind kind) -> Token;

    // ========================================================================
    // Whitespace
    // ========================================================================

    /// Skips whitespace and returns the number of newlines crossed.
    auto skip_whitespace() -> int;

    // ========================================================================
    // Token Lexers
    // ========================================================================

    [[nodiscard]] auto lex_quote() -> Token;
    [[nodiscard]] auto lex_hash() -> Token;
    [[nodiscard]] auto lex_atom() -> Token;
    [[nodiscard]] auto lex_string() -> Token;
    [[nodiscard]] auto lex_line_comment() -> Token;
    [[nodiscard]] auto lex_block_comment() -> Token;
    [[nodiscard]] auto lex_directive(DirectiveKind kind) -> Token;

    // ========================================================================
    // Character Classes
    // ========================================================================

    [[nodiscard]] static auto is_whitespace(char c) -> bool;
    [[nodiscard]] static auto is_open_delimiter(char c) -> bool;
    [[nodiscard]] static auto is_close_delimiter(char c) -> bool;
    [[nodiscard]] static auto delimiter_kind(char c) -> DelimiterKind;
};

} // namespace schemat::lexer

#endif // SCHEMAT_LEXER_SCANNER_HPP
