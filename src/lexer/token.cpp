//! # Token Utilities
//!
//! This file implements token utility functions.
//!
//! ## Functions
//!
//! - `token_kind_to_string()`: Convert token kind to display string
//! - `open_delimiter()` / `close_delimiter()`: Delimiter text per shape
//! - `quote_prefix()`: Canonical prefix text per quote kind
//!
//! ## Token Value Accessors
//!
//! - `delimiter()`: Get `DelimiterKind` from `Open` / `Close`
//! - `quote()`: Get `QuoteKind` from `QuotePrefix`
//! - `directive()`: Get `DirectiveKind` from `Directive`

#include "schemat/lexer/token.hpp"

#include <cassert>

namespace schemat::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of input";
    case TokenKind::Open:
        return "opening delimiter";
    case TokenKind::Close:
        return "closing delimiter";
    case TokenKind::Atom:
        return "atom";
    case TokenKind::String:
        return "string";
    case TokenKind::QuotePrefix:
        return "quote prefix";
    case TokenKind::LineComment:
        return "line comment";
    case TokenKind::BlockComment:
        return "block comment";
    case TokenKind::Directive:
        return "directive";
    case TokenKind::BlankLine:
        return "blank line";
    case TokenKind::UnterminatedString:
        return "unterminated string";
    case TokenKind::UnterminatedComment:
        return "unterminated block comment";
    }
    return "unknown";
}

auto open_delimiter(DelimiterKind kind) -> std::string_view {
    switch (kind) {
    case DelimiterKind::Paren:
        return "(";
    case DelimiterKind::Bracket:
        return "[";
    case DelimiterKind::Brace:
        return "{";
    }
    return "(";
}

auto close_delimiter(DelimiterKind kind) -> std::string_view {
    switch (kind) {
    case DelimiterKind::Paren:
        return ")";
    case DelimiterKind::Bracket:
        return "]";
    case DelimiterKind::Brace:
        return "}";
    }
    return ")";
}

auto quote_prefix(QuoteKind kind) -> std::string_view {
    switch (kind) {
    case QuoteKind::Quote:
        return "'";
    case QuoteKind::Quasiquote:
        return "`";
    case QuoteKind::Unquote:
        return ",";
    case QuoteKind::UnquoteSplicing:
        return ",@";
    case QuoteKind::Hash:
        return "#";
    case QuoteKind::DatumComment:
        return "#;";
    }
    return "'";
}

auto Token::delimiter() const -> DelimiterKind {
    assert(kind == TokenKind::Open || kind == TokenKind::Close);
    return std::get<DelimiterKind>(value);
}

auto Token::quote() const -> QuoteKind {
    assert(kind == TokenKind::QuotePrefix);
    return std::get<QuoteKind>(value);
}

auto Token::directive() const -> DirectiveKind {
    assert(kind == TokenKind::Directive);
    return std::get<DirectiveKind>(value);
}

} // namespace schemat::lexer
