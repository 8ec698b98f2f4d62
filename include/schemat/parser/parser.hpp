//! # S-expression Parser
//!
//! Turns the scanner's token stream into the lossless syntax tree of
//! `parser/syntax.hpp`. Lists are tracked on an explicit frame stack: an open
//! delimiter pushes a frame and its close pops it, so input depth never
//! reaches the call stack.
//!
//! ## Comment Attachment
//!
//! A comment that starts on the line where the previous sibling in the same
//! frame ends is a `Trailing` comment of that sibling. Every other comment is
//! a `Leading` comment, placed before the next sibling of its frame or, when
//! none follows, kept as the last child of the frame.
//!
//! ## Blank Lines
//!
//! Blank-line markers are kept between siblings only. Markers at the start or
//! end of a frame carry no layout meaning and are dropped.
//!
//! ## Errors
//!
//! Structural errors are not recoverable: the first one aborts the parse and
//! is returned instead of a partial tree. Forms nested deeper than
//! `MAX_NESTING_DEPTH` (lists and quote prefixes together) are rejected, which
//! bounds the depth every later stage has to handle.

#ifndef SCHEMAT_PARSER_PARSER_HPP
#define SCHEMAT_PARSER_PARSER_HPP

#include "schemat/common.hpp"
#include "schemat/lexer/source.hpp"
#include "schemat/lexer/token.hpp"
#include "schemat/parser/syntax.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace schemat::parser {

/// Maximum number of nested lists and quote prefixes around any form.
constexpr size_t MAX_NESTING_DEPTH = 1000;

/// Kinds of structural parse failure.
enum class ParseErrorKind {
    MismatchedDelimiter, ///< Close delimiter of a different shape than its open.
    UnexpectedClose,     ///< Close delimiter with no open list.
    UnclosedList,        ///< End of input with a list still open.
    DanglingQuote,       ///< Prefix not followed by a form.
    UnterminatedString,  ///< String literal running to end of input.
    UnterminatedComment, ///< Block comment running to end of input.
    NestingTooDeep,      ///< More than `MAX_NESTING_DEPTH` nested forms.
};

/// Returns the display name for a parse error kind.
[[nodiscard]] auto parse_error_kind_to_string(ParseErrorKind kind) -> std::string_view;

/// Parser error
struct ParseError {
    ParseErrorKind kind;
    std::string message;
    SourceSpan span;
    std::vector<std::string> notes;

    /// 1-based line of the error position.
    [[nodiscard]] auto line() const -> uint32_t {
        return span.start.line;
    }

    /// 1-based column of the error position.
    [[nodiscard]] auto column() const -> uint32_t {
        return span.start.column;
    }

    /// Formats the error as `"<message> at line L and column C: <source line>"`,
    /// followed by one indented line per note.
    [[nodiscard]] auto render(const lexer::Source& source) const -> std::string;
};

// Parser for S-expression token streams
class Parser {
public:
    explicit Parser(std::vector<lexer::Token> tokens);

    // Parse the entire token stream into the top-level node sequence
    [[nodiscard]] auto parse_module() -> Result<Module, ParseError>;

private:
    /// An open list, or the top level when `open` is null.
    struct Frame {
        const lexer::Token* open = nullptr;
        std::vector<NodePtr> children;
        std::vector<const lexer::Token*> prefixes; // Waiting for the next form
    };

    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;
    uint32_t last_line_ = 0; // End line of the last consumed non-blank token
    bool seen_form_ = false; // Directives are only accepted before this is set
    size_t depth_ = 0;       // Open lists plus pending prefixes

    // Token access
    [[nodiscard]] auto peek() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() const -> bool;

    // Frames
    void push_form(Frame& frame, NodePtr node);
    void push_trivia(Frame& frame, const lexer::Token& token);
    [[nodiscard]] auto close_frame(Frame& frame, const lexer::Token& close)
        -> Result<NodePtr, ParseError>;
    [[nodiscard]] auto make_comment(const lexer::Token& token,
                                    const std::vector<NodePtr>& siblings) const -> NodePtr;

    // Error construction
    [[nodiscard]] auto unterminated_error(const lexer::Token& token) const -> ParseError;
    [[nodiscard]] static auto dangling_error(const lexer::Token& prefix) -> ParseError;
    [[nodiscard]] static auto nesting_error(const lexer::Token& token) -> ParseError;

    static void drop_trailing_blanks(std::vector<NodePtr>& nodes);
};

} // namespace schemat::parser

#endif // SCHEMAT_PARSER_PARSER_HPP
