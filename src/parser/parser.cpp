//! # Parser
//!
//! This file implements the frame-stack parser.
//!
//! ## Token Navigation
//!
//! | Method      | Description                                      |
//! |-------------|--------------------------------------------------|
//! | `peek()`    | Look at current token                            |
//! | `advance()` | Consume current token, tracking its end line     |
//!
//! ## Grammar
//!
//! ```text
//! module  = node* EOF
//! node    = BLANK | COMMENT | DIRECTIVE | form
//! form    = ATOM | STRING | list | quoted
//! list    = OPEN node* CLOSE          ; CLOSE must match OPEN's shape
//! quoted  = PREFIX form
//! ```
//!
//! `OPEN` pushes a frame and `CLOSE` pops it. A `PREFIX` waits on its frame
//! until the next form of that frame is complete, then wraps it.

#include "schemat/parser/parser.hpp"

#include <sstream>

namespace schemat::parser {

namespace {

auto quoted(std::string_view text) -> std::string {
    return "'" + std::string(text) + "'";
}

auto location_note(std::string_view what, const SourceLocation& loc) -> std::string {
    return std::string(what) + " at line " + std::to_string(loc.line) + ", column " +
           std::to_string(loc.column);
}

} // anonymous namespace

auto parse_error_kind_to_string(ParseErrorKind kind) -> std::string_view {
    switch (kind) {
    case ParseErrorKind::MismatchedDelimiter:
        return "MismatchedDelimiter";
    case ParseErrorKind::UnexpectedClose:
        return "UnexpectedClose";
    case ParseErrorKind::UnclosedList:
        return "UnclosedList";
    case ParseErrorKind::DanglingQuote:
        return "DanglingQuote";
    case ParseErrorKind::UnterminatedString:
        return "UnterminatedString";
    case ParseErrorKind::UnterminatedComment:
        return "UnterminatedComment";
    case ParseErrorKind::NestingTooDeep:
        return "NestingTooDeep";
    }
    return "Unknown";
}

auto ParseError::render(const lexer::Source& source) const -> std::string {
    auto text = source.line(line());
    auto end = text.find_last_not_of(" \t\r\f\v");
    text = end == std::string_view::npos ? std::string_view{} : text.substr(0, end + 1);

    std::ostringstream out;
    out << message << " at line " << line() << " and column " << column() << ": " << text;
    for (const auto& note : notes) {
        out << "\n  note: " << note;
    }
    return out.str();
}

Parser::Parser(std::vector<lexer::Token> tokens) : tokens_(std::move(tokens)) {}

// ============================================================================
// Token Access
// ============================================================================

auto Parser::peek() const -> const lexer::Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back(); // Should be EOF
    }
    return tokens_[pos_];
}

auto Parser::advance() -> const lexer::Token& {
    const auto& token = peek();
    if (!is_at_end()) {
        ++pos_;
    }
    if (!token.is(lexer::TokenKind::BlankLine) && !token.is_eof()) {
        last_line_ = token.span.end.line;
    }
    return token;
}

auto Parser::is_at_end() const -> bool {
    return tokens_.empty() || peek().is_eof();
}

// ============================================================================
// Grammar
// ============================================================================

auto Parser::parse_module() -> Result<Module, ParseError> {
    using lexer::TokenKind;

    if (tokens_.empty()) {
        return Module{};
    }

    std::vector<Frame> frames(1);

    while (true) {
        auto& frame = frames.back();
        const auto& token = peek();

        if (!frame.prefixes.empty() && !token.starts_form()) {
            if (token.is_one_of({TokenKind::UnterminatedString, TokenKind::UnterminatedComment})) {
                return unterminated_error(token);
            }
            return dangling_error(*frame.prefixes.back());
        }

        switch (token.kind) {
        case TokenKind::Eof:
            if (frame.open != nullptr) {
                return ParseError{.kind = ParseErrorKind::UnclosedList,
                                  .message = "unclosed list: " + quoted(frame.open->lexeme) +
                                             " is never closed",
                                  .span = frame.open->span,
                                  .notes = {}};
            }
            drop_trailing_blanks(frame.children);
            return Module{.nodes = std::move(frame.children)};

        case TokenKind::BlankLine:
        case TokenKind::LineComment:
        case TokenKind::BlockComment:
        case TokenKind::Directive:
            push_trivia(frame, token);
            break;

        case TokenKind::UnterminatedString:
        case TokenKind::UnterminatedComment:
            return unterminated_error(token);

        case TokenKind::Open:
        case TokenKind::QuotePrefix:
            if (depth_ >= MAX_NESTING_DEPTH) {
                return nesting_error(token);
            }
            ++depth_;
            seen_form_ = true;
            if (token.is(TokenKind::QuotePrefix)) {
                frame.prefixes.push_back(&advance());
            } else {
                // `frame` is invalidated here.
                frames.push_back(Frame{.open = &advance(), .children = {}, .prefixes = {}});
            }
            break;

        case TokenKind::Close: {
            if (frame.open == nullptr) {
                return ParseError{.kind = ParseErrorKind::UnexpectedClose,
                                  .message = "unexpected closing delimiter " + quoted(token.lexeme),
                                  .span = token.span,
                                  .notes = {}};
            }
            auto list = close_frame(frame, token);
            if (is_err(list)) {
                return std::move(unwrap_err(list));
            }
            frames.pop_back();
            --depth_;
            push_form(frames.back(), std::move(unwrap(list)));
            break;
        }

        case TokenKind::Atom:
        case TokenKind::String:
            seen_form_ = true;
            advance();
            push_form(frame,
                      make_box<Node>(Node{.kind = AtomNode{.text = std::string(token.lexeme),
                                                           .is_string = token.is(TokenKind::String)},
                                          .span = token.span}));
            break;
        }
    }
}

// ============================================================================
// Frames
// ============================================================================

void Parser::push_form(Frame& frame, NodePtr node) {
    while (!frame.prefixes.empty()) {
        const auto& prefix = *frame.prefixes.back();
        frame.prefixes.pop_back();
        --depth_;

        auto span = SourceSpan::merge(prefix.span, node->span);
        node = make_box<Node>(Node{.kind = QuotedNode{.kind = prefix.quote(),
                                                      .prefix = std::string(prefix.lexeme),
                                                      .inner = std::move(node)},
                                   .span = span});
    }
    frame.children.push_back(std::move(node));
}

void Parser::push_trivia(Frame& frame, const lexer::Token& token) {
    auto& siblings = frame.children;

    switch (token.kind) {
    case lexer::TokenKind::BlankLine:
        if (!siblings.empty() && !siblings.back()->is<BlankNode>()) {
            siblings.push_back(make_box<Node>(Node{.kind = BlankNode{}, .span = token.span}));
        }
        break;

    case lexer::TokenKind::Directive:
        if (!seen_form_) {
            if (!siblings.empty() && siblings.back()->is<BlankNode>()) {
                siblings.pop_back();
            }
            siblings.push_back(make_box<Node>(Node{
                .kind = DirectiveNode{.kind = token.directive(), .text = std::string(token.lexeme)},
                .span = token.span}));
            break;
        }
        // Misplaced directives are tolerated as own-line comments.
        siblings.push_back(make_comment(token, siblings));
        break;

    default:
        siblings.push_back(make_comment(token, siblings));
        seen_form_ = true;
        break;
    }

    advance();
}

auto Parser::close_frame(Frame& frame, const lexer::Token& close) -> Result<NodePtr, ParseError> {
    const auto& open = *frame.open;
    auto delimiter = open.delimiter();

    if (close.delimiter() != delimiter) {
        return ParseError{.kind = ParseErrorKind::MismatchedDelimiter,
                          .message = "mismatched delimiter: expected " +
                                     quoted(lexer::close_delimiter(delimiter)) + " but found " +
                                     quoted(close.lexeme),
                          .span = close.span,
                          .notes = {location_note("list opened with " + quoted(open.lexeme),
                                                  open.span.start)}};
    }

    advance();
    drop_trailing_blanks(frame.children);
    return make_box<Node>(
        Node{.kind = ListNode{.delimiter = delimiter, .children = std::move(frame.children)},
             .span = SourceSpan::merge(open.span, close.span)});
}

auto Parser::make_comment(const lexer::Token& token, const std::vector<NodePtr>& siblings) const
    -> NodePtr {
    bool trailing = !siblings.empty() && !siblings.back()->is<BlankNode>() &&
                    token.span.start.line == last_line_;

    return make_box<Node>(
        Node{.kind = CommentNode{.text = std::string(token.lexeme),
                                 .attachment = trailing ? CommentAttachment::Trailing
                                                        : CommentAttachment::Leading},
             .span = token.span});
}

// ============================================================================
// Errors
// ============================================================================

auto Parser::unterminated_error(const lexer::Token& token) const -> ParseError {
    bool is_string = token.is(lexer::TokenKind::UnterminatedString);
    return ParseError{.kind = is_string ? ParseErrorKind::UnterminatedString
                                        : ParseErrorKind::UnterminatedComment,
                      .message = is_string ? "unterminated string literal"
                                           : "unterminated block comment",
                      .span = token.span,
                      .notes = {}};
}

auto Parser::dangling_error(const lexer::Token& prefix) -> ParseError {
    return ParseError{.kind = ParseErrorKind::DanglingQuote,
                      .message = "dangling quote: prefix " + quoted(prefix.lexeme) +
                                 " is not followed by a datum",
                      .span = prefix.span,
                      .notes = {}};
}

auto Parser::nesting_error(const lexer::Token& token) -> ParseError {
    return ParseError{.kind = ParseErrorKind::NestingTooDeep,
                      .message = "nesting too deep: more than " +
                                 std::to_string(MAX_NESTING_DEPTH) + " nested forms",
                      .span = token.span,
                      .notes = {}};
}

void Parser::drop_trailing_blanks(std::vector<NodePtr>& nodes) {
    while (!nodes.empty() && nodes.back()->is<BlankNode>()) {
        nodes.pop_back();
    }
}

} // namespace schemat::parser
