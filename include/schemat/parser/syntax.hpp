//! # Lossless Syntax Tree
//!
//! This module defines the syntax tree built by the parser. Unlike a typical
//! AST, the tree keeps every comment and every blank-line signal as ordinary
//! children interleaved with the real forms, in source order.
//!
//! ## Node Kinds
//!
//! | Node            | Contents                                          |
//! |-----------------|---------------------------------------------------|
//! | `AtomNode`      | Verbatim atom or string literal text              |
//! | `ListNode`      | Delimiter shape and ordered children              |
//! | `QuotedNode`    | Prefix and exactly one inner form                 |
//! | `CommentNode`   | Verbatim comment text and its attachment          |
//! | `DirectiveNode` | Shebang or `#lang` line (top-level prefix only)   |
//! | `BlankNode`     | One or more blank lines occurred here             |
//!
//! ## Ownership Model
//!
//! All children are owned via `Box<T>`. The tree is built bottom-up once per
//! input and is never mutated afterwards; there are no back-references.

#ifndef SCHEMAT_PARSER_SYNTAX_HPP
#define SCHEMAT_PARSER_SYNTAX_HPP

#include "schemat/common.hpp"
#include "schemat/lexer/token.hpp"

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace schemat::parser {

struct Node;

/// Owned pointer to a syntax node.
using NodePtr = Box<Node>;

/// An atom or a string literal, kept byte-for-byte.
struct AtomNode {
    std::string text;
    bool is_string = false; ///< True for double-quoted string literals.
};

/// A delimited list.
///
/// Children include nested forms, comments and blank markers in source order.
struct ListNode {
    lexer::DelimiterKind delimiter;
    std::vector<NodePtr> children;
};

/// A reader prefix applied to exactly one form.
struct QuotedNode {
    lexer::QuoteKind kind;
    std::string prefix; ///< Prefix text as written (`'`, `,@`, `#u8`...).
    NodePtr inner;
};

/// Where a comment sits relative to its neighbours.
enum class CommentAttachment {
    Trailing, ///< Written on the same line, after the previous sibling.
    Leading,  ///< Written on its own line, before the next sibling (if any).
};

/// A line comment or block comment, text kept verbatim.
struct CommentNode {
    std::string text;
    CommentAttachment attachment;
};

/// A shebang or `#lang` line preceding all forms.
struct DirectiveNode {
    lexer::DirectiveKind kind;
    std::string text;
};

/// Marks that one or more blank lines separated two siblings.
struct BlankNode {};

/// A node of the lossless syntax tree.
struct Node {
    std::variant<AtomNode, ListNode, QuotedNode, CommentNode, DirectiveNode, BlankNode> kind;
    SourceSpan span;

    /// Checks if this node is of kind `T`.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this node as kind `T`. Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    /// Checks if this node is a comment with the given attachment.
    [[nodiscard]] auto is_comment(CommentAttachment attachment) const -> bool {
        return is<CommentNode>() && as<CommentNode>().attachment == attachment;
    }
};

/// The top-level node sequence of one input.
///
/// Directives, if present, form a contiguous prefix of `nodes`.
struct Module {
    std::vector<NodePtr> nodes;
};

/// Renders a compact, single-line description of a node for tests and tracing.
///
/// Atoms print verbatim, lists as `(list ...)`, quoted forms as
/// `(quote <prefix> ...)`, comments as `(comment trailing|leading <text>)`,
/// directives as `(directive <text>)` and blank markers as `(blank)`.
[[nodiscard]] auto dump(const Node& node) -> std::string;

/// Renders every top-level node of a module with `dump()`, space separated.
[[nodiscard]] auto dump(const Module& module) -> std::string;

} // namespace schemat::parser

#endif // SCHEMAT_PARSER_SYNTAX_HPP
