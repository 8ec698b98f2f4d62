//! # Layout Documents
//!
//! The layout IR sits between the syntax tree and the final text. A document
//! says *what* may be printed and *where* a break is allowed; the renderer
//! decides which breaks are taken under the column budget.
//!
//! ## Primitives
//!
//! | Document   | Rendering                                              |
//! |------------|--------------------------------------------------------|
//! | `Text`     | Verbatim text                                          |
//! | `Concat`   | Children one after another                             |
//! | `Indent`   | Inner document with the indent increased by `width`    |
//! | `Line`     | Space when its group is flat, else newline + indent    |
//! | `HardLine` | Always newline + indent                                |
//! | `Group`    | Renders flat if it fits, else broken                   |
//!
//! ## Hard Breaks
//!
//! A `HardLine` inside a flat group still ends the line. The group itself
//! stays flat as long as every line of its flat rendering fits, so a trailing
//! comment does not force the `Line`s before it to break.

#ifndef SCHEMAT_LAYOUT_DOCUMENT_HPP
#define SCHEMAT_LAYOUT_DOCUMENT_HPP

#include "schemat/common.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace schemat::layout {

struct Doc;

/// Owned pointer to a document node.
using DocPtr = Box<Doc>;

struct TextDoc {
    std::string text;
};

struct ConcatDoc {
    std::vector<DocPtr> parts;
};

struct IndentDoc {
    int width;
    DocPtr inner;
};

struct LineDoc {};

struct HardLineDoc {};

struct GroupDoc {
    DocPtr inner;
};

/// A layout document node.
struct Doc {
    std::variant<TextDoc, ConcatDoc, IndentDoc, LineDoc, HardLineDoc, GroupDoc> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }
};

// ============================================================================
// Constructors
// ============================================================================

[[nodiscard]] auto text(std::string_view value) -> DocPtr;
[[nodiscard]] auto concat(std::vector<DocPtr> parts) -> DocPtr;
[[nodiscard]] auto indent(int width, DocPtr inner) -> DocPtr;
[[nodiscard]] auto line() -> DocPtr;
[[nodiscard]] auto hard_line() -> DocPtr;

/// Wraps `inner` in a group, the unit the renderer flattens or breaks.
[[nodiscard]] auto group(DocPtr inner) -> DocPtr;

// ============================================================================
// Measurement
// ============================================================================

/// Display width of `text` in columns: one column per UTF-8 code point.
[[nodiscard]] auto display_width(std::string_view text) -> int;

/// Renders a compact description of a document for tests, e.g.
/// `(group (concat "(" (indent 2 (concat "a" line "b")) ")"))`.
[[nodiscard]] auto dump(const Doc& doc) -> std::string;

} // namespace schemat::layout

#endif // SCHEMAT_LAYOUT_DOCUMENT_HPP
