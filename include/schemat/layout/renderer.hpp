//! # Layout Renderer
//!
//! Renders a layout document to text under a column budget.
//!
//! ## Algorithm
//!
//! The renderer walks the document with an explicit stack of
//! `(indent, mode, doc)` commands. On entering a group in break mode it measures
//! the group's flat rendering, followed by whatever comes after it up to the
//! next line break, against the columns left on the current line. The
//! measurement never looks past the first break after the group.
//!
//! - A group nested in a flat group is flat.
//! - A `HardLine` inside a flat group still breaks. The line it starts is
//!   measured from its indent, so every line of a flat group fits.
//! - Nested groups of a broken group get their own fit test at their own column.
//!
//! Indentation after a newline is written lazily, right before the next text,
//! so output never carries trailing whitespace and blank lines stay empty.

#ifndef SCHEMAT_LAYOUT_RENDERER_HPP
#define SCHEMAT_LAYOUT_RENDERER_HPP

#include "schemat/layout/document.hpp"

#include <string>
#include <vector>

namespace schemat::layout {

/// Default column budget.
constexpr int DEFAULT_MAX_WIDTH = 80;

class Renderer {
public:
    explicit Renderer(int max_width = DEFAULT_MAX_WIDTH);

    /// Renders `doc`. Deterministic: equal documents give equal text.
    [[nodiscard]] auto render(const Doc& doc) const -> std::string;

    [[nodiscard]] auto max_width() const -> int {
        return max_width_;
    }

private:
    enum class Mode { Flat, Break };

    struct Command {
        int indent;
        Mode mode;
        const Doc* doc;
    };

    int max_width_;

    /// Checks whether `next`, followed by the pending commands in `rest`, fits
    /// in `width` columns before the next line break. Lines forced inside
    /// `next` are checked against the full budget.
    [[nodiscard]] auto fits(const Command& next, const std::vector<Command>& rest,
                            int width) const -> bool;
};

} // namespace schemat::layout

#endif // SCHEMAT_LAYOUT_RENDERER_HPP
