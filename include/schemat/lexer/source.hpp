//! # Source Text Management
//!
//! This module provides the source representation consumed by the scanner.
//! It owns the input text, tracks line/column positions and hands out slices
//! for token lexemes and diagnostics.
//!
//! ## Features
//!
//! - **Line tracking**: Efficient line/column lookup from byte offsets
//! - **Slicing**: Extract substrings for lexeme creation
//! - **Error reporting**: Provides line content for diagnostic messages
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("(define x 42)", "<test>");
//!
//! SourceLocation loc = source.location(8); // line 1, column 9
//! std::string_view line = source.line(1);  // "(define x 42)"
//! ```

#ifndef SCHEMAT_LEXER_SOURCE_HPP
#define SCHEMAT_LEXER_SOURCE_HPP

#include "schemat/common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace schemat::lexer {

/// An input text with efficient location tracking.
///
/// Upon construction, the source builds an index of line start offsets,
/// enabling O(log n) lookup of line numbers from byte offsets.
///
/// String views returned by `content()`, `slice()` and `line()` are valid as
/// long as the Source object exists.
class Source {
public:
    /// Constructs a source from a name and content.
    Source(std::string name, std::string content);

    /// Returns the entire source content as a string view.
    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    /// Returns the file name or identifier for this source.
    [[nodiscard]] auto name() const -> std::string_view {
        return name_;
    }

    /// Returns the length of the source in bytes.
    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at the given offset, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns a substring from `start` to `end` (exclusive), clamped to bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Returns the content of a specific line (1-indexed), without its line terminator.
    ///
    /// Returns an empty view if the line number is out of range.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    /// Returns the total number of lines in the source.
    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a source file from disk.
    ///
    /// Returns an error string if the file cannot be read.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<stdin>")
        -> Source;

private:
    std::string name_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace schemat::lexer

#endif // SCHEMAT_LEXER_SOURCE_HPP
