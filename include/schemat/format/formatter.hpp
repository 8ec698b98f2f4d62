//! # Formatting Pipeline
//!
//! Composes scanner, parser, document builder and renderer:
//!
//! ```text
//! Source -> Scanner -> tokens -> Parser -> Module -> DocumentBuilder -> Doc
//!        -> Renderer -> text
//! ```
//!
//! A `Formatter` holds only its options. Every call builds its own token
//! list, tree and document, so one instance may serve several threads.

#ifndef SCHEMAT_FORMAT_FORMATTER_HPP
#define SCHEMAT_FORMAT_FORMATTER_HPP

#include "schemat/common.hpp"
#include "schemat/layout/renderer.hpp"
#include "schemat/lexer/source.hpp"
#include "schemat/parser/parser.hpp"

#include <string>
#include <string_view>

namespace schemat::format {

// Formatter options
struct FormatOptions {
    int max_width = layout::DEFAULT_MAX_WIDTH; // Column budget for the renderer
};

// S-expression source formatter
class Formatter {
public:
    explicit Formatter(FormatOptions options = {});

    // Format a source into canonical text
    [[nodiscard]] auto format(const lexer::Source& source) const
        -> Result<std::string, parser::ParseError>;
    [[nodiscard]] auto format(std::string_view text) const
        -> Result<std::string, parser::ParseError>;

    // True if the source is already canonical, i.e. formatting it is a no-op
    [[nodiscard]] auto check(const lexer::Source& source) const -> Result<bool, parser::ParseError>;
    [[nodiscard]] auto check(std::string_view text) const -> Result<bool, parser::ParseError>;

    [[nodiscard]] auto options() const -> const FormatOptions& {
        return options_;
    }

private:
    FormatOptions options_;
};

} // namespace schemat::format

#endif // SCHEMAT_FORMAT_FORMATTER_HPP
