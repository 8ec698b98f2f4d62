#include "schemat/format/formatter.hpp"

#include "schemat/format/builder.hpp"
#include "schemat/lexer/scanner.hpp"
#include "schemat/log/log.hpp"

namespace schemat::format {

Formatter::Formatter(FormatOptions options) : options_(options) {}

auto Formatter::format(const lexer::Source& source) const
    -> Result<std::string, parser::ParseError> {
    lexer::Scanner scanner(source);
    auto tokens = scanner.tokenize();
    SCHEMAT_LOG_TRACE("format", source.name() << ": " << tokens.size() << " tokens");

    parser::Parser parser(std::move(tokens));
    auto module = parser.parse_module();
    if (is_err(module)) {
        const auto& error = unwrap_err(module);
        SCHEMAT_LOG_DEBUG("format", source.name()
                                        << ": " << parser::parse_error_kind_to_string(error.kind)
                                        << " at " << error.line() << ":" << error.column());
        return error;
    }
    SCHEMAT_LOG_DEBUG("format", source.name() << ": parsed " << unwrap(module).nodes.size()
                                              << " top-level nodes");

    DocumentBuilder builder;
    auto doc = builder.build(unwrap(module));
    SCHEMAT_LOG_TRACE("format", source.name() << ": document " << layout::dump(*doc));

    layout::Renderer renderer(options_.max_width);
    return renderer.render(*doc);
}

auto Formatter::format(std::string_view text) const -> Result<std::string, parser::ParseError> {
    return format(lexer::Source::from_string(std::string(text)));
}

auto Formatter::check(const lexer::Source& source) const -> Result<bool, parser::ParseError> {
    auto formatted = format(source);
    if (is_err(formatted)) {
        return std::move(unwrap_err(formatted));
    }

    bool canonical = unwrap(formatted) == source.content();
    SCHEMAT_LOG_DEBUG("format", source.name() << (canonical ? ": canonical" : ": not canonical"));
    return canonical;
}

auto Formatter::check(std::string_view text) const -> Result<bool, parser::ParseError> {
    return check(lexer::Source::from_string(std::string(text)));
}

} // namespace schemat::format
