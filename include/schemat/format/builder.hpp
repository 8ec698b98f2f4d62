#ifndef SCHEMAT_FORMAT_BUILDER_HPP
#define SCHEMAT_FORMAT_BUILDER_HPP

#include "schemat/layout/document.hpp"
#include "schemat/parser/syntax.hpp"

#include <vector>

namespace schemat::format {

/// Indentation of list children relative to the opening delimiter's line.
constexpr int LIST_INDENT = 2;

// Builds the layout document for a parsed module
//
// The canonical style is fixed: list children are separated by soft lines
// inside one group, comments always end their line, blank markers become one
// empty line and prefixes stay glued to their form.
class DocumentBuilder {
public:
    DocumentBuilder() = default;

    // Build the document for a whole input
    [[nodiscard]] auto build(const parser::Module& module) const -> layout::DocPtr;

    // Build the document for a single node
    [[nodiscard]] auto build_node(const parser::Node& node) const -> layout::DocPtr;

private:
    [[nodiscard]] auto build_list(const parser::ListNode& list) const -> layout::DocPtr;
    [[nodiscard]] auto build_quoted(const parser::QuotedNode& quoted) const -> layout::DocPtr;

    // Joins siblings with the separators their neighbours call for
    // Top-level siblings always go on their own lines
    [[nodiscard]] auto build_sequence(const std::vector<parser::NodePtr>& nodes,
                                      bool top_level) const -> std::vector<layout::DocPtr>;
};

} // namespace schemat::format

#endif // SCHEMAT_FORMAT_BUILDER_HPP
