// Document Builder
//
// Lowers the lossless syntax tree to a layout document. The rules, per node:
//
//   atom        -> text
//   list        -> open + group(indent(children)) + close
//   quoted      -> prefix + inner
//   comment     -> text, then a forced break before whatever follows
//   directive   -> text on its own line
//   blank       -> one extra hard line between its neighbours

#include "schemat/format/builder.hpp"

#include <type_traits>

namespace schemat::format {

using layout::DocPtr;

auto DocumentBuilder::build(const parser::Module& module) const -> DocPtr {
    auto parts = build_sequence(module.nodes, /*top_level=*/true);
    if (!parts.empty()) {
        parts.push_back(layout::hard_line());
    }
    return layout::concat(std::move(parts));
}

auto DocumentBuilder::build_node(const parser::Node& node) const -> DocPtr {
    return std::visit(
        [this](const auto& n) -> DocPtr {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, parser::AtomNode>) {
                return layout::text(n.text);
            } else if constexpr (std::is_same_v<T, parser::ListNode>) {
                return build_list(n);
            } else if constexpr (std::is_same_v<T, parser::QuotedNode>) {
                return build_quoted(n);
            } else if constexpr (std::is_same_v<T, parser::CommentNode>) {
                return layout::text(n.text);
            } else if constexpr (std::is_same_v<T, parser::DirectiveNode>) {
                return layout::text(n.text);
            } else {
                // Blank markers are consumed by build_sequence().
                return layout::concat({});
            }
        },
        node.kind);
}

auto DocumentBuilder::build_list(const parser::ListNode& list) const -> DocPtr {
    std::vector<DocPtr> parts;
    parts.push_back(layout::text(lexer::open_delimiter(list.delimiter)));

    if (!list.children.empty()) {
        parts.push_back(layout::group(
            layout::indent(LIST_INDENT, layout::concat(build_sequence(list.children, false)))));

        // A comment runs to the end of its line, so the close goes below it.
        if (list.children.back()->is<parser::CommentNode>()) {
            parts.push_back(layout::hard_line());
        }
    }

    parts.push_back(layout::text(lexer::close_delimiter(list.delimiter)));
    return layout::concat(std::move(parts));
}

auto DocumentBuilder::build_quoted(const parser::QuotedNode& quoted) const -> DocPtr {
    std::vector<DocPtr> parts;
    parts.push_back(layout::text(quoted.prefix));
    parts.push_back(build_node(*quoted.inner));
    return layout::concat(std::move(parts));
}

auto DocumentBuilder::build_sequence(const std::vector<parser::NodePtr>& nodes,
                                     bool top_level) const -> std::vector<DocPtr> {
    std::vector<DocPtr> parts;
    const parser::Node* previous = nullptr;
    bool blank_pending = false;

    for (const auto& node : nodes) {
        if (node->is<parser::BlankNode>()) {
            blank_pending = previous != nullptr;
            continue;
        }

        if (previous != nullptr) {
            if (node->is_comment(parser::CommentAttachment::Trailing) && !blank_pending) {
                parts.push_back(layout::text(" "));
            } else if (top_level || blank_pending || previous->is<parser::CommentNode>() ||
                       node->is<parser::CommentNode>()) {
                parts.push_back(layout::hard_line());
                if (blank_pending) {
                    parts.push_back(layout::hard_line());
                }
            } else {
                parts.push_back(layout::line());
            }
        }

        parts.push_back(build_node(*node));
        previous = node.get();
        blank_pending = false;
    }

    return parts;
}

} // namespace schemat::format
