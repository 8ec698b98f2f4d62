#include "schemat/parser/syntax.hpp"

#include <sstream>
#include <type_traits>

namespace schemat::parser {

namespace {

void dump_into(std::ostringstream& out, const Node& node) {
    std::visit(
        [&out](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, AtomNode>) {
                out << n.text;
            } else if constexpr (std::is_same_v<T, ListNode>) {
                out << "(list";
                for (const auto& child : n.children) {
                    out << ' ';
                    dump_into(out, *child);
                }
                out << ')';
            } else if constexpr (std::is_same_v<T, QuotedNode>) {
                out << "(quote " << n.prefix << ' ';
                dump_into(out, *n.inner);
                out << ')';
            } else if constexpr (std::is_same_v<T, CommentNode>) {
                out << "(comment "
                    << (n.attachment == CommentAttachment::Trailing ? "trailing " : "leading ")
                    << n.text << ')';
            } else if constexpr (std::is_same_v<T, DirectiveNode>) {
                out << "(directive " << n.text << ')';
            } else {
                out << "(blank)";
            }
        },
        node.kind);
}

} // anonymous namespace

auto dump(const Node& node) -> std::string {
    std::ostringstream out;
    dump_into(out, node);
    return out.str();
}

auto dump(const Module& module) -> std::string {
    std::ostringstream out;
    for (size_t i = 0; i < module.nodes.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        dump_into(out, *module.nodes[i]);
    }
    return out.str();
}

} // namespace schemat::parser
