#include "schemat/layout/document.hpp"

#include <sstream>
#include <type_traits>

namespace schemat::layout {

auto text(std::string_view value) -> DocPtr {
    return make_box<Doc>(Doc{.kind = TextDoc{.text = std::string(value)}});
}

auto concat(std::vector<DocPtr> parts) -> DocPtr {
    return make_box<Doc>(Doc{.kind = ConcatDoc{.parts = std::move(parts)}});
}

auto indent(int width, DocPtr inner) -> DocPtr {
    return make_box<Doc>(Doc{.kind = IndentDoc{.width = width, .inner = std::move(inner)}});
}

auto line() -> DocPtr {
    return make_box<Doc>(Doc{.kind = LineDoc{}});
}

auto hard_line() -> DocPtr {
    return make_box<Doc>(Doc{.kind = HardLineDoc{}});
}

auto group(DocPtr inner) -> DocPtr {
    return make_box<Doc>(Doc{.kind = GroupDoc{.inner = std::move(inner)}});
}

auto display_width(std::string_view text) -> int {
    int width = 0;
    for (char c : text) {
        // Continuation bytes (10xxxxxx) belong to the preceding code point.
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

namespace {

void dump_into(std::ostringstream& out, const Doc& doc) {
    std::visit(
        [&out](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, TextDoc>) {
                out << '"' << d.text << '"';
            } else if constexpr (std::is_same_v<T, ConcatDoc>) {
                out << "(concat";
                for (const auto& part : d.parts) {
                    out << ' ';
                    dump_into(out, *part);
                }
                out << ')';
            } else if constexpr (std::is_same_v<T, IndentDoc>) {
                out << "(indent " << d.width << ' ';
                dump_into(out, *d.inner);
                out << ')';
            } else if constexpr (std::is_same_v<T, LineDoc>) {
                out << "line";
            } else if constexpr (std::is_same_v<T, HardLineDoc>) {
                out << "hardline";
            } else {
                out << "(group ";
                dump_into(out, *d.inner);
                out << ')';
            }
        },
        doc.kind);
}

} // anonymous namespace

auto dump(const Doc& doc) -> std::string {
    std::ostringstream out;
    dump_into(out, doc);
    return out.str();
}

} // namespace schemat::layout
