#include "schemat/layout/renderer.hpp"

#include <type_traits>

namespace schemat::layout {

namespace {

/// Column reached after writing `text` starting at `column`.
auto advance_column(int column, std::string_view text) -> int {
    auto newline = text.rfind('\n');
    if (newline == std::string_view::npos) {
        return column + display_width(text);
    }
    return display_width(text.substr(newline + 1));
}

} // anonymous namespace

Renderer::Renderer(int max_width) : max_width_(max_width) {}

auto Renderer::render(const Doc& doc) const -> std::string {
    std::string out;
    int column = 0;
    int pending_indent = -1; // Indent owed to the current line, -1 when none

    std::vector<Command> stack{{0, Mode::Break, &doc}};

    auto newline = [&](int indent) {
        out += '\n';
        column = indent;
        pending_indent = indent;
    };

    auto write = [&](std::string_view value) {
        if (pending_indent > 0) {
            out.append(static_cast<size_t>(pending_indent), ' ');
        }
        pending_indent = -1;
        out += value;
        column = advance_column(column, value);
    };

    while (!stack.empty()) {
        Command cmd = stack.back();
        stack.pop_back();

        std::visit(
            [&](const auto& d) {
                using T = std::decay_t<decltype(d)>;
                if constexpr (std::is_same_v<T, TextDoc>) {
                    write(d.text);
                } else if constexpr (std::is_same_v<T, ConcatDoc>) {
                    for (auto it = d.parts.rbegin(); it != d.parts.rend(); ++it) {
                        stack.push_back({cmd.indent, cmd.mode, it->get()});
                    }
                } else if constexpr (std::is_same_v<T, IndentDoc>) {
                    stack.push_back({cmd.indent + d.width, cmd.mode, d.inner.get()});
                } else if constexpr (std::is_same_v<T, LineDoc>) {
                    if (cmd.mode == Mode::Flat) {
                        write(" ");
                    } else {
                        newline(cmd.indent);
                    }
                } else if constexpr (std::is_same_v<T, HardLineDoc>) {
                    newline(cmd.indent);
                } else {
                    Command flat{cmd.indent, Mode::Flat, d.inner.get()};
                    Command broken{cmd.indent, Mode::Break, d.inner.get()};
                    if (cmd.mode == Mode::Flat) {
                        stack.push_back(flat);
                    } else {
                        stack.push_back(fits(flat, stack, max_width_ - column) ? flat : broken);
                    }
                }
            },
            cmd.doc->kind);
    }

    return out;
}

auto Renderer::fits(const Command& next, const std::vector<Command>& rest, int width) const
    -> bool {
    std::vector<Command> pending{next};
    size_t rest_index = rest.size();
    bool inside = true; // Still measuring `next` rather than what follows it

    while (width >= 0) {
        if (pending.empty()) {
            if (rest_index == 0) {
                return true;
            }
            inside = false;
            pending.push_back(rest[--rest_index]);
            continue;
        }

        Command cmd = pending.back();
        pending.pop_back();

        // Returns 1 at the line break that ends the measurement, 0 to continue.
        int done = std::visit(
            [&](const auto& d) -> int {
                using T = std::decay_t<decltype(d)>;
                if constexpr (std::is_same_v<T, TextDoc>) {
                    auto newline = d.text.find('\n');
                    if (newline != std::string::npos) {
                        std::string_view value(d.text);
                        width -= display_width(value.substr(0, newline));
                        if (!inside || width < 0) {
                            return 1;
                        }
                        width = max_width_ - display_width(value.substr(value.rfind('\n') + 1));
                        return 0;
                    }
                    width -= display_width(d.text);
                    return 0;
                } else if constexpr (std::is_same_v<T, ConcatDoc>) {
                    for (auto it = d.parts.rbegin(); it != d.parts.rend(); ++it) {
                        pending.push_back({cmd.indent, cmd.mode, it->get()});
                    }
                    return 0;
                } else if constexpr (std::is_same_v<T, IndentDoc>) {
                    pending.push_back({cmd.indent + d.width, cmd.mode, d.inner.get()});
                    return 0;
                } else if constexpr (std::is_same_v<T, LineDoc>) {
                    if (cmd.mode == Mode::Break) {
                        return 1;
                    }
                    width -= 1;
                    return 0;
                } else if constexpr (std::is_same_v<T, HardLineDoc>) {
                    if (!inside) {
                        return 1;
                    }
                    // A forced break inside the group starts a new line that
                    // must fit as well.
                    width = max_width_ - cmd.indent;
                    return 0;
                } else {
                    pending.push_back({cmd.indent, cmd.mode, d.inner.get()});
                    return 0;
                }
            },
            cmd.doc->kind);

        if (done != 0) {
            return width >= 0;
        }
    }

    return false;
}

} // namespace schemat::layout
