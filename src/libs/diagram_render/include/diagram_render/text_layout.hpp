#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace diagram_render {

// Indentation used for section contents and for lines inside a "{ }" block.
const std::size_t block_indent = 4;

// Prefixes every line of text with size spaces. Lines are split on '\n' and
// joined back with '\n'; no line is added or removed.
std::string indent(std::string_view text, std::size_t size);

// "%% <title> start" / "%% <title> end"
std::string section_banner(std::string_view title, bool start);

// Appends a banner-delimited section with one indented line block per item.
// Nothing is appended when items is empty.
template <typename Range, typename Render>
void append_section(std::string& out, std::string_view title, const Range& items, Render render) {
    if (items.empty()) return;

    out += '\n';
    out += indent(section_banner(title, true), block_indent);
    for (const auto& item : items) {
        out += '\n';
        out += indent(render(item), block_indent);
    }
    out += '\n';
    out += indent(section_banner(title, false), block_indent);
}

} // namespace diagram_render
