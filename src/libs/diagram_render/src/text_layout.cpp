#include <diagram_render/text_layout.hpp>

namespace diagram_render {

std::string indent(std::string_view text, std::size_t size) {
    if (text.empty()) return {};

    const std::string padding(size, ' ');
    std::string out;
    out.reserve(text.size() + padding.size());

    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        if (start > 0) out += '\n';
        out += padding;
        out.append(text.substr(start, end - start));
        if (end == text.size()) break;
        start = end + 1;
        // A trailing '\n' ends the last line rather than starting an empty one.
        if (start == text.size()) break;
    }
    return out;
}

std::string section_banner(std::string_view title, bool start) {
    std::string out = "%% ";
    out.append(title);
    out += start ? " start" : " end";
    return out;
}

} // namespace diagram_render
