#include <diagram_render/renderer.hpp>
#include <diagram_render/text_layout.hpp>
#include <diagram_model/entity_relationship.hpp>

namespace diagram_render {

namespace {

std::string quoted(const std::string& text) {
    return "\"" + text + "\"";
}

// Mermaid front matter; only emitted for titled diagrams.
std::string front_matter(const std::string& title) {
    return "---\ntitle: " + title + "\n---\n";
}

} // namespace

std::string render(const diagram_model::Attribute& attribute) {
    std::string line = attribute.type + " " + attribute.name;
    if (attribute.keys.any())
        line += " " + diagram_model::to_string(attribute.keys);
    if (attribute.comment)
        line += " " + quoted(*attribute.comment);
    return line;
}

std::string render(const diagram_model::Entity& entity) {
    std::string out = entity.id.str();
    if (entity.alias)
        out += "[" + quoted(*entity.alias) + "]";
    if (entity.attributes.empty()) return out;

    std::string body;
    for (const auto& attribute : entity.attributes) {
        if (!body.empty()) body += '\n';
        body += render(attribute);
    }
    out += " {\n";
    out += indent(body, block_indent);
    out += "\n}";
    return out;
}

std::string render(const diagram_model::Relationship& relationship) {
    using diagram_model::Side;

    std::string out = relationship.left_id.str();
    out += ' ';
    out += diagram_model::to_string(relationship.left_cardinality, Side::Left);
    out += relationship.is_identifying ? "--" : "..";
    out += diagram_model::to_string(relationship.right_cardinality, Side::Right);
    out += ' ';
    out += relationship.right_id.str();
    if (relationship.label)
        out += " : " + quoted(*relationship.label);
    return out;
}

std::string render(const diagram_model::Erd& diagram) {
    std::string out;
    if (diagram.title()) out += front_matter(*diagram.title());
    out += erd_header;

    auto render_entity = [](const diagram_model::Entity& e) { return render(e); };
    auto render_relationship = [](const diagram_model::Relationship& r) { return render(r); };
    append_section(out, "Entities", diagram.entities(), render_entity);
    append_section(out, "Relationships", diagram.relationships(), render_relationship);
    return out;
}

} // namespace diagram_render
