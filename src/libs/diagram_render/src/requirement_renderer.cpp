#include <diagram_render/renderer.hpp>
#include <diagram_render/text_layout.hpp>
#include <diagram_model/requirement_diagram.hpp>

namespace diagram_render {

namespace {

// One "key: value" line inside an element or requirement block.
std::string field_line(const char* key, const std::string& value) {
    return indent(std::string(key) + ": " + value, block_indent) + "\n";
}

} // namespace

std::string render(const diagram_model::Element& element) {
    std::string out = "element " + element.name + " {\n";
    out += field_line("type", "\"" + element.kind + "\"");
    if (element.docref)
        out += field_line("docref", *element.docref);
    out += "}";
    return out;
}

std::string render(const diagram_model::Requirement& requirement) {
    std::string out = diagram_model::to_string(requirement.kind);
    out += " " + requirement.name + " {\n";
    out += field_line("id", requirement.id);
    if (requirement.risk)
        out += field_line("risk", diagram_model::to_string(*requirement.risk));
    if (requirement.text)
        out += field_line("text", "\"" + *requirement.text + "\"");
    if (requirement.verify_method)
        out += field_line("verifymethod", diagram_model::to_string(*requirement.verify_method));
    out += "}";
    return out;
}

std::string render(const diagram_model::RequirementRelationship& relationship) {
    return relationship.source + " - " + diagram_model::to_string(relationship.kind)
        + " -> " + relationship.target;
}

std::string render(const diagram_model::RequirementDiagram& diagram) {
    std::string out = requirement_diagram_header;

    auto render_element = [](const diagram_model::Element& e) { return render(e); };
    auto render_requirement = [](const diagram_model::Requirement& r) { return render(r); };
    auto render_relationship = [](const diagram_model::RequirementRelationship& r) { return render(r); };
    append_section(out, "Elements", diagram.elements(), render_element);
    append_section(out, "Requirements", diagram.requirements(), render_requirement);
    append_section(out, "Relationships", diagram.relationships(), render_relationship);
    return out;
}

} // namespace diagram_render
