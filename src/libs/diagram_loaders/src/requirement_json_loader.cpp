#include <diagram_loaders/json_loader.hpp>
#include <diagram_model/logger.hpp>
#include "json_fields.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace diagram_loaders {

namespace {

using detail::InvalidDocument;

diagram_model::Element parse_element(const nlohmann::json& e) {
    diagram_model::Element element(detail::required_string(e, "name", "element"),
        detail::required_string(e, "type", "element"));
    if (auto docref = detail::optional_string(e, "docref"))
        element.with_docref(std::move(*docref));
    return element;
}

diagram_model::Requirement parse_requirement(const nlohmann::json& r) {
    // "kind" may be omitted for a plain requirement.
    diagram_model::RequirementType kind = diagram_model::RequirementType::Default;
    if (r.contains("kind"))
        kind = detail::required_enum(r, "kind", "requirement", diagram_model::parse_requirement_type);

    diagram_model::Requirement requirement(kind,
        detail::required_string(r, "name", "requirement"),
        detail::required_string(r, "id", "requirement"));
    if (auto text = detail::optional_string(r, "text"))
        requirement.with_text(std::move(*text));
    if (r.contains("risk"))
        requirement.with_risk(detail::required_enum(r, "risk", "requirement", diagram_model::parse_risk));
    if (r.contains("verify_method"))
        requirement.with_verify_method(
            detail::required_enum(r, "verify_method", "requirement", diagram_model::parse_verify_method));
    return requirement;
}

diagram_model::RequirementRelationship parse_relationship(const nlohmann::json& r) {
    return diagram_model::RequirementRelationship(
        detail::required_string(r, "source", "relationship"),
        detail::required_string(r, "target", "relationship"),
        detail::required_enum(r, "kind", "relationship", diagram_model::parse_relationship_type));
}

diagram_model::RequirementDiagram parse_requirement_diagram_json(const nlohmann::json& j) {
    if (!j.is_object()) throw InvalidDocument("document must be an object");

    diagram_model::RequirementDiagram diagram;
    if (const auto* elements = detail::optional_array(j, "elements")) {
        for (const auto& e : *elements)
            diagram.add_element(parse_element(e));
    }
    if (const auto* requirements = detail::optional_array(j, "requirements")) {
        for (const auto& r : *requirements)
            diagram.add_requirement(parse_requirement(r));
    }
    // Relationships come last so they can refer to any element or requirement.
    if (const auto* relationships = detail::optional_array(j, "relationships")) {
        for (const auto& r : *relationships)
            diagram.add_relationship(parse_relationship(r));
    }
    return diagram;
}

} // namespace

std::optional<diagram_model::RequirementDiagram> load_requirement_diagram_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_requirement_diagram_json(j);
    } catch (const nlohmann::json::exception& e) {
        diagram_model::logger()->warn("requirement document is not valid JSON: {}", e.what());
    } catch (const InvalidDocument& e) {
        diagram_model::logger()->warn("requirement document rejected: {}", e.what());
    } catch (const std::invalid_argument& e) {
        diagram_model::logger()->warn("requirement document rejected: {}", e.what());
    }
    return std::nullopt;
}

std::optional<diagram_model::RequirementDiagram> load_requirement_diagram_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        diagram_model::logger()->warn("cannot open requirement file {}", path);
        return std::nullopt;
    }
    return load_requirement_diagram_from_json(f);
}

} // namespace diagram_loaders
