#pragma once

#include <string>

namespace diagram_model {
struct Attribute;
struct Entity;
struct Relationship;
class Erd;
struct Element;
struct Requirement;
struct RequirementRelationship;
class RequirementDiagram;
}

namespace diagram_render {

// Header tokens that open each diagram.
const char* const erd_header = "erDiagram";
const char* const requirement_diagram_header = "requirementDiagram";

// Entity-relationship diagrams (renderer.cpp).
std::string render(const diagram_model::Attribute& attribute);
std::string render(const diagram_model::Entity& entity);
std::string render(const diagram_model::Relationship& relationship);
// Exactly "erDiagram" for an empty, untitled diagram.
std::string render(const diagram_model::Erd& diagram);

// Requirement diagrams (requirement_renderer.cpp).
std::string render(const diagram_model::Element& element);
std::string render(const diagram_model::Requirement& requirement);
std::string render(const diagram_model::RequirementRelationship& relationship);
std::string render(const diagram_model::RequirementDiagram& diagram);

} // namespace diagram_render
