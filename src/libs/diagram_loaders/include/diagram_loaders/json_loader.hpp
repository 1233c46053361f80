#pragma once

#include <diagram_model/entity_relationship.hpp>
#include <diagram_model/requirement_diagram.hpp>
#include <optional>
#include <istream>
#include <string>

namespace diagram_loaders {

// Rejected documents yield std::nullopt; the reason is logged as a warning.
std::optional<diagram_model::Erd> load_erd_from_json(std::istream& in);
std::optional<diagram_model::Erd> load_erd_from_json_file(const std::string& path);

std::optional<diagram_model::RequirementDiagram> load_requirement_diagram_from_json(std::istream& in);
std::optional<diagram_model::RequirementDiagram> load_requirement_diagram_from_json_file(const std::string& path);

} // namespace diagram_loaders
