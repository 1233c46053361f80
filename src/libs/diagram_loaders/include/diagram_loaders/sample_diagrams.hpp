#pragma once

#include <diagram_model/entity_relationship.hpp>
#include <diagram_model/requirement_diagram.hpp>

namespace diagram_loaders {

// Album/song catalogue; ARTIST is only created through a relationship.
diagram_model::Erd sample_erd();

// A "search" release element satisfied by three requirements.
diagram_model::RequirementDiagram sample_requirement_diagram();

} // namespace diagram_loaders
