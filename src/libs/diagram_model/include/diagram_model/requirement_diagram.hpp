#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace diagram_model {

enum class RequirementType { Default, Functional, Interface, Performance, Physical, DesignConstraint };

inline const char* to_string(RequirementType type) {
    switch (type) {
    case RequirementType::Default: return "requirement";
    case RequirementType::Functional: return "functionalRequirement";
    case RequirementType::Interface: return "interfaceRequirement";
    case RequirementType::Performance: return "performanceRequirement";
    case RequirementType::Physical: return "physicalRequirement";
    case RequirementType::DesignConstraint: return "designConstraint";
    }
    return "";
}

enum class Risk { Low, Medium, High };

inline const char* to_string(Risk risk) {
    switch (risk) {
    case Risk::Low: return "Low";
    case Risk::Medium: return "Medium";
    case Risk::High: return "High";
    }
    return "";
}

enum class VerifyMethod { Analysis, Inspection, Test, Demo };

inline const char* to_string(VerifyMethod method) {
    switch (method) {
    case VerifyMethod::Analysis: return "Analysis";
    case VerifyMethod::Inspection: return "Inspection";
    case VerifyMethod::Test: return "Test";
    case VerifyMethod::Demo: return "Demonstration";
    }
    return "";
}

enum class RelationshipType { Contains, Copies, Derives, Satisfies, Verifies, Refines, Traces };

inline const char* to_string(RelationshipType type) {
    switch (type) {
    case RelationshipType::Contains: return "contains";
    case RelationshipType::Copies: return "copies";
    case RelationshipType::Derives: return "derives";
    case RelationshipType::Satisfies: return "satisfies";
    case RelationshipType::Verifies: return "verifies";
    case RelationshipType::Refines: return "refines";
    case RelationshipType::Traces: return "traces";
    }
    return "";
}

// Enumerator names in snake_case, any case ("design_constraint", "demo", ...).
std::optional<RequirementType> parse_requirement_type(std::string_view text);
std::optional<Risk> parse_risk(std::string_view text);
std::optional<VerifyMethod> parse_verify_method(std::string_view text);
std::optional<RelationshipType> parse_relationship_type(std::string_view text);

// External reference (document, release, ...) in a requirement diagram.
struct Element {
    std::string name;
    std::string kind;
    std::optional<std::string> docref;

    Element(std::string name, std::string kind);

    Element& with_docref(std::string ref) &;
    Element with_docref(std::string ref) &&;
};

struct Requirement {
    RequirementType kind;
    std::string name;
    std::string id;
    std::optional<std::string> text;
    std::optional<Risk> risk;
    std::optional<VerifyMethod> verify_method;

    Requirement(RequirementType kind, std::string name, std::string id);

    Requirement& with_text(std::string value) &;
    Requirement with_text(std::string value) &&;
    Requirement& with_risk(Risk value) &;
    Requirement with_risk(Risk value) &&;
    Requirement& with_verify_method(VerifyMethod value) &;
    Requirement with_verify_method(VerifyMethod value) &&;
};

struct RequirementRelationship {
    std::string source;
    std::string target;
    RelationshipType kind;

    RequirementRelationship(std::string source, std::string target, RelationshipType kind);
};

class RequirementDiagram {
public:
    RequirementDiagram() = default;

    void add_element(Element element);
    RequirementDiagram& with_element(Element element) &;
    RequirementDiagram with_element(Element element) &&;
    const Element* get_element_by_name(const std::string& name) const;

    void add_requirement(Requirement requirement);
    RequirementDiagram& with_requirement(Requirement requirement) &;
    RequirementDiagram with_requirement(Requirement requirement) &&;
    const Requirement* get_requirement_by_name(const std::string& name) const;

    // True when name is a known element or requirement.
    bool contains(const std::string& name) const;

    // Throws std::invalid_argument naming the first unknown endpoint; the
    // diagram is left unchanged in that case.
    void add_relationship(RequirementRelationship relationship);
    RequirementDiagram& with_relationship(RequirementRelationship relationship) &;
    RequirementDiagram with_relationship(RequirementRelationship relationship) &&;

    const std::vector<Element>& elements() const { return elements_; }
    const std::vector<Requirement>& requirements() const { return requirements_; }
    const std::vector<RequirementRelationship>& relationships() const { return relationships_; }

private:
    std::vector<Element> elements_;
    std::unordered_map<std::string, std::size_t> element_index_;
    std::vector<Requirement> requirements_;
    std::unordered_map<std::string, std::size_t> requirement_index_;
    std::vector<RequirementRelationship> relationships_;
};

} // namespace diagram_model
