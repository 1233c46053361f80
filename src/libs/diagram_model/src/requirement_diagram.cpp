#include <diagram_model/requirement_diagram.hpp>
#include <diagram_model/logger.hpp>
#include "token.hpp"
#include <stdexcept>
#include <utility>

namespace diagram_model {

namespace {

template <typename T>
void insert_or_replace(std::vector<T>& items, std::unordered_map<std::string, std::size_t>& index,
    T item, const char* what)
{
    auto it = index.find(item.name);
    if (it != index.end()) {
        logger()->debug("replacing {} {}", what, item.name);
        items[it->second] = std::move(item);
        return;
    }
    index.emplace(item.name, items.size());
    items.push_back(std::move(item));
}

template <typename T>
const T* find_by_name(const std::vector<T>& items,
    const std::unordered_map<std::string, std::size_t>& index, const std::string& name)
{
    auto it = index.find(name);
    if (it == index.end()) return nullptr;
    return &items[it->second];
}

} // namespace

std::optional<RequirementType> parse_requirement_type(std::string_view text) {
    const std::string word = detail::to_lower(text);
    if (word == "default" || word == "requirement") return RequirementType::Default;
    if (word == "functional") return RequirementType::Functional;
    if (word == "interface") return RequirementType::Interface;
    if (word == "performance") return RequirementType::Performance;
    if (word == "physical") return RequirementType::Physical;
    if (word == "design_constraint") return RequirementType::DesignConstraint;
    return std::nullopt;
}

std::optional<Risk> parse_risk(std::string_view text) {
    const std::string word = detail::to_lower(text);
    if (word == "low") return Risk::Low;
    if (word == "medium") return Risk::Medium;
    if (word == "high") return Risk::High;
    return std::nullopt;
}

std::optional<VerifyMethod> parse_verify_method(std::string_view text) {
    const std::string word = detail::to_lower(text);
    if (word == "analysis") return VerifyMethod::Analysis;
    if (word == "inspection") return VerifyMethod::Inspection;
    if (word == "test") return VerifyMethod::Test;
    if (word == "demo" || word == "demonstration") return VerifyMethod::Demo;
    return std::nullopt;
}

std::optional<RelationshipType> parse_relationship_type(std::string_view text) {
    const std::string word = detail::to_lower(text);
    if (word == "contains") return RelationshipType::Contains;
    if (word == "copies") return RelationshipType::Copies;
    if (word == "derives") return RelationshipType::Derives;
    if (word == "satisfies") return RelationshipType::Satisfies;
    if (word == "verifies") return RelationshipType::Verifies;
    if (word == "refines") return RelationshipType::Refines;
    if (word == "traces") return RelationshipType::Traces;
    return std::nullopt;
}

Element::Element(std::string name, std::string kind)
    : name(std::move(name)), kind(std::move(kind))
{
}

Element& Element::with_docref(std::string ref) & {
    docref = std::move(ref);
    return *this;
}

Element Element::with_docref(std::string ref) && {
    with_docref(std::move(ref));
    return std::move(*this);
}

Requirement::Requirement(RequirementType kind, std::string name, std::string id)
    : kind(kind), name(std::move(name)), id(std::move(id))
{
}

Requirement& Requirement::with_text(std::string value) & {
    text = std::move(value);
    return *this;
}

Requirement Requirement::with_text(std::string value) && {
    with_text(std::move(value));
    return std::move(*this);
}

Requirement& Requirement::with_risk(Risk value) & {
    risk = value;
    return *this;
}

Requirement Requirement::with_risk(Risk value) && {
    with_risk(value);
    return std::move(*this);
}

Requirement& Requirement::with_verify_method(VerifyMethod value) & {
    verify_method = value;
    return *this;
}

Requirement Requirement::with_verify_method(VerifyMethod value) && {
    with_verify_method(value);
    return std::move(*this);
}

RequirementRelationship::RequirementRelationship(std::string source, std::string target,
    RelationshipType kind)
    : source(std::move(source)), target(std::move(target)), kind(kind)
{
}

void RequirementDiagram::add_element(Element element) {
    insert_or_replace(elements_, element_index_, std::move(element), "element");
}

RequirementDiagram& RequirementDiagram::with_element(Element element) & {
    add_element(std::move(element));
    return *this;
}

RequirementDiagram RequirementDiagram::with_element(Element element) && {
    with_element(std::move(element));
    return std::move(*this);
}

const Element* RequirementDiagram::get_element_by_name(const std::string& name) const {
    return find_by_name(elements_, element_index_, name);
}

void RequirementDiagram::add_requirement(Requirement requirement) {
    insert_or_replace(requirements_, requirement_index_, std::move(requirement), "requirement");
}

RequirementDiagram& RequirementDiagram::with_requirement(Requirement requirement) & {
    add_requirement(std::move(requirement));
    return *this;
}

RequirementDiagram RequirementDiagram::with_requirement(Requirement requirement) && {
    with_requirement(std::move(requirement));
    return std::move(*this);
}

const Requirement* RequirementDiagram::get_requirement_by_name(const std::string& name) const {
    return find_by_name(requirements_, requirement_index_, name);
}

bool RequirementDiagram::contains(const std::string& name) const {
    return element_index_.count(name) > 0 || requirement_index_.count(name) > 0;
}

void RequirementDiagram::add_relationship(RequirementRelationship relationship) {
    for (const std::string* name : { &relationship.source, &relationship.target }) {
        if (!contains(*name)) {
            logger()->error("rejected relationship {} - {} -> {}: unknown {}",
                relationship.source, to_string(relationship.kind), relationship.target, *name);
            throw std::invalid_argument(*name + " isn't found in the list of elements or requirements");
        }
    }
    relationships_.push_back(std::move(relationship));
}

RequirementDiagram& RequirementDiagram::with_relationship(RequirementRelationship relationship) & {
    add_relationship(std::move(relationship));
    return *this;
}

RequirementDiagram RequirementDiagram::with_relationship(RequirementRelationship relationship) && {
    with_relationship(std::move(relationship));
    return std::move(*this);
}

} // namespace diagram_model
