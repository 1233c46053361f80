#include <diagram_loaders/json_loader.hpp>
#include <diagram_model/logger.hpp>
#include "json_fields.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace diagram_loaders {

namespace {

using detail::InvalidDocument;

diagram_model::Attribute parse_attribute(const nlohmann::json& a) {
    diagram_model::Attribute attribute(detail::required_string(a, "type", "attribute"),
        detail::required_string(a, "name", "attribute"));
    if (const auto* keys = detail::optional_array(a, "keys")) {
        for (const auto& key : *keys) {
            const std::string k = key.is_string() ? key.get<std::string>() : "";
            if (k == "PK") attribute.as_primary_key();
            else if (k == "FK") attribute.as_foreign_key();
            else if (k == "UK") attribute.as_unique();
            else throw InvalidDocument("attribute " + attribute.name + ": unknown key \"" + k + "\"");
        }
    }
    if (auto comment = detail::optional_string(a, "comment"))
        attribute.with_comment(std::move(*comment));
    return attribute;
}

diagram_model::Entity parse_entity(const nlohmann::json& e) {
    diagram_model::Entity entity(detail::required_string(e, "id", "entity"));
    if (auto alias = detail::optional_string(e, "alias"))
        entity.with_alias(std::move(*alias));
    if (const auto* attributes = detail::optional_array(e, "attributes")) {
        for (const auto& a : *attributes)
            entity.with_attribute(parse_attribute(a));
    }
    return entity;
}

diagram_model::Relationship parse_relationship(const nlohmann::json& r) {
    diagram_model::Relationship relationship(
        detail::required_string(r, "left", "relationship"),
        detail::required_string(r, "right", "relationship"),
        detail::required_enum(r, "left_cardinality", "relationship", diagram_model::parse_cardinality),
        detail::required_enum(r, "right_cardinality", "relationship", diagram_model::parse_cardinality));
    if (detail::optional_bool(r, "identifying") == false)
        relationship.as_non_identifying();
    if (auto label = detail::optional_string(r, "label"))
        relationship.with_label(std::move(*label));
    return relationship;
}

diagram_model::Erd parse_erd_json(const nlohmann::json& j) {
    if (!j.is_object()) throw InvalidDocument("document must be an object");

    diagram_model::Erd erd;
    if (auto title = detail::optional_string(j, "title"))
        erd.with_title(std::move(*title));
    if (const auto* entities = detail::optional_array(j, "entities")) {
        for (const auto& e : *entities)
            erd.add_entity(parse_entity(e));
    }
    if (const auto* relationships = detail::optional_array(j, "relationships")) {
        for (const auto& r : *relationships)
            erd.add_relationship(parse_relationship(r));
    }
    return erd;
}

} // namespace

std::optional<diagram_model::Erd> load_erd_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_erd_json(j);
    } catch (const nlohmann::json::exception& e) {
        diagram_model::logger()->warn("erd document is not valid JSON: {}", e.what());
    } catch (const InvalidDocument& e) {
        diagram_model::logger()->warn("erd document rejected: {}", e.what());
    }
    return std::nullopt;
}

std::optional<diagram_model::Erd> load_erd_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        diagram_model::logger()->warn("cannot open erd file {}", path);
        return std::nullopt;
    }
    return load_erd_from_json(f);
}

} // namespace diagram_loaders
