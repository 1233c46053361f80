#include <diagram_loaders/sample_diagrams.hpp>
#include <initializer_list>

namespace diagram_loaders {

diagram_model::Erd sample_erd() {
    using diagram_model::Attribute;
    using diagram_model::Cardinality;
    using diagram_model::Entity;
    using diagram_model::Relationship;

    auto table = [](const char* id, const char* alias, std::initializer_list<Attribute> attributes) {
        Entity e(id);
        e.with_alias(alias);
        for (const auto& a : attributes)
            e.with_attribute(a);
        return e;
    };

    diagram_model::Erd out;
    out.with_title("Music catalogue (sample)");

    out.add_entity(table("ALBUM", "album", {
        Attribute("int", "albumId").as_primary_key(),
        Attribute("str", "title") }));

    out.add_entity(table("SONG", "song", {
        Attribute("int", "songId").as_primary_key(),
        Attribute("int", "albumId").as_foreign_key(),
        Attribute("str", "title"),
        Attribute("int", "plays").with_comment("Number of times the song has been played") }));

    out.add_relationship(
        Relationship("ALBUM", "SONG", Cardinality::ExactlyOne, Cardinality::OneOrMore)
            .with_label("includes"));
    // ARTIST has no entity of its own yet; the relationship creates it.
    out.add_relationship(
        Relationship("ALBUM", "ARTIST", Cardinality::OneOrMore, Cardinality::OneOrMore)
            .as_non_identifying());
    return out;
}

diagram_model::RequirementDiagram sample_requirement_diagram() {
    using diagram_model::Requirement;
    using diagram_model::RequirementType;
    using diagram_model::Risk;

    const auto method = diagram_model::VerifyMethod::Test;
    auto feature = [&](RequirementType kind, const char* name, const char* id, Risk risk, const char* text) {
        return Requirement(kind, name, id).with_risk(risk).with_text(text).with_verify_method(method);
    };

    diagram_model::RequirementDiagram out;
    out.add_element(diagram_model::Element("search", "release").with_docref("releases/0.1.1/search"));

    for (auto& req : {
             feature(RequirementType::Functional, "feature_1", "1.1.1", Risk::High, "Test feature 1"),
             feature(RequirementType::Functional, "feature_2", "1.1.2", Risk::Medium, "Test feature 2"),
             feature(RequirementType::Performance, "speed", "1.1.3", Risk::Low, "Test performance") }) {
        out.add_requirement(req);
        out.add_relationship(diagram_model::RequirementRelationship(
            "search", req.name, diagram_model::RelationshipType::Satisfies));
    }
    return out;
}

} // namespace diagram_loaders
