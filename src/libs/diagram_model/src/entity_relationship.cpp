#include <diagram_model/entity_relationship.hpp>
#include <diagram_model/logger.hpp>
#include "token.hpp"
#include <utility>

namespace diagram_model {

std::optional<Cardinality> parse_cardinality(std::string_view text) {
    const std::string word = detail::to_lower(text);
    if (word == "zero_or_one") return Cardinality::ZeroOrOne;
    if (word == "exactly_one") return Cardinality::ExactlyOne;
    if (word == "zero_or_more") return Cardinality::ZeroOrMore;
    if (word == "one_or_more") return Cardinality::OneOrMore;
    return std::nullopt;
}

EntityId::EntityId(std::string_view id)
    : value_(detail::to_upper(id))
{
}

std::string to_string(const KeyConstraints& keys) {
    std::string out;
    auto append = [&out](const char* key) {
        if (!out.empty()) out += ", ";
        out += key;
    };
    if (keys.is_primary) append("PK");
    if (keys.is_foreign) append("FK");
    if (keys.is_unique) append("UK");
    return out;
}

Attribute::Attribute(std::string type, std::string name)
    : type(std::move(type)), name(std::move(name))
{
}

Attribute& Attribute::as_primary_key() & {
    keys.is_primary = true;
    return *this;
}

Attribute Attribute::as_primary_key() && {
    as_primary_key();
    return std::move(*this);
}

Attribute& Attribute::as_foreign_key() & {
    keys.is_foreign = true;
    return *this;
}

Attribute Attribute::as_foreign_key() && {
    as_foreign_key();
    return std::move(*this);
}

Attribute& Attribute::as_unique() & {
    keys.is_unique = true;
    return *this;
}

Attribute Attribute::as_unique() && {
    as_unique();
    return std::move(*this);
}

Attribute& Attribute::with_comment(std::string text) & {
    comment = std::move(text);
    return *this;
}

Attribute Attribute::with_comment(std::string text) && {
    with_comment(std::move(text));
    return std::move(*this);
}

Entity::Entity(EntityId id)
    : id(std::move(id))
{
}

Entity& Entity::with_alias(std::string text) & {
    alias = std::move(text);
    return *this;
}

Entity Entity::with_alias(std::string text) && {
    with_alias(std::move(text));
    return std::move(*this);
}

Entity& Entity::with_attribute(Attribute attribute) & {
    attributes.push_back(std::move(attribute));
    return *this;
}

Entity Entity::with_attribute(Attribute attribute) && {
    with_attribute(std::move(attribute));
    return std::move(*this);
}

Relationship::Relationship(EntityId left_id, EntityId right_id,
    Cardinality left_cardinality, Cardinality right_cardinality)
    : left_id(std::move(left_id))
    , right_id(std::move(right_id))
    , left_cardinality(left_cardinality)
    , right_cardinality(right_cardinality)
{
}

Relationship& Relationship::as_non_identifying() & {
    is_identifying = false;
    return *this;
}

Relationship Relationship::as_non_identifying() && {
    as_non_identifying();
    return std::move(*this);
}

Relationship& Relationship::with_label(std::string text) & {
    label = std::move(text);
    return *this;
}

Relationship Relationship::with_label(std::string text) && {
    with_label(std::move(text));
    return std::move(*this);
}

Erd& Erd::with_title(std::string title) & {
    title_ = std::move(title);
    return *this;
}

Erd Erd::with_title(std::string title) && {
    with_title(std::move(title));
    return std::move(*this);
}

void Erd::add_entity(Entity entity) {
    auto it = entity_index_.find(entity.id);
    if (it != entity_index_.end()) {
        logger()->debug("replacing entity {} ({} attributes dropped)",
            entity.id.str(), entities_[it->second].attributes.size());
        entities_[it->second] = std::move(entity);
        return;
    }
    entity_index_.emplace(entity.id, entities_.size());
    entities_.push_back(std::move(entity));
}

Erd& Erd::with_entity(Entity entity) & {
    add_entity(std::move(entity));
    return *this;
}

Erd Erd::with_entity(Entity entity) && {
    with_entity(std::move(entity));
    return std::move(*this);
}

bool Erd::create_entity_if_missing(const EntityId& id) {
    if (get_entity_by_id(id)) return false;
    logger()->debug("creating entity {} referenced by a relationship", id.str());
    add_entity(Entity(id));
    return true;
}

const Entity* Erd::get_entity_by_id(const EntityId& id) const {
    auto it = entity_index_.find(id);
    if (it == entity_index_.end()) return nullptr;
    return &entities_[it->second];
}

void Erd::add_relationship(Relationship relationship) {
    create_entity_if_missing(relationship.left_id);
    create_entity_if_missing(relationship.right_id);
    relationships_.push_back(std::move(relationship));
}

Erd& Erd::with_relationship(Relationship relationship) & {
    add_relationship(std::move(relationship));
    return *this;
}

Erd Erd::with_relationship(Relationship relationship) && {
    with_relationship(std::move(relationship));
    return std::move(*this);
}

} // namespace diagram_model
