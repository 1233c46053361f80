#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace diagram_model {

enum class Cardinality { ZeroOrOne, ExactlyOne, ZeroOrMore, OneOrMore };

// Which end of a relationship a cardinality symbol is drawn on.
enum class Side { Left, Right };

inline const char* to_string(Cardinality cardinality, Side side) {
    const bool left = side == Side::Left;
    switch (cardinality) {
    case Cardinality::ZeroOrOne: return left ? "|o" : "o|";
    case Cardinality::ExactlyOne: return "||";
    case Cardinality::ZeroOrMore: return left ? "}o" : "o{";
    case Cardinality::OneOrMore: return left ? "}|" : "|{";
    }
    return "";
}

// Accepts "zero_or_one", "exactly_one", "zero_or_more", "one_or_more" (any case).
std::optional<Cardinality> parse_cardinality(std::string_view text);

// Entity key, always upper case.
class EntityId {
public:
    EntityId() = default;
    EntityId(std::string_view id);
    EntityId(const char* id) : EntityId(std::string_view(id)) {}
    EntityId(const std::string& id) : EntityId(std::string_view(id)) {}

    const std::string& str() const { return value_; }
    bool empty() const { return value_.empty(); }

    friend bool operator==(const EntityId& a, const EntityId& b) { return a.value_ == b.value_; }
    friend bool operator!=(const EntityId& a, const EntityId& b) { return a.value_ != b.value_; }
    friend bool operator<(const EntityId& a, const EntityId& b) { return a.value_ < b.value_; }

private:
    std::string value_;
};

struct KeyConstraints {
    bool is_primary = false;
    bool is_foreign = false;
    bool is_unique = false;

    bool any() const { return is_primary || is_foreign || is_unique; }
};

// "PK", "FK", "UK" joined by ", " in that order; empty when no flag is set.
std::string to_string(const KeyConstraints& keys);

struct Attribute {
    std::string type;
    std::string name;
    KeyConstraints keys;
    std::optional<std::string> comment;

    Attribute(std::string type, std::string name);

    // Builders update an lvalue in place; called on a temporary they return
    // the updated value, so chains on temporaries never yield a reference.
    Attribute& as_primary_key() &;
    Attribute as_primary_key() &&;
    Attribute& as_foreign_key() &;
    Attribute as_foreign_key() &&;
    Attribute& as_unique() &;
    Attribute as_unique() &&;
    Attribute& with_comment(std::string text) &;
    Attribute with_comment(std::string text) &&;
};

struct Entity {
    EntityId id;
    // Display name; unlike the id it may contain spaces.
    std::optional<std::string> alias;
    std::vector<Attribute> attributes;

    explicit Entity(EntityId id);

    Entity& with_alias(std::string text) &;
    Entity with_alias(std::string text) &&;
    Entity& with_attribute(Attribute attribute) &;
    Entity with_attribute(Attribute attribute) &&;
};

struct Relationship {
    EntityId left_id;
    EntityId right_id;
    Cardinality left_cardinality;
    Cardinality right_cardinality;
    // Identifying relationships are drawn with a solid line.
    bool is_identifying = true;
    std::optional<std::string> label;

    Relationship(EntityId left_id, EntityId right_id,
        Cardinality left_cardinality, Cardinality right_cardinality);

    Relationship& as_non_identifying() &;
    Relationship as_non_identifying() &&;
    Relationship& with_label(std::string text) &;
    Relationship with_label(std::string text) &&;
};

} // namespace diagram_model

template <>
struct std::hash<diagram_model::EntityId> {
    std::size_t operator()(const diagram_model::EntityId& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};

namespace diagram_model {

// Entity-relationship diagram. Entities are kept in insertion order; a
// relationship to an unknown id creates a bare entity for it.
class Erd {
public:
    Erd() = default;

    Erd& with_title(std::string title) &;
    Erd with_title(std::string title) &&;
    const std::optional<std::string>& title() const { return title_; }

    // Inserts or replaces by id (last write wins, first position kept).
    void add_entity(Entity entity);
    Erd& with_entity(Entity entity) &;
    Erd with_entity(Entity entity) &&;

    // Returns true when a bare entity was inserted.
    bool create_entity_if_missing(const EntityId& id);

    const Entity* get_entity_by_id(const EntityId& id) const;

    void add_relationship(Relationship relationship);
    Erd& with_relationship(Relationship relationship) &;
    Erd with_relationship(Relationship relationship) &&;

    const std::vector<Entity>& entities() const { return entities_; }
    const std::vector<Relationship>& relationships() const { return relationships_; }
    std::size_t entity_count() const { return entities_.size(); }

private:
    std::optional<std::string> title_;
    std::vector<Entity> entities_;
    std::unordered_map<EntityId, std::size_t> entity_index_;
    std::vector<Relationship> relationships_;
};

} // namespace diagram_model
