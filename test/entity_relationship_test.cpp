#include <gtest/gtest.h>

#include <diagram_model/entity_relationship.hpp>

#include <string>
#include <type_traits>
#include <unordered_set>

using namespace diagram_model;

namespace {

const char* const album_id = "ALBUM";
const char* const song_id = "SONG";

} // namespace

TEST(EntityIdTest, NormalizesToUpperCase)
{
    EXPECT_EQ("ALBUM", EntityId("album").str());
    EXPECT_EQ(EntityId("Album"), EntityId(album_id));
    EXPECT_NE(EntityId("album"), EntityId(song_id));
}

TEST(EntityIdTest, HashesByNormalizedValue)
{
    std::unordered_set<EntityId> ids{ EntityId("album"), EntityId("ALBUM"), EntityId("song") };
    EXPECT_EQ(2u, ids.size());
}

TEST(AttributeTest, CreatedWithoutConstraintsOrComment)
{
    Attribute attr("string", "title");
    EXPECT_EQ("string", attr.type);
    EXPECT_EQ("title", attr.name);
    EXPECT_FALSE(attr.keys.is_primary);
    EXPECT_FALSE(attr.keys.is_foreign);
    EXPECT_FALSE(attr.keys.is_unique);
    EXPECT_FALSE(attr.comment.has_value());
}

TEST(AttributeTest, BuildersSetOneFieldEach)
{
    auto attr = Attribute("int", "id").as_primary_key().with_comment("Unique identifier");
    EXPECT_TRUE(attr.keys.is_primary);
    EXPECT_FALSE(attr.keys.is_foreign);
    EXPECT_EQ(std::optional<std::string>("Unique identifier"), attr.comment);

    attr.as_foreign_key().as_foreign_key();
    EXPECT_TRUE(attr.keys.is_foreign);
    attr.as_unique();
    EXPECT_TRUE(attr.keys.is_unique);
}

TEST(KeyConstraintsTest, AllCombinations)
{
    EXPECT_EQ("", to_string(KeyConstraints{ false, false, false }));
    EXPECT_EQ("PK", to_string(KeyConstraints{ true, false, false }));
    EXPECT_EQ("FK", to_string(KeyConstraints{ false, true, false }));
    EXPECT_EQ("UK", to_string(KeyConstraints{ false, false, true }));
    EXPECT_EQ("PK, FK", to_string(KeyConstraints{ true, true, false }));
    EXPECT_EQ("PK, UK", to_string(KeyConstraints{ true, false, true }));
    EXPECT_EQ("FK, UK", to_string(KeyConstraints{ false, true, true }));
    EXPECT_EQ("PK, FK, UK", to_string(KeyConstraints{ true, true, true }));
    EXPECT_FALSE(KeyConstraints{}.any());
}

TEST(EntityTest, CreatedWithoutAliasOrAttributes)
{
    Entity entity(album_id);
    EXPECT_EQ(EntityId(album_id), entity.id);
    EXPECT_FALSE(entity.alias.has_value());
    EXPECT_TRUE(entity.attributes.empty());
}

TEST(EntityTest, AttributesKeepInsertionOrder)
{
    auto entity = Entity(album_id)
        .with_alias("album_table")
        .with_attribute(Attribute("int", "albumId"))
        .with_attribute(Attribute("string", "title"));
    ASSERT_EQ(2u, entity.attributes.size());
    EXPECT_EQ("albumId", entity.attributes[0].name);
    EXPECT_EQ("title", entity.attributes[1].name);
    EXPECT_EQ(std::optional<std::string>("album_table"), entity.alias);
}

TEST(CardinalityTest, SymbolsDependOnSide)
{
    EXPECT_STREQ("|o", to_string(Cardinality::ZeroOrOne, Side::Left));
    EXPECT_STREQ("o|", to_string(Cardinality::ZeroOrOne, Side::Right));
    EXPECT_STREQ("||", to_string(Cardinality::ExactlyOne, Side::Left));
    EXPECT_STREQ("||", to_string(Cardinality::ExactlyOne, Side::Right));
    EXPECT_STREQ("}o", to_string(Cardinality::ZeroOrMore, Side::Left));
    EXPECT_STREQ("o{", to_string(Cardinality::ZeroOrMore, Side::Right));
    EXPECT_STREQ("}|", to_string(Cardinality::OneOrMore, Side::Left));
    EXPECT_STREQ("|{", to_string(Cardinality::OneOrMore, Side::Right));
}

TEST(CardinalityTest, ParsesSnakeCaseNames)
{
    EXPECT_EQ(Cardinality::ZeroOrOne, parse_cardinality("zero_or_one"));
    EXPECT_EQ(Cardinality::OneOrMore, parse_cardinality("ONE_OR_MORE"));
    EXPECT_FALSE(parse_cardinality("many").has_value());
}

TEST(RelationshipTest, DefaultsToIdentifyingWithoutLabel)
{
    Relationship rel("album", song_id, Cardinality::ExactlyOne, Cardinality::OneOrMore);
    EXPECT_EQ(EntityId(album_id), rel.left_id);
    EXPECT_EQ(EntityId(song_id), rel.right_id);
    EXPECT_EQ(Cardinality::ExactlyOne, rel.left_cardinality);
    EXPECT_EQ(Cardinality::OneOrMore, rel.right_cardinality);
    EXPECT_TRUE(rel.is_identifying);
    EXPECT_FALSE(rel.label.has_value());
}

TEST(RelationshipTest, NonIdentifyingIsIdempotent)
{
    Relationship rel(album_id, song_id, Cardinality::ExactlyOne, Cardinality::OneOrMore);
    rel.as_non_identifying().as_non_identifying().with_label("has");
    EXPECT_FALSE(rel.is_identifying);
    EXPECT_EQ(std::optional<std::string>("has"), rel.label);
}

TEST(ErdTest, AddEntities)
{
    Erd erd;
    erd.add_entity(Entity(album_id));
    erd.add_entity(Entity(song_id));
    EXPECT_EQ(2u, erd.entity_count());
    EXPECT_NE(nullptr, erd.get_entity_by_id(album_id));
    EXPECT_NE(nullptr, erd.get_entity_by_id("song"));
    EXPECT_EQ(nullptr, erd.get_entity_by_id("artist"));
}

TEST(ErdTest, ReinsertedEntityReplacesPreviousOneInPlace)
{
    Erd erd;
    erd.with_entity(Entity(album_id).with_attribute(Attribute("int", "albumId")))
        .with_entity(Entity(song_id))
        .with_entity(Entity("album").with_alias("album"));

    ASSERT_EQ(2u, erd.entity_count());
    const Entity* album = erd.get_entity_by_id(album_id);
    ASSERT_NE(nullptr, album);
    EXPECT_TRUE(album->attributes.empty());
    EXPECT_EQ(std::optional<std::string>("album"), album->alias);
    EXPECT_EQ(EntityId(album_id), erd.entities()[0].id);
}

TEST(ErdTest, CreateEntityIfMissing)
{
    Erd erd;
    erd.add_entity(Entity(album_id).with_alias("album"));

    EXPECT_FALSE(erd.create_entity_if_missing(album_id));
    EXPECT_EQ(std::optional<std::string>("album"), erd.get_entity_by_id(album_id)->alias);

    EXPECT_TRUE(erd.create_entity_if_missing(song_id));
    const Entity* song = erd.get_entity_by_id(song_id);
    ASSERT_NE(nullptr, song);
    EXPECT_FALSE(song->alias.has_value());
    EXPECT_TRUE(song->attributes.empty());
}

TEST(ErdTest, RelationshipBetweenExistingEntities)
{
    Erd erd;
    erd.with_entity(Entity(album_id)).with_entity(Entity(song_id));
    erd.add_relationship(Relationship(album_id, song_id, Cardinality::ExactlyOne, Cardinality::OneOrMore));
    EXPECT_EQ(1u, erd.relationships().size());
    EXPECT_EQ(2u, erd.entity_count());
}

TEST(ErdTest, RelationshipCreatesMissingEntities)
{
    Erd erd;
    erd.add_relationship(Relationship(album_id, song_id, Cardinality::ExactlyOne, Cardinality::OneOrMore));
    EXPECT_EQ(1u, erd.relationships().size());
    EXPECT_EQ(2u, erd.entity_count());
    EXPECT_NE(nullptr, erd.get_entity_by_id(album_id));
    EXPECT_NE(nullptr, erd.get_entity_by_id(song_id));
}

TEST(ErdTest, RelationshipKeepsAttributesOfExistingEntity)
{
    Erd erd;
    erd.add_entity(Entity(album_id).with_attribute(Attribute("int", "albumId")));
    erd.add_relationship(Relationship(album_id, "artist", Cardinality::OneOrMore, Cardinality::OneOrMore));
    EXPECT_EQ(1u, erd.get_entity_by_id(album_id)->attributes.size());
    EXPECT_EQ(2u, erd.entity_count());
}

TEST(BuilderTest, ChainOnTemporaryYieldsValue)
{
    static_assert(std::is_same_v<decltype(Entity("album").with_alias("x")), Entity>);
    static_assert(std::is_same_v<decltype(Attribute("int", "id").as_primary_key().with_comment("c")), Attribute>);
    static_assert(std::is_same_v<decltype(Relationship("a", "b", Cardinality::ExactlyOne, Cardinality::OneOrMore)
                                              .as_non_identifying()),
        Relationship>);
    static_assert(std::is_same_v<decltype(Erd().with_title("t")), Erd>);

    Entity lvalue("album");
    static_assert(std::is_same_v<decltype(lvalue.with_alias("x")), Entity&>);
    EXPECT_EQ(&lvalue, &lvalue.with_alias("x"));
}

TEST(BuilderTest, ConstReferenceToChainedTemporaryStaysValid)
{
    const std::string alias(200, 'a');
    const Entity& entity = Entity("album").with_alias(alias).with_attribute(Attribute("int", "albumId"));
    EXPECT_EQ(EntityId("ALBUM"), entity.id);
    EXPECT_EQ(std::optional<std::string>(alias), entity.alias);
    ASSERT_EQ(1u, entity.attributes.size());
    EXPECT_EQ("albumId", entity.attributes[0].name);

    const Erd& erd = Erd().with_entity(Entity("album")).with_relationship(
        Relationship("album", "song", Cardinality::ExactlyOne, Cardinality::OneOrMore));
    EXPECT_EQ(2u, erd.entity_count());
    EXPECT_EQ(1u, erd.relationships().size());
}
