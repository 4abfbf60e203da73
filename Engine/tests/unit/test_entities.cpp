/**
 * @file test_entities.cpp
 * @brief Measurement, standard and classification recognition
 */

#include <gtest/gtest.h>
#include <analysis/entities.hpp>
#include <algorithm>

using namespace Repealer;

namespace {

bool has_entity(const std::vector<Entity>& entities, EntityType type, const std::string& canonical) {
    return std::any_of(entities.begin(), entities.end(), [&](const Entity& e) {
        return e.type == type && e.canonical == canonical;
    });
}

} // namespace

TEST(EntitiesTest, LengthUnitsAreCanonical) {
    auto m = extract_measurements("Clearance 18 feet, burial depth 36 inches, offset 1.5m");
    ASSERT_EQ(m.size(), 3u);
    EXPECT_DOUBLE_EQ(m[0].value, 18.0);
    EXPECT_EQ(m[0].unit, "ft");
    EXPECT_EQ(m[1].unit, "in");
    EXPECT_DOUBLE_EQ(m[2].value, 1.5);
    EXPECT_EQ(m[2].unit, "m");
}

TEST(EntitiesTest, ElectricalUnitsAreCaseSensitive) {
    auto m = extract_measurements("Primary 12 kV, transformer 25 kVA, service 240V at 200 A");
    ASSERT_EQ(m.size(), 4u);
    EXPECT_EQ(m[0].unit, "kV");
    EXPECT_EQ(m[1].unit, "kVA");
    EXPECT_EQ(m[2].unit, "V");
    EXPECT_EQ(m[3].unit, "A");

    EXPECT_TRUE(extract_measurements("Pole 12 a bit leaning").empty());
}

TEST(EntitiesTest, MeasurementsCompareByCanonicalForm) {
    auto a = extract_entities("clearance of 18 ft");
    auto b = extract_entities("a minimum 18 feet above grade");
    EXPECT_TRUE(has_entity(a, EntityType::Measurement, "18 ft"));
    EXPECT_TRUE(has_entity(b, EntityType::Measurement, "18 ft"));
}

TEST(EntitiesTest, StandardCitations) {
    auto e = extract_entities("Galvanize per ASTM A123 and meet NESC Rule 232 and G.O. 95 clearances");
    EXPECT_TRUE(has_entity(e, EntityType::Standard, "astm a123"));
    EXPECT_TRUE(has_entity(e, EntityType::Standard, "nesc rule 232"));
    EXPECT_TRUE(has_entity(e, EntityType::Standard, "go 95"));
    EXPECT_TRUE(has_entity(extract_entities("GO-95 Rule 37"), EntityType::Standard, "go 95"));
}

TEST(EntitiesTest, Classifications) {
    auto e = extract_entities("Use Class H1 poles with Type 3 guys, Grade B construction");
    EXPECT_TRUE(has_entity(e, EntityType::Classification, "class h1"));
    EXPECT_TRUE(has_entity(e, EntityType::Classification, "type 3"));
    EXPECT_TRUE(has_entity(e, EntityType::Classification, "grade b"));
    EXPECT_TRUE(extract_entities("this type of pole").empty());
}

TEST(EntitiesTest, Names) {
    EXPECT_STREQ(to_string(EntityType::Measurement), "measurement");
    EXPECT_STREQ(to_string(EntityType::Standard), "standard");
    EXPECT_STREQ(to_string(EntityType::Classification), "classification");
}

TEST(EntitiesTest, OverlongNumbersAreSkipped) {
    const std::string huge = "1" + std::string(400, '0');
    std::vector<Measurement> m;
    ASSERT_NO_THROW(m = extract_measurements(huge + " ft clearance, then 18 ft over the road"));
    ASSERT_EQ(m.size(), 1u);
    EXPECT_DOUBLE_EQ(m[0].value, 18.0);

    std::vector<Entity> e;
    ASSERT_NO_THROW(e = extract_entities(huge + " kV line"));
    EXPECT_TRUE(e.empty());
}
