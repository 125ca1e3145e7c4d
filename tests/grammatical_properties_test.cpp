#include "grammatical_properties.hpp"
#include <gtest/gtest.h>

TEST(PropertyRegistryTest, DefaultRegistryOrder) {
    PropertyRegistry registry = PropertyRegistry::default_registry();
    std::vector<std::string> expected = {"mood", "tense", "gender", "number",
                                         "person", "case", "degree"};
    EXPECT_EQ(registry.names(), expected);
    EXPECT_EQ(registry.get("number").output_size(), 3u);
    EXPECT_EQ(registry.position("case"), 5u);
}

TEST(PropertyRegistryTest, GoldIndexOfKnownValue) {
    PropertyRegistry registry = PropertyRegistry::default_registry();
    EXPECT_EQ(registry.gold_index("tense", std::string("present")), 0u);
    EXPECT_EQ(registry.gold_index("tense", std::string("past")), 1u);
}

TEST(PropertyRegistryTest, GoldIndexWithoutValueIsNoValueSlot) {
    PropertyRegistry registry = PropertyRegistry::default_registry();
    const auto& tense = registry.get("tense");
    EXPECT_EQ(registry.gold_index("tense", std::nullopt), tense.values.size());
    EXPECT_EQ(registry.gold_index("tense", std::string("plural")), tense.values.size());
}

TEST(PropertyRegistryTest, ValueAtMapsIndicesBack) {
    PropertyRegistry registry = PropertyRegistry::default_registry();
    EXPECT_EQ(registry.value_at("number", 1), std::optional<std::string>("plural"));
    EXPECT_EQ(registry.value_at("number", 2), std::nullopt);
    EXPECT_THROW(registry.value_at("number", 3), std::out_of_range);
    EXPECT_THROW(registry.value_at("aspect", 0), std::out_of_range);
}

TEST(PropertyRegistryTest, RejectsInvalidTables) {
    using Properties = std::vector<GrammaticalProperty>;
    GrammaticalProperty present{"tense", {"present"}};
    GrammaticalProperty past{"tense", {"past"}};
    GrammaticalProperty empty_values{"tense", {}};
    GrammaticalProperty repeated{"tense", {"past", "past"}};

    EXPECT_THROW(PropertyRegistry(Properties{}), std::invalid_argument);
    EXPECT_THROW(PropertyRegistry(Properties{present, past}), std::invalid_argument);
    EXPECT_THROW(PropertyRegistry(Properties{empty_values}), std::invalid_argument);
    EXPECT_THROW(PropertyRegistry(Properties{repeated}), std::invalid_argument);
}

TEST(PropertyRegistryTest, JsonKeepsOrder) {
    nlohmann::json j = nlohmann::json::parse(
        R"([{"name": "number", "values": ["singular", "plural"]},
            {"name": "aspect", "values": ["perfective", "imperfective"]}])");
    PropertyRegistry registry = PropertyRegistry::from_json(j);
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"number", "aspect"}));
    EXPECT_EQ(PropertyRegistry::from_json(registry.to_json()), registry);
    EXPECT_THROW(PropertyRegistry::from_json(nlohmann::json::object()), std::invalid_argument);
}
