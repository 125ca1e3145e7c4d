#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <nlohmann/json.hpp>

/**
 * @brief One grammatical property and its ordered value annotations.
 *
 * A classifier for the property has |values| + 1 outputs: one per value and a
 * trailing slot meaning "no value applies".
 */
struct GrammaticalProperty {
    std::string name;
    std::vector<std::string> values;

    size_t output_size() const {
        return values.size() + 1;
    }

    size_t no_value_index() const {
        return values.size();
    }

    /**
     * @brief Position of a value annotation, if it belongs to this property.
     */
    std::optional<size_t> index_of(const std::string& value) const;

    bool operator==(const GrammaticalProperty& other) const {
        return name == other.name && values == other.values;
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(name, values);
    }
};

/**
 * @brief Immutable ordered table of the predicted grammatical properties.
 *
 * Built once at startup (the default table or a configured one) and shared
 * read-only by the predictor, the dataset reader, the loss and the
 * evaluator. Property order is significant: it fixes the order of the
 * classifier heads, of checkpoint contents and of printed statistics.
 */
class PropertyRegistry {
  public:
    /**
     * @brief Empty registry, only meant as a deserialization target.
     */
    PropertyRegistry() = default;

    /**
     * @brief Builds a registry from an ordered property list.
     * @throws std::invalid_argument on an empty list, duplicate property names,
     *         empty value lists or duplicate values within a property
     */
    explicit PropertyRegistry(std::vector<GrammaticalProperty> properties);

    /**
     * @brief mood, tense, gender, number, person, case, degree with their
     *        standard value annotations.
     */
    static PropertyRegistry default_registry();

    /**
     * @brief Reads `[{"name": ..., "values": [...]}, ...]`.
     * @throws std::invalid_argument if the JSON does not have that shape
     */
    static PropertyRegistry from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    const std::vector<GrammaticalProperty>& properties() const {
        return properties_;
    }

    size_t size() const {
        return properties_.size();
    }

    bool contains(const std::string& name) const {
        return positions_.count(name) > 0;
    }

    /**
     * @throws std::out_of_range for an unknown property name
     */
    const GrammaticalProperty& get(const std::string& name) const;

    /**
     * @brief Position of the property in registry order.
     * @throws std::out_of_range for an unknown property name
     */
    size_t position(const std::string& name) const;

    std::vector<std::string> names() const;

    /**
     * @brief Sum of the value counts of all properties.
     */
    size_t total_values() const;

    /**
     * @brief Target class for a gold annotation.
     *
     * The registry position of the value, or the "no value" slot when the
     * value is absent or not an annotation of that property.
     */
    size_t gold_index(const std::string& property, const std::optional<std::string>& value) const;

    /**
     * @brief Value annotation for a classifier output index.
     * @return The value, or std::nullopt for the "no value" slot
     * @throws std::out_of_range if the index is past the "no value" slot
     */
    std::optional<std::string> value_at(const std::string& property, size_t index) const;

    bool operator==(const PropertyRegistry& other) const {
        return properties_ == other.properties_;
    }

    bool operator!=(const PropertyRegistry& other) const {
        return !(*this == other);
    }

    template <class Archive>
    void save(Archive& ar) const {
        ar(properties_);
    }

    template <class Archive>
    void load(Archive& ar) {
        std::vector<GrammaticalProperty> properties;
        ar(properties);
        *this = PropertyRegistry(std::move(properties));
    }

  private:
    std::vector<GrammaticalProperty> properties_;
    std::unordered_map<std::string, size_t> positions_;
};
