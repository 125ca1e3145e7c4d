#include "../include/grammatical_properties.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

std::optional<size_t> GrammaticalProperty::index_of(const std::string& value) const {
    auto it = std::find(values.begin(), values.end(), value);
    if (it == values.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(values.begin(), it));
}

PropertyRegistry::PropertyRegistry(std::vector<GrammaticalProperty> properties)
    : properties_(std::move(properties)) {
    if (properties_.empty()) {
        throw std::invalid_argument("A property registry needs at least one property");
    }

    for (size_t i = 0; i < properties_.size(); ++i) {
        const auto& property = properties_[i];
        if (property.name.empty()) {
            throw std::invalid_argument("Grammatical property #" + std::to_string(i) +
                                        " has an empty name");
        }
        if (property.values.empty()) {
            throw std::invalid_argument("Grammatical property '" + property.name +
                                        "' has no values");
        }
        std::unordered_set<std::string> seen(property.values.begin(), property.values.end());
        if (seen.size() != property.values.size()) {
            throw std::invalid_argument("Grammatical property '" + property.name +
                                        "' has duplicate values");
        }
        if (!positions_.emplace(property.name, i).second) {
            throw std::invalid_argument("Duplicate grammatical property '" + property.name + "'");
        }
    }
}

PropertyRegistry PropertyRegistry::default_registry() {
    return PropertyRegistry({
        {"mood",
         {"indicative", "subjunctive", "conditional", "imperative", "infinitive", "gerund",
          "participle"}},
        {"tense", {"present", "past", "future", "imperfect"}},
        {"gender", {"masculine", "feminine", "neuter", "common"}},
        {"number", {"singular", "plural"}},
        {"person", {"first", "second", "third"}},
        {"case",
         {"nominative", "genitive", "dative", "accusative", "vocative", "ablative", "locative",
          "instrumental"}},
        {"degree", {"positive", "comparative", "superlative"}},
    });
}

PropertyRegistry PropertyRegistry::from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("Property registry must be a JSON array");
    }

    std::vector<GrammaticalProperty> properties;
    for (const auto& entry : j) {
        try {
            GrammaticalProperty property;
            property.name = entry.at("name").get<std::string>();
            property.values = entry.at("values").get<std::vector<std::string>>();
            properties.push_back(std::move(property));
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument("Invalid property registry entry: " +
                                        std::string(e.what()));
        }
    }
    return PropertyRegistry(std::move(properties));
}

nlohmann::json PropertyRegistry::to_json() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& property : properties_) {
        j.push_back({{"name", property.name}, {"values", property.values}});
    }
    return j;
}

const GrammaticalProperty& PropertyRegistry::get(const std::string& name) const {
    return properties_[position(name)];
}

size_t PropertyRegistry::position(const std::string& name) const {
    auto it = positions_.find(name);
    if (it == positions_.end()) {
        throw std::out_of_range("Unknown grammatical property '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> PropertyRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(properties_.size());
    for (const auto& property : properties_) {
        result.push_back(property.name);
    }
    return result;
}

size_t PropertyRegistry::total_values() const {
    size_t total = 0;
    for (const auto& property : properties_) {
        total += property.values.size();
    }
    return total;
}

size_t PropertyRegistry::gold_index(const std::string& property,
                                    const std::optional<std::string>& value) const {
    const auto& entry = get(property);
    if (!value) {
        return entry.no_value_index();
    }
    return entry.index_of(*value).value_or(entry.no_value_index());
}

std::optional<std::string> PropertyRegistry::value_at(const std::string& property,
                                                      size_t index) const {
    const auto& entry = get(property);
    if (index == entry.no_value_index()) {
        return std::nullopt;
    }
    if (index > entry.no_value_index()) {
        throw std::out_of_range("Output index " + std::to_string(index) +
                                " is out of range for property '" + property + "'");
    }
    return entry.values[index];
}
