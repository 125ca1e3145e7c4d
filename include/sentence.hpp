#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Location of a token (or sentence) in the source text.
 *
 * `start` and `end` are inclusive offsets counted in code points.
 */
struct Position {
    size_t index = 0;
    size_t start = 0;
    size_t end = 0;
};

/**
 * @brief One candidate morphological reading of a token.
 */
struct Reading {
    std::string lemma;
    std::map<std::string, std::string> properties;
};

/**
 * @brief Output of a morphological analyzer: candidate readings per token.
 *
 * `readings[i]` belongs to token i; an empty list means the analyzer does not
 * know the form.
 */
struct MorphologicalAnalysis {
    std::vector<std::vector<Reading>> readings;
};

/**
 * @brief A token with its gold annotations.
 *
 * `properties` maps a property name to its gold value; properties without an
 * entry have no value for this token.
 */
struct Token {
    std::string form;
    Position position;
    std::string lemma;
    std::map<std::string, std::string> properties;

    std::optional<std::string> property(const std::string& name) const {
        auto it = properties.find(name);
        if (it == properties.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/**
 * @brief An ordered token sequence, the unit of training and prediction.
 */
struct Sentence {
    std::vector<Token> tokens;
    Position position;
    MorphologicalAnalysis analysis;

    size_t size() const {
        return tokens.size();
    }

    bool empty() const {
        return tokens.empty();
    }

    std::vector<std::string> forms() const {
        std::vector<std::string> result;
        result.reserve(tokens.size());
        for (const auto& token : tokens) {
            result.push_back(token.form);
        }
        return result;
    }
};
