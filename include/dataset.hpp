#pragma once
#include "grammatical_properties.hpp"
#include "morphology.hpp"
#include "sentence.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Raised when a line of a dataset file is not a valid example.
 */
class InvalidExample : public std::runtime_error {
  public:
    InvalidExample(size_t line_index, const std::string& path, const std::string& reason);

    size_t line_index() const {
        return line_index_;
    }

    const std::string& path() const {
        return path_;
    }

  private:
    size_t line_index_;
    std::string path_;
};

struct DatasetOptions {
    /// Characters assumed between consecutive tokens when computing positions
    size_t token_separator_width = 1;
};

/**
 * @brief Annotated sentences read from a JSONL file.
 *
 * Each line holds one sentence:
 * {"tokens": [{"form": "...", "morphologies": [{"best": true, "components":
 *   [{"lemma": "...", "pos": "...", "properties": {"tense": "present", ...}}]}]}]}
 *
 * The morphology of a token is its only one, or else the first flagged
 * "best". A morphology with several components yields one token per
 * component, whose form is the component lemma. Gold values unknown to the
 * registry are dropped (the token has no value for that property).
 */
class Dataset {
  public:
    Dataset() = default;
    explicit Dataset(std::vector<Sentence> examples) : examples_(std::move(examples)) {}

    /**
     * @brief Loads a dataset file, analyzing every sentence.
     *
     * Blank lines are skipped.
     *
     * @throws std::runtime_error if the file cannot be opened
     * @throws InvalidExample on the first malformed line
     */
    static Dataset from_file(const std::string& path, const PropertyRegistry& registry,
                             const MorphologicalAnalyzer& analyzer,
                             const DatasetOptions& options = {});

    /**
     * @brief Builds the sentence of one JSON example (without analysis).
     * @throws std::runtime_error or nlohmann::json::exception if malformed
     */
    static Sentence parse_example(const nlohmann::json& example, size_t sentence_index,
                                  const PropertyRegistry& registry,
                                  const DatasetOptions& options);

    /**
     * @brief Builds an unannotated sentence from raw text.
     *
     * The text is split on whitespace and punctuation; positions are the
     * code point offsets of the tokens in the text.
     */
    static Sentence sentence_from_text(const std::string& text, size_t sentence_index);

    const std::vector<Sentence>& examples() const {
        return examples_;
    }

    size_t size() const {
        return examples_.size();
    }

    bool empty() const {
        return examples_.empty();
    }

    /**
     * @brief Forms of all tokens of all examples, in order.
     */
    std::vector<std::string> forms() const;

  private:
    std::vector<Sentence> examples_;
};
