#pragma once
#include "sentence.hpp"
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Produces the candidate morphological readings of every token of a
 * sentence.
 */
class MorphologicalAnalyzer {
  public:
    virtual ~MorphologicalAnalyzer() = default;

    /**
     * @brief Analyzes a sentence.
     * @return One (possibly empty) reading list per token, in token order
     */
    virtual MorphologicalAnalysis analyze(const Sentence& sentence) const = 0;
};

/**
 * @brief Analyzer that knows no forms.
 */
class EmptyAnalyzer : public MorphologicalAnalyzer {
  public:
    MorphologicalAnalysis analyze(const Sentence& sentence) const override;
};

/**
 * @brief Analyzer backed by a form -> readings table.
 *
 * Lookups are case-insensitive. The table is read from a JSONL file where
 * each line is `{"form": ..., "readings": [{"lemma": ..., "properties": {...}}]}`.
 */
class DictionaryAnalyzer : public MorphologicalAnalyzer {
  public:
    DictionaryAnalyzer() = default;

    /**
     * @brief Loads a dictionary file.
     * @throws std::runtime_error if the file cannot be read or a line is malformed
     */
    static DictionaryAnalyzer load(const std::string& path);

    void add_reading(const std::string& form, Reading reading);

    size_t size() const {
        return entries_.size();
    }

    MorphologicalAnalysis analyze(const Sentence& sentence) const override;

  private:
    std::unordered_map<std::string, std::vector<Reading>> entries_;
};
