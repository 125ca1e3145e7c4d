#pragma once
#include "base_tokenizer.hpp"
#include "vocabulary.hpp"
#include <string>
#include <vector>

/**
 * @brief WordPiece segmentation (greedy longest-match-first) as used by BERT.
 *
 * Each form is optionally lowercased and split on whitespace and punctuation;
 * each resulting word is segmented into the longest vocabulary entries from
 * left to right, continuation pieces carrying the "##" prefix. A word that
 * cannot be segmented, or is longer than `max_chars_per_word`, becomes a
 * single [UNK] piece; so does a form with no characters.
 */
class WordPieceTokenizer : public BaseTokenizer {
public:
    WordPieceTokenizer() = default;
    explicit WordPieceTokenizer(Vocabulary vocabulary, bool lowercase = true,
                                size_t max_chars_per_word = 100);

    PieceSequence tokenize(const std::vector<std::string>& forms) const override;

    /**
     * @brief Segments a single word.
     * @return The pieces, or a single [UNK] when the word cannot be segmented
     */
    std::vector<std::string> wordpiece(const std::string& word) const;

    size_t vocab_size() const override {
        return vocabulary_.size();
    }

    int get_unk_token_id() const override {
        return vocabulary_.get_unk_token_id();
    }

    const Vocabulary& vocabulary() const {
        return vocabulary_;
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(vocabulary_, lowercase_, max_chars_per_word_);
    }

private:
    Vocabulary vocabulary_;
    bool lowercase_ = true;
    size_t max_chars_per_word_ = 100;
};
