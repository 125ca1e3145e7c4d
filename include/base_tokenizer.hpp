#pragma once
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Inclusive range of piece indices produced by one token.
 */
struct PieceRange {
    size_t first = 0;
    size_t last = 0;

    size_t length() const {
        return last - first + 1;
    }

    bool operator==(const PieceRange& other) const {
        return first == other.first && last == other.last;
    }
};

/**
 * @brief Sub-word segmentation of a token sequence.
 *
 * `ranges[i]` gives the pieces of token i. Ranges are contiguous, in token
 * order, never empty, and together cover every piece exactly once.
 */
struct PieceSequence {
    std::vector<std::string> pieces;
    std::vector<int> ids;
    std::vector<PieceRange> ranges;
};

/**
 * @brief Splits token forms into sub-word pieces.
 */
class BaseTokenizer {
public:
    virtual ~BaseTokenizer() = default;

    /**
     * @brief Tokenizes every form, giving each at least one piece.
     */
    virtual PieceSequence tokenize(const std::vector<std::string>& forms) const = 0;

    virtual size_t vocab_size() const = 0;
    virtual int get_unk_token_id() const = 0;
};
