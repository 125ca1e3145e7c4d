#pragma once
#include "base_tokenizer.hpp"
#include "context_encoder.hpp"
#include <memory>
#include <vector>
#include <cereal/types/memory.hpp>
#include <cereal/types/polymorphic.hpp>

/**
 * @brief Collapses piece encodings into one encoding per token.
 *
 * A token with a single piece gets that piece's encoding unchanged; a token
 * with several pieces gets their arithmetic mean.
 *
 * @param piece_encodings Matrix of shape [num_pieces, size]
 * @param ranges Inclusive piece range of each token
 * @return Matrix of shape [ranges.size(), size]
 * @throws std::invalid_argument if a range is empty or outside the piece matrix
 */
Matrix aggregate_pieces(const Matrix& piece_encodings, const std::vector<PieceRange>& ranges);

/**
 * @brief Inverse of aggregate_pieces() for gradients.
 *
 * Every piece of a token receives the token gradient divided by the number
 * of pieces of that token.
 *
 * @param token_gradients Matrix of shape [ranges.size(), size]
 * @param ranges Inclusive piece range of each token
 * @return Matrix of shape [ranges.back().last + 1, size]
 * @throws std::invalid_argument if the row count differs from the number of ranges
 */
Matrix split_token_gradients(const Matrix& token_gradients,
                             const std::vector<PieceRange>& ranges);

/**
 * @brief Half-open range [begin, end) of pieces encoded in one pass.
 */
struct PieceWindow {
    size_t begin = 0;
    size_t end = 0;

    size_t length() const {
        return end - begin;
    }
};

/**
 * @brief Cuts a piece sequence into windows of at most max_length pieces.
 *
 * Windows end on token boundaries; only a token that alone has more than
 * max_length pieces is cut inside. max_length 0 yields a single window.
 *
 * @param ranges Inclusive piece range of each token, in order
 * @param num_pieces Total number of pieces
 */
std::vector<PieceWindow> plan_piece_windows(const std::vector<PieceRange>& ranges,
                                            size_t num_pieces, size_t max_length);

/**
 * @brief Turns a piece-level encoder into a token-level ContextEncoder.
 *
 * forward: tokenize the forms, encode the pieces, aggregate per token.
 * backward: split the token gradients over the pieces, backward the encoder.
 *
 * Sequences longer than the encoder's max_length() are encoded window by
 * window. backward() then runs each window forward again before its own
 * backward pass, so the encoder caches always match.
 */
class PieceAggregatingEncoder : public ContextEncoder {
public:
    PieceAggregatingEncoder() = default;

    /**
     * @throws std::invalid_argument if either collaborator is missing or the
     *         tokenizer vocabulary is larger than the encoder's
     */
    PieceAggregatingEncoder(std::unique_ptr<PieceEncoder> encoder,
                            std::shared_ptr<BaseTokenizer> tokenizer);

    /**
     * @throws std::logic_error if aggregation does not yield one row per token
     */
    Matrix forward(const Sentence& sentence) override;
    Matrix backward(const Matrix& token_gradients) override;

    size_t output_size() const override {
        return encoder_->output_size();
    }

    ParameterList parameters() override {
        return encoder_->parameters();
    }

    const BaseTokenizer& tokenizer() const {
        return *tokenizer_;
    }

    /**
     * @brief Piece ranges of the last forward() call.
     */
    const std::vector<PieceRange>& last_ranges() const {
        return ranges_cache_;
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(encoder_, tokenizer_);
    }

private:
    std::unique_ptr<PieceEncoder> encoder_;
    std::shared_ptr<BaseTokenizer> tokenizer_;
    std::vector<PieceRange> ranges_cache_;
    std::vector<int> ids_cache_;
    std::vector<PieceWindow> windows_cache_;
};
