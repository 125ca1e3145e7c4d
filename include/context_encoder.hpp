#pragma once
#include "components.hpp"
#include "sentence.hpp"
#include <vector>

/**
 * @brief Encodes a sentence into one contextual vector per token.
 *
 * Implementations run example by example: backward() refers to the most
 * recent forward() call.
 */
class ContextEncoder {
public:
    virtual ~ContextEncoder() = default;

    /**
     * @brief Encodes the tokens of a sentence.
     * @return Matrix of shape [sentence.size(), output_size()]
     */
    virtual Matrix forward(const Sentence& sentence) = 0;

    /**
     * @brief Propagates token-level gradients through the encoder.
     *
     * Accumulates the parameter gradients.
     *
     * @param token_gradients Matrix of shape [sentence.size(), output_size()]
     * @return Gradient with respect to the encoder input representation
     */
    virtual Matrix backward(const Matrix& token_gradients) = 0;

    virtual size_t output_size() const = 0;

    virtual ParameterList parameters() = 0;

    /**
     * @brief Whether training updates this encoder (fine-tuning).
     */
    bool trainable() const {
        return trainable_;
    }

    void set_trainable(bool trainable) {
        trainable_ = trainable;
    }

protected:
    bool trainable_ = true;
};

/**
 * @brief Encodes a sequence of sub-word piece ids, one vector per piece.
 */
class PieceEncoder {
public:
    virtual ~PieceEncoder() = default;

    /**
     * @return Matrix of shape [piece_ids.size(), output_size()]
     */
    virtual Matrix forward(const std::vector<int>& piece_ids) = 0;

    /**
     * @return Gradient with respect to the piece embeddings
     */
    virtual Matrix backward(const Matrix& piece_gradients) = 0;

    virtual size_t output_size() const = 0;
    virtual size_t vocab_size() const = 0;
    virtual ParameterList parameters() = 0;

    /**
     * @brief Longest sequence a single forward() accepts, 0 when unbounded.
     */
    virtual size_t max_length() const {
        return 0;
    }
};
