#pragma once
#include "base_tokenizer.hpp"
#include <memory>
#include <string>
#include <vector>
#include <sentencepiece_processor.h>
#include <cereal/types/string.hpp>

/**
 * @brief Piece tokenizer backed by a SentencePiece model.
 *
 * Forms are encoded one at a time so that the pieces of different tokens
 * never merge. The serialized model proto travels with the tokenizer, so a
 * checkpoint that contains it does not depend on the original model file.
 */
class SentencePieceTokenizer : public BaseTokenizer {
public:
    SentencePieceTokenizer();
    ~SentencePieceTokenizer() override = default;

    /**
     * @brief Initialize with a pre-trained model.
     * @throws std::runtime_error if the model cannot be loaded
     */
    void load_model(const std::string& model_path);

    /**
     * @brief Trains a unigram model on the given texts and loads it.
     *
     * Writes `<model_prefix>.model` and `<model_prefix>.vocab`. The
     * vocabulary size is a soft limit, so small corpora do not fail.
     *
     * @throws std::runtime_error if training fails
     */
    void train(const std::vector<std::string>& texts, const std::string& model_prefix,
               size_t vocab_size = 8000);

    PieceSequence tokenize(const std::vector<std::string>& forms) const override;

    size_t vocab_size() const override {
        return static_cast<size_t>(processor_->GetPieceSize());
    }

    int get_unk_token_id() const override {
        return processor_->unk_id();
    }

    template <class Archive>
    void save(Archive& ar) const {
        ar(processor_->serialized_model_proto());
    }

    template <class Archive>
    void load(Archive& ar) {
        std::string proto;
        ar(proto);
        load_serialized_model(proto);
    }

private:
    std::unique_ptr<sentencepiece::SentencePieceProcessor> processor_;

    void load_serialized_model(const std::string& proto);
};
