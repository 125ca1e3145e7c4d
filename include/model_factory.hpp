#pragma once
#include "config.hpp"
#include "context_encoder.hpp"
#include "dataset.hpp"
#include "morpho_predictor.hpp"
#include <memory>

/**
 * @brief Builds a fresh context encoder as described by the configuration.
 *
 * - transformer: a WordPiece tokenizer (vocabulary file, or built from the
 *   training forms) or a SentencePiece tokenizer (model file, or trained on the
 *   training sentences and written to tokenizer.model_path), feeding a
 *   TransformerEncoder whose piece vectors are averaged per token
 * - recurrent: word embeddings plus analysis features, built from the
 *   training forms, feeding a BiRNN
 *
 * @throws std::invalid_argument or std::runtime_error on unusable settings
 */
std::shared_ptr<ContextEncoder> build_context_encoder(const PredictorConfig& config,
                                                      const Dataset& training_set);

/**
 * @brief Builds untrained heads over an existing encoder.
 */
std::shared_ptr<TextMorphoPredictorModel> build_text_model(const PredictorConfig& config,
                                                           std::shared_ptr<ContextEncoder> encoder);
