#pragma once
#include "context_encoder.hpp"
#include "morpho_predictor.hpp"
#include <iosfwd>
#include <memory>

/**
 * @file serialization.hpp
 * @brief Binary (cereal) encoding of the model components.
 *
 * Encoders and tokenizers are written polymorphically, so an archive restores
 * the concrete classes it was written from. The streams must be opened in
 * binary mode; ModelSaver adds the metadata header around these payloads.
 */

/**
 * @throws cereal::Exception or std::runtime_error if writing fails
 */
void save_predictor_model(std::ostream& os, const MorphoPredictorModel& model);

/**
 * @throws cereal::Exception on a truncated or corrupt payload
 * @throws std::runtime_error if the heads do not match the stored registry
 */
void load_predictor_model(std::istream& is, MorphoPredictorModel& model);

void save_context_encoder(std::ostream& os, const std::shared_ptr<ContextEncoder>& encoder);

/**
 * @return The encoder, of the concrete class it was saved as
 */
std::shared_ptr<ContextEncoder> load_context_encoder(std::istream& is);

void save_text_model(std::ostream& os, const TextMorphoPredictorModel& model);

/**
 * @throws std::invalid_argument if the stored encoder and heads do not fit together
 */
void load_text_model(std::istream& is, TextMorphoPredictorModel& model);
