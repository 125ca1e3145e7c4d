#pragma once
// Included by exactly one source file: registers the polymorphic encoder and
// tokenizer classes with cereal. Archives must be included before the macros.
#include <cereal/archives/binary.hpp>
#include <cereal/types/polymorphic.hpp>
#include "piece_aggregation.hpp"
#include "recurrent_encoder.hpp"
#include "sentencepiece_tokenizer.hpp"
#include "transformer.hpp"
#include "wordpiece_tokenizer.hpp"

// Register polymorphic types with cereal
CEREAL_REGISTER_TYPE(PieceAggregatingEncoder)
CEREAL_REGISTER_TYPE(RecurrentContextEncoder)
CEREAL_REGISTER_TYPE(TransformerEncoder)
CEREAL_REGISTER_TYPE(WordPieceTokenizer)
CEREAL_REGISTER_TYPE(SentencePieceTokenizer)

// Register base classes
CEREAL_REGISTER_POLYMORPHIC_RELATION(ContextEncoder, PieceAggregatingEncoder)
CEREAL_REGISTER_POLYMORPHIC_RELATION(ContextEncoder, RecurrentContextEncoder)
CEREAL_REGISTER_POLYMORPHIC_RELATION(PieceEncoder, TransformerEncoder)
CEREAL_REGISTER_POLYMORPHIC_RELATION(BaseTokenizer, WordPieceTokenizer)
CEREAL_REGISTER_POLYMORPHIC_RELATION(BaseTokenizer, SentencePieceTokenizer)
