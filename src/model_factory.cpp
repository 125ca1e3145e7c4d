#include "../include/model_factory.hpp"
#include "../include/logger.hpp"
#include "../include/piece_aggregation.hpp"
#include "../include/recurrent_encoder.hpp"
#include "../include/sentencepiece_tokenizer.hpp"
#include "../include/transformer.hpp"
#include "../include/utils.hpp"
#include "../include/wordpiece_tokenizer.hpp"
#include <fstream>
#include <stdexcept>

namespace {

std::vector<std::string> training_words(const Dataset& training_set, bool lowercase) {
    std::vector<std::string> words = training_set.forms();
    if (lowercase) {
        for (auto& word : words) {
            word = Utils::to_lower(word);
        }
    }
    return words;
}

std::shared_ptr<BaseTokenizer> build_tokenizer(const TokenizerConfig& config,
                                               const Dataset& training_set) {
    Logger& logger = Logger::getInstance();

    if (config.type == "sentencepiece") {
        if (config.model_path.empty()) {
            throw std::invalid_argument("tokenizer.model_path is required for sentencepiece");
        }
        auto tokenizer = std::make_shared<SentencePieceTokenizer>();
        if (std::ifstream(config.model_path).good()) {
            tokenizer->load_model(config.model_path);
        } else {
            std::vector<std::string> texts;
            texts.reserve(training_set.size());
            for (const auto& sentence : training_set.examples()) {
                std::string text;
                for (const auto& form : sentence.forms()) {
                    if (!text.empty()) text += ' ';
                    text += form;
                }
                texts.push_back(text);
            }
            std::string prefix = config.model_path;
            const std::string suffix = ".model";
            if (prefix.size() > suffix.size() &&
                prefix.compare(prefix.size() - suffix.size(), suffix.size(), suffix) == 0) {
                prefix.resize(prefix.size() - suffix.size());
            }
            tokenizer->train(texts, prefix, config.vocab_size);
        }
        logger.log("SentencePiece tokenizer ready (" + std::to_string(tokenizer->vocab_size()) +
                   " pieces)");
        return tokenizer;
    }

    Vocabulary vocabulary;
    if (!config.vocab_path.empty()) {
        vocabulary = Vocabulary::load_from_file(config.vocab_path);
    } else {
        vocabulary = Vocabulary::build_from_words(training_words(training_set, config.lowercase),
                                                  config.min_word_frequency);
    }
    logger.log("WordPiece vocabulary size: " + std::to_string(vocabulary.size()));
    return std::make_shared<WordPieceTokenizer>(std::move(vocabulary), config.lowercase,
                                                config.max_chars_per_word);
}

}  // namespace

std::shared_ptr<ContextEncoder> build_context_encoder(const PredictorConfig& config,
                                                      const Dataset& training_set) {
    config.validate();

    if (config.encoder_type == "recurrent") {
        const RecurrentConfig& rnn = config.recurrent;
        Vocabulary words = Vocabulary::build_word_vocabulary(
            training_words(training_set, rnn.lowercase), rnn.min_word_frequency);
        EmbeddingTokensEncoder tokens_encoder(std::move(words), rnn.word_embedding_size,
                                              config.properties, rnn.lowercase,
                                              config.training.seed);
        Logger::getInstance().log("Recurrent encoder: " +
                                  std::to_string(tokens_encoder.vocabulary().size()) +
                                  " words, " + std::to_string(tokens_encoder.feature_size()) +
                                  " analysis features");
        return std::make_shared<RecurrentContextEncoder>(std::move(tokens_encoder),
                                                         rnn.hidden_size, config.training.seed);
    }

    std::shared_ptr<BaseTokenizer> tokenizer = build_tokenizer(config.tokenizer, training_set);
    TransformerEncoderConfig transformer_config = config.transformer;
    transformer_config.vocab_size = tokenizer->vocab_size();
    auto encoder = std::make_unique<TransformerEncoder>(transformer_config, config.training.seed);
    return std::make_shared<PieceAggregatingEncoder>(std::move(encoder), std::move(tokenizer));
}

std::shared_ptr<TextMorphoPredictorModel> build_text_model(const PredictorConfig& config,
                                                           std::shared_ptr<ContextEncoder> encoder) {
    if (!encoder) {
        throw std::invalid_argument("No context encoder given");
    }
    auto registry = std::make_shared<const PropertyRegistry>(config.properties);
    auto predictor = std::make_shared<MorphoPredictorModel>(
        registry, encoder->output_size(), config.predictor_hidden_size, config.training.seed);
    return std::make_shared<TextMorphoPredictorModel>(std::move(predictor), std::move(encoder));
}
