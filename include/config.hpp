#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "dataset.hpp"
#include "grammatical_properties.hpp"
#include "transformer.hpp"
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

struct TokenizerConfig {
    std::string type = "wordpiece";  ///< "wordpiece" or "sentencepiece"
    std::string vocab_path;          ///< WordPiece vocabulary, built from the training forms if empty
    std::string model_path;          ///< SentencePiece model, trained on the training sentences if missing
    bool lowercase = true;
    size_t max_chars_per_word = 100;
    size_t min_word_frequency = 1;
    size_t vocab_size = 8000;  ///< SentencePiece training vocabulary size
};

struct RecurrentConfig {
    size_t word_embedding_size = 50;
    size_t hidden_size = 100;
    size_t min_word_frequency = 1;
    bool lowercase = true;
};

struct TrainingConfig {
    size_t epochs = 10;
    float learning_rate = 0.001f;
    float beta1 = 0.9f;
    float beta2 = 0.999f;
    float epsilon = 1e-8f;
    bool rectified = true;
    float gradient_clip_threshold = 0.0f;
    unsigned int seed = 743;
    bool fine_tune_encoder = true;
    bool save_whole_model = true;
    size_t log_every = 100;
};

struct LoggingConfig {
    std::string log_file;  ///< Empty for console only
    bool verbose = true;
};

/**
 * @brief Settings of the morphological predictor tools.
 *
 * Every section of the JSON file is optional; missing keys keep the defaults
 * below. Sections:
 * - encoder: which context encoder to build
 * - transformer / recurrent: architecture of that encoder
 * - tokenizer: sub-word tokenization of the transformer encoder
 * - predictor: size of the classification heads
 * - training: optimizer and training loop
 * - dataset: position computation
 * - properties: ordered property registry, the default registry if absent
 * - logging: log file and verbosity
 */
struct PredictorConfig {
    std::string encoder_type = "transformer";  ///< "transformer" or "recurrent"
    TransformerEncoderConfig transformer;
    RecurrentConfig recurrent;
    TokenizerConfig tokenizer;
    size_t predictor_hidden_size = 0;  ///< 0 for the token encoding size
    TrainingConfig training;
    DatasetOptions dataset;
    PropertyRegistry properties = PropertyRegistry::default_registry();
    LoggingConfig logging;

    /**
     * @brief Overrides the defaults with the content of a JSON file.
     * @throws std::runtime_error naming the file if it cannot be read or is invalid
     */
    void load_from_json(const std::string& config_path);

    /**
     * @brief Applies the sections present in a parsed JSON object.
     * @throws nlohmann::json::exception on wrongly typed values
     * @throws std::invalid_argument on invalid settings
     */
    void apply_json(const nlohmann::json& j);

    /**
     * @throws std::invalid_argument on unknown types or out-of-range values
     */
    void validate() const;
};

#endif  // CONFIG_HPP
