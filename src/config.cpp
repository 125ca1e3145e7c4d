#include "../include/config.hpp"
#include "../include/logger.hpp"
#include <fstream>
#include <stdexcept>

void PredictorConfig::load_from_json(const std::string& config_path) {
    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + config_path);
        }

        nlohmann::json j;
        file >> j;
        apply_json(j);
    } catch (const std::exception& e) {
        throw std::runtime_error("Error loading config from " + config_path + ": " +
                                 std::string(e.what()));
    }

    Logger::getInstance().log("Loaded configuration from " + config_path + " (encoder: " +
                              encoder_type + ", " + std::to_string(properties.size()) +
                              " properties)");
}

void PredictorConfig::apply_json(const nlohmann::json& j) {
    if (j.contains("encoder")) {
        const auto& encoder = j["encoder"];
        encoder_type = encoder.value("type", encoder_type);
    }

    if (j.contains("transformer")) {
        const auto& model = j["transformer"];
        transformer.hidden_size = model.value("hidden_size", transformer.hidden_size);
        transformer.num_heads = model.value("num_heads", transformer.num_heads);
        transformer.num_layers = model.value("num_layers", transformer.num_layers);
        transformer.intermediate_size = model.value("intermediate_size", transformer.intermediate_size);
        transformer.max_seq_length = model.value("max_seq_length", transformer.max_seq_length);
        transformer.layer_norm_epsilon =
            model.value("layer_norm_epsilon", transformer.layer_norm_epsilon);
    }

    if (j.contains("recurrent")) {
        const auto& rnn = j["recurrent"];
        recurrent.word_embedding_size = rnn.value("word_embedding_size", recurrent.word_embedding_size);
        recurrent.hidden_size = rnn.value("hidden_size", recurrent.hidden_size);
        recurrent.min_word_frequency = rnn.value("min_word_frequency", recurrent.min_word_frequency);
        recurrent.lowercase = rnn.value("lowercase", recurrent.lowercase);
    }

    if (j.contains("tokenizer")) {
        const auto& tok = j["tokenizer"];
        tokenizer.type = tok.value("type", tokenizer.type);
        tokenizer.vocab_path = tok.value("vocab_path", tokenizer.vocab_path);
        tokenizer.model_path = tok.value("model_path", tokenizer.model_path);
        tokenizer.lowercase = tok.value("lowercase", tokenizer.lowercase);
        tokenizer.max_chars_per_word = tok.value("max_chars_per_word", tokenizer.max_chars_per_word);
        tokenizer.min_word_frequency = tok.value("min_word_frequency", tokenizer.min_word_frequency);
        tokenizer.vocab_size = tok.value("vocab_size", tokenizer.vocab_size);
    }

    if (j.contains("predictor")) {
        predictor_hidden_size = j["predictor"].value("hidden_size", predictor_hidden_size);
    }

    if (j.contains("training")) {
        const auto& t = j["training"];
        training.epochs = t.value("epochs", training.epochs);
        training.learning_rate = t.value("learning_rate", training.learning_rate);
        training.beta1 = t.value("beta1", training.beta1);
        training.beta2 = t.value("beta2", training.beta2);
        training.epsilon = t.value("epsilon", training.epsilon);
        training.rectified = t.value("rectified", training.rectified);
        training.gradient_clip_threshold =
            t.value("gradient_clip_threshold", training.gradient_clip_threshold);
        training.seed = t.value("seed", training.seed);
        training.fine_tune_encoder = t.value("fine_tune_encoder", training.fine_tune_encoder);
        training.save_whole_model = t.value("save_whole_model", training.save_whole_model);
        training.log_every = t.value("log_every", training.log_every);
    }

    if (j.contains("dataset")) {
        dataset.token_separator_width =
            j["dataset"].value("token_separator_width", dataset.token_separator_width);
    }

    if (j.contains("properties")) {
        properties = PropertyRegistry::from_json(j["properties"]);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        logging.log_file = l.value("log_file", logging.log_file);
        logging.verbose = l.value("verbose", logging.verbose);
    }

    validate();
}

void PredictorConfig::validate() const {
    if (encoder_type != "transformer" && encoder_type != "recurrent") {
        throw std::invalid_argument("Unknown encoder type: " + encoder_type);
    }
    if (tokenizer.type != "wordpiece" && tokenizer.type != "sentencepiece") {
        throw std::invalid_argument("Unknown tokenizer type: " + tokenizer.type);
    }
    if (encoder_type == "transformer") {
        // The vocabulary size is only known once the tokenizer exists
        TransformerEncoderConfig checked = transformer;
        checked.vocab_size = 1;
        checked.validate();
    } else if (recurrent.word_embedding_size == 0 || recurrent.hidden_size == 0) {
        throw std::invalid_argument("Recurrent encoder sizes must be positive");
    }
    if (tokenizer.max_chars_per_word == 0) {
        throw std::invalid_argument("max_chars_per_word must be positive");
    }
    if (training.learning_rate <= 0.0f) {
        throw std::invalid_argument("Learning rate must be positive");
    }
    if (training.beta1 < 0.0f || training.beta1 >= 1.0f || training.beta2 < 0.0f ||
        training.beta2 >= 1.0f) {
        throw std::invalid_argument("Beta coefficients must be in [0, 1)");
    }
    if (training.gradient_clip_threshold < 0.0f) {
        throw std::invalid_argument("Gradient clip threshold must not be negative");
    }
    if (properties.size() == 0) {
        throw std::invalid_argument("At least one property must be configured");
    }
}
