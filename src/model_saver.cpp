#include "../include/model_saver.hpp"
#include "../include/serialization.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

json CheckpointMetadata::to_json() const {
    json meta;
    meta["format"] = FORMAT;
    meta["version"] = version;
    meta["kind"] = kind;
    meta["token_encoding_size"] = token_encoding_size;
    meta["properties"] = properties;
    meta["epoch"] = epoch;
    meta["accuracy"] = accuracy;
    return meta;
}

CheckpointMetadata CheckpointMetadata::from_json(const json& j) {
    if (j.value("format", std::string()) != FORMAT) {
        throw std::runtime_error("Not a morphological predictor checkpoint");
    }
    CheckpointMetadata meta;
    meta.version = j.value("version", 0);
    if (meta.version != VERSION) {
        throw std::runtime_error("Unsupported checkpoint version " + std::to_string(meta.version));
    }
    meta.kind = j.at("kind").get<std::string>();
    meta.token_encoding_size = j.value("token_encoding_size", size_t(0));
    meta.properties = j.value("properties", std::vector<std::string>());
    meta.epoch = j.value("epoch", size_t(0));
    meta.accuracy = j.value("accuracy", 0.0);
    return meta;
}

namespace {

// Reads the size-prefixed metadata block and leaves the stream on the payload
CheckpointMetadata read_header(std::istream& is, const std::string& path) {
    size_t meta_size = 0;
    if (!is.read(reinterpret_cast<char*>(&meta_size), sizeof(meta_size)) || meta_size == 0 ||
        meta_size > (1u << 24)) {
        throw std::runtime_error("Corrupt checkpoint header in " + path);
    }

    std::string meta_str(meta_size, '\0');
    if (!is.read(&meta_str[0], meta_size)) {
        throw std::runtime_error("Truncated checkpoint header in " + path);
    }

    try {
        return CheckpointMetadata::from_json(json::parse(meta_str));
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid checkpoint metadata in " + path + ": " + e.what());
    }
}

}  // namespace

ModelSaver::ModelSaver() : logger(Logger::getInstance()) {}

std::ofstream ModelSaver::open_for_writing(const std::string& path,
                                           const CheckpointMetadata& meta) const {
    fs::path file_path(path);
    if (file_path.has_parent_path() && !fs::exists(file_path.parent_path())) {
        fs::create_directories(file_path.parent_path());
    }

    std::ofstream ckpt_file(path, std::ios::binary);
    if (!ckpt_file) {
        throw std::runtime_error("Failed to open checkpoint file for writing: " + path);
    }

    std::string meta_str = meta.to_json().dump();
    size_t meta_size = meta_str.size();

    // Write metadata size and content
    if (!ckpt_file.write(reinterpret_cast<const char*>(&meta_size), sizeof(meta_size)) ||
        !ckpt_file.write(meta_str.c_str(), meta_size)) {
        throw std::runtime_error("Failed to write metadata to checkpoint file: " + path);
    }
    return ckpt_file;
}

std::ifstream ModelSaver::open_for_reading(const std::string& path,
                                           const std::string& expected_kind,
                                           CheckpointMetadata& meta) const {
    std::ifstream ckpt_file(path, std::ios::binary);
    if (!ckpt_file) {
        throw std::runtime_error("Failed to open checkpoint file for reading: " + path);
    }

    meta = read_header(ckpt_file, path);

    if (meta.kind != expected_kind) {
        throw std::runtime_error("Checkpoint " + path + " holds a " + meta.kind +
                                 " model, expected " + expected_kind);
    }
    return ckpt_file;
}

void ModelSaver::check_heads(const MorphoPredictorModel& model, const CheckpointMetadata& meta,
                             const std::string& path) {
    if (model.registry().names() != meta.properties) {
        throw std::runtime_error("Property list of " + path + " does not match its metadata");
    }
    if (model.token_encoding_size() != meta.token_encoding_size) {
        throw std::runtime_error("Token encoding size of " + path + " does not match its metadata");
    }
}

bool ModelSaver::save_predictor(const MorphoPredictorModel& model, const std::string& path,
                                size_t epoch, double accuracy) {
    try {
        logger.log("Saving predictor to: " + path);

        CheckpointMetadata meta;
        meta.kind = "predictor";
        meta.token_encoding_size = model.token_encoding_size();
        meta.properties = model.registry().names();
        meta.epoch = epoch;
        meta.accuracy = accuracy;

        std::ofstream ckpt_file = open_for_writing(path, meta);
        save_predictor_model(ckpt_file, model);

        ckpt_file.flush();
        if (!ckpt_file) {
            logger.log("Error occurred while writing checkpoint file", true);
            return false;
        }
        logger.log("Predictor saved successfully");
        return true;
    } catch (const std::exception& e) {
        logger.log("Error saving predictor: " + std::string(e.what()), true);
        return false;
    }
}

bool ModelSaver::save_encoder(const std::shared_ptr<ContextEncoder>& encoder,
                              const std::string& path) {
    try {
        if (!encoder) {
            throw std::invalid_argument("No encoder to save");
        }
        logger.log("Saving encoder to: " + path);

        CheckpointMetadata meta;
        meta.kind = "encoder";
        meta.token_encoding_size = encoder->output_size();

        std::ofstream ckpt_file = open_for_writing(path, meta);
        save_context_encoder(ckpt_file, encoder);

        ckpt_file.flush();
        if (!ckpt_file) {
            logger.log("Error occurred while writing checkpoint file", true);
            return false;
        }
        logger.log("Encoder saved successfully");
        return true;
    } catch (const std::exception& e) {
        logger.log("Error saving encoder: " + std::string(e.what()), true);
        return false;
    }
}

bool ModelSaver::save_text_model(const TextMorphoPredictorModel& model, const std::string& path,
                                 size_t epoch, double accuracy) {
    try {
        logger.log("Saving model to: " + path);

        CheckpointMetadata meta;
        meta.kind = "text_predictor";
        meta.token_encoding_size = model.predictor().token_encoding_size();
        meta.properties = model.registry().names();
        meta.epoch = epoch;
        meta.accuracy = accuracy;

        std::ofstream ckpt_file = open_for_writing(path, meta);
        ::save_text_model(ckpt_file, model);

        ckpt_file.flush();
        if (!ckpt_file) {
            logger.log("Error occurred while writing checkpoint file", true);
            return false;
        }
        logger.log("Model saved successfully");
        return true;
    } catch (const std::exception& e) {
        logger.log("Error saving model: " + std::string(e.what()), true);
        return false;
    }
}

std::shared_ptr<MorphoPredictorModel> ModelSaver::load_predictor(const std::string& path) {
    logger.log("Loading predictor from: " + path);
    CheckpointMetadata meta;
    std::ifstream ckpt_file = open_for_reading(path, "predictor", meta);

    auto model = std::make_shared<MorphoPredictorModel>();
    try {
        load_predictor_model(ckpt_file, *model);
    } catch (const std::exception& e) {
        throw std::runtime_error("Error loading predictor from " + path + ": " + e.what());
    }
    check_heads(*model, meta, path);

    logger.log("Loaded predictor with " + std::to_string(model->registry().size()) +
               " properties (epoch " + std::to_string(meta.epoch) + ")");
    return model;
}

std::shared_ptr<ContextEncoder> ModelSaver::load_encoder(const std::string& path) {
    logger.log("Loading encoder from: " + path);
    CheckpointMetadata meta;
    std::ifstream ckpt_file = open_for_reading(path, "encoder", meta);

    std::shared_ptr<ContextEncoder> encoder;
    try {
        encoder = load_context_encoder(ckpt_file);
    } catch (const std::exception& e) {
        throw std::runtime_error("Error loading encoder from " + path + ": " + e.what());
    }
    if (!encoder || encoder->output_size() != meta.token_encoding_size) {
        throw std::runtime_error("Encoder of " + path + " does not match its metadata");
    }

    logger.log("Loaded encoder with output size " + std::to_string(encoder->output_size()));
    return encoder;
}

std::shared_ptr<TextMorphoPredictorModel> ModelSaver::load_text_model(const std::string& path) {
    logger.log("Loading model from: " + path);
    CheckpointMetadata meta;
    std::ifstream ckpt_file = open_for_reading(path, "text_predictor", meta);

    auto model = std::make_shared<TextMorphoPredictorModel>();
    try {
        ::load_text_model(ckpt_file, *model);
    } catch (const std::exception& e) {
        throw std::runtime_error("Error loading model from " + path + ": " + e.what());
    }
    check_heads(model->predictor(), meta, path);

    logger.log("Successfully loaded model from epoch " + std::to_string(meta.epoch));
    return model;
}

CheckpointMetadata ModelSaver::read_metadata(const std::string& path) const {
    std::ifstream ckpt_file(path, std::ios::binary);
    if (!ckpt_file) {
        throw std::runtime_error("Failed to open checkpoint file for reading: " + path);
    }
    return read_header(ckpt_file, path);
}
