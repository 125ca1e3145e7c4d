#pragma once

#include "context_encoder.hpp"
#include "logger.hpp"
#include "morpho_predictor.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Header written at the start of every checkpoint file.
 */
struct CheckpointMetadata {
    static constexpr const char* FORMAT = "morpho_predictor";
    static constexpr int VERSION = 1;

    std::string kind;                     ///< "predictor", "encoder" or "text_predictor"
    int version = VERSION;
    size_t token_encoding_size = 0;
    std::vector<std::string> properties;  ///< Registry names, empty for encoder checkpoints
    size_t epoch = 0;
    double accuracy = 0.0;

    nlohmann::json to_json() const;

    /**
     * @throws std::runtime_error if the header is not a checkpoint of this format
     */
    static CheckpointMetadata from_json(const nlohmann::json& j);
};

/**
 * @brief Manages model checkpointing and persistence.
 *
 * A checkpoint file holds the size of a JSON metadata block, the block
 * itself and the cereal binary payload. Three kinds exist:
 * - predictor: the classification heads and their registry
 * - encoder: a context encoder alone (with its tokenizer or vocabulary)
 * - text_predictor: encoder and heads together
 *
 * Save methods create missing parent directories, log failures and return
 * false. Load methods throw, since there is no model to return otherwise.
 */
class ModelSaver {
  public:
    ModelSaver();

    bool save_predictor(const MorphoPredictorModel& model, const std::string& path,
                        size_t epoch = 0, double accuracy = 0.0);

    bool save_encoder(const std::shared_ptr<ContextEncoder>& encoder, const std::string& path);

    bool save_text_model(const TextMorphoPredictorModel& model, const std::string& path,
                         size_t epoch = 0, double accuracy = 0.0);

    /**
     * @throws std::runtime_error if the file is missing, of another kind or corrupt
     */
    std::shared_ptr<MorphoPredictorModel> load_predictor(const std::string& path);

    /**
     * @throws std::runtime_error if the file is missing, of another kind or corrupt
     */
    std::shared_ptr<ContextEncoder> load_encoder(const std::string& path);

    /**
     * @throws std::runtime_error if the file is missing, of another kind or corrupt
     */
    std::shared_ptr<TextMorphoPredictorModel> load_text_model(const std::string& path);

    /**
     * @brief Reads only the metadata block of a checkpoint.
     * @throws std::runtime_error if the file cannot be read
     */
    CheckpointMetadata read_metadata(const std::string& path) const;

  private:
    Logger& logger;  ///< Logger for error and status messages

    /**
     * @brief Opens a checkpoint for writing and writes its metadata block.
     * @throws std::runtime_error if the file cannot be created
     */
    std::ofstream open_for_writing(const std::string& path, const CheckpointMetadata& meta) const;

    /**
     * @brief Opens a checkpoint, checks its kind and positions the stream on the payload.
     * @throws std::runtime_error on a missing file or a kind mismatch
     */
    std::ifstream open_for_reading(const std::string& path, const std::string& expected_kind,
                                   CheckpointMetadata& meta) const;

    /**
     * @throws std::runtime_error if the restored heads contradict the metadata
     */
    static void check_heads(const MorphoPredictorModel& model, const CheckpointMetadata& meta,
                            const std::string& path);
};
