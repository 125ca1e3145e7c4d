#pragma once
#include "config.hpp"
#include "dataset.hpp"
#include "evaluator.hpp"
#include "model_saver.hpp"
#include "morpho_predictor.hpp"
#include "optimizer.hpp"
#include "training/loss_tracker.hpp"
#include <memory>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Training orchestrator for morphological predictors.
 *
 * Examples are learnt one sentence at a time (batch size 1) in a shuffled
 * order that changes every epoch. After each epoch the model is validated
 * and written to model_path whenever its accuracy is the best so far.
 * A predictor-only checkpoint of a fine-tuned model also rewrites the
 * encoder at encoder_path(model_path).
 */
class MorphoPredictorTrainer {
  private:
    TextMorphoPredictorModel& model;
    std::string model_path;
    const Dataset& dataset;
    Evaluator& evaluator;
    TrainingConfig config;
    MorphoPredictor predictor;
    std::unique_ptr<Optimizer> optimizer;
    ModelSaver saver;
    LossTracker loss_tracker;
    std::mt19937 shuffler;
    double best_accuracy = -1.0;
    std::vector<float> epoch_losses;

  public:
    /**
     * @param model_ Model to train; the encoder is updated only if trainable
     * @param model_path_ Where the best model is written
     * @param dataset_ Training examples
     * @param evaluator_ Validation run after every epoch
     * @param config_ Optimizer and loop settings
     */
    MorphoPredictorTrainer(TextMorphoPredictorModel& model_, std::string model_path_,
                           const Dataset& dataset_, Evaluator& evaluator_,
                           const TrainingConfig& config_);

    /**
     * @brief Runs every epoch.
     * @throws std::runtime_error if the training or validation set is empty,
     *         an example cannot be learnt or the model cannot be saved
     */
    void train();

    /**
     * @brief Forward, loss, backward and one optimizer step on a sentence.
     * @return The sentence loss
     */
    float learn_from_example(const Sentence& sentence);

    double get_best_accuracy() const {
        return best_accuracy;
    }

    /**
     * @brief Average training loss of every finished epoch.
     */
    const std::vector<float>& get_epoch_losses() const {
        return epoch_losses;
    }

    /**
     * @brief File of the encoder that goes with a predictor-only checkpoint.
     */
    static std::string encoder_path(const std::string& model_path) {
        return model_path + ".encoder";
    }

    const Optimizer& get_optimizer() const {
        return *optimizer;
    }

  private:
    void train_epoch(size_t epoch);
    void validate_and_save(size_t epoch);
};
