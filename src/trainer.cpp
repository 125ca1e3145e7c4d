#include "../include/trainer.hpp"
#include "../include/logger.hpp"
#include "../include/performance_metrics.hpp"
#include "../include/training/loss.hpp"
#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>

MorphoPredictorTrainer::MorphoPredictorTrainer(TextMorphoPredictorModel& model_,
                                               std::string model_path_, const Dataset& dataset_,
                                               Evaluator& evaluator_,
                                               const TrainingConfig& config_)
    : model(model_),
      model_path(std::move(model_path_)),
      dataset(dataset_),
      evaluator(evaluator_),
      config(config_),
      predictor(model_),
      optimizer(std::make_unique<Optimizer>(config_.learning_rate, config_.beta1, config_.beta2,
                                            config_.epsilon, config_.rectified,
                                            config_.gradient_clip_threshold)),
      shuffler(config_.seed) {
    optimizer->add_parameters(model.trainable_parameters());
}

float MorphoPredictorTrainer::learn_from_example(const Sentence& sentence) {
    std::vector<TokenPredictions> predictions = predictor.forward(sentence);
    if (predictions.empty()) {
        return 0.0f;
    }

    SentenceLoss loss = compute_sentence_loss(model.registry(), sentence, predictions);
    predictor.backward(loss.errors);
    optimizer->step();
    return loss.loss;
}

void MorphoPredictorTrainer::train() {
    Logger& logger = Logger::getInstance();
    if (dataset.empty()) {
        throw std::runtime_error("Cannot train on an empty dataset");
    }
    if (evaluator.dataset_size() == 0) {
        throw std::runtime_error("Cannot validate on an empty dataset");
    }

    logger.log("Training on " + std::to_string(dataset.size()) + " examples for " +
               std::to_string(config.epochs) + " epochs (" +
               std::to_string(optimizer->get_parameter_count()) + " parameter tensors, encoder " +
               (model.encoder().trainable() ? "trainable" : "frozen") + ")");

    for (size_t epoch = 1; epoch <= config.epochs; ++epoch) {
        train_epoch(epoch);
        validate_and_save(epoch);
    }

    std::ostringstream oss;
    oss.precision(2);
    oss << std::fixed << "Training finished, best accuracy: " << 100.0 * best_accuracy << "%";
    logger.log(oss.str());
}

void MorphoPredictorTrainer::train_epoch(size_t epoch) {
    Logger& logger = Logger::getInstance();
    PerformanceMetrics metrics;
    metrics.start_timer("epoch");
    loss_tracker.reset();

    logger.log("Epoch " + std::to_string(epoch) + " of " + std::to_string(config.epochs));

    std::vector<size_t> order(dataset.size());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), shuffler);

    for (size_t i = 0; i < order.size(); ++i) {
        const Sentence& sentence = dataset.examples()[order[i]];
        try {
            loss_tracker.add_loss(learn_from_example(sentence));
        } catch (const std::exception& e) {
            throw std::runtime_error("Error learning example #" +
                                     std::to_string(sentence.position.index) + ": " + e.what());
        }

        if (config.log_every > 0 && (i + 1) % config.log_every == 0) {
            logger.log("  [" + std::to_string(i + 1) + "/" + std::to_string(order.size()) +
                       "] recent loss: " + std::to_string(loss_tracker.get_recent_average()));
        }
    }

    epoch_losses.push_back(loss_tracker.get_overall_average());
    double elapsed = metrics.stop_timer("epoch");
    logger.log("Epoch " + std::to_string(epoch) + " average loss: " +
               std::to_string(loss_tracker.get_overall_average()) + ", elapsed time: " +
               PerformanceMetrics::format_duration(elapsed));
}

void MorphoPredictorTrainer::validate_and_save(size_t epoch) {
    Logger& logger = Logger::getInstance();
    logger.log("Validate on " + std::to_string(evaluator.dataset_size()) + " examples");

    Statistics stats = evaluator.evaluate();
    logger.log("Statistics\n" + stats.to_string());

    if (stats.accuracy() > best_accuracy) {
        best_accuracy = stats.accuracy();
        logger.log("New best accuracy, saving model to " + model_path);

        bool saved = config.save_whole_model
                         ? saver.save_text_model(model, model_path, epoch, best_accuracy)
                         : saver.save_predictor(model.predictor(), model_path, epoch, best_accuracy);
        if (!saved) {
            throw std::runtime_error("Could not save the model to " + model_path);
        }

        // The heads were trained against the updated encoder
        if (!config.save_whole_model && model.encoder().trainable()) {
            const std::string path = encoder_path(model_path);
            if (!saver.save_encoder(model.encoder_ptr(), path)) {
                throw std::runtime_error("Could not save the encoder to " + path);
            }
        }
    }
}
