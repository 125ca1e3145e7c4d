#include "../../include/config.hpp"
#include "../../include/dataset.hpp"
#include "../../include/evaluator.hpp"
#include "../../include/logger.hpp"
#include "../../include/model_factory.hpp"
#include "../../include/model_saver.hpp"
#include "../../include/morphology.hpp"
#include "../../include/trainer.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>

namespace po = boost::program_options;

namespace {

bool InitCommandLine(int argc, char** argv, po::variables_map* conf) {
    po::options_description opts("Configuration options");
    opts.add_options()
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("training-set,t", po::value<std::string>()->required(), "Training set (JSONL)")
        ("validation-set,v", po::value<std::string>()->required(), "Validation set (JSONL)")
        ("model-path,m", po::value<std::string>()->required(), "Where to save the best model")
        ("dictionary,d", po::value<std::string>(), "Morphological dictionary (JSONL)")
        ("encoder-path,e", po::value<std::string>(), "Pre-trained encoder checkpoint")
        ("epochs,n", po::value<size_t>(), "Number of training epochs (overrides the config)")
        ("help,h", "Help");
    po::store(po::parse_command_line(argc, argv, opts), *conf);
    if (conf->count("help")) {
        std::cerr << opts << std::endl;
        return false;
    }
    po::notify(*conf);
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    Logger& logger = Logger::getInstance();
    try {
        po::variables_map conf;
        if (!InitCommandLine(argc, argv, &conf)) {
            return 1;
        }

        PredictorConfig config;
        if (conf.count("config")) {
            config.load_from_json(conf["config"].as<std::string>());
        }
        if (conf.count("epochs")) {
            config.training.epochs = conf["epochs"].as<size_t>();
        }
        if (!config.logging.log_file.empty()) {
            logger.startLogging(config.logging.log_file);
        }

        std::unique_ptr<MorphologicalAnalyzer> analyzer;
        if (conf.count("dictionary")) {
            analyzer = std::make_unique<DictionaryAnalyzer>(
                DictionaryAnalyzer::load(conf["dictionary"].as<std::string>()));
        } else {
            analyzer = std::make_unique<EmptyAnalyzer>();
        }

        logger.log("-- READ DATASET");
        Dataset training_set = Dataset::from_file(conf["training-set"].as<std::string>(),
                                                  config.properties, *analyzer, config.dataset);
        Dataset validation_set = Dataset::from_file(conf["validation-set"].as<std::string>(),
                                                    config.properties, *analyzer, config.dataset);

        logger.log("-- BUILD MODEL");
        ModelSaver saver;
        std::shared_ptr<ContextEncoder> encoder;
        bool pretrained = conf.count("encoder-path") > 0;
        if (pretrained) {
            encoder = saver.load_encoder(conf["encoder-path"].as<std::string>());
        } else {
            encoder = build_context_encoder(config, training_set);
        }
        encoder->set_trainable(config.training.fine_tune_encoder);

        std::shared_ptr<TextMorphoPredictorModel> model = build_text_model(config, encoder);
        const std::string model_path = conf["model-path"].as<std::string>();

        // A frozen encoder built here is saved once; a fine-tuned one is
        // rewritten by the trainer with every new best predictor
        if (!config.training.save_whole_model && !pretrained &&
            !config.training.fine_tune_encoder) {
            if (!saver.save_encoder(encoder, MorphoPredictorTrainer::encoder_path(model_path))) {
                return 1;
            }
        }

        logger.log("-- START TRAINING");
        Evaluator evaluator(*model, validation_set, config.logging.verbose);
        MorphoPredictorTrainer trainer(*model, model_path, training_set, evaluator,
                                       config.training);
        trainer.train();
    } catch (const std::exception& e) {
        logger.log(std::string("Training failed: ") + e.what(), true);
        return 1;
    }
    return 0;
}
