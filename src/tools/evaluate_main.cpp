#include "../../include/dataset.hpp"
#include "../../include/evaluator.hpp"
#include "../../include/logger.hpp"
#include "../../include/model_saver.hpp"
#include "../../include/morphology.hpp"
#include "../../include/performance_metrics.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>

namespace po = boost::program_options;

namespace {

bool InitCommandLine(int argc, char** argv, po::variables_map* conf) {
    po::options_description opts("Configuration options");
    opts.add_options()
        ("model-path,m", po::value<std::string>()->required(), "Model checkpoint")
        ("encoder-path,e", po::value<std::string>(), "Encoder checkpoint, for predictor-only models")
        ("validation-set,v", po::value<std::string>()->required(), "Validation set (JSONL)")
        ("dictionary,d", po::value<std::string>(), "Morphological dictionary (JSONL)")
        ("token-separator-width", po::value<size_t>()->default_value(1),
         "Characters between consecutive tokens")
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

        ModelSaver saver;
        const std::string model_path = conf["model-path"].as<std::string>();
        std::shared_ptr<TextMorphoPredictorModel> model;
        if (saver.read_metadata(model_path).kind == "predictor") {
            if (!conf.count("encoder-path")) {
                throw std::runtime_error("A predictor-only checkpoint needs --encoder-path");
            }
            model = std::make_shared<TextMorphoPredictorModel>(
                saver.load_predictor(model_path),
                saver.load_encoder(conf["encoder-path"].as<std::string>()));
        } else {
            model = saver.load_text_model(model_path);
        }

        std::unique_ptr<MorphologicalAnalyzer> analyzer;
        if (conf.count("dictionary")) {
            analyzer = std::make_unique<DictionaryAnalyzer>(
                DictionaryAnalyzer::load(conf["dictionary"].as<std::string>()));
        } else {
            analyzer = std::make_unique<EmptyAnalyzer>();
        }

        DatasetOptions options;
        options.token_separator_width = conf["token-separator-width"].as<size_t>();
        Dataset validation_set = Dataset::from_file(conf["validation-set"].as<std::string>(),
                                                    model->registry(), *analyzer, options);

        PerformanceMetrics metrics;
        metrics.start_timer("evaluation");
        Evaluator evaluator(*model, validation_set, false);
        Statistics stats = evaluator.evaluate();
        double elapsed = metrics.stop_timer("evaluation");

        std::cout << "Elapsed time: " << PerformanceMetrics::format_duration(elapsed) << "\n\n";
        std::cout << "Statistics\n" << stats.to_string() << std::endl;
    } catch (const std::exception& e) {
        logger.log(std::string("Evaluation failed: ") + e.what(), true);
        return 1;
    }
    return 0;
}
