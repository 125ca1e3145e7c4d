#include "../../include/dataset.hpp"
#include "../../include/logger.hpp"
#include "../../include/model_saver.hpp"
#include "../../include/morpho_predictor.hpp"
#include "../../include/morphology.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include <string>

namespace po = boost::program_options;

namespace {

bool InitCommandLine(int argc, char** argv, po::variables_map* conf) {
    po::options_description opts("Configuration options");
    opts.add_options()
        ("model-path,m", po::value<std::string>()->required(), "Model checkpoint")
        ("encoder-path,e", po::value<std::string>(), "Encoder checkpoint, for predictor-only models")
        ("dictionary,d", po::value<std::string>(), "Morphological dictionary (JSONL)")
        ("help,h", "Help");
    po::store(po::parse_command_line(argc, argv, opts), *conf);
    if (conf->count("help")) {
        std::cerr << opts << std::endl;
        return false;
    }
    po::notify(*conf);
    return true;
}

void print_predictions(const Sentence& sentence, const std::vector<TokenPredictions>& predictions,
                       const PropertyRegistry& registry) {
    for (size_t i = 0; i < sentence.size(); ++i) {
        std::cout << sentence.tokens[i].form << ":";
        for (const auto& property : registry.properties()) {
            auto it = predictions[i].find(property.name);
            if (it != predictions[i].end() && it->second.value) {
                std::cout << " " << *it->second.value;
            }
        }
        std::cout << "\n";
    }
    std::cout << std::endl;
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

        MorphoPredictor predictor(*model);
        size_t sentence_index = 0;
        std::string line;
        while (true) {
            std::cout << "Type a sentence (empty to exit): " << std::flush;
            if (!std::getline(std::cin, line) || line.empty()) {
                break;
            }

            Sentence sentence = Dataset::sentence_from_text(line, sentence_index++);
            if (sentence.empty()) {
                continue;
            }
            sentence.analysis = analyzer->analyze(sentence);
            print_predictions(sentence, predictor.forward(sentence), model->registry());
        }
    } catch (const std::exception& e) {
        logger.log(std::string("Prediction failed: ") + e.what(), true);
        return 1;
    }
    return 0;
}
