#include "../include/morphology.hpp"
#include "../include/logger.hpp"
#include "../include/utils.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

MorphologicalAnalysis EmptyAnalyzer::analyze(const Sentence& sentence) const {
    MorphologicalAnalysis analysis;
    analysis.readings.resize(sentence.size());
    return analysis;
}

DictionaryAnalyzer DictionaryAnalyzer::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open morphological dictionary: " + path);
    }

    DictionaryAnalyzer analyzer;
    std::string line;
    size_t line_index = 0;
    while (std::getline(file, line)) {
        Utils::trim(line);
        if (line.empty()) {
            ++line_index;
            continue;
        }

        try {
            auto entry = nlohmann::json::parse(line);
            const auto form = entry.at("form").get<std::string>();
            for (const auto& reading_json : entry.at("readings")) {
                Reading reading;
                reading.lemma = reading_json.at("lemma").get<std::string>();
                if (reading_json.contains("properties")) {
                    reading.properties =
                        reading_json.at("properties").get<std::map<std::string, std::string>>();
                }
                analyzer.add_reading(form, std::move(reading));
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Malformed dictionary entry at line " +
                                     std::to_string(line_index) + " of " + path + ": " + e.what());
        }
        ++line_index;
    }

    Logger::getInstance().log("Loaded " + std::to_string(analyzer.size()) +
                              " dictionary forms from " + path);
    return analyzer;
}

void DictionaryAnalyzer::add_reading(const std::string& form, Reading reading) {
    entries_[Utils::to_lower(form)].push_back(std::move(reading));
}

MorphologicalAnalysis DictionaryAnalyzer::analyze(const Sentence& sentence) const {
    MorphologicalAnalysis analysis;
    analysis.readings.reserve(sentence.size());
    for (const auto& token : sentence.tokens) {
        auto it = entries_.find(Utils::to_lower(token.form));
        if (it == entries_.end()) {
            analysis.readings.emplace_back();
        } else {
            analysis.readings.push_back(it->second);
        }
    }
    return analysis;
}
