#include "../include/dataset.hpp"
#include "../include/logger.hpp"
#include "../include/utils.hpp"
#include <fstream>

InvalidExample::InvalidExample(size_t line_index, const std::string& path,
                               const std::string& reason)
    : std::runtime_error("Example #" + std::to_string(line_index) + " of " + path + ": " + reason),
      line_index_(line_index),
      path_(path) {}

namespace {

const nlohmann::json& best_morphology(const nlohmann::json& token) {
    const auto& morphologies = token.at("morphologies");
    if (!morphologies.is_array() || morphologies.empty()) {
        throw std::runtime_error("token without morphologies");
    }
    if (morphologies.size() == 1) {
        return morphologies.front();
    }
    for (const auto& morphology : morphologies) {
        if (morphology.contains("best")) {
            return morphology;
        }
    }
    throw std::runtime_error("ambiguous token without a best morphology");
}

std::map<std::string, std::string> gold_properties(const nlohmann::json& component,
                                                   const PropertyRegistry& registry) {
    const auto& properties = component.at("properties");
    if (!properties.is_object()) {
        throw std::runtime_error("component properties must be an object");
    }

    std::map<std::string, std::string> result;
    for (auto it = properties.begin(); it != properties.end(); ++it) {
        if (it.value().is_null()) {
            continue;
        }
        const auto value = it.value().get<std::string>();
        if (registry.contains(it.key()) && registry.get(it.key()).index_of(value)) {
            result.emplace(it.key(), value);
        }
    }
    return result;
}

} // namespace

Sentence Dataset::parse_example(const nlohmann::json& example, size_t sentence_index,
                                const PropertyRegistry& registry, const DatasetOptions& options) {
    const auto& tokens_json = example.at("tokens");
    if (!tokens_json.is_array() || tokens_json.empty()) {
        throw std::runtime_error("example without tokens");
    }

    Sentence sentence;
    size_t start = 0;
    for (size_t i = 0; i < tokens_json.size(); ++i) {
        const auto& token_json = tokens_json[i];
        const auto& components = best_morphology(token_json).at("components");
        if (!components.is_array() || components.empty()) {
            throw std::runtime_error("morphology without components");
        }

        for (const auto& component : components) {
            Token token;
            token.lemma = component.at("lemma").get<std::string>();
            token.form = components.size() == 1 ? token_json.at("form").get<std::string>()
                                                : token.lemma;
            if (token.form.empty()) {
                throw std::runtime_error("empty form in token " + std::to_string(i));
            }
            token.properties = gold_properties(component, registry);

            token.position.index = i;
            token.position.start = start;
            token.position.end = start + Utils::utf8_length(token.form) - 1;
            start = token.position.end + 1 + options.token_separator_width;

            sentence.tokens.push_back(std::move(token));
        }
    }

    sentence.position.index = sentence_index;
    sentence.position.start = 0;
    sentence.position.end = sentence.tokens.back().position.end;
    return sentence;
}

Dataset Dataset::from_file(const std::string& path, const PropertyRegistry& registry,
                           const MorphologicalAnalyzer& analyzer, const DatasetOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open dataset file: " + path);
    }

    std::vector<Sentence> examples;
    std::string line;
    size_t line_index = 0;
    while (std::getline(file, line)) {
        Utils::trim(line);
        if (!line.empty()) {
            try {
                Sentence sentence =
                    parse_example(nlohmann::json::parse(line), examples.size(), registry, options);
                sentence.analysis = analyzer.analyze(sentence);
                examples.push_back(std::move(sentence));
            } catch (const nlohmann::json::exception& e) {
                throw InvalidExample(line_index, path, e.what());
            } catch (const std::runtime_error& e) {
                throw InvalidExample(line_index, path, e.what());
            }
        }
        ++line_index;
    }

    Logger::getInstance().log("Loaded " + std::to_string(examples.size()) + " examples from " +
                              path);
    return Dataset(std::move(examples));
}

std::vector<std::string> Dataset::forms() const {
    std::vector<std::string> result;
    for (const auto& sentence : examples_) {
        for (const auto& token : sentence.tokens) {
            result.push_back(token.form);
        }
    }
    return result;
}

Sentence Dataset::sentence_from_text(const std::string& text, size_t sentence_index) {
    Sentence sentence;
    size_t byte_cursor = 0;
    size_t char_cursor = 0;

    for (const std::string& form : Utils::split_text(text)) {
        size_t found = text.find(form, byte_cursor);
        if (found == std::string::npos) {
            throw std::logic_error("Token not found in its own text: " + form);
        }
        char_cursor += Utils::utf8_length(text.substr(byte_cursor, found - byte_cursor));

        Token token;
        token.form = form;
        token.position.index = sentence.tokens.size();
        token.position.start = char_cursor;
        token.position.end = char_cursor + Utils::utf8_length(form) - 1;
        sentence.tokens.push_back(std::move(token));

        char_cursor += Utils::utf8_length(form);
        byte_cursor = found + form.size();
    }

    sentence.position.index = sentence_index;
    sentence.position.start = 0;
    sentence.position.end = sentence.tokens.empty() ? 0 : sentence.tokens.back().position.end;
    return sentence;
}
