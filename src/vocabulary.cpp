#include "../include/vocabulary.hpp"
#include "../include/token_constants.hpp"
#include "../include/utils.hpp"
#include <fstream>
#include <map>
#include <stdexcept>

Vocabulary::Vocabulary() : unk_token_id(tokens::UNK_ID), pad_token_id(tokens::PAD_ID) {
    // Initialize special tokens in consistent order using constants
    id_to_token = {tokens::PAD_TOKEN, tokens::UNK_TOKEN};
    rebuild_index();
}

void Vocabulary::rebuild_index() {
    token_to_id.clear();
    for (size_t i = 0; i < id_to_token.size(); ++i) {
        if (!token_to_id.emplace(id_to_token[i], static_cast<int>(i)).second) {
            throw std::runtime_error("Duplicate vocabulary entry '" + id_to_token[i] + "'");
        }
    }

    auto unk = token_to_id.find(tokens::UNK_TOKEN);
    if (unk == token_to_id.end()) {
        throw std::runtime_error("Vocabulary has no " + tokens::UNK_TOKEN + " entry");
    }
    unk_token_id = unk->second;

    auto pad = token_to_id.find(tokens::PAD_TOKEN);
    pad_token_id = pad == token_to_id.end() ? -1 : pad->second;
}

Vocabulary Vocabulary::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open vocabulary file: " + path);
    }

    Vocabulary vocab;
    vocab.id_to_token.clear();
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            vocab.id_to_token.push_back(line);
        }
    }

    try {
        vocab.rebuild_index();
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid vocabulary file " + path + ": " + e.what());
    }
    return vocab;
}

Vocabulary Vocabulary::build_word_vocabulary(const std::vector<std::string>& words,
                                             size_t min_frequency) {
    std::map<std::string, size_t> counts;
    for (const auto& word : words) {
        counts[word]++;
    }

    Vocabulary vocab;
    for (const auto& [word, count] : counts) {
        if (count >= min_frequency) {
            vocab.add_token(word);
        }
    }
    return vocab;
}

Vocabulary Vocabulary::build_from_words(const std::vector<std::string>& words,
                                        size_t min_frequency) {
    Vocabulary vocab = build_word_vocabulary(words, min_frequency);
    for (const auto& word : words) {
        for (const auto& character : Utils::utf8_characters(word)) {
            vocab.add_token(character);
            vocab.add_token(tokens::CONTINUATION_PREFIX + character);
        }
    }
    return vocab;
}

void Vocabulary::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not write vocabulary file: " + path);
    }
    for (const auto& token : id_to_token) {
        file << token << "\n";
    }
}

int Vocabulary::add_token(const std::string& token) {
    auto it = token_to_id.find(token);
    if (it != token_to_id.end()) {
        return it->second;
    }
    int id = static_cast<int>(id_to_token.size());
    token_to_id.emplace(token, id);
    id_to_token.push_back(token);
    return id;
}

int Vocabulary::get_id(const std::string& token) const {
    auto it = token_to_id.find(token);
    return it == token_to_id.end() ? unk_token_id : it->second;
}

const std::string& Vocabulary::get_token(int id) const {
    if (id < 0 || static_cast<size_t>(id) >= id_to_token.size()) {
        throw std::out_of_range("Vocabulary id " + std::to_string(id) + " out of range");
    }
    return id_to_token[static_cast<size_t>(id)];
}
