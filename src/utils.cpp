#include "../include/utils.hpp"
#include <algorithm>
#include <cctype>

void Utils::trim(std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

std::string Utils::to_lower(const std::string& s) {
    std::string result(s);
    for (auto& c : result) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x80) {
            c = static_cast<char>(std::tolower(byte));
        }
    }
    return result;
}

std::vector<std::string> Utils::utf8_characters(const std::string& s) {
    std::vector<std::string> characters;
    size_t i = 0;
    while (i < s.size()) {
        auto lead = static_cast<unsigned char>(s[i]);
        size_t length = 1;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
        }

        // Fall back to a single byte when the continuation bytes are missing
        if (i + length > s.size()) {
            length = 1;
        } else {
            for (size_t k = 1; k < length; ++k) {
                if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
                    length = 1;
                    break;
                }
            }
        }

        characters.push_back(s.substr(i, length));
        i += length;
    }
    return characters;
}

size_t Utils::utf8_length(const std::string& s) {
    return utf8_characters(s).size();
}

bool Utils::is_ascii_punctuation(const std::string& character) {
    return character.size() == 1 && std::ispunct(static_cast<unsigned char>(character[0]));
}

std::vector<std::string> Utils::split_text(const std::string& text) {
    std::vector<std::string> forms;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            forms.push_back(current);
            current.clear();
        }
    };

    for (const auto& character : utf8_characters(text)) {
        if (character.size() == 1 && std::isspace(static_cast<unsigned char>(character[0]))) {
            flush();
        } else if (is_ascii_punctuation(character)) {
            flush();
            forms.push_back(character);
        } else {
            current += character;
        }
    }
    flush();
    return forms;
}
