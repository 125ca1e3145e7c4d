#include "../include/wordpiece_tokenizer.hpp"
#include "../include/token_constants.hpp"
#include "../include/utils.hpp"

WordPieceTokenizer::WordPieceTokenizer(Vocabulary vocabulary, bool lowercase,
                                       size_t max_chars_per_word)
    : vocabulary_(std::move(vocabulary)),
      lowercase_(lowercase),
      max_chars_per_word_(max_chars_per_word) {}

std::vector<std::string> WordPieceTokenizer::wordpiece(const std::string& word) const {
    const auto characters = Utils::utf8_characters(word);
    if (characters.empty() || characters.size() > max_chars_per_word_) {
        return {tokens::UNK_TOKEN};
    }

    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < characters.size()) {
        size_t end = characters.size();
        std::string match;

        while (start < end) {
            std::string candidate;
            for (size_t i = start; i < end; ++i) {
                candidate += characters[i];
            }
            if (start > 0) {
                candidate = tokens::CONTINUATION_PREFIX + candidate;
            }
            if (vocabulary_.has_token(candidate)) {
                match = std::move(candidate);
                break;
            }
            --end;
        }

        if (match.empty()) {
            return {tokens::UNK_TOKEN};
        }
        pieces.push_back(std::move(match));
        start = end;
    }
    return pieces;
}

PieceSequence WordPieceTokenizer::tokenize(const std::vector<std::string>& forms) const {
    PieceSequence sequence;
    sequence.ranges.reserve(forms.size());

    for (const auto& form : forms) {
        const size_t first = sequence.pieces.size();
        const std::string text = lowercase_ ? Utils::to_lower(form) : form;

        for (const auto& word : Utils::split_text(text)) {
            for (auto& piece : wordpiece(word)) {
                sequence.ids.push_back(vocabulary_.get_id(piece));
                sequence.pieces.push_back(std::move(piece));
            }
        }

        // Every token owns at least one piece
        if (sequence.pieces.size() == first) {
            sequence.pieces.push_back(tokens::UNK_TOKEN);
            sequence.ids.push_back(vocabulary_.get_unk_token_id());
        }

        sequence.ranges.push_back({first, sequence.pieces.size() - 1});
    }
    return sequence;
}
