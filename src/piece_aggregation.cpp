#include "../include/piece_aggregation.hpp"
#include <stdexcept>
#include <string>

Matrix aggregate_pieces(const Matrix& piece_encodings, const std::vector<PieceRange>& ranges) {
    Matrix result(ranges.size(), piece_encodings.cols());

    for (size_t t = 0; t < ranges.size(); ++t) {
        const auto& range = ranges[t];
        if (range.first > range.last || range.last >= piece_encodings.rows()) {
            throw std::invalid_argument("Invalid piece range [" + std::to_string(range.first) +
                                        ", " + std::to_string(range.last) + "] for token " +
                                        std::to_string(t) + " over " +
                                        std::to_string(piece_encodings.rows()) + " pieces");
        }

        if (range.length() == 1) {
            result.set_row(t, piece_encodings.row(range.first));
            continue;
        }

        Vector mean(piece_encodings.cols());
        for (size_t p = range.first; p <= range.last; ++p) {
            mean += piece_encodings.row(p);
        }
        mean /= static_cast<float>(range.length());
        result.set_row(t, mean);
    }
    return result;
}

Matrix split_token_gradients(const Matrix& token_gradients,
                             const std::vector<PieceRange>& ranges) {
    if (token_gradients.rows() != ranges.size()) {
        throw std::invalid_argument("Got gradients for " + std::to_string(token_gradients.rows()) +
                                    " tokens but " + std::to_string(ranges.size()) +
                                    " piece ranges");
    }
    if (ranges.empty()) {
        return Matrix(0, token_gradients.cols());
    }

    Matrix result(ranges.back().last + 1, token_gradients.cols());
    for (size_t t = 0; t < ranges.size(); ++t) {
        const auto& range = ranges[t];
        Vector share = token_gradients.row(t);
        if (range.length() > 1) {
            share /= static_cast<float>(range.length());
        }
        for (size_t p = range.first; p <= range.last; ++p) {
            result.set_row(p, share);
        }
    }
    return result;
}

std::vector<PieceWindow> plan_piece_windows(const std::vector<PieceRange>& ranges,
                                            size_t num_pieces, size_t max_length) {
    std::vector<PieceWindow> windows;
    if (num_pieces == 0) {
        return windows;
    }
    if (max_length == 0 || num_pieces <= max_length) {
        windows.push_back({0, num_pieces});
        return windows;
    }

    size_t begin = 0;
    for (const auto& range : ranges) {
        if (range.last + 1 - begin <= max_length) {
            continue;
        }
        if (range.first > begin) {
            windows.push_back({begin, range.first});
            begin = range.first;
        }
        while (range.last + 1 - begin > max_length) {
            windows.push_back({begin, begin + max_length});
            begin += max_length;
        }
    }
    if (begin < num_pieces) {
        windows.push_back({begin, num_pieces});
    }
    return windows;
}

PieceAggregatingEncoder::PieceAggregatingEncoder(std::unique_ptr<PieceEncoder> encoder,
                                                 std::shared_ptr<BaseTokenizer> tokenizer)
    : encoder_(std::move(encoder)), tokenizer_(std::move(tokenizer)) {
    if (!encoder_ || !tokenizer_) {
        throw std::invalid_argument("PieceAggregatingEncoder needs an encoder and a tokenizer");
    }
    if (tokenizer_->vocab_size() > encoder_->vocab_size()) {
        throw std::invalid_argument("Tokenizer vocabulary (" +
                                    std::to_string(tokenizer_->vocab_size()) +
                                    ") is larger than the encoder vocabulary (" +
                                    std::to_string(encoder_->vocab_size()) + ")");
    }
}

Matrix PieceAggregatingEncoder::forward(const Sentence& sentence) {
    PieceSequence sequence = tokenizer_->tokenize(sentence.forms());
    std::vector<PieceWindow> windows =
        plan_piece_windows(sequence.ranges, sequence.ids.size(), encoder_->max_length());

    Matrix piece_encodings(sequence.ids.size(), encoder_->output_size());
    if (windows.size() == 1) {
        piece_encodings = encoder_->forward(sequence.ids);
    } else {
        for (const auto& window : windows) {
            std::vector<int> ids(sequence.ids.begin() + window.begin,
                                 sequence.ids.begin() + window.end);
            Matrix encoded = encoder_->forward(ids);
            for (size_t p = 0; p < window.length(); ++p) {
                piece_encodings.set_row(window.begin + p, encoded.row(p));
            }
        }
    }

    Matrix token_encodings = aggregate_pieces(piece_encodings, sequence.ranges);
    if (token_encodings.rows() != sentence.size()) {
        throw std::logic_error("Aggregated " + std::to_string(token_encodings.rows()) +
                               " token encodings for a sentence of " +
                               std::to_string(sentence.size()) + " tokens");
    }

    ranges_cache_ = std::move(sequence.ranges);
    ids_cache_ = std::move(sequence.ids);
    windows_cache_ = std::move(windows);
    return token_encodings;
}

Matrix PieceAggregatingEncoder::backward(const Matrix& token_gradients) {
    Matrix piece_gradients = split_token_gradients(token_gradients, ranges_cache_);
    if (windows_cache_.empty()) {
        return piece_gradients;
    }
    if (windows_cache_.size() == 1) {
        return encoder_->backward(piece_gradients);
    }

    Matrix result(piece_gradients.rows(), piece_gradients.cols());
    for (const auto& window : windows_cache_) {
        std::vector<int> ids(ids_cache_.begin() + window.begin, ids_cache_.begin() + window.end);
        Matrix window_gradients(window.length(), piece_gradients.cols());
        for (size_t p = 0; p < window.length(); ++p) {
            window_gradients.set_row(p, piece_gradients.row(window.begin + p));
        }

        encoder_->forward(ids);
        Matrix input_gradients = encoder_->backward(window_gradients);
        for (size_t p = 0; p < window.length(); ++p) {
            result.set_row(window.begin + p, input_gradients.row(p));
        }
    }
    return result;
}
