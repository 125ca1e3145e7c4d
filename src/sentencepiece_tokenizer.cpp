#include "../include/sentencepiece_tokenizer.hpp"
#include "../include/logger.hpp"
#include "../include/token_constants.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sentencepiece_trainer.h>

SentencePieceTokenizer::SentencePieceTokenizer()
    : processor_(std::make_unique<sentencepiece::SentencePieceProcessor>()) {}

void SentencePieceTokenizer::load_model(const std::string& model_path) {
    const auto status = processor_->Load(model_path);
    if (!status.ok()) {
        throw std::runtime_error("Failed to load SentencePiece model " + model_path + ": " +
                                 status.ToString());
    }
}

void SentencePieceTokenizer::load_serialized_model(const std::string& proto) {
    const auto status = processor_->LoadFromSerializedProto(proto);
    if (!status.ok()) {
        throw std::runtime_error("Failed to restore SentencePiece model: " + status.ToString());
    }
}

void SentencePieceTokenizer::train(const std::vector<std::string>& texts,
                                   const std::string& model_prefix, size_t vocab_size) {
    std::filesystem::path abs_model_path = std::filesystem::absolute(model_prefix);
    std::filesystem::path model_dir = abs_model_path.parent_path();
    if (!model_dir.empty()) {
        std::filesystem::create_directories(model_dir);
    }

    // Use a temporary file in the same directory as the model
    std::filesystem::path temp_file = model_dir / "sentencepiece_training_data.txt";
    {
        std::ofstream ofs(temp_file);
        if (!ofs) {
            throw std::runtime_error("Failed to create training data file: " + temp_file.string());
        }
        for (const auto& text : texts) {
            if (!text.empty()) {
                ofs << text << "\n";
            }
        }
    }

    std::string training_args =
        "--input=" + temp_file.string() + " "
        "--model_prefix=" + abs_model_path.string() + " "
        "--vocab_size=" + std::to_string(vocab_size) + " "
        "--hard_vocab_limit=false "
        "--character_coverage=1.0 "
        "--model_type=unigram "
        "--pad_id=" + std::to_string(tokens::PAD_ID) + " "
        "--unk_id=" + std::to_string(tokens::UNK_ID) + " "
        "--bos_id=-1 "
        "--eos_id=-1 "
        "--pad_piece=" + tokens::PAD_TOKEN + " "
        "--unk_piece=" + tokens::UNK_TOKEN + " "
        "--split_by_whitespace=true "
        "--add_dummy_prefix=true";

    Logger::getInstance().log("Training SentencePiece model " + abs_model_path.string() + " on " +
                              std::to_string(texts.size()) + " texts");

    const auto status = sentencepiece::SentencePieceTrainer::Train(training_args);
    std::filesystem::remove(temp_file);
    if (!status.ok()) {
        throw std::runtime_error("SentencePiece training failed: " + status.ToString());
    }

    load_model(abs_model_path.string() + ".model");
}

PieceSequence SentencePieceTokenizer::tokenize(const std::vector<std::string>& forms) const {
    PieceSequence sequence;
    sequence.ranges.reserve(forms.size());

    for (const auto& form : forms) {
        const size_t first = sequence.pieces.size();

        std::vector<int> ids;
        const auto status = processor_->Encode(form, &ids);
        if (!status.ok()) {
            throw std::runtime_error("SentencePiece encoding of '" + form +
                                     "' failed: " + status.ToString());
        }

        for (int id : ids) {
            sequence.ids.push_back(id);
            sequence.pieces.push_back(processor_->IdToPiece(id));
        }

        // Every token owns at least one piece
        if (sequence.pieces.size() == first) {
            sequence.ids.push_back(processor_->unk_id());
            sequence.pieces.push_back(processor_->IdToPiece(processor_->unk_id()));
        }

        sequence.ranges.push_back({first, sequence.pieces.size() - 1});
    }
    return sequence;
}
