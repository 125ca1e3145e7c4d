#include "../include/serialization.hpp"
#include "../include/serialization_registration.hpp"
#include <cereal/archives/binary.hpp>
#include <cereal/types/memory.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <istream>
#include <ostream>

void save_predictor_model(std::ostream& os, const MorphoPredictorModel& model) {
    cereal::BinaryOutputArchive archive(os);
    archive(model);
}

void load_predictor_model(std::istream& is, MorphoPredictorModel& model) {
    cereal::BinaryInputArchive archive(is);
    archive(model);
}

void save_context_encoder(std::ostream& os, const std::shared_ptr<ContextEncoder>& encoder) {
    cereal::BinaryOutputArchive archive(os);
    archive(encoder);
}

std::shared_ptr<ContextEncoder> load_context_encoder(std::istream& is) {
    cereal::BinaryInputArchive archive(is);
    std::shared_ptr<ContextEncoder> encoder;
    archive(encoder);
    return encoder;
}

void save_text_model(std::ostream& os, const TextMorphoPredictorModel& model) {
    cereal::BinaryOutputArchive archive(os);
    archive(model);
}

void load_text_model(std::istream& is, TextMorphoPredictorModel& model) {
    cereal::BinaryInputArchive archive(is);
    archive(model);
}
