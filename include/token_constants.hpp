#pragma once
#include <string>

namespace tokens {
    // Special token IDs of a vocabulary built from training data
    constexpr int PAD_ID = 0;
    constexpr int UNK_ID = 1;

    // Special token strings, matching BERT vocabulary files
    const std::string PAD_TOKEN = "[PAD]";
    const std::string UNK_TOKEN = "[UNK]";

    // Prefix marking a piece that continues the previous one inside a word
    const std::string CONTINUATION_PREFIX = "##";

    constexpr int NUM_SPECIAL_TOKENS = 2;
}
