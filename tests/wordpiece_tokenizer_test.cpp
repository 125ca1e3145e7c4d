#include "token_constants.hpp"
#include "wordpiece_tokenizer.hpp"
#include <gtest/gtest.h>

namespace {

Vocabulary test_vocabulary() {
    Vocabulary vocab;
    for (const char* token : {"run", "##ning", "##s", "the", "dog", ",", "un", "##able"}) {
        vocab.add_token(token);
    }
    return vocab;
}

}  // namespace

TEST(WordPieceTokenizerTest, GreedyLongestMatch) {
    WordPieceTokenizer tokenizer(test_vocabulary());
    EXPECT_EQ(tokenizer.wordpiece("running"), (std::vector<std::string>{"run", "##ning"}));
    EXPECT_EQ(tokenizer.wordpiece("runs"), (std::vector<std::string>{"run", "##s"}));
    EXPECT_EQ(tokenizer.wordpiece("dog"), (std::vector<std::string>{"dog"}));
}

TEST(WordPieceTokenizerTest, UnknownWordBecomesUnk) {
    WordPieceTokenizer tokenizer(test_vocabulary());
    EXPECT_EQ(tokenizer.wordpiece("cat"), (std::vector<std::string>{tokens::UNK_TOKEN}));
}

TEST(WordPieceTokenizerTest, TooLongWordBecomesUnk) {
    WordPieceTokenizer tokenizer(test_vocabulary(), true, 4);
    EXPECT_EQ(tokenizer.wordpiece("running"), (std::vector<std::string>{tokens::UNK_TOKEN}));
}

TEST(WordPieceTokenizerTest, RangesCoverEveryPieceOnce) {
    WordPieceTokenizer tokenizer(test_vocabulary());
    PieceSequence sequence = tokenizer.tokenize({"The", "dog", "runs", "unable"});

    ASSERT_EQ(sequence.ranges.size(), 4u);
    EXPECT_EQ(sequence.pieces,
              (std::vector<std::string>{"the", "dog", "run", "##s", "un", "##able"}));
    EXPECT_EQ(sequence.ranges[0], (PieceRange{0, 0}));
    EXPECT_EQ(sequence.ranges[1], (PieceRange{1, 1}));
    EXPECT_EQ(sequence.ranges[2], (PieceRange{2, 3}));
    EXPECT_EQ(sequence.ranges[3], (PieceRange{4, 5}));
    EXPECT_EQ(sequence.ids.size(), sequence.pieces.size());
}

TEST(WordPieceTokenizerTest, EmptyFormGetsOneUnkPiece) {
    WordPieceTokenizer tokenizer(test_vocabulary());
    PieceSequence sequence = tokenizer.tokenize({"dog", ""});
    ASSERT_EQ(sequence.ranges.size(), 2u);
    EXPECT_EQ(sequence.ranges[1], (PieceRange{1, 1}));
    EXPECT_EQ(sequence.ids[1], tokenizer.get_unk_token_id());
}

TEST(WordPieceTokenizerTest, BuiltVocabularySegmentsSeenCharacters) {
    Vocabulary vocab = Vocabulary::build_from_words({"abc"}, 1);
    WordPieceTokenizer tokenizer(vocab);
    std::vector<std::string> pieces = tokenizer.wordpiece("cab");
    ASSERT_EQ(pieces.size(), 3u);
    EXPECT_EQ(pieces[0], "c");
    EXPECT_EQ(pieces[1], "##a");
    EXPECT_EQ(pieces[2], "##b");
}
