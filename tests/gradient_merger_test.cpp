#include "gradient_merger.hpp"
#include <gtest/gtest.h>

TEST(GradientMergerTest, SingleHeadIsReturnedUnchanged) {
    Matrix gradient(2, 3);
    gradient(0, 0) = 0.5f;
    gradient(1, 2) = -2.0f;
    Matrix merged = merge_head_gradients({gradient});
    for (size_t r = 0; r < 2; ++r) {
        for (size_t c = 0; c < 3; ++c) {
            EXPECT_EQ(merged(r, c), gradient(r, c));
        }
    }
}

TEST(GradientMergerTest, AveragesAllHeads) {
    Matrix a(1, 2, 1.0f);
    Matrix b(1, 2, 2.0f);
    Matrix c(1, 2, 6.0f);
    c(0, 1) = -3.0f;
    Matrix merged = merge_head_gradients({a, b, c});
    EXPECT_FLOAT_EQ(merged(0, 0), 3.0f);
    EXPECT_FLOAT_EQ(merged(0, 1), 0.0f);
}

TEST(GradientMergerTest, RejectsEmptyAndMismatchedInput) {
    EXPECT_THROW(merge_head_gradients({}), std::invalid_argument);
    EXPECT_THROW(merge_head_gradients({Matrix(1, 2), Matrix(2, 2)}), std::invalid_argument);
}
