#include "gradient_check.hpp"
#include "property_classifier.hpp"
#include "training/loss.hpp"
#include <gtest/gtest.h>

TEST(PropertyClassifierTest, RowsAreDistributions) {
    std::mt19937 gen(3);
    PropertyClassifier classifier("tense", 6, 5, 4, gen);
    Matrix output = classifier.forward(gradient_check::random_matrix(3, 6, 1));

    ASSERT_EQ(output.rows(), 3u);
    ASSERT_EQ(output.cols(), 4u);
    for (size_t r = 0; r < output.rows(); ++r) {
        EXPECT_NEAR(output.row(r).sum(), 1.0f, 1e-5f);
        for (size_t c = 0; c < output.cols(); ++c) {
            EXPECT_GT(output(r, c), 0.0f);
        }
    }
}

TEST(PropertyClassifierTest, CrossEntropyInputGradient) {
    std::mt19937 gen(5);
    PropertyClassifier classifier("number", 4, 3, 3, gen);
    const std::vector<size_t> gold = {0, 2};

    auto loss_of = [&](const Matrix& input) {
        Matrix output = classifier.forward(input);
        float loss = 0.0f;
        for (size_t r = 0; r < output.rows(); ++r) {
            loss += cross_entropy_loss(output.row(r), gold[r]);
        }
        return loss;
    };

    Matrix input = gradient_check::random_matrix(2, 4, 9);
    Matrix output = classifier.forward(input);
    Matrix errors(2, 3);
    for (size_t r = 0; r < 2; ++r) {
        errors.set_row(r, softmax_cross_entropy_errors(output.row(r), gold[r]));
    }
    Matrix analytic = classifier.backward(errors);

    const float eps = gradient_check::kEpsilon;
    for (size_t r = 0; r < input.rows(); ++r) {
        for (size_t c = 0; c < input.cols(); ++c) {
            Matrix plus = input;
            plus(r, c) += eps;
            Matrix minus = input;
            minus(r, c) -= eps;
            gradient_check::expect_close(analytic(r, c),
                                         (loss_of(plus) - loss_of(minus)) / (2.0f * eps),
                                         "input gradient");
        }
    }
}

TEST(PropertyClassifierTest, BackwardAccumulatesParameterGradients) {
    std::mt19937 gen(5);
    PropertyClassifier classifier("number", 4, 3, 3, gen);
    Matrix input = gradient_check::random_matrix(2, 4, 2);
    Matrix output = classifier.forward(input);

    Matrix errors(2, 3);
    errors.set_row(0, softmax_cross_entropy_errors(output.row(0), 1));
    errors.set_row(1, softmax_cross_entropy_errors(output.row(1), 1));
    classifier.backward(errors);

    for (Parameter* param : classifier.parameters()) {
        EXPECT_GT(param->grad.squared_norm(), 0.0f);
    }
}

TEST(LossTest, ErrorsAreDistributionMinusOneHot) {
    Vector distribution = {0.2f, 0.5f, 0.3f};
    Vector errors = softmax_cross_entropy_errors(distribution, 1);
    EXPECT_FLOAT_EQ(errors[0], 0.2f);
    EXPECT_FLOAT_EQ(errors[1], -0.5f);
    EXPECT_FLOAT_EQ(errors[2], 0.3f);
    EXPECT_THROW(softmax_cross_entropy_errors(distribution, 3), std::out_of_range);
    EXPECT_NEAR(cross_entropy_loss(distribution, 1), -std::log(0.5f), 1e-6f);
}
