#include "attention.hpp"
#include "feed_forward.hpp"
#include "gradient_check.hpp"
#include "layer_norm.hpp"
#include "recurrent_encoder.hpp"
#include "transformer.hpp"
#include <gtest/gtest.h>

using gradient_check::check_input_gradient;
using gradient_check::check_parameter_gradient;
using gradient_check::random_matrix;

TEST(EncoderGradientTest, LayerNorm) {
    LayerNorm ln(5);
    std::mt19937 gen(1);
    ParameterList params = ln.parameters();
    params[0]->value.randomize(0.5f, 1.5f, gen);
    params[1]->value.randomize(-0.5f, 0.5f, gen);

    auto forward = [&](const Matrix& x) { return ln.forward(x); };
    auto backward = [&](const Matrix& g) { return ln.backward(g); };
    Matrix input = random_matrix(3, 5, 2);

    check_input_gradient(forward, backward, input);
    check_parameter_gradient(forward, backward, input, *params[0]);
    check_parameter_gradient(forward, backward, input, *params[1]);
}

TEST(EncoderGradientTest, FeedForward) {
    std::mt19937 gen(3);
    FeedForward ffn(4, 6, gen);
    auto forward = [&](const Matrix& x) { return ffn.forward(x); };
    auto backward = [&](const Matrix& g) { return ffn.backward(g); };
    Matrix input = random_matrix(3, 4, 4);

    check_input_gradient(forward, backward, input);
    for (Parameter* param : ffn.parameters()) {
        check_parameter_gradient(forward, backward, input, *param);
    }
}

TEST(EncoderGradientTest, MultiHeadAttention) {
    std::mt19937 gen(5);
    MultiHeadAttention attention(4, 2, gen);
    auto forward = [&](const Matrix& x) { return attention.forward(x); };
    auto backward = [&](const Matrix& g) { return attention.backward(g); };
    Matrix input = random_matrix(3, 4, 6);

    check_input_gradient(forward, backward, input);
    for (Parameter* param : attention.parameters()) {
        check_parameter_gradient(forward, backward, input, *param);
    }
}

TEST(EncoderGradientTest, TransformerLayer) {
    TransformerEncoderConfig config;
    config.vocab_size = 10;
    config.hidden_size = 4;
    config.num_heads = 2;
    config.num_layers = 1;
    config.intermediate_size = 8;
    std::mt19937 gen(7);
    TransformerLayer layer(config, gen);

    auto forward = [&](const Matrix& x) { return layer.forward(x); };
    auto backward = [&](const Matrix& g) { return layer.backward(g); };
    check_input_gradient(forward, backward, random_matrix(3, 4, 8));
}

TEST(EncoderGradientTest, RecurrentLayerBothDirections) {
    for (bool reverse : {false, true}) {
        std::mt19937 gen(9);
        RecurrentLayer layer(3, 4, reverse, gen);
        auto forward = [&](const Matrix& x) { return layer.forward(x); };
        auto backward = [&](const Matrix& g) { return layer.backward(g); };
        Matrix input = random_matrix(4, 3, 10);

        check_input_gradient(forward, backward, input);
        for (Parameter* param : layer.parameters()) {
            check_parameter_gradient(forward, backward, input, *param);
        }
    }
}

TEST(EncoderGradientTest, BiRNN) {
    std::mt19937 gen(11);
    BiRNN birnn(3, 2, gen);
    EXPECT_EQ(birnn.output_size(), 4u);

    auto forward = [&](const Matrix& x) { return birnn.forward(x); };
    auto backward = [&](const Matrix& g) { return birnn.backward(g); };
    check_input_gradient(forward, backward, random_matrix(5, 3, 12));
}

TEST(EncoderGradientTest, RecurrentLayerDirectionMatters) {
    std::mt19937 gen_a(9);
    std::mt19937 gen_b(9);
    RecurrentLayer forward_layer(2, 3, false, gen_a);
    RecurrentLayer backward_layer(2, 3, true, gen_b);
    Matrix input = random_matrix(3, 2, 1);

    // Same weights: the first output of the forward direction sees only the first input
    Matrix changed = input;
    changed(2, 0) += 1.0f;
    EXPECT_FLOAT_EQ(forward_layer.forward(input)(0, 0), forward_layer.forward(changed)(0, 0));
    EXPECT_NE(backward_layer.forward(input)(0, 0), backward_layer.forward(changed)(0, 0));
}
