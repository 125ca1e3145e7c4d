#include "optimizer.hpp"
#include <gtest/gtest.h>

TEST(OptimizerTest, AdamFirstStepMovesByLearningRate) {
    Parameter param(1, 1, 0.0f);
    Optimizer optimizer(0.1f, 0.9f, 0.999f, 1e-8f, false);
    optimizer.add_parameter(param);

    param.grad(0, 0) = 2.0f;
    optimizer.step();
    EXPECT_NEAR(param.value(0, 0), -0.1f, 1e-5f);
    EXPECT_EQ(param.grad(0, 0), 0.0f);
    EXPECT_EQ(optimizer.get_step_count(), 1u);
}

TEST(OptimizerTest, RectifiedFirstStepsUseMomentum) {
    Parameter param(1, 1, 0.0f);
    Optimizer optimizer(0.1f);
    optimizer.add_parameter(param);

    param.grad(0, 0) = 2.0f;
    optimizer.step();
    EXPECT_NEAR(param.value(0, 0), -0.2f, 1e-4f);
}

TEST(OptimizerTest, MinimizesAQuadratic) {
    for (bool rectified : {false, true}) {
        Parameter param(1, 2, 0.0f);
        Optimizer optimizer(0.05f, 0.9f, 0.999f, 1e-8f, rectified);
        optimizer.add_parameter(param);

        for (int i = 0; i < 2000; ++i) {
            param.grad(0, 0) = 2.0f * (param.value(0, 0) - 3.0f);
            param.grad(0, 1) = 2.0f * (param.value(0, 1) + 1.0f);
            optimizer.step();
        }
        EXPECT_NEAR(param.value(0, 0), 3.0f, 0.05f);
        EXPECT_NEAR(param.value(0, 1), -1.0f, 0.05f);
    }
}

TEST(OptimizerTest, ClipsTheGlobalGradientNorm) {
    Parameter a(1, 1, 0.0f);
    Parameter b(1, 1, 0.0f);
    // Momentum steps move by lr * clipped gradient
    Optimizer optimizer(1.0f, 0.9f, 0.999f, 1e-8f, true, 1.0f);
    optimizer.add_parameters({&a, &b});

    a.grad(0, 0) = 3.0f;
    b.grad(0, 0) = 4.0f;
    optimizer.step();
    EXPECT_NEAR(a.value(0, 0), -0.6f, 1e-4f);
    EXPECT_NEAR(b.value(0, 0), -0.8f, 1e-4f);
}

TEST(OptimizerTest, RejectsInvalidHyperparameters) {
    EXPECT_THROW(Optimizer(0.0f), std::invalid_argument);
    EXPECT_THROW(Optimizer(0.1f, 1.0f), std::invalid_argument);
    EXPECT_THROW(Optimizer(0.1f, 0.9f, 0.999f, 1e-8f, true, -1.0f), std::invalid_argument);
}
