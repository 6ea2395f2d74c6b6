/**
 * @file test_masked_convolver.cpp
 * @brief Unit tests for MaskedConvolver
 */

#include "core/MaskedConvolver.hpp"
#include "core/GaussianKernel.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>

using namespace shake;

namespace {

Kernel MakeCrossKernel() {
    Kernel kernel(3, 3);
    kernel << 0.05, 0.1, 0.05,
              0.1,  0.4, 0.1,
              0.05, 0.1, 0.05;
    return kernel;
}

Grid MakeImpulse(Eigen::Index size) {
    Grid grid = Grid::Zero(size, size);
    grid(size / 2, size / 2) = 1.0;
    return grid;
}

Grid MakeRandomGrid(Eigen::Index rows, Eigen::Index cols, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(1.0, 10.0);
    Grid grid(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        for (Eigen::Index j = 0; j < cols; ++j) {
            grid(i, j) = dist(rng);
        }
    }
    return grid;
}

} // anonymous namespace

// =============================================================================
// Unmasked convolution
// =============================================================================

class MaskedConvolverTest : public ::testing::Test {
protected:
    MaskedConvolver convolver_;
};

TEST_F(MaskedConvolverTest, ImpulseReproducesKernel) {
    Grid output = convolver_.convolve(MakeImpulse(5), MakeCrossKernel());

    Grid expected = Grid::Zero(5, 5);
    expected.block(1, 1, 3, 3) = MakeCrossKernel();

    ASSERT_EQ(output.rows(), 5);
    ASSERT_EQ(output.cols(), 5);
    for (Eigen::Index i = 0; i < 5; ++i) {
        for (Eigen::Index j = 0; j < 5; ++j) {
            EXPECT_NEAR(output(i, j), expected(i, j), 1e-15) << "at (" << i << ", " << j << ")";
        }
    }
    EXPECT_NEAR(output(2, 2), 0.4, 1e-15);
    EXPECT_NEAR(output(1, 2), 0.1, 1e-15);
    EXPECT_NEAR(output(1, 1), 0.05, 1e-15);
    EXPECT_DOUBLE_EQ(output(0, 0), 0.0);
}

TEST_F(MaskedConvolverTest, ShapeIsPreserved) {
    Grid grid = MakeRandomGrid(7, 11);
    Grid output = convolver_.convolve(grid, GaussianKernel::build(1.0, 2.0));

    EXPECT_EQ(output.rows(), 7);
    EXPECT_EQ(output.cols(), 11);
}

TEST_F(MaskedConvolverTest, ConstantFieldIsUnchanged) {
    Grid grid = Grid::Constant(12, 9, 7.25);
    Grid output = convolver_.convolve(grid, GaussianKernel::build(0.9));

    EXPECT_TRUE(((output - 7.25).abs() < 1e-12).all());
}

TEST_F(MaskedConvolverTest, WindowedMatchesReference) {
    Grid grid = MakeRandomGrid(20, 17);
    Kernel kernel = GaussianKernel::build(1.5);   // 13x13

    Grid windowed = convolver_.convolve(grid, kernel, nullptr, ConvolutionMode::WINDOWED);
    Grid reference = convolver_.convolve(grid, kernel, nullptr, ConvolutionMode::REFERENCE);

    EXPECT_LT((windowed - reference).abs().maxCoeff(), 1e-9);
}

TEST_F(MaskedConvolverTest, KernelAsLargeAsGridIsAccepted) {
    Grid grid = MakeRandomGrid(5, 5);
    Kernel kernel = Kernel::Constant(5, 5, 1.0 / 25.0);

    Grid output;
    ASSERT_NO_THROW(output = convolver_.convolve(grid, kernel));
    EXPECT_EQ(output.rows(), 5);
}

TEST_F(MaskedConvolverTest, InputIsNotModified) {
    Grid grid = MakeRandomGrid(6, 6);
    Grid copy = grid;
    Mask mask = Mask::Constant(6, 6, false);
    mask(2, 3) = true;

    convolver_.convolve(grid, MakeCrossKernel(), &mask);

    EXPECT_TRUE((grid == copy).all());
}

// =============================================================================
// Masked convolution
// =============================================================================

TEST_F(MaskedConvolverTest, MaskedCellsPassThrough) {
    Grid grid = MakeRandomGrid(8, 8);
    grid(3, 4) = std::numeric_limits<double>::quiet_NaN();
    grid(0, 0) = -9999.0;

    Mask mask = Mask::Constant(8, 8, false);
    mask(3, 4) = true;
    mask(0, 0) = true;
    mask(7, 2) = true;

    Grid output = convolver_.convolve(grid, GaussianKernel::build(0.9, 2.0), &mask);

    EXPECT_TRUE(std::isnan(output(3, 4)));
    EXPECT_EQ(output(0, 0), -9999.0);
    EXPECT_EQ(output(7, 2), grid(7, 2));
}

TEST_F(MaskedConvolverTest, MaskedNoDataDoesNotLeak) {
    Grid grid = Grid::Constant(9, 9, 5.0);
    grid(4, 4) = std::numeric_limits<double>::quiet_NaN();
    grid(1, 6) = -9999.0;

    Mask mask = Mask::Constant(9, 9, false);
    mask(4, 4) = true;
    mask(1, 6) = true;

    Grid output = convolver_.convolve(grid, GaussianKernel::build(1.0, 2.0), &mask);

    for (Eigen::Index i = 0; i < 9; ++i) {
        for (Eigen::Index j = 0; j < 9; ++j) {
            if (mask(i, j)) continue;
            EXPECT_NEAR(output(i, j), 5.0, 1e-12) << "at (" << i << ", " << j << ")";
        }
    }
}

TEST_F(MaskedConvolverTest, MaskedImpulseConcentratesWeightOnCentre) {
    Grid grid = MakeImpulse(5);
    Mask mask = Mask::Constant(5, 5, false);
    mask(1, 2) = true;
    mask(3, 2) = true;
    mask(2, 1) = true;
    mask(2, 3) = true;

    Grid output = convolver_.convolve(grid, MakeCrossKernel(), &mask);

    // 0.4 of masked mass spread over the 5 unmasked window cells
    EXPECT_GT(output(2, 2), 0.4);
    EXPECT_NEAR(output(2, 2), 0.48, 1e-12);

    // Masked neighbours keep their input value
    EXPECT_EQ(output(1, 2), 0.0);
    EXPECT_EQ(output(2, 3), 0.0);
}

TEST_F(MaskedConvolverTest, EmptyMaskMatchesUnmasked) {
    Grid grid = MakeRandomGrid(10, 13);
    Kernel kernel = GaussianKernel::build(0.9, 3.0);
    Mask mask = Mask::Constant(10, 13, false);

    Grid masked = convolver_.convolve(grid, kernel, &mask);
    Grid unmasked = convolver_.convolve(grid, kernel);

    EXPECT_LT((masked - unmasked).abs().maxCoeff(), 1e-15);
}

// =============================================================================
// Weight redistribution
// =============================================================================

TEST(RedistributeWeightsTest, WorkingKernelSumsToOne) {
    Mask window = Mask::Constant(3, 3, false);
    window(0, 1) = true;
    window(2, 1) = true;
    window(1, 0) = true;
    window(1, 2) = true;

    Kernel working = MaskedConvolver::redistribute_weights(MakeCrossKernel(), window);

    EXPECT_NEAR(working.sum(), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(working(0, 1), 0.0);
    EXPECT_DOUBLE_EQ(working(1, 2), 0.0);
    EXPECT_NEAR(working(1, 1), 0.48, 1e-15);
    EXPECT_NEAR(working(0, 0), 0.13, 1e-15);
    EXPECT_NEAR(working(2, 2), 0.13, 1e-15);
}

TEST(RedistributeWeightsTest, AllOnesKernelWithMaskedCorner) {
    Kernel kernel = Kernel::Ones(3, 3);
    Mask window = Mask::Constant(3, 3, false);
    window(0, 0) = true;

    Kernel working = MaskedConvolver::redistribute_weights(kernel, window);

    EXPECT_DOUBLE_EQ(working(0, 0), 0.0);
    for (Eigen::Index i = 0; i < 3; ++i) {
        for (Eigen::Index j = 0; j < 3; ++j) {
            if (i == 0 && j == 0) continue;
            EXPECT_DOUBLE_EQ(working(i, j), 1.125);
        }
    }
    EXPECT_NEAR(working.sum(), 9.0, 1e-12);
}

TEST(RedistributeWeightsTest, UnmaskedWindowIsUnchanged) {
    Kernel kernel = MakeCrossKernel();
    Mask window = Mask::Constant(3, 3, false);

    Kernel working = MaskedConvolver::redistribute_weights(kernel, window);

    EXPECT_TRUE((working == kernel).all());
}

TEST(RedistributeWeightsTest, FullyMaskedWindowThrows) {
    Mask window = Mask::Constant(3, 3, true);
    EXPECT_THROW(MaskedConvolver::redistribute_weights(MakeCrossKernel(), window),
                 InternalConsistencyError);
}

TEST(RedistributeWeightsTest, ShapeMismatchThrows) {
    Mask window = Mask::Constant(5, 5, false);
    EXPECT_THROW(MaskedConvolver::redistribute_weights(MakeCrossKernel(), window),
                 InvalidInputError);
}

// =============================================================================
// Preconditions
// =============================================================================

TEST_F(MaskedConvolverTest, RejectsEmptyInputs) {
    EXPECT_THROW(convolver_.convolve(Grid(0, 0), MakeCrossKernel()), InvalidInputError);
    EXPECT_THROW(convolver_.convolve(MakeImpulse(5), Kernel(0, 0)), InvalidInputError);
}

TEST_F(MaskedConvolverTest, RejectsKernelLargerThanGrid) {
    Kernel kernel = Kernel::Constant(7, 7, 1.0 / 49.0);
    EXPECT_THROW(convolver_.convolve(MakeImpulse(5), kernel), InvalidInputError);

    Kernel tall = Kernel::Constant(7, 3, 1.0 / 21.0);
    EXPECT_THROW(convolver_.convolve(MakeRandomGrid(6, 10), tall), InvalidInputError);
}

TEST_F(MaskedConvolverTest, RejectsEvenKernel) {
    Kernel kernel = Kernel::Constant(2, 2, 0.25);
    EXPECT_THROW(convolver_.convolve(MakeImpulse(5), kernel), InvalidInputError);

    Kernel wide = Kernel::Constant(3, 4, 1.0 / 12.0);
    EXPECT_THROW(convolver_.convolve(MakeImpulse(5), wide), InvalidInputError);
}

TEST_F(MaskedConvolverTest, RejectsMaskShapeMismatch) {
    Mask mask = Mask::Constant(4, 5, false);
    EXPECT_THROW(convolver_.convolve(MakeImpulse(5), MakeCrossKernel(), &mask), InvalidInputError);
}

TEST_F(MaskedConvolverTest, RejectsMaskWithReferenceMode) {
    Mask mask = Mask::Constant(5, 5, false);
    EXPECT_THROW(convolver_.convolve(MakeImpulse(5), MakeCrossKernel(), &mask,
                                     ConvolutionMode::REFERENCE),
                 InvalidInputError);
}

TEST(MaskedConvolverMemoryTest, EstimatesWorkingBytes) {
    // 12x12 padded doubles plus 10x10 output doubles
    EXPECT_EQ(MaskedConvolver::estimate_working_bytes(10, 10, 3, 3, false),
              144 * sizeof(double) + 100 * sizeof(double));
    EXPECT_EQ(MaskedConvolver::estimate_working_bytes(10, 10, 3, 3, true),
              144 * sizeof(double) + 100 * sizeof(double) + 144 * sizeof(bool));
}

// =============================================================================
// Execution policies
// =============================================================================

TEST_F(MaskedConvolverTest, ParallelMatchesSequential) {
    Grid grid = MakeRandomGrid(64, 48, 7);
    Kernel kernel = GaussianKernel::build(1.3);
    Mask mask = Mask::Constant(64, 48, false);
    mask.block(10, 10, 5, 8).setConstant(true);
    mask(63, 0) = true;

    Grid sequential = convolver_.convolve_parallel(SequentialPolicy{}, grid, kernel, &mask);

    ParallelPolicy policy;
    policy.max_threads = 4;
    Grid parallel = convolver_.convolve_parallel(policy, grid, kernel, &mask);

    for (Eigen::Index i = 0; i < grid.rows(); ++i) {
        for (Eigen::Index j = 0; j < grid.cols(); ++j) {
            EXPECT_DOUBLE_EQ(parallel(i, j), sequential(i, j));
        }
    }
}

TEST_F(MaskedConvolverTest, ParallelDefaultThreadCount) {
    Grid grid = MakeRandomGrid(30, 30, 3);
    Kernel kernel = GaussianKernel::build(0.9);

    Grid sequential = convolver_.convolve(grid, kernel);
    Grid parallel = convolver_.convolve_parallel(ParallelPolicy{}, grid, kernel);

    EXPECT_TRUE((parallel == sequential).all());
}
