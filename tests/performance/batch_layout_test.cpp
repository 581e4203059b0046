// File: tests/performance/batch_layout_test.cpp
#include "performance/batch_layout.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace resonance;

TEST(BatchLayoutTest, TransposesPatternMajor) {
    BatchMatrix rows{{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}};
    BatchMatrix columns = BatchLayout::ToDimensionMajor(rows);

    ASSERT_EQ(3u, columns.size());
    ASSERT_EQ(2u, columns[0].size());
    EXPECT_DOUBLE_EQ(1.0, columns[0][0]);
    EXPECT_DOUBLE_EQ(4.0, columns[0][1]);
    EXPECT_DOUBLE_EQ(6.0, columns[2][1]);

    EXPECT_EQ(rows, BatchLayout::ToPatternMajor(columns));
}

TEST(BatchLayoutTest, AcceptsPatterns) {
    std::vector<Pattern> patterns{Pattern{0.1, 0.2}, Pattern{0.3, 0.4}};
    BatchMatrix columns = BatchLayout::ToDimensionMajor(patterns);
    ASSERT_EQ(2u, columns.size());
    EXPECT_DOUBLE_EQ(0.3, columns[0][1]);
}

TEST(BatchLayoutTest, RejectsEmptyAndRagged) {
    EXPECT_THROW(BatchLayout::ToDimensionMajor(BatchMatrix{}), std::invalid_argument);
    EXPECT_THROW(BatchLayout::ToDimensionMajor(BatchMatrix(1, std::vector<double>{})), std::invalid_argument);
    EXPECT_THROW(BatchLayout::ToDimensionMajor(BatchMatrix{{1.0, 2.0}, {1.0}}),
                 std::invalid_argument);
    EXPECT_THROW(BatchLayout::ToPatternMajor(BatchMatrix{{1.0, 2.0}, {1.0}}),
                 std::invalid_argument);
    EXPECT_THROW(DimensionMajorBatch batch(std::vector<Pattern>{}), std::invalid_argument);
}

TEST(DimensionMajorBatchTest, ShapeAndRows) {
    DimensionMajorBatch batch(BatchMatrix{{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});
    EXPECT_EQ(3u, batch.BatchSize());
    EXPECT_EQ(2u, batch.Dimension());
    EXPECT_DOUBLE_EQ(5.0, batch.Row(0)[2]);
    EXPECT_THROW(batch.Row(2), std::out_of_range);
}

TEST(DimensionMajorBatchTest, EachStageMatchesScalarHelper) {
    BatchMatrix input{{0.2, 0.9}, {0.5, 0.0}};
    DimensionMajorBatch batch(input);

    batch.ApplyDrivingStrength(1.5);
    batch.ApplyShuntingStep(0.3, 1.0, 0.01);
    batch.ApplySaturation(1.0, 0.0);
    BatchMatrix out = batch.ToPatterns();

    for (size_t i = 0; i < input.size(); ++i) {
        for (size_t d = 0; d < input[i].size(); ++d) {
            double x = ShuntingDynamics::Drive(input[i][d], 1.5);
            x = ShuntingDynamics::Integrate(x, 0.3, 1.0, 0.01);
            x = ShuntingDynamics::Saturate(x, 1.0, 0.0);
            EXPECT_DOUBLE_EQ(x, out[i][d]);
        }
    }
}

TEST(ShuntingDynamicsTest, StepStaysWithinBounds) {
    ShuntingParameters params;
    params.driving_strength = 10.0;
    ShuntingDynamics dynamics(params);

    auto out = dynamics.Step({0.0, 0.5, 1.0, -0.2});
    for (double x : out) {
        EXPECT_GE(x, params.floor);
        EXPECT_LE(x, params.ceiling);
    }
    EXPECT_DOUBLE_EQ(0.0, out[0]);
    EXPECT_DOUBLE_EQ(0.0, out[3]);
}

TEST(ShuntingDynamicsTest, InvalidParametersRejected) {
    ShuntingParameters params;
    params.floor = 1.0;
    EXPECT_FALSE(params.IsValid());
    EXPECT_THROW(ShuntingDynamics dynamics(params), std::invalid_argument);

    params = ShuntingParameters{};
    params.time_step = 0.0;
    EXPECT_THROW(ShuntingDynamics dynamics(params), std::invalid_argument);
}
