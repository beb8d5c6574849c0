#include <gtest/gtest.h>
#include "scatter_add.hpp"

#include <random>

TEST(ScatterAddTest, RepeatedSymbolAccumulates) {
    RowMatrixXf target = RowMatrixXf::Zero(1, 4);
    RowMatrixXi index(1, 3);
    index << 2, 0, 2;
    RowMatrixXf src(1, 3);
    src << 0.25f, 1.0f, 0.5f;

    scatter_add(target, index, src);

    EXPECT_FLOAT_EQ(target(0, 2), 0.75f);
    EXPECT_FLOAT_EQ(target(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(target(0, 1), 0.0f);
    EXPECT_FLOAT_EQ(target(0, 3), 0.0f);
}

TEST(ScatterAddTest, AddsOntoExistingValues) {
    RowMatrixXf target(2, 3);
    target << 1.0f, 2.0f, 3.0f,
              4.0f, 5.0f, 6.0f;
    RowMatrixXi index(2, 2);
    index << 0, 1,
             2, 2;
    RowMatrixXf src(2, 2);
    src << 10.0f, 20.0f,
           30.0f, 40.0f;

    scatter_add(target, index, src);

    RowMatrixXf expected(2, 3);
    expected << 11.0f, 22.0f, 3.0f,
                4.0f, 5.0f, 76.0f;
    EXPECT_TRUE(target == expected);
}

// the same symbol in two lanes must land in two different rows
TEST(ScatterAddTest, LanesStaySeparate) {
    RowMatrixXf target = RowMatrixXf::Zero(3, 5);
    RowMatrixXi index = RowMatrixXi::Constant(3, 1, 4);
    RowMatrixXf src(3, 1);
    src << 1.0f, 2.0f, 3.0f;

    scatter_add(target, index, src);

    EXPECT_FLOAT_EQ(target(0, 4), 1.0f);
    EXPECT_FLOAT_EQ(target(1, 4), 2.0f);
    EXPECT_FLOAT_EQ(target(2, 4), 3.0f);
    EXPECT_FLOAT_EQ(target.sum(), 6.0f);
}

TEST(ScatterAddTest, FlattenedMatchesNestedLoop) {
    std::mt19937 rng(1234);
    const int lanes = 7, vocab = 13, width = 40;
    std::uniform_int_distribution<int> symbol(0, vocab - 1);

    RowMatrixXi index(lanes, width);
    for (int i = 0; i < lanes; ++i)
        for (int j = 0; j < width; ++j) index(i, j) = symbol(rng);

    RowMatrixXf src = RowMatrixXf::Random(lanes, width);
    RowMatrixXf base = RowMatrixXf::Random(lanes, vocab);

    RowMatrixXf flat = base;
    RowMatrixXf nested = base;
    scatter_add(flat, index, src);
    scatter_add_naive(nested, index, src);

    EXPECT_TRUE(flat.isApprox(nested, 1e-6f));
}

TEST(ScatterAddTest, ZeroWidthIsNoop) {
    RowMatrixXf target = RowMatrixXf::Random(2, 6);
    RowMatrixXf before = target;

    scatter_add(target, RowMatrixXi(2, 0), RowMatrixXf(2, 0));

    EXPECT_TRUE(target == before);
}

TEST(ScatterAddTest, ShapeMismatchThrows) {
    RowMatrixXf target = RowMatrixXf::Zero(2, 5);

    EXPECT_THROW(scatter_add(target, RowMatrixXi::Zero(3, 2), RowMatrixXf::Zero(3, 2)), std::runtime_error);
    EXPECT_THROW(scatter_add(target, RowMatrixXi::Zero(2, 2), RowMatrixXf::Zero(2, 3)), std::runtime_error);
    EXPECT_THROW(scatter_add_naive(target, RowMatrixXi::Zero(2, 2), RowMatrixXf::Zero(1, 2)), std::runtime_error);
}
