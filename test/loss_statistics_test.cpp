#include <gtest/gtest.h>
#include "loss_statistics.hpp"

#include <cmath>

TEST(LossStatisticsTest, PerplexityOfUniformGuessIsVocabSize) {
    LossStatistics loss;
    for (int i = 0; i < 5; ++i) loss.add(4 * std::log(10.0), 4);

    EXPECT_EQ(loss.total_tokens(), 20);
    EXPECT_NEAR(loss.perplexity(), 10.0, 1e-9);
}

TEST(LossStatisticsTest, WeightsBatchesByTokenCount) {
    LossStatistics loss;
    loss.add(1.0, 1);
    loss.add(3.0, 3);

    EXPECT_DOUBLE_EQ(loss.total_nll(), 4.0);
    EXPECT_NEAR(loss.perplexity(), std::exp(1.0), 1e-12);
}

TEST(LossStatisticsTest, EmptyHasNoPerplexity) {
    LossStatistics loss;
    EXPECT_THROW(loss.perplexity(), std::logic_error);
    EXPECT_THROW(loss.add(1.0, -1), std::invalid_argument);
}
