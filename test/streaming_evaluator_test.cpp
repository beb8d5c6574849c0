#include <gtest/gtest.h>
#include "streaming_evaluator.hpp"
#include "scripted_model.hpp"

#include <cmath>
#include <vector>

namespace {
    // vocab 3, hidden size 1; every token maps to hidden [1], logits are all zero (uniform)
    ScriptedModel uniform_model() {
        return ScriptedModel(Eigen::MatrixXf::Ones(3, 1), Eigen::MatrixXf::Zero(3, 3));
    }

    EvalConfig small_config(InterpolationMode mode, int bptt) {
        EvalConfig config;
        config.cache.cache_capacity = 10;
        config.cache.key_dim = 1;
        config.cache.vocab_size = 3;
        config.cache.alpha = 0.5f;
        config.cache.theta = 1.0f;
        config.cache.mode = mode;
        config.batch_size = 1;
        config.bptt = bptt;
        return config;
    }
}

TEST(StreamingEvaluatorTest, RejectsMismatchedConfiguration) {
    ScriptedModel model = uniform_model();

    EvalConfig config = small_config(InterpolationMode::Linear, 2);
    config.cache.key_dim = 2;
    EXPECT_THROW(StreamingEvaluator(model, config), std::invalid_argument);

    config = small_config(InterpolationMode::Linear, 2);
    config.cache.vocab_size = 4;
    EXPECT_THROW(StreamingEvaluator(model, config), std::invalid_argument);

    config = small_config(InterpolationMode::Linear, 2);
    config.cache.cache_capacity = 0;
    EXPECT_THROW(StreamingEvaluator(model, config), std::invalid_argument);
}

TEST(StreamingEvaluatorTest, StateMachine) {
    ScriptedModel model = uniform_model();
    BlockDataset dataset({0, 1, 2, 1, 0}, 1, 2);
    StreamingEvaluator evaluator(model, small_config(InterpolationMode::Linear, 2));

    EXPECT_EQ(evaluator.state(), StreamingEvaluator::State::Idle);
    EXPECT_THROW(evaluator.perplexity(), std::logic_error);

    double ppl = evaluator.run(dataset);

    EXPECT_EQ(evaluator.state(), StreamingEvaluator::State::Done);
    EXPECT_DOUBLE_EQ(evaluator.perplexity(), ppl);
    EXPECT_THROW(evaluator.run(dataset), std::logic_error);
}

// tokens [0, 1, 1]: step 0 is scored on the base model alone, step 1 sees symbol 1 in the cache
TEST(StreamingEvaluatorTest, LinearMatchesHandComputation) {
    ScriptedModel model = uniform_model();
    BlockDataset dataset({0, 1, 1}, 1, 2);

    StreamingEvaluator evaluator(model, small_config(InterpolationMode::Linear, 2));
    double ppl = evaluator.run(dataset);

    // one cached slot, so the cache softmax puts everything on symbol 1
    double step0 = -std::log(1.0 / 3.0 + kProbabilityFloor);
    double step1 = -std::log(0.5 / 3.0 + 0.5 + kProbabilityFloor);
    EXPECT_NEAR(ppl, std::exp((step0 + step1) / 2.0), 1e-5);
}

TEST(StreamingEvaluatorTest, GlobalMatchesHandComputation) {
    ScriptedModel model = uniform_model();
    BlockDataset dataset({0, 1, 1}, 1, 2);

    StreamingEvaluator evaluator(model, small_config(InterpolationMode::Global, 2));
    double ppl = evaluator.run(dataset);

    // symbol 1 logit becomes theta * (1 * 1) + alpha = 1.5
    double step0 = -std::log(1.0 / 3.0 + kProbabilityFloor);
    double step1 = -std::log(std::exp(1.5) / (2.0 + std::exp(1.5)) + kProbabilityFloor);
    EXPECT_NEAR(ppl, std::exp((step0 + step1) / 2.0), 1e-5);
}

TEST(StreamingEvaluatorTest, ZeroAlphaLinearIsBaseModel) {
    ScriptedModel model = uniform_model();
    BlockDataset dataset({0, 1, 2, 2, 1, 0, 0, 1, 2, 1, 1}, 1, 3);

    EvalConfig config = small_config(InterpolationMode::Linear, 3);
    config.cache.alpha = 0.0f;
    StreamingEvaluator evaluator(model, config);

    EXPECT_NEAR(evaluator.run(dataset), 3.0, 1e-4);
}

TEST(StreamingEvaluatorTest, CacheSurvivesChunkBoundaries) {
    std::vector<int> tokens = {0, 1, 1, 2, 1, 0, 2, 2, 1};

    std::vector<double> results;
    for (int bptt : {1, 2, 3, 8}) {
        ScriptedModel model = uniform_model();
        BlockDataset dataset(tokens, 1, bptt);
        StreamingEvaluator evaluator(model, small_config(InterpolationMode::Linear, bptt));
        results.push_back(evaluator.run(dataset));
    }

    for (double ppl : results) EXPECT_NEAR(ppl, results.front(), 1e-5);
}

TEST(StreamingEvaluatorTest, ThreadsModelStateAcrossChunks) {
    ScriptedModel model = uniform_model();
    BlockDataset dataset(std::vector<int>(8, 1), 1, 2);  // 7 targets -> 4 chunks
    StreamingEvaluator evaluator(model, small_config(InterpolationMode::Linear, 2));

    evaluator.run(dataset);

    EXPECT_EQ(model.seen_states, (std::vector<int>{-1, 1, 2, 3}));
}

TEST(StreamingEvaluatorTest, CachesTheTrueTargets) {
    // the base model is confidently wrong: it always bets on symbol 0
    Eigen::MatrixXf hidden(3, 2);
    hidden << 1.0f, 0.0f,
              0.0f, 1.0f,
              1.0f, 0.0f;
    Eigen::MatrixXf logits = Eigen::MatrixXf::Zero(3, 3);
    logits.col(0).setConstant(5.0f);
    ScriptedModel model(hidden, logits);

    // half the targets are 2, which only the cache can pick up
    BlockDataset dataset({0, 2, 0, 2, 0, 2, 0, 2}, 1, 4);

    EvalConfig no_cache;
    no_cache.cache = CacheConfig{.cache_capacity = 4, .key_dim = 2, .vocab_size = 3, .alpha = 0.0f, .theta = 1.0f};
    no_cache.batch_size = 1;
    no_cache.bptt = 4;

    EvalConfig with_cache = no_cache;
    with_cache.cache.alpha = 0.9f;

    double base = StreamingEvaluator(model, no_cache).run(dataset);
    double cached = StreamingEvaluator(model, with_cache).run(dataset);
    EXPECT_LT(cached, base);
}

TEST(StreamingEvaluatorTest, KeepsLanesApart) {
    ScriptedModel model = uniform_model();
    // lane 0 only ever sees 0 -> 1, lane 1 only 2 -> 2
    BlockDataset two_lanes({0, 1, 0, 1, 2, 2, 2, 2}, 2, 2);
    BlockDataset lane0({0, 1, 0, 1}, 1, 2);
    BlockDataset lane1({2, 2, 2, 2}, 1, 2);

    EvalConfig config = small_config(InterpolationMode::Global, 2);
    double joint = StreamingEvaluator(model, EvalConfig{config.cache, 2, 2, false}).run(two_lanes);
    double ppl0 = StreamingEvaluator(model, config).run(lane0);
    double ppl1 = StreamingEvaluator(model, config).run(lane1);

    // same number of targets per lane, so the joint log-ppl is the mean of the two
    EXPECT_NEAR(std::log(joint), 0.5 * (std::log(ppl0) + std::log(ppl1)), 1e-5);
}

TEST(StreamingEvaluatorTest, RejectsDatasetWithWrongLaneCount) {
    ScriptedModel model = uniform_model();
    BlockDataset dataset({0, 1, 2, 1, 0, 1}, 2, 2);
    StreamingEvaluator evaluator(model, small_config(InterpolationMode::Linear, 2));

    EXPECT_THROW(evaluator.run(dataset), std::invalid_argument);
}

namespace {
    class ShortModel : public SequenceModel {
    public:
        StepOutput step(const RowMatrixXi& inputs, ModelState state) const override {
            StepOutput out;
            out.hidden.push_back(RowMatrixXf::Zero(inputs.cols(), 1));
            out.logits.push_back(RowMatrixXf::Zero(inputs.cols(), 3));
            out.state = state;
            return out;
        }
        int hidden_dim() const override { return 1; }
        int vocab_size() const override { return 3; }
    };
}

TEST(StreamingEvaluatorTest, RejectsModelOutputOfWrongLength) {
    ShortModel model;
    BlockDataset dataset({0, 1, 2, 1}, 1, 3);
    StreamingEvaluator evaluator(model, small_config(InterpolationMode::Linear, 3));

    EXPECT_THROW(evaluator.run(dataset), std::runtime_error);
}

// inputs 0, 1, 2, 1 are all in the vocabulary; only the last target is not
TEST(StreamingEvaluatorTest, RejectsTargetOutsideVocabulary) {
    ScriptedModel model = uniform_model();
    BlockDataset dataset({0, 1, 2, 1, 100000}, 1, 2);
    StreamingEvaluator evaluator(model, small_config(InterpolationMode::Linear, 2));

    EXPECT_THROW(evaluator.run(dataset), std::runtime_error);
}

TEST(StreamingEvaluatorTest, RejectsNegativeTarget) {
    ScriptedModel model = uniform_model();
    BlockDataset dataset({0, 1, -1}, 1, 4);
    StreamingEvaluator evaluator(model, small_config(InterpolationMode::Global, 4));

    EXPECT_THROW(evaluator.run(dataset), std::runtime_error);
}
