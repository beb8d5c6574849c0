#pragma once
#include "block_dataset.hpp"
#include "interpolation.hpp"
#include "loss_statistics.hpp"
#include "ring_cache.hpp"
#include "sequence_model.hpp"
#include "utils/config.hpp"

// One cache-augmented evaluation pass over a dataset: Idle -> Running -> Done.
//
// Per chunk the model is called once and its recurrent state carried over to the next chunk.
// Per time step, in order: query the cache, interpolate, score the true target, then insert
// (hidden, true target). The cache always holds ground truth, never model predictions.
//
// Single use. Build a new evaluator for a new run.
class StreamingEvaluator {
public:
    enum class State { Idle, Running, Done };

    StreamingEvaluator(const SequenceModel& model, const EvalConfig& config);

    // Returns the perplexity. Only callable once, from Idle.
    double run(const BlockDataset& dataset);

    // exp(total_nll / total_tokens), once Done.
    double perplexity() const;

    State state() const { return _state; }

private:
    void evaluate_chunk(const Chunk& chunk);
    void check_step_output(const StepOutput& out, int T) const;
    void check_targets(const Chunk& chunk) const;

    const SequenceModel& _model;
    const EvalConfig _config;

    RingCache _cache;
    InterpolationPolicy _policy;
    LossStatistics _loss;
    ModelState _model_state;

    State _state = State::Idle;
};
