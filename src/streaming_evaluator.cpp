#include "streaming_evaluator.hpp"
#include "utils/weight_utils.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {
    // Runs before any member is built, so a bad config never allocates a cache.
    const EvalConfig& validated(const EvalConfig& config, const SequenceModel& model) {
        config.validate();
        if (config.cache.key_dim != model.hidden_dim()) {
            std::ostringstream oss;
            oss << "key_dim " << config.cache.key_dim << " does not match model hidden size " << model.hidden_dim();
            throw std::invalid_argument(oss.str());
        }
        if (config.cache.vocab_size != model.vocab_size()) {
            std::ostringstream oss;
            oss << "vocab_size " << config.cache.vocab_size << " does not match model vocabulary " << model.vocab_size();
            throw std::invalid_argument(oss.str());
        }
        return config;
    }
}

StreamingEvaluator::StreamingEvaluator(const SequenceModel& model, const EvalConfig& config)
    : _model(model),
      _config(validated(config, model)),
      _cache(config.cache, config.batch_size),
      _policy(config.cache) {}

double StreamingEvaluator::run(const BlockDataset& dataset) {
    if (_state != State::Idle) {
        throw std::logic_error("StreamingEvaluator::run called twice; build a new evaluator per run");
    }
    if (dataset.lanes() != _cache.lanes()) {
        std::ostringstream oss;
        oss << "Dataset has " << dataset.lanes() << " lanes, evaluator was configured for " << _cache.lanes();
        throw std::invalid_argument(oss.str());
    }

    _state = State::Running;

    int chunk_idx = 0;
    for (const Chunk& chunk : dataset) {
        evaluate_chunk(chunk);

        if (_config.verbose) {
            std::cerr << "\rchunk " << ++chunk_idx << "/" << dataset.size()
                      << "  ppl " << _loss.perplexity() << std::flush;
        }
    }
    if (_config.verbose) std::cerr << std::endl;

    _state = State::Done;
    return perplexity();
}

double StreamingEvaluator::perplexity() const {
    if (_state != State::Done) {
        throw std::logic_error("StreamingEvaluator::perplexity is only available after run()");
    }
    return _loss.perplexity();
}

void StreamingEvaluator::check_step_output(const StepOutput& out, int T) const {
    if (static_cast<int>(out.hidden.size()) != T || static_cast<int>(out.logits.size()) != T) {
        std::ostringstream oss;
        oss << "Model returned " << out.hidden.size() << " hidden and " << out.logits.size()
            << " logit steps for a chunk of " << T;
        throw std::runtime_error(oss.str());
    }
    for (int t = 0; t < T; ++t) {
        weight_utils::assert_tensor_shape(out.hidden[t], _cache.lanes(), _cache.key_dim(), "model hidden output");
        weight_utils::assert_tensor_shape(out.logits[t], _cache.lanes(), _cache.vocab_size(), "model logits");
    }
}

void StreamingEvaluator::check_targets(const Chunk& chunk) const {
    for (int t = 0; t < chunk.target.rows(); ++t) {
        for (int lane = 0; lane < chunk.target.cols(); ++lane) {
            const int symbol = chunk.target(t, lane);
            if (symbol < 0 || symbol >= _cache.vocab_size()) {
                std::ostringstream oss;
                oss << "Target token " << symbol << " at step " << t << " of lane " << lane
                    << " is outside the vocabulary of size " << _cache.vocab_size();
                throw std::runtime_error(oss.str());
            }
        }
    }
}

void StreamingEvaluator::evaluate_chunk(const Chunk& chunk) {
    const int T = chunk.input.rows();
    // targets are scored and cached without passing through the model
    check_targets(chunk);

    // outs: [T] x [lanes, hid]; the state is carried into the next chunk
    StepOutput out = _model.step(chunk.input, std::move(_model_state));
    check_step_output(out, T);
    _model_state = std::move(out.state);

    for (int t = 0; t < T; ++t) {
        const RowMatrixXf& hidden = out.hidden[t];
        Eigen::VectorXi targets = chunk.target.row(t).transpose();

        RowMatrixXf prob;
        if (_cache.stored() > 0) {  // only interpolate after first step
            CacheQuery cached = _cache.query(hidden);
            prob = _policy.apply(out.logits[t], &cached);
        } else {
            prob = _policy.apply(out.logits[t], nullptr);
        }

        _loss.add(token_nll(prob, targets), targets.size());
        _cache.insert(hidden, targets);
    }
}
