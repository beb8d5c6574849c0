#pragma once
#include "ring_cache.hpp"
#include "utils/config.hpp"
#include "utils/eigen_types.hpp"

// Added to the target probability before taking its log, so a target with no mass under
// either distribution costs -log(1e-8) instead of infinity.
constexpr double kProbabilityFloor = 1e-8;

// Row-wise softmax, max-subtracted for numerical stability.
RowMatrixXf softmax_rows(const RowMatrixXf& logits);

// Sum over lanes of -log(prob[l, targets[l]] + kProbabilityFloor).
double token_nll(const RowMatrixXf& prob, const Eigen::VectorXi& targets);

// Blends the base model distribution with what the cache returned for the same step.
//
//   linear: (1 - alpha) * softmax(logits), plus alpha * softmax(theta * scores) scattered onto
//           the cached symbols.
//   global: theta * scores + alpha scattered onto the logits, then one softmax.
//
// The two give different numbers for the same alpha/theta and are kept as separate branches.
class InterpolationPolicy {
public:
    InterpolationPolicy(InterpolationMode mode, float alpha, float theta);
    explicit InterpolationPolicy(const CacheConfig& config);

    // base_logits: [lanes, vocab]. cached may be null (nothing stored yet), in which case
    // the result is exactly softmax_rows(base_logits).
    RowMatrixXf apply(const RowMatrixXf& base_logits, const CacheQuery* cached) const;

    InterpolationMode mode() const { return _mode; }
    float alpha() const { return _alpha; }
    float theta() const { return _theta; }

private:
    RowMatrixXf linear(const RowMatrixXf& base_logits, const CacheQuery& cached) const;
    RowMatrixXf global(const RowMatrixXf& base_logits, const CacheQuery& cached) const;

    InterpolationMode _mode;
    float _alpha;
    float _theta;
};
