#include "interpolation.hpp"
#include "scatter_add.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

RowMatrixXf softmax_rows(const RowMatrixXf& logits) {
    RowMatrixXf result(logits.rows(), logits.cols());
    for (int i = 0; i < logits.rows(); ++i) {
        Eigen::RowVectorXf exp_x = (logits.row(i).array() - logits.row(i).maxCoeff()).exp();  // for numerical stability
        result.row(i) = exp_x / exp_x.sum();
    }
    return result;
}

double token_nll(const RowMatrixXf& prob, const Eigen::VectorXi& targets) {
    if (targets.size() != prob.rows()) {
        std::ostringstream oss;
        oss << "token_nll: " << targets.size() << " targets for " << prob.rows() << " lanes";
        throw std::runtime_error(oss.str());
    }

    double nll = 0.0;
    for (int lane = 0; lane < prob.rows(); ++lane) {
        if (targets(lane) < 0 || targets(lane) >= prob.cols()) {
            std::ostringstream oss;
            oss << "token_nll: target " << targets(lane) << " of lane " << lane
                << " is outside the vocabulary of size " << prob.cols();
            throw std::runtime_error(oss.str());
        }
        nll -= std::log(static_cast<double>(prob(lane, targets(lane))) + kProbabilityFloor);
    }
    return nll;
}

InterpolationPolicy::InterpolationPolicy(InterpolationMode mode, float alpha, float theta)
    : _mode(mode), _alpha(alpha), _theta(theta) {}

InterpolationPolicy::InterpolationPolicy(const CacheConfig& config)
    : InterpolationPolicy(config.mode, config.alpha, config.theta) {}

RowMatrixXf InterpolationPolicy::apply(const RowMatrixXf& base_logits, const CacheQuery* cached) const {
    // First step of a session: nothing to interpolate with.
    if (cached == nullptr || cached->width() == 0) {
        return softmax_rows(base_logits);
    }

    switch (_mode) {
        case InterpolationMode::Linear: return linear(base_logits, *cached);
        case InterpolationMode::Global: return global(base_logits, *cached);
    }
    throw std::invalid_argument("Invalid InterpolationMode value");
}

RowMatrixXf InterpolationPolicy::linear(const RowMatrixXf& base_logits, const CacheQuery& cached) const {
    RowMatrixXf prob = (1.0f - _alpha) * softmax_rows(base_logits);
    RowMatrixXf cache_prob = _alpha * softmax_rows(_theta * cached.scores);
    scatter_add(prob, cached.symbols, cache_prob);
    return prob;
}

RowMatrixXf InterpolationPolicy::global(const RowMatrixXf& base_logits, const CacheQuery& cached) const {
    RowMatrixXf logits = base_logits;
    RowMatrixXf cache_logits = ((_theta * cached.scores).array() + _alpha).matrix();
    scatter_add(logits, cached.symbols, cache_logits);
    return softmax_rows(logits);
}
