#include "loss_statistics.hpp"

#include <cmath>
#include <stdexcept>

void LossStatistics::add(double nll, long tokens) {
    if (tokens < 0) throw std::invalid_argument("LossStatistics: negative token count");
    _total_nll += nll;
    _total_tokens += tokens;
}

double LossStatistics::perplexity() const {
    if (_total_tokens == 0) throw std::logic_error("LossStatistics: perplexity of zero tokens");
    return std::exp(_total_nll / static_cast<double>(_total_tokens));
}
