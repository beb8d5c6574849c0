#include "grid_search.hpp"
#include "streaming_evaluator.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

std::vector<GridResult> grid_search(const SequenceModel& model, const BlockDataset& dataset,
                                    const EvalConfig& base, const GridSpec& spec) {
    if (spec.theta_steps <= 0 || spec.alpha_steps <= 0) {
        throw std::invalid_argument("grid_search: theta_steps and alpha_steps must be > 0");
    }

    std::vector<GridResult> results;
    results.reserve(static_cast<size_t>(spec.theta_steps) * spec.alpha_steps);

    for (int i = 0; i < spec.theta_steps; ++i) {
        for (int j = 0; j < spec.alpha_steps; ++j) {
            // from the integer index, so 0.1 * 7 doesn't drift like seven additions would
            EvalConfig config = base;
            config.cache.theta = i * spec.theta_step;
            config.cache.alpha = j * spec.alpha_step;

            StreamingEvaluator evaluator(model, config);
            double ppl = evaluator.run(dataset);
            results.push_back(GridResult{
                .theta = config.cache.theta,
                .alpha = config.cache.alpha,
                .perplexity = ppl
            });

            if (base.verbose) {
                std::cerr << "theta=" << config.cache.theta << " alpha=" << config.cache.alpha
                          << " ppl=" << ppl << std::endl;
            }
        }
    }
    return results;
}

std::string format_grid_table(const std::vector<GridResult>& results) {
    std::ostringstream oss;
    oss << std::left << std::setw(8) << "theta" << std::setw(8) << "alpha" << "ppl\n";
    oss << std::fixed;
    for (const auto& result : results) {
        oss << std::setw(8) << std::setprecision(1) << result.theta
            << std::setw(8) << std::setprecision(2) << result.alpha
            << std::setprecision(4) << result.perplexity << "\n";
    }
    return oss.str();
}
