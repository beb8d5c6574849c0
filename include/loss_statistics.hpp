#pragma once

// Running negative log-likelihood over a session, reduced to perplexity.
class LossStatistics {
public:
    // nll: summed over the tokens being added, not averaged
    void add(double nll, long tokens);

    // exp(total_nll / total_tokens). Throws when nothing was added.
    double perplexity() const;

    double total_nll() const { return _total_nll; }
    long total_tokens() const { return _total_tokens; }

private:
    double _total_nll = 0.0;
    long _total_tokens = 0;
};
