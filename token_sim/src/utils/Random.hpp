#pragma once

#include <random>
#include <cmath>
#include <cstdint>

namespace tokensim {

// Seedable random engine. One instance per economy so repetitions running on
// different threads never share generator state.
class Random {
public:
    explicit Random(uint64_t seed = 5489u) : engine_(seed) {}

    // Fresh nondeterministic seed
    static uint64_t entropySeed() {
        std::random_device rd;
        return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
    }

    void seed(uint64_t s) { engine_.seed(s); }

    // Uniform distribution [min, max)
    double uniform(double min, double max) {
        std::uniform_real_distribution<double> dist(min, max);
        return dist(engine_);
    }

    // Normal distribution
    double normal(double mean, double stddev) {
        std::normal_distribution<double> dist(mean, stddev);
        return dist(engine_);
    }

    // Log-normal distribution
    double logNormal(double mean, double stddev) {
        std::lognormal_distribution<double> dist(mean, stddev);
        return dist(engine_);
    }

    // Exponential distribution
    double exponential(double lambda) {
        std::exponential_distribution<double> dist(lambda);
        return dist(engine_);
    }

    // Poisson distribution
    int64_t poisson(double lambda) {
        if (lambda <= 0.0) return 0;
        std::poisson_distribution<int64_t> dist(lambda);
        return dist(engine_);
    }

    // Binomial distribution
    int64_t binomial(int64_t trials, double p) {
        if (trials <= 0) return 0;
        std::binomial_distribution<int64_t> dist(trials, p);
        return dist(engine_);
    }

    // Student-t distribution
    double studentT(double degreesOfFreedom) {
        std::student_t_distribution<double> dist(degreesOfFreedom);
        return dist(engine_);
    }

private:
    std::mt19937_64 engine_;
};

} // namespace tokensim
