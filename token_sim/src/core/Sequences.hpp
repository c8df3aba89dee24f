#pragma once

#include "Types.hpp"
#include <vector>

namespace tokensim {

    // Deterministic schedule generators
    class Sequences {
    public:
        static std::vector<double> linspace(double start, double stop, size_t num);

        // Geometric progression; start and stop must be positive
        static std::vector<double> geomspace(double start, double stop, size_t num);

        // 10^x for x in linspace(start, stop)
        static std::vector<double> logspace(double start, double stop, size_t num);

        // log(linspace) normalised by its maximum, scaled to start + stop
        static std::vector<double> logSaturatedSpace(double start, double stop, size_t num);

        // Logistic curve normalised by its maximum, scaled to start + stop
        static std::vector<double> logisticSaturatedSpace(double start, double stop, size_t num,
            double steepness = 1.0, double takeoff = 0.0);

        static std::vector<double> generate(SpaceFunction fn, double start, double stop, size_t num);

        static std::vector<double> rounded(std::vector<double> values);
    };

} // namespace tokensim
