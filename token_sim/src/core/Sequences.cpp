#include "Sequences.hpp"
#include <algorithm>
#include <cmath>

namespace tokensim {

    std::vector<double> Sequences::linspace(double start, double stop, size_t num) {
        std::vector<double> out;
        if (num == 0) return out;
        out.reserve(num);
        if (num == 1) {
            out.push_back(start);
            return out;
        }

        double step = (stop - start) / static_cast<double>(num - 1);
        for (size_t i = 0; i < num; ++i) {
            out.push_back(start + step * static_cast<double>(i));
        }
        out.back() = stop;
        return out;
    }

    std::vector<double> Sequences::geomspace(double start, double stop, size_t num) {
        if (start <= 0.0 || stop <= 0.0) {
            throw ConfigurationError("geomspace needs positive start and stop");
        }
        auto exps = linspace(std::log(start), std::log(stop), num);
        for (auto& x : exps) x = std::exp(x);
        if (!exps.empty()) {
            exps.front() = start;
            if (num > 1) exps.back() = stop;
        }
        return exps;
    }

    std::vector<double> Sequences::logspace(double start, double stop, size_t num) {
        auto exps = linspace(start, stop, num);
        for (auto& x : exps) x = std::pow(10.0, x);
        return exps;
    }

    std::vector<double> Sequences::logSaturatedSpace(double start, double stop, size_t num) {
        if (start <= 0.0 || stop <= 0.0) {
            throw ConfigurationError("log saturated space needs positive start and stop");
        }
        auto spaces = linspace(start, stop, num);
        if (spaces.empty()) return spaces;
        for (auto& x : spaces) x = std::log(x);

        double maxVal = *std::max_element(spaces.begin(), spaces.end());
        if (maxVal <= 0.0) {
            throw ConfigurationError("log saturated space degenerates for start/stop <= 1");
        }
        for (auto& x : spaces) x = x / maxVal * (stop + start);
        return spaces;
    }

    std::vector<double> Sequences::logisticSaturatedSpace(double start, double stop, size_t num,
        double steepness, double takeoff) {
        if (stop == 0.0) {
            throw ConfigurationError("logistic saturated space needs a non-zero stop");
        }
        auto original = linspace(start, stop, num);
        auto shift = linspace(-6.0, 6.0, num);
        if (original.empty()) return original;

        std::vector<double> spaces(num);
        for (size_t i = 0; i < num; ++i) {
            double x = steepness * (original[i] / stop + shift[i] + takeoff);
            spaces[i] = 1.0 / (1.0 + std::exp(-x));
        }

        double maxVal = *std::max_element(spaces.begin(), spaces.end());
        for (auto& x : spaces) x = x / maxVal * (stop + start);
        return spaces;
    }

    std::vector<double> Sequences::generate(SpaceFunction fn, double start, double stop, size_t num) {
        switch (fn) {
        case SpaceFunction::LINEAR: return linspace(start, stop, num);
        case SpaceFunction::GEOMETRIC: return geomspace(start, stop, num);
        case SpaceFunction::LOGARITHMIC: return logspace(start, stop, num);
        case SpaceFunction::LOG_SATURATED: return logSaturatedSpace(start, stop, num);
        case SpaceFunction::LOGISTIC: return logisticSaturatedSpace(start, stop, num);
        }
        return linspace(start, stop, num);
    }

    std::vector<double> Sequences::rounded(std::vector<double> values) {
        for (auto& v : values) v = std::nearbyint(v);
        return values;
    }

} // namespace tokensim
