#include "Sampler.hpp"
#include <cmath>
#include <numeric>

namespace tokensim {

    double Sampler::sampleMean(const Distribution& dist, size_t count) {
        if (count == 0) return 0.0;
        auto draws = sample(dist, count);
        return std::accumulate(draws.begin(), draws.end(), 0.0) / draws.size();
    }

    void validateDistribution(DistributionKind kind, const DistributionParams& params) {
        switch (kind) {
        case DistributionKind::CONSTANT:
            break;
        case DistributionKind::NORMAL:
        case DistributionKind::UNIFORM:
        case DistributionKind::EXPONENTIAL:
            if (!(params.scale > 0.0)) {
                throw ConfigurationError("Distribution scale must be positive");
            }
            break;
        case DistributionKind::LOGNORMAL:
        case DistributionKind::STUDENT_T:
            if (!(params.scale > 0.0) || !(params.shape > 0.0)) {
                throw ConfigurationError("Distribution scale and shape must be positive");
            }
            break;
        case DistributionKind::POISSON:
            if (params.mu < 0.0) {
                throw ConfigurationError("Poisson mu must be non-negative");
            }
            break;
        case DistributionKind::BINOMIAL:
            if (params.n < 0 || params.p < 0.0 || params.p > 1.0) {
                throw ConfigurationError("Binomial needs n >= 0 and p in [0, 1]");
            }
            break;
        }
    }

    std::vector<double> RandomSampler::sample(DistributionKind kind,
        const DistributionParams& params,
        size_t count) {
        validateDistribution(kind, params);

        std::vector<double> out;
        out.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            out.push_back(draw(kind, params));
        }
        return out;
    }

    double RandomSampler::draw(DistributionKind kind, const DistributionParams& params) {
        switch (kind) {
        case DistributionKind::CONSTANT:
            return params.loc;
        case DistributionKind::NORMAL:
            return random_.normal(params.loc, params.scale);
        case DistributionKind::LOGNORMAL:
            return params.loc + params.scale * random_.logNormal(0.0, params.shape);
        case DistributionKind::UNIFORM:
            return random_.uniform(params.loc, params.loc + params.scale);
        case DistributionKind::EXPONENTIAL:
            return params.loc + random_.exponential(1.0 / params.scale);
        case DistributionKind::POISSON:
            return static_cast<double>(random_.poisson(params.mu));
        case DistributionKind::BINOMIAL:
            return static_cast<double>(random_.binomial(params.n, params.p));
        case DistributionKind::STUDENT_T:
            return params.loc + params.scale * random_.studentT(params.shape);
        }
        return 0.0;
    }

} // namespace tokensim
