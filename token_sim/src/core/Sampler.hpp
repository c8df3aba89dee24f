#pragma once

#include "Types.hpp"
#include "utils/Random.hpp"
#include <memory>
#include <vector>

namespace tokensim {

    // Source of stochastic draws for every component of one economy.
    // Deterministic once seeded.
    class Sampler {
    public:
        virtual ~Sampler() = default;

        virtual std::vector<double> sample(DistributionKind kind,
            const DistributionParams& params,
            size_t count) = 0;

        virtual void seed(uint64_t seed) = 0;

        virtual std::unique_ptr<Sampler> clone() const = 0;

        double sampleOne(DistributionKind kind, const DistributionParams& params) {
            return sample(kind, params, 1).front();
        }

        double sampleOne(const Distribution& dist) {
            return sampleOne(dist.kind, dist.params);
        }

        std::vector<double> sample(const Distribution& dist, size_t count) {
            return sample(dist.kind, dist.params, count);
        }

        // Mean of `count` draws
        double sampleMean(const Distribution& dist, size_t count);
    };

    // Sampler backed by the standard library distributions
    class RandomSampler : public Sampler {
    public:
        explicit RandomSampler(uint64_t seed = 5489u) : random_(seed) {}

        using Sampler::sample;

        std::vector<double> sample(DistributionKind kind,
            const DistributionParams& params,
            size_t count) override;

        void seed(uint64_t seed) override { random_.seed(seed); }

        std::unique_ptr<Sampler> clone() const override {
            return std::make_unique<RandomSampler>(*this);
        }

    private:
        Random random_;

        double draw(DistributionKind kind, const DistributionParams& params);
    };

    // Throws ConfigurationError for parameters a distribution cannot take
    void validateDistribution(DistributionKind kind, const DistributionParams& params);

    inline void validateDistribution(const Distribution& dist) {
        validateDistribution(dist.kind, dist.params);
    }

} // namespace tokensim
