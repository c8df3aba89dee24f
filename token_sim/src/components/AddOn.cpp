#include "AddOn.hpp"
#include <algorithm>
#include <cmath>

namespace tokensim {

    AddOnChain::AddOnChain(const AddOnChain& other) {
        addOns_.reserve(other.addOns_.size());
        for (const auto& a : other.addOns_) {
            addOns_.push_back(a->clone());
        }
    }

    AddOnChain& AddOnChain::operator=(const AddOnChain& other) {
        if (this != &other) {
            AddOnChain copy(other);
            addOns_ = std::move(copy.addOns_);
        }
        return *this;
    }

    void AddOnChain::add(std::unique_ptr<AddOn> addOn) {
        if (!addOn) {
            throw ConfigurationError("Null add-on");
        }
        addOns_.push_back(std::move(addOn));
    }

    double AddOnChain::apply(double value, const StepContext& ctx) {
        for (auto& a : addOns_) {
            value = a->apply(value, ctx);
        }
        return value;
    }

    void AddOnChain::reset() {
        for (auto& a : addOns_) {
            a->reset();
        }
    }

    // ---- RandomNoise -----------------------------------------------------------

    RandomNoise::RandomNoise(const Distribution& noise)
        : noise_(noise)
    {
        validateDistribution(noise_);
    }

    double RandomNoise::apply(double value, const StepContext& ctx) {
        return value + ctx.sampler.sampleOne(noise_);
    }

    // ---- ProportionalNoise -----------------------------------------------------

    ProportionalNoise::ProportionalNoise(double mean, double stdDivisor, bool addValue)
        : mean_(mean)
        , stdDivisor_(stdDivisor)
        , addValue_(addValue)
    {
        if (!(stdDivisor_ > 0.0)) {
            throw ConfigurationError("ProportionalNoise std divisor must be positive");
        }
    }

    double ProportionalNoise::apply(double value, const StepContext& ctx) {
        double scale = std::abs(value) / stdDivisor_;
        if (scale == 0.0) return value;

        double draw = ctx.sampler.sampleOne(Distribution::normal(mean_ + value, scale));
        return addValue_ ? value + draw : draw;
    }

    // ---- RandomReduction -------------------------------------------------------

    RandomReduction::RandomReduction(const Distribution& reduction)
        : reduction_(reduction)
    {
        validateDistribution(reduction_);
    }

    double RandomReduction::apply(double value, const StepContext& ctx) {
        double r = std::clamp(ctx.sampler.sampleOne(reduction_), 0.0, 1.0);
        return value * (1.0 - r);
    }

    // ---- TimedMultiplier -------------------------------------------------------

    TimedMultiplier::TimedMultiplier(double multiplier, StepIndex firstStep, StepIndex lastStep)
        : multiplier_(multiplier)
        , firstStep_(firstStep)
        , lastStep_(lastStep)
    {
        if (firstStep_ > lastStep_) {
            throw ConfigurationError("TimedMultiplier window is empty");
        }
    }

    double TimedMultiplier::apply(double value, const StepContext& ctx) {
        if (ctx.step >= firstStep_ && ctx.step <= lastStep_) {
            return value * multiplier_;
        }
        return value;
    }

} // namespace tokensim
