#include "HoldingTimeModel.hpp"
#include <algorithm>

namespace tokensim {

    ConstantHoldingTime::ConstantHoldingTime(double holdingTime)
        : holdingTime_(holdingTime)
    {
        if (!(holdingTime_ > 0.0)) {
            throw ConfigurationError("Holding time must be positive");
        }
    }

    StochasticHoldingTime::StochasticHoldingTime(DistributionKind kind,
        std::vector<DistributionParams> params, double minimum)
        : kind_(kind)
        , params_(std::move(params))
        , minimum_(minimum)
    {
        if (params_.empty()) {
            throw ConfigurationError("Stochastic holding time needs distribution parameters");
        }
        if (!(minimum_ > 0.0)) {
            throw ConfigurationError("Minimum holding time must be positive");
        }
        for (const auto& p : params_) {
            validateDistribution(kind_, p);
        }
    }

    StochasticHoldingTime::StochasticHoldingTime(const Distribution& dist, double minimum)
        : StochasticHoldingTime(dist.kind, std::vector<DistributionParams>{dist.params}, minimum)
    {
    }

    double StochasticHoldingTime::nextHoldingTime(const StepContext& ctx) {
        const auto& params = params_[std::min(iteration_, params_.size() - 1)];
        ++iteration_;
        return std::max(minimum_, ctx.sampler.sampleOne(kind_, params));
    }

    AdaptiveHoldingTime::AdaptiveHoldingTime(double initial, double minimum, double maximum)
        : initial_(initial)
        , minimum_(minimum)
        , maximum_(maximum)
    {
        if (!(initial_ > 0.0)) {
            throw ConfigurationError("Initial holding time must be positive");
        }
        if (!(minimum_ > 0.0) || maximum_ < minimum_) {
            throw ConfigurationError("Adaptive holding time bounds are invalid");
        }
    }

    double AdaptiveHoldingTime::nextHoldingTime(const StepContext& ctx) {
        const auto& h = ctx.history;
        if (h.rows() == 0 || !h.hasColumn(ctx.keys.fiatVolume)) {
            return std::clamp(initial_, minimum_, maximum_);
        }

        double price = h.previous(ctx.keys.price, ctx.price);
        double tokens = h.previous(ctx.keys.tokenVolume, 0.0);
        double fiat = h.previous(ctx.keys.fiatVolume, 0.0);

        double holdingTime = price * tokens / (fiat + 1e-9);
        return std::clamp(holdingTime, minimum_, maximum_);
    }

} // namespace tokensim
