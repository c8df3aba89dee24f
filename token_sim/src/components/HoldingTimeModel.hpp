#pragma once

#include "core/StepContext.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tokensim {

    // How long currency stays held before re-entering circulation.
    // Feeds the velocity of the equation-of-exchange price.
    class HoldingTimeModel {
    public:
        virtual ~HoldingTimeModel() = default;

        virtual double nextHoldingTime(const StepContext& ctx) = 0;

        virtual void reset() = 0;

        virtual std::string getType() const = 0;

        virtual std::unique_ptr<HoldingTimeModel> clone() const = 0;
    };

    class ConstantHoldingTime : public HoldingTimeModel {
    public:
        explicit ConstantHoldingTime(double holdingTime);

        double nextHoldingTime(const StepContext&) override { return holdingTime_; }
        void reset() override {}
        std::string getType() const override { return "ConstantHoldingTime"; }
        std::unique_ptr<HoldingTimeModel> clone() const override { return std::make_unique<ConstantHoldingTime>(*this); }

    private:
        double holdingTime_;
    };

    // Sampled every step; draws below minimum revert to minimum
    class StochasticHoldingTime : public HoldingTimeModel {
    public:
        StochasticHoldingTime(DistributionKind kind, std::vector<DistributionParams> params,
            double minimum = 0.1);

        explicit StochasticHoldingTime(const Distribution& dist = Distribution::lognormal(1.0),
            double minimum = 0.1);

        double nextHoldingTime(const StepContext& ctx) override;
        void reset() override { iteration_ = 0; }
        std::string getType() const override { return "StochasticHoldingTime"; }
        std::unique_ptr<HoldingTimeModel> clone() const override { return std::make_unique<StochasticHoldingTime>(*this); }

    private:
        DistributionKind kind_;
        std::vector<DistributionParams> params_;
        double minimum_;
        size_t iteration_ = 0;
    };

    // price x token volume / fiat volume of the previous step, clamped to [minimum, maximum]
    class AdaptiveHoldingTime : public HoldingTimeModel {
    public:
        explicit AdaptiveHoldingTime(double initial, double minimum = 0.01, double maximum = 12.0);

        double nextHoldingTime(const StepContext& ctx) override;
        void reset() override {}
        std::string getType() const override { return "AdaptiveHoldingTime"; }
        std::unique_ptr<HoldingTimeModel> clone() const override { return std::make_unique<AdaptiveHoldingTime>(*this); }

    private:
        double initial_;
        double minimum_;
        double maximum_;
    };

} // namespace tokensim
