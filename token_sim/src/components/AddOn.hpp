#pragma once

#include "core/StepContext.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tokensim {

    // Post-hoc transform of one value (noise injection, damping, shocks)
    class AddOn {
    public:
        virtual ~AddOn() = default;

        virtual double apply(double value, const StepContext& ctx) = 0;

        // Called between repetitions
        virtual void reset() {}

        virtual std::string getType() const = 0;

        virtual std::unique_ptr<AddOn> clone() const = 0;
    };

    // Ordered add-ons; each output feeds the next. Copies are deep.
    class AddOnChain {
    public:
        AddOnChain() = default;
        AddOnChain(const AddOnChain& other);
        AddOnChain& operator=(const AddOnChain& other);
        AddOnChain(AddOnChain&&) noexcept = default;
        AddOnChain& operator=(AddOnChain&&) noexcept = default;

        void add(std::unique_ptr<AddOn> addOn);
        double apply(double value, const StepContext& ctx);
        void reset();

        bool empty() const { return addOns_.empty(); }
        size_t size() const { return addOns_.size(); }

    private:
        std::vector<std::unique_ptr<AddOn>> addOns_;
    };

    // value + draw
    class RandomNoise : public AddOn {
    public:
        explicit RandomNoise(const Distribution& noise = Distribution::normal(0.0, 1.0));

        double apply(double value, const StepContext& ctx) override;
        std::string getType() const override { return "RandomNoise"; }
        std::unique_ptr<AddOn> clone() const override { return std::make_unique<RandomNoise>(*this); }

    private:
        Distribution noise_;
    };

    // Normal noise whose spread scales with the value: N(mean + value, |value| / stdDivisor)
    class ProportionalNoise : public AddOn {
    public:
        ProportionalNoise(double mean = 0.0, double stdDivisor = 5.0, bool addValue = true);

        double apply(double value, const StepContext& ctx) override;
        std::string getType() const override { return "ProportionalNoise"; }
        std::unique_ptr<AddOn> clone() const override { return std::make_unique<ProportionalNoise>(*this); }

    private:
        double mean_;
        double stdDivisor_;
        bool addValue_;
    };

    // value * (1 - r), r drawn and clamped to [0, 1]
    class RandomReduction : public AddOn {
    public:
        explicit RandomReduction(const Distribution& reduction = Distribution::uniform(0.0, 1.0));

        double apply(double value, const StepContext& ctx) override;
        std::string getType() const override { return "RandomReduction"; }
        std::unique_ptr<AddOn> clone() const override { return std::make_unique<RandomReduction>(*this); }

    private:
        Distribution reduction_;
    };

    // Multiplies inside the inclusive step window [firstStep, lastStep]
    class TimedMultiplier : public AddOn {
    public:
        TimedMultiplier(double multiplier, StepIndex firstStep, StepIndex lastStep);

        double apply(double value, const StepContext& ctx) override;
        std::string getType() const override { return "TimedMultiplier"; }
        std::unique_ptr<AddOn> clone() const override { return std::make_unique<TimedMultiplier>(*this); }

    private:
        double multiplier_;
        StepIndex firstStep_;
        StepIndex lastStep_;
    };

} // namespace tokensim
