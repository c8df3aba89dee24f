#pragma once

#include "core/StepContext.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tokensim {

    // One mint/burn mechanism. computeDelta sees ctx.supply as left by the
    // controllers registered before it; the economy clamps the result at zero.
    class SupplyController {
    public:
        explicit SupplyController(std::string name) : name_(std::move(name)) {}
        virtual ~SupplyController() = default;

        virtual double computeDelta(const StepContext& ctx) = 0;

        // Called once the planned iteration count is known
        virtual void prepare(size_t iterations) { (void)iterations; }

        virtual void reset() = 0;

        virtual std::string getType() const = 0;

        virtual std::unique_ptr<SupplyController> clone() const = 0;

        const std::string& name() const { return name_; }

    protected:
        std::string name_;
    };

    // Burns or mints param (absolute) or param x supply (percentage) every step
    class RateSupplyController : public SupplyController {
    public:
        RateSupplyController(SupplyDirection direction, double param,
            SupplyStyle style = SupplyStyle::PERCENTAGE,
            bool selfDestruct = false,
            std::string name = "rate");

        // Style given as "perc" or "fixed"
        RateSupplyController(SupplyDirection direction, double param,
            const std::string& style,
            bool selfDestruct = false,
            std::string name = "rate");

        double computeDelta(const StepContext& ctx) override;
        void reset() override { fired_ = false; }
        std::string getType() const override { return "RateSupplyController"; }
        std::unique_ptr<SupplyController> clone() const override { return std::make_unique<RateSupplyController>(*this); }

        SupplyDirection getDirection() const { return direction_; }
        SupplyStyle getStyle() const { return style_; }
        double getParam() const { return param_; }

    private:
        SupplyDirection direction_;
        double param_;
        SupplyStyle style_;
        bool selfDestruct_;
        bool fired_ = false;
    };

    // Releases amount / vestingPeriod per step once delay + cliff have elapsed
    class VestingSupplyController : public SupplyController {
    public:
        VestingSupplyController(double amount, size_t vestingPeriod, size_t cliff = 0,
            size_t delay = 0, std::string name = "vesting");

        double computeDelta(const StepContext& ctx) override;
        void reset() override { iteration_ = 0; }
        std::string getType() const override { return "VestingSupplyController"; }
        std::unique_ptr<SupplyController> clone() const override { return std::make_unique<VestingSupplyController>(*this); }

        const std::vector<double>& getSchedule() const { return schedule_; }

    private:
        std::vector<double> schedule_;
        size_t iteration_ = 0;
    };

    // Investors dumping a spaced, rounded number of tokens into circulation
    class DumpingSupplyController : public SupplyController {
    public:
        DumpingSupplyController(double initialAmount, double finalAmount, size_t numSteps,
            SpaceFunction space = SpaceFunction::LINEAR,
            std::string name = "dumping");

        double computeDelta(const StepContext& ctx) override;
        void reset() override { iteration_ = 0; }
        std::string getType() const override { return "DumpingSupplyController"; }
        std::unique_ptr<SupplyController> clone() const override { return std::make_unique<DumpingSupplyController>(*this); }

        const std::vector<double>& getSchedule() const { return schedule_; }

    private:
        std::vector<double> schedule_;
        size_t iteration_ = 0;
    };

    // Parks a random share of purchased tokens in an inactive pool and returns
    // a random share of that pool to circulation every step
    class AdaptiveStochasticSupplyController : public SupplyController {
    public:
        AdaptiveStochasticSupplyController(
            const Distribution& removal = Distribution::uniform(0.0, 0.1),
            const Distribution& addition = Distribution::uniform(0.0, 0.05),
            std::string name = "adaptive_stochastic");

        double computeDelta(const StepContext& ctx) override;
        void reset() override { inactiveTokens_ = 0.0; }
        std::string getType() const override { return "AdaptiveStochasticSupplyController"; }
        std::unique_ptr<SupplyController> clone() const override { return std::make_unique<AdaptiveStochasticSupplyController>(*this); }

        double getInactiveTokens() const { return inactiveTokens_; }

    private:
        Distribution removal_;
        Distribution addition_;
        double inactiveTokens_ = 0.0;
    };

    // Adds a recorded per-step supply change; past the end of the data it
    // repeats the last value, or refuses to run when onEndContinue is off
    class FromDataSupplyController : public SupplyController {
    public:
        explicit FromDataSupplyController(std::vector<double> values, bool onEndContinue = true,
            std::string name = "from_data");

        double computeDelta(const StepContext& ctx) override;
        void prepare(size_t iterations) override;
        void reset() override { iteration_ = 0; }
        std::string getType() const override { return "FromDataSupplyController"; }
        std::unique_ptr<SupplyController> clone() const override { return std::make_unique<FromDataSupplyController>(*this); }

        const std::vector<double>& getValues() const { return values_; }

    private:
        std::vector<double> values_;
        bool onEndContinue_;
        size_t iteration_ = 0;
    };

    struct SpeculatorParams {
        // Share of the step's fiat volume used to buy and hold
        Distribution speculation = Distribution::uniform(0.0, 0.1);
        double takeProfit = 1.1;
        double stopLoss = 0.9;
        // Cap on tokens held, as a share of circulating supply
        double maxShareOfSupply = 0.9;
    };

    // Buy-and-hold speculators: each step a sampled share of fiat volume buys
    // tokens out of circulation at the current price. A position returns to
    // circulation once price / entry price leaves [stopLoss, takeProfit].
    class SpeculatorSupplyController : public SupplyController {
    public:
        explicit SpeculatorSupplyController(SpeculatorParams params = SpeculatorParams(),
            std::string name = "speculator");

        double computeDelta(const StepContext& ctx) override;
        void reset() override;
        std::string getType() const override { return "SpeculatorSupplyController"; }
        std::unique_ptr<SupplyController> clone() const override { return std::make_unique<SpeculatorSupplyController>(*this); }

        double getHeldTokens() const { return held_; }
        size_t getOpenPositions() const { return positions_.size(); }

    private:
        struct Position {
            double tokens;
            double upper;
            double lower;
        };

        SpeculatorParams params_;
        std::vector<Position> positions_;
        double held_ = 0.0;
    };

} // namespace tokensim
