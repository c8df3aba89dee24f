#include "SupplyController.hpp"
#include "core/Sequences.hpp"
#include <algorithm>
#include <cmath>

namespace tokensim {

    RateSupplyController::RateSupplyController(SupplyDirection direction, double param,
        SupplyStyle style, bool selfDestruct, std::string name)
        : SupplyController(std::move(name))
        , direction_(direction)
        , param_(param)
        , style_(style)
        , selfDestruct_(selfDestruct)
    {
        if (!std::isfinite(param_) || param_ < 0.0) {
            throw ConfigurationError("Supply controller " + name_ + " needs a finite non-negative parameter");
        }
    }

    RateSupplyController::RateSupplyController(SupplyDirection direction, double param,
        const std::string& style, bool selfDestruct, std::string name)
        : RateSupplyController(direction, param, parseSupplyStyle(style), selfDestruct, std::move(name))
    {
    }

    double RateSupplyController::computeDelta(const StepContext& ctx) {
        if (selfDestruct_ && fired_) {
            return 0.0;
        }
        fired_ = true;

        double amount = style_ == SupplyStyle::PERCENTAGE ? ctx.supply * param_ : param_;
        return direction_ == SupplyDirection::BURN ? -amount : amount;
    }

    // ---- Vesting ---------------------------------------------------------------

    VestingSupplyController::VestingSupplyController(double amount, size_t vestingPeriod,
        size_t cliff, size_t delay, std::string name)
        : SupplyController(std::move(name))
    {
        if (amount < 0.0) {
            throw ConfigurationError("Vesting amount must be non-negative");
        }

        double remaining = amount;
        double chunk = vestingPeriod > 0 ? amount / static_cast<double>(vestingPeriod) : amount;
        size_t periods = delay + cliff + std::max<size_t>(vestingPeriod, 1);

        schedule_.reserve(periods);
        for (size_t period = 0; period < periods; ++period) {
            if (period < delay + cliff) {
                schedule_.push_back(0.0);
                continue;
            }
            double release = std::min(remaining, chunk);
            schedule_.push_back(release);
            remaining -= release;
        }
    }

    double VestingSupplyController::computeDelta(const StepContext&) {
        double delta = iteration_ < schedule_.size() ? schedule_[iteration_] : 0.0;
        ++iteration_;
        return delta;
    }

    // ---- Dumping ---------------------------------------------------------------

    DumpingSupplyController::DumpingSupplyController(double initialAmount, double finalAmount, size_t numSteps,
        SpaceFunction space, std::string name)
        : SupplyController(std::move(name))
        , schedule_(Sequences::rounded(Sequences::generate(space, initialAmount, finalAmount, numSteps)))
    {
        if (numSteps == 0) {
            throw ConfigurationError("Dumping schedule needs at least one step");
        }
    }

    double DumpingSupplyController::computeDelta(const StepContext&) {
        double delta = iteration_ < schedule_.size() ? schedule_[iteration_] : 0.0;
        ++iteration_;
        return delta;
    }

    // ---- AdaptiveStochastic ----------------------------------------------------

    AdaptiveStochasticSupplyController::AdaptiveStochasticSupplyController(
        const Distribution& removal, const Distribution& addition, std::string name)
        : SupplyController(std::move(name))
        , removal_(removal)
        , addition_(addition)
    {
        validateDistribution(removal_);
        validateDistribution(addition_);
    }

    double AdaptiveStochasticSupplyController::computeDelta(const StepContext& ctx) {
        double purchased = 0.0;
        if (ctx.price > 0.0) {
            purchased = std::max(0.0, ctx.tokenVolume * ctx.holdingTime / ctx.price);
        }

        double removed = purchased * std::clamp(ctx.sampler.sampleOne(removal_), 0.0, 1.0);
        inactiveTokens_ += removed;

        double returned = inactiveTokens_ * std::clamp(ctx.sampler.sampleOne(addition_), 0.0, 1.0);
        inactiveTokens_ -= returned;

        return returned - removed;
    }

    // ---- FromData --------------------------------------------------------------

    FromDataSupplyController::FromDataSupplyController(std::vector<double> values, bool onEndContinue,
        std::string name)
        : SupplyController(std::move(name))
        , values_(std::move(values))
        , onEndContinue_(onEndContinue)
    {
        if (values_.empty()) {
            throw ConfigurationError("Supply controller " + name_ + " needs at least one value");
        }
        for (double v : values_) {
            if (!std::isfinite(v)) {
                throw ConfigurationError("Supply controller " + name_ + " has a non-finite value");
            }
        }
    }

    void FromDataSupplyController::prepare(size_t iterations) {
        if (!onEndContinue_ && iterations > values_.size()) {
            throw ConfigurationError("Supply controller " + name_ + " has "
                + std::to_string(values_.size()) + " values but " + std::to_string(iterations)
                + " iterations were requested");
        }
    }

    double FromDataSupplyController::computeDelta(const StepContext&) {
        double delta = values_[std::min(iteration_, values_.size() - 1)];
        ++iteration_;
        return delta;
    }

    // ---- Speculator ------------------------------------------------------------

    SpeculatorSupplyController::SpeculatorSupplyController(SpeculatorParams params, std::string name)
        : SupplyController(std::move(name))
        , params_(std::move(params))
    {
        validateDistribution(params_.speculation);
        if (!(params_.takeProfit >= 1.0)) {
            throw ConfigurationError("Speculator take profit must be at least 1");
        }
        if (!(params_.stopLoss >= 0.0 && params_.stopLoss <= 1.0)) {
            throw ConfigurationError("Speculator stop loss must lie in [0, 1]");
        }
        if (!(params_.maxShareOfSupply >= 0.0 && params_.maxShareOfSupply <= 1.0)) {
            throw ConfigurationError("Speculator supply share must lie in [0, 1]");
        }
    }

    double SpeculatorSupplyController::computeDelta(const StepContext& ctx) {
        const double price = ctx.price;

        double released = 0.0;
        auto closed = std::remove_if(positions_.begin(), positions_.end(), [&](const Position& p) {
            if (price > p.upper || price < p.lower) {
                released += p.tokens;
                return true;
            }
            return false;
        });
        positions_.erase(closed, positions_.end());
        held_ -= released;

        // Draw every step so the stream does not depend on the price path
        double share = std::clamp(ctx.sampler.sampleOne(params_.speculation), 0.0, 1.0);
        double bought = 0.0;
        if (price > 0.0) {
            bought = std::max(0.0, ctx.fiatVolume) * share / price;
            double room = std::max(0.0, params_.maxShareOfSupply * ctx.supply - held_);
            bought = std::min(bought, room);
        }

        if (bought > 0.0) {
            positions_.push_back({ bought, price * params_.takeProfit, price * params_.stopLoss });
            held_ += bought;
        }

        return released - bought;
    }

    void SpeculatorSupplyController::reset() {
        positions_.clear();
        held_ = 0.0;
    }

} // namespace tokensim
