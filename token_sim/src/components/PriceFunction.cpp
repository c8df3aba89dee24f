#include "PriceFunction.hpp"
#include <algorithm>
#include <cmath>

namespace tokensim {

    PriceCurve PriceCurves::linear(double slope, double intercept) {
        return [slope, intercept](double x) { return intercept + slope * x; };
    }

    PriceCurve PriceCurves::power(double coefficient, double exponent) {
        return [coefficient, exponent](double x) { return coefficient * std::pow(std::max(0.0, x), exponent); };
    }

    PriceCurve PriceCurves::exponential(double coefficient, double rate) {
        return [coefficient, rate](double x) { return coefficient * std::exp(rate * x); };
    }

    // ---- Constant --------------------------------------------------------------

    ConstantPrice::ConstantPrice(double price)
        : price_(price)
    {
        if (!(price_ >= 0.0) || !std::isfinite(price_)) {
            throw ConfigurationError("Constant price must be finite and non-negative");
        }
    }

    // ---- Equation of exchange --------------------------------------------------

    EquationOfExchangePrice::EquationOfExchangePrice(double smoothing, bool useVelocity)
        : smoothing_(smoothing)
        , useVelocity_(useVelocity)
    {
        if (smoothing_ < 0.0 || smoothing_ > 1.0) {
            throw ConfigurationError("Smoothing must lie in [0, 1]");
        }
    }

    double EquationOfExchangePrice::velocity(double holdingTime) {
        double v = 0.03358 + 1.20329 / holdingTime;
        return v < 0.01 ? 0.01 : v;
    }

    double EquationOfExchangePrice::compute(const StepContext& ctx) {
        if (ctx.supply <= 0.0) {
            return ctx.price;
        }

        double price = useVelocity_
            ? ctx.fiatVolume / (ctx.supply * velocity(ctx.holdingTime))
            : ctx.holdingTime * ctx.fiatVolume / ctx.supply;

        return smoothing_ * price + (1.0 - smoothing_) * ctx.price;
    }

    // ---- Constant elasticity ---------------------------------------------------

    ConstantElasticityPrice::ConstantElasticityPrice(double demandElasticity, double supplyElasticity)
        : demandElasticity_(demandElasticity)
        , supplyElasticity_(supplyElasticity)
    {
    }

    double ConstantElasticityPrice::compute(const StepContext& ctx) {
        const auto& h = ctx.history;
        if (h.rows() == 0) {
            return ctx.price;
        }

        double prevFiat = h.previous(ctx.keys.fiatVolume, 0.0);
        double prevSupply = h.previous(ctx.keys.supply, 0.0);

        double demandRatio = (prevFiat > 0.0 && ctx.fiatVolume > 0.0) ? ctx.fiatVolume / prevFiat : 1.0;
        double supplyRatio = (prevSupply > 0.0 && ctx.supply > 0.0) ? ctx.supply / prevSupply : 1.0;

        return ctx.price * std::pow(demandRatio, demandElasticity_) * std::pow(supplyRatio, -supplyElasticity_);
    }

    // ---- Linear regression -----------------------------------------------------

    LinearRegressionPrice::LinearRegressionPrice(double topAppreciation, double stdPrior,
        double anchoring, bool proportionateNoise)
        : topAppreciation_(topAppreciation)
        , stdPrior_(stdPrior)
        , anchoring_(anchoring)
        , proportionateNoise_(proportionateNoise)
    {
        if (topAppreciation_ < 0.0) {
            throw ConfigurationError("Top appreciation must be non-negative");
        }
        if (stdPrior_ < 0.0) {
            throw ConfigurationError("Std prior must be non-negative");
        }
        if (anchoring_ < 0.0 || anchoring_ > 1.0) {
            throw ConfigurationError("Anchoring must lie in [0, 1]");
        }
    }

    double LinearRegressionPrice::compute(const StepContext& ctx) {
        double previous = ctx.price;
        double v = 0.03358 + 1.20329 / ctx.holdingTime;
        if (v < 0.0) v = 0.001;

        double t = ctx.sampler.sampleOne(Distribution::studentT(kNoiseDegreesOfFreedom));
        double noise = t * stdPrior_ * (proportionateNoise_ ? previous : 1.0);

        double fitted = 0.0;
        if (ctx.fiatVolume > 0.0 && ctx.supply > 0.0) {
            double logPrice = 0.88 * std::log(ctx.fiatVolume)
                + 0.84 * std::log(1.0 / ctx.supply)
                + 1.15 * std::log(1.0 / v);
            fitted = std::exp(logPrice + noise);
        }

        double price = (1.0 - anchoring_) * fitted + anchoring_ * previous;
        if (price <= 0.0) {
            price = kFloor;
        }
        if (previous > 0.0 && price > previous * (1.0 + topAppreciation_)) {
            price = previous * (1.0 + topAppreciation_);
        }
        return price;
    }

    // ---- Bonding curve ---------------------------------------------------------

    BondingCurvePrice::BondingCurvePrice(PriceCurve curve, double maxSupply)
        : curve_(std::move(curve))
        , maxSupply_(maxSupply)
    {
        if (!curve_) {
            throw ConfigurationError("Bonding curve is empty");
        }
        if (!(maxSupply_ > 0.0)) {
            throw ConfigurationError("Bonding curve max supply must be positive");
        }
    }

    double BondingCurvePrice::compute(const StepContext& ctx) {
        return curve_(std::min(ctx.supply, maxSupply_));
    }

    // ---- Issuance curve --------------------------------------------------------

    IssuanceCurvePrice::IssuanceCurvePrice(PriceCurve curve, double maxSupply)
        : curve_(std::move(curve))
        , maxSupply_(maxSupply)
    {
        if (!curve_) {
            throw ConfigurationError("Issuance curve is empty");
        }
        if (!(maxSupply_ > 0.0)) {
            throw ConfigurationError("Issuance curve max supply must be positive");
        }
    }

    double IssuanceCurvePrice::compute(const StepContext& ctx) {
        if (ctx.tokenVolume > 0.0) {
            issued_ = std::min(issued_ + ctx.tokenVolume, maxSupply_);
        }
        return curve_(issued_);
    }

} // namespace tokensim
