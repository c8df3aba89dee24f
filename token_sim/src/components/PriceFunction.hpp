#pragma once

#include "core/StepContext.hpp"
#include <functional>
#include <limits>
#include <memory>
#include <string>

namespace tokensim {

    // Maps the economy state to this step's price. ctx.price is the previous
    // price, ctx.supply the supply already recorded for this step.
    class PriceFunction {
    public:
        virtual ~PriceFunction() = default;

        virtual double compute(const StepContext& ctx) = 0;

        virtual void reset() {}

        virtual std::string getType() const = 0;

        virtual std::unique_ptr<PriceFunction> clone() const = 0;
    };

    using PriceCurve = std::function<double(double)>;

    // Curve shapes offered by the JSON configuration
    class PriceCurves {
    public:
        // intercept + slope * x
        static PriceCurve linear(double slope, double intercept = 0.0);
        // coefficient * x^exponent
        static PriceCurve power(double coefficient, double exponent);
        // coefficient * exp(rate * x)
        static PriceCurve exponential(double coefficient, double rate);
    };

    class ConstantPrice : public PriceFunction {
    public:
        explicit ConstantPrice(double price);

        double compute(const StepContext&) override { return price_; }
        std::string getType() const override { return "ConstantPrice"; }
        std::unique_ptr<PriceFunction> clone() const override { return std::make_unique<ConstantPrice>(*this); }

    private:
        double price_;
    };

    // Quantity theory of money: P = T / (M x V) with V = 0.03358 + 1.20329 / H,
    // or P = H x T / M without velocity. Smoothing blends with the previous price.
    class EquationOfExchangePrice : public PriceFunction {
    public:
        explicit EquationOfExchangePrice(double smoothing = 1.0, bool useVelocity = true);

        double compute(const StepContext& ctx) override;
        std::string getType() const override { return "EquationOfExchangePrice"; }
        std::unique_ptr<PriceFunction> clone() const override { return std::make_unique<EquationOfExchangePrice>(*this); }

        static double velocity(double holdingTime);

    private:
        double smoothing_;
        bool useVelocity_;
    };

    // Previous price scaled by demand and supply ratios against the previous step
    class ConstantElasticityPrice : public PriceFunction {
    public:
        ConstantElasticityPrice(double demandElasticity = 1.0, double supplyElasticity = 1.0);

        double compute(const StepContext& ctx) override;
        std::string getType() const override { return "ConstantElasticityPrice"; }
        std::unique_ptr<PriceFunction> clone() const override { return std::make_unique<ConstantElasticityPrice>(*this); }

    private:
        double demandElasticity_;
        double supplyElasticity_;
    };

    // Empirical log-linear fit of price against fiat volume, supply and velocity
    class LinearRegressionPrice : public PriceFunction {
    public:
        LinearRegressionPrice(double topAppreciation = 0.3,
            double stdPrior = 0.1,
            double anchoring = 0.1,
            bool proportionateNoise = true);

        double compute(const StepContext& ctx) override;
        std::string getType() const override { return "LinearRegressionPrice"; }
        std::unique_ptr<PriceFunction> clone() const override { return std::make_unique<LinearRegressionPrice>(*this); }

        static constexpr double kFloor = 1e-4;
        static constexpr double kNoiseDegreesOfFreedom = 13000.0;

    private:
        double topAppreciation_;
        double stdPrior_;
        double anchoring_;
        bool proportionateNoise_;
    };

    // price = curve(circulating supply), supply capped at maxSupply
    class BondingCurvePrice : public PriceFunction {
    public:
        explicit BondingCurvePrice(PriceCurve curve,
            double maxSupply = std::numeric_limits<double>::infinity());

        double compute(const StepContext& ctx) override;
        std::string getType() const override { return "BondingCurvePrice"; }
        std::unique_ptr<PriceFunction> clone() const override { return std::make_unique<BondingCurvePrice>(*this); }

    private:
        PriceCurve curve_;
        double maxSupply_;
    };

    // price = curve(tokens ever purchased), the running total capped at maxSupply
    class IssuanceCurvePrice : public PriceFunction {
    public:
        explicit IssuanceCurvePrice(PriceCurve curve,
            double maxSupply = std::numeric_limits<double>::infinity());

        double compute(const StepContext& ctx) override;
        void reset() override { issued_ = 0.0; }
        std::string getType() const override { return "IssuanceCurvePrice"; }
        std::unique_ptr<PriceFunction> clone() const override { return std::make_unique<IssuanceCurvePrice>(*this); }

        double getIssued() const { return issued_; }

    private:
        PriceCurve curve_;
        double maxSupply_;
        double issued_ = 0.0;
    };

} // namespace tokensim
